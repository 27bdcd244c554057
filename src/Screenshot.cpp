#include "mdv/Screenshot.h"

#include <QFileInfo>

#include <vtkBMPWriter.h>
#include <vtkImageWriter.h>
#include <vtkJPEGWriter.h>
#include <vtkPNGWriter.h>
#include <vtkRenderWindow.h>
#include <vtkSmartPointer.h>
#include <vtkTIFFWriter.h>
#include <vtkWindowToImageFilter.h>

#include "mdv/Log.h"

namespace mdv {

namespace {

vtkSmartPointer<vtkImageWriter> CreateWriter(ImageFormat format) {
  switch (format) {
    case ImageFormat::kPng:
      return vtkSmartPointer<vtkPNGWriter>::New();
    case ImageFormat::kJpeg: {
      auto writer = vtkSmartPointer<vtkJPEGWriter>::New();
      writer->SetQuality(kJpegQuality);
      return writer;
    }
    case ImageFormat::kTiff:
      return vtkSmartPointer<vtkTIFFWriter>::New();
    case ImageFormat::kBmp:
      return vtkSmartPointer<vtkBMPWriter>::New();
    case ImageFormat::kUnknown:
    default:
      return nullptr;
  }
}

}  // namespace

ImageFormat ImageFormatForPath(const QString& path) {
  const QString ext = QFileInfo(path).suffix().toLower();
  if (ext == "png") {
    return ImageFormat::kPng;
  }
  if (ext == "jpg" || ext == "jpeg") {
    return ImageFormat::kJpeg;
  }
  if (ext == "tif" || ext == "tiff") {
    return ImageFormat::kTiff;
  }
  if (ext == "bmp") {
    return ImageFormat::kBmp;
  }
  return ImageFormat::kUnknown;
}

QString ScreenshotFileFilter() {
  return "PNG Image (*.png);;JPEG Image (*.jpg *.jpeg);;"
         "TIFF Image (*.tif *.tiff);;BMP Image (*.bmp)";
}

bool WriteScreenshot(vtkRenderWindow* window, const QString& path,
                     QString* error) {
  auto fail = [&](const QString& message) {
    qCWarning(lcRender) << "screenshot failed:" << message;
    if (error) {
      *error = message;
    }
    return false;
  };
  if (!window) {
    return fail("No render window.");
  }
  if (path.isEmpty()) {
    return fail("No file name given.");
  }
  auto writer = CreateWriter(ImageFormatForPath(path));
  if (!writer) {
    return fail(QString("Unsupported image format: %1").arg(path));
  }

  window->Render();
  auto w2i = vtkSmartPointer<vtkWindowToImageFilter>::New();
  w2i->SetInput(window);
  w2i->ReadFrontBufferOff();
  w2i->Update();
  writer->SetFileName(path.toUtf8().constData());
  writer->SetInputConnection(w2i->GetOutputPort());
  writer->Write();
  if (!QFileInfo::exists(path)) {
    return fail(QString("Could not write %1").arg(path));
  }
  qCInfo(lcRender) << "screenshot saved to" << path;
  return true;
}

}  // namespace mdv
