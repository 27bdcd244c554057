#pragma once

#include <QString>

class vtkRenderWindow;

namespace mdv {

enum class ImageFormat { kPng, kJpeg, kTiff, kBmp, kUnknown };

constexpr int kJpegQuality = 95;

ImageFormat ImageFormatForPath(const QString& path);
QString ScreenshotFileFilter();

// Writes the back buffer of `window` in the format named by the extension.
bool WriteScreenshot(vtkRenderWindow* window, const QString& path,
                     QString* error = nullptr);

}  // namespace mdv
