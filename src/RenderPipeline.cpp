#include "mdv/RenderPipeline.h"

#include <algorithm>
#include <cmath>

#include <vtkActor.h>
#include <vtkArrowSource.h>
#include <vtkAxesActor.h>
#include <vtkCamera.h>
#include <vtkCaptionActor2D.h>
#include <vtkClipDataSet.h>
#include <vtkContourFilter.h>
#include <vtkCubeAxesActor.h>
#include <vtkDataArray.h>
#include <vtkDataObject.h>
#include <vtkDataSetMapper.h>
#include <vtkDoubleArray.h>
#include <vtkExtractGrid.h>
#include <vtkGlyph3D.h>
#include <vtkLookupTable.h>
#include <vtkOrientationMarkerWidget.h>
#include <vtkPlane.h>
#include <vtkPointData.h>
#include <vtkPolyDataMapper.h>
#include <vtkProperty.h>
#include <vtkRenderWindowInteractor.h>
#include <vtkRenderer.h>
#include <vtkScalarBarActor.h>
#include <vtkStructuredGrid.h>
#include <vtkTextProperty.h>

#include "mdv/Log.h"

namespace mdv {

namespace {

constexpr int kMinCellsForTrim = 3;

int SlotIndex(ActorSlot slot) {
  return static_cast<int>(slot);
}

double ComputeMagnitude(vtkDataArray* arr, vtkIdType idx) {
  const int comps = arr->GetNumberOfComponents();
  double sum_sq = 0.0;
  for (int c = 0; c < comps; ++c) {
    const double v = arr->GetComponent(idx, c);
    sum_sq += v * v;
  }
  return std::sqrt(sum_sq);
}

QString MagnitudeName(const QString& field) {
  return field + "_magnitude";
}

void SetTextColor(vtkTextProperty* prop, const Rgb& color) {
  if (prop) {
    prop->SetColor(color[0], color[1], color[2]);
  }
}

}  // namespace

RenderPipeline::RenderPipeline(vtkRenderer* renderer) : renderer_(renderer) {
  build_actors();
  apply_background("Light Gray");
}

RenderPipeline::~RenderPipeline() {
  if (orientation_widget_) {
    orientation_widget_->SetEnabled(0);
  }
}

void RenderPipeline::build_actors() {
  for (auto& a : actors_) {
    a = vtkSmartPointer<vtkActor>::New();
    a->VisibilityOff();
  }

  surface_mapper_ = vtkSmartPointer<vtkDataSetMapper>::New();
  surface_mapper_->SetRelativeCoincidentTopologyPolygonOffsetParameters(1.0,
                                                                        1.0);
  actors_[SlotIndex(ActorSlot::kSurface)]->SetMapper(surface_mapper_);

  wire_mapper_ = vtkSmartPointer<vtkDataSetMapper>::New();
  wire_mapper_->ScalarVisibilityOff();
  wire_mapper_->SetRelativeCoincidentTopologyLineOffsetParameters(-1.0, -1.0);
  auto* wire = actors_[SlotIndex(ActorSlot::kWireframe)].Get();
  wire->SetMapper(wire_mapper_);
  wire->GetProperty()->SetRepresentationToWireframe();
  wire->GetProperty()->SetColor(0.0, 0.0, 0.0);
  wire->GetProperty()->SetLineWidth(1.0);
  wire->SetPickable(0);

  clip_plane_ = vtkSmartPointer<vtkPlane>::New();
  clipper_ = vtkSmartPointer<vtkClipDataSet>::New();
  clipper_->SetClipFunction(clip_plane_);
  clip_mapper_ = vtkSmartPointer<vtkDataSetMapper>::New();
  clip_mapper_->SetInputConnection(clipper_->GetOutputPort());
  actors_[SlotIndex(ActorSlot::kClip)]->SetMapper(clip_mapper_);

  contour_filter_ = vtkSmartPointer<vtkContourFilter>::New();
  contour_mapper_ = vtkSmartPointer<vtkPolyDataMapper>::New();
  contour_mapper_->SetInputConnection(contour_filter_->GetOutputPort());
  actors_[SlotIndex(ActorSlot::kContour)]->SetMapper(contour_mapper_);

  arrow_source_ = vtkSmartPointer<vtkArrowSource>::New();
  glyph_filter_ = vtkSmartPointer<vtkGlyph3D>::New();
  glyph_filter_->SetSourceConnection(arrow_source_->GetOutputPort());
  glyph_filter_->SetVectorModeToUseVector();
  glyph_filter_->OrientOn();
  glyph_mapper_ = vtkSmartPointer<vtkPolyDataMapper>::New();
  glyph_mapper_->SetInputConnection(glyph_filter_->GetOutputPort());
  actors_[SlotIndex(ActorSlot::kGlyph)]->SetMapper(glyph_mapper_);

  if (renderer_) {
    for (auto& a : actors_) {
      renderer_->AddActor(a);
    }
  }
}

void RenderPipeline::set_interactor(vtkRenderWindowInteractor* interactor) {
  interactor_ = interactor;
}

vtkActor* RenderPipeline::actor(ActorSlot slot) const {
  return actors_[SlotIndex(slot)];
}

bool RenderPipeline::actor_visible(ActorSlot slot) const {
  return actors_[SlotIndex(slot)]->GetVisibility() != 0;
}

void RenderPipeline::hide_mode_actors() {
  for (auto& a : actors_) {
    a->VisibilityOff();
  }
}

void RenderPipeline::clear() {
  hide_mode_actors();
  if (scalar_bar_) {
    scalar_bar_->VisibilityOff();
  }
  if (cube_axes_) {
    cube_axes_->VisibilityOff();
  }
  if (orientation_widget_) {
    orientation_widget_->SetEnabled(0);
  }
}

void RenderPipeline::prepare_grid(const GridFramePtr& frame,
                                  bool include_boundary) {
  const auto& dims = frame->dimensions();
  const bool trim = !include_boundary &&
                    dims[0] - 1 >= kMinCellsForTrim &&
                    dims[1] - 1 >= kMinCellsForTrim &&
                    dims[2] - 1 >= kMinCellsForTrim;
  if (frame == frame_ && render_grid_ && trim == grid_trimmed_) {
    return;
  }

  frame_ = frame;
  grid_trimmed_ = trim;
  magnitudes_.clear();
  render_grid_ = vtkSmartPointer<vtkStructuredGrid>::New();
  if (trim) {
    auto extract = vtkSmartPointer<vtkExtractGrid>::New();
    int ext[6] = {0, 0, 0, 0, 0, 0};
    frame->grid()->GetExtent(ext);
    extract->SetInputData(frame->grid());
    extract->SetVOI(ext[0] + 1, ext[1] - 1, ext[2] + 1, ext[3] - 1,
                    ext[4] + 1, ext[5] - 1);
    extract->Update();
    render_grid_->ShallowCopy(extract->GetOutput());
  } else {
    render_grid_->ShallowCopy(frame->grid());
  }
}

vtkDataArray* RenderPipeline::magnitude_array(const QString& field) {
  auto it = magnitudes_.find(field);
  if (it != magnitudes_.end()) {
    return it->second;
  }
  auto* pd = render_grid_->GetPointData();
  vtkDataArray* vectors = pd->GetArray(field.toUtf8().constData());
  if (!vectors) {
    return nullptr;
  }
  const vtkIdType tuples = vectors->GetNumberOfTuples();
  auto mag = vtkSmartPointer<vtkDoubleArray>::New();
  mag->SetName(MagnitudeName(field).toUtf8().constData());
  mag->SetNumberOfComponents(1);
  mag->SetNumberOfTuples(tuples);
  for (vtkIdType i = 0; i < tuples; ++i) {
    mag->SetValue(i, ComputeMagnitude(vectors, i));
  }
  pd->AddArray(mag);
  magnitudes_[field] = mag;
  return mag;
}

void RenderPipeline::bind_scalars(vtkMapper* mapper,
                                  const QString& scalar_name) {
  mapper->SetScalarModeToUsePointFieldData();
  mapper->SelectColorArray(scalar_name.toUtf8().constData());
  mapper->SetLookupTable(lut_.table());
  mapper->UseLookupTableScalarRangeOn();
  mapper->ScalarVisibilityOn();
}

RenderReport RenderPipeline::render(const GridFramePtr& frame,
                                    const VisualizationConfig& config) {
  RenderReport report;
  if (!renderer_) {
    return report;
  }
  if (!frame || !frame->grid()) {
    clear();
    report.message = "No frame loaded.";
    return report;
  }

  const bool reset = reset_camera_;
  const CameraState saved = capture_camera();

  hide_mode_actors();

  const FieldInfo* field = frame->find_field(config.field_name);
  if (!field) {
    report.message = QString("Field '%1' is not present in %2")
                         .arg(config.field_name, frame->file_name());
    qCWarning(lcRender) << report.message;
    if (scalar_bar_) {
      scalar_bar_->VisibilityOff();
    }
    return report;
  }

  prepare_grid(frame, config.include_boundary);

  QString scalar_name = field->name;
  vtkDataArray* scalars = nullptr;
  if (field->kind == FieldKind::kVector) {
    scalars = magnitude_array(field->name);
    scalar_name = MagnitudeName(field->name);
  } else {
    scalars = render_grid_->GetPointData()->GetArray(
        field->name.toUtf8().constData());
  }
  if (!scalars) {
    report.message = QString("Field '%1' has no point data").arg(field->name);
    return report;
  }

  double data_range[2] = {0.0, 1.0};
  scalars->GetRange(data_range, 0);
  report.scalar_name = scalar_name;
  report.data_range = {data_range[0], data_range[1]};
  report.applied_range = ResolveScalarRange(config, report.data_range);
  lut_.update(config.color_map, report.applied_range.min,
              report.applied_range.max);

  switch (config.mode) {
    case VisMode::kSurface:
      update_surface(scalar_name, false, config.opacity);
      break;
    case VisMode::kSurfaceWithGrid:
      update_surface(scalar_name, true, config.opacity);
      break;
    case VisMode::kClip:
      update_clip(scalar_name, config);
      break;
    case VisMode::kContour:
      if (!update_contour(scalar_name, config)) {
        report.message =
            QString("Invalid contour levels '%1'").arg(config.contour_levels);
      }
      break;
    case VisMode::kVectorArrows:
      if (!update_glyph(config)) {
        report.message = "Vector arrows need a 3-component field.";
      }
      break;
  }

  update_overlays(scalar_name, config);

  if (reset) {
    renderer_->ResetCamera();
    reset_camera_ = false;
  } else {
    restore_camera(saved);
  }
  renderer_->ResetCameraClippingRange();
  report.rendered = true;
  return report;
}

void RenderPipeline::update_surface(const QString& scalar_name,
                                    bool with_grid, double opacity) {
  surface_mapper_->SetInputData(render_grid_);
  bind_scalars(surface_mapper_, scalar_name);
  auto* surface = actor(ActorSlot::kSurface);
  surface->GetProperty()->SetRepresentationToSurface();
  surface->GetProperty()->SetOpacity(opacity);
  surface->VisibilityOn();

  if (with_grid) {
    wire_mapper_->SetInputData(render_grid_);
    auto* wire = actor(ActorSlot::kWireframe);
    wire->GetProperty()->SetOpacity(WireframeOpacity(opacity));
    wire->VisibilityOn();
  }
}

void RenderPipeline::update_clip(const QString& scalar_name,
                                 const VisualizationConfig& config) {
  double b[6] = {0, 0, 0, 0, 0, 0};
  render_grid_->GetBounds(b);
  double origin[3] = {(b[0] + b[1]) * 0.5, (b[2] + b[3]) * 0.5,
                      (b[4] + b[5]) * 0.5};
  double normal[3] = {0.0, 0.0, 0.0};
  const int axis = static_cast<int>(config.clip_axis);
  origin[axis] = config.clip_position;
  normal[axis] = 1.0;
  clip_plane_->SetOrigin(origin);
  clip_plane_->SetNormal(normal);

  clipper_->SetInputData(render_grid_);
  bind_scalars(clip_mapper_, scalar_name);
  auto* clip = actor(ActorSlot::kClip);
  clip->GetProperty()->SetOpacity(config.opacity);
  clip->VisibilityOn();
}

bool RenderPipeline::update_contour(const QString& scalar_name,
                                    const VisualizationConfig& config) {
  const auto levels = ParseContourLevels(config.contour_levels);
  if (!levels) {
    actor(ActorSlot::kContour)->VisibilityOff();
    return false;
  }
  contour_filter_->SetNumberOfContours(0);
  for (std::size_t i = 0; i < levels->size(); ++i) {
    contour_filter_->SetValue(static_cast<int>(i), (*levels)[i]);
  }
  contour_filter_->SetInputData(render_grid_);
  contour_filter_->SetInputArrayToProcess(
      0, 0, 0, vtkDataObject::FIELD_ASSOCIATION_POINTS,
      scalar_name.toUtf8().constData());
  bind_scalars(contour_mapper_, scalar_name);
  auto* contour = actor(ActorSlot::kContour);
  contour->GetProperty()->SetOpacity(config.opacity);
  contour->VisibilityOn();
  return true;
}

bool RenderPipeline::update_glyph(const VisualizationConfig& config) {
  auto* glyph = actor(ActorSlot::kGlyph);
  const FieldInfo* field = frame_->find_field(config.field_name);
  if (!field || field->kind != FieldKind::kVector || field->components != 3) {
    glyph->VisibilityOff();
    return false;
  }
  const QByteArray name = field->name.toUtf8();
  glyph_filter_->SetInputData(render_grid_);
  glyph_filter_->SetInputArrayToProcess(
      1, 0, 0, vtkDataObject::FIELD_ASSOCIATION_POINTS, name.constData());
  if (config.glyph_size_mode == GlyphSizeMode::kUniform) {
    glyph_filter_->SetScaleModeToDataScalingOff();
  } else {
    glyph_filter_->SetScaleModeToScaleByVector();
  }
  glyph_filter_->SetScaleFactor(ClampGlyphScale(config.glyph_scale));

  if (config.glyph_color_mode == GlyphColorMode::kColormap) {
    magnitude_array(field->name);
    bind_scalars(glyph_mapper_, MagnitudeName(field->name));
  } else {
    glyph_mapper_->ScalarVisibilityOff();
    glyph->GetProperty()->SetColor(config.glyph_color[0],
                                   config.glyph_color[1],
                                   config.glyph_color[2]);
  }
  glyph->GetProperty()->SetOpacity(config.opacity);
  glyph->VisibilityOn();
  return true;
}

void RenderPipeline::update_overlays(const QString& scalar_name,
                                     const VisualizationConfig& config) {
  if (config.show_axes && interactor_) {
    if (!orientation_widget_) {
      axes_actor_ = vtkSmartPointer<vtkAxesActor>::New();
      axes_actor_->SetShaftTypeToCylinder();
      axes_actor_->SetCylinderRadius(0.02);
      orientation_widget_ = vtkSmartPointer<vtkOrientationMarkerWidget>::New();
      orientation_widget_->SetOutlineColor(0.93, 0.57, 0.13);
      orientation_widget_->SetOrientationMarker(axes_actor_);
      orientation_widget_->SetInteractor(interactor_);
      orientation_widget_->SetViewport(0.0, 0.0, 0.2, 0.2);
      apply_text_color();
    }
    orientation_widget_->SetEnabled(1);
    orientation_widget_->InteractiveOff();
  } else if (orientation_widget_) {
    orientation_widget_->SetEnabled(0);
  }

  if (config.show_bounds) {
    if (!cube_axes_) {
      cube_axes_ = vtkSmartPointer<vtkCubeAxesActor>::New();
      cube_axes_->SetXLabelFormat("%.2g");
      cube_axes_->SetYLabelFormat("%.2g");
      cube_axes_->SetZLabelFormat("%.2g");
      cube_axes_->SetFlyModeToOuterEdges();
      cube_axes_->SetTickLocationToInside();
      cube_axes_->XAxisMinorTickVisibilityOff();
      cube_axes_->YAxisMinorTickVisibilityOff();
      cube_axes_->ZAxisMinorTickVisibilityOff();
      cube_axes_->SetPickable(0);
      renderer_->AddActor(cube_axes_);
      apply_text_color();
    }
    cube_axes_->SetBounds(render_grid_->GetBounds());
    cube_axes_->SetCamera(renderer_->GetActiveCamera());
    cube_axes_->VisibilityOn();
  } else if (cube_axes_) {
    cube_axes_->VisibilityOff();
  }

  if (config.show_color_bar) {
    if (!scalar_bar_) {
      scalar_bar_ = vtkSmartPointer<vtkScalarBarActor>::New();
      scalar_bar_->SetOrientationToHorizontal();
      scalar_bar_->SetPosition(0.2, 0.02);
      scalar_bar_->SetWidth(0.5);
      scalar_bar_->SetHeight(0.05);
      scalar_bar_->SetNumberOfLabels(5);
      scalar_bar_->SetLabelFormat("%.3g");
      scalar_bar_->GetTitleTextProperty()->SetFontFamilyToArial();
      scalar_bar_->GetTitleTextProperty()->SetFontSize(14);
      scalar_bar_->GetLabelTextProperty()->SetFontFamilyToArial();
      scalar_bar_->GetLabelTextProperty()->SetFontSize(10);
      renderer_->AddActor2D(scalar_bar_);
      apply_text_color();
    }
    scalar_bar_->SetLookupTable(lut_.table());
    scalar_bar_->SetTitle(scalar_name.toUtf8().constData());
    scalar_bar_->VisibilityOn();
  } else if (scalar_bar_) {
    scalar_bar_->VisibilityOff();
  }
}

void RenderPipeline::apply_background(const QString& name) {
  const Rgb bg = BackgroundColorFromName(name);
  if (renderer_) {
    renderer_->SetBackground(bg[0], bg[1], bg[2]);
  }
  text_color_ = TextColorForBackground(bg);
  apply_text_color();
}

void RenderPipeline::apply_text_color() {
  if (scalar_bar_) {
    SetTextColor(scalar_bar_->GetTitleTextProperty(), text_color_);
    SetTextColor(scalar_bar_->GetLabelTextProperty(), text_color_);
  }
  if (cube_axes_) {
    for (int i = 0; i < 3; ++i) {
      SetTextColor(cube_axes_->GetTitleTextProperty(i), text_color_);
      SetTextColor(cube_axes_->GetLabelTextProperty(i), text_color_);
    }
    cube_axes_->GetXAxesLinesProperty()->SetColor(text_color_.data());
    cube_axes_->GetYAxesLinesProperty()->SetColor(text_color_.data());
    cube_axes_->GetZAxesLinesProperty()->SetColor(text_color_.data());
  }
  if (axes_actor_) {
    vtkCaptionActor2D* captions[3] = {axes_actor_->GetXAxisCaptionActor2D(),
                                      axes_actor_->GetYAxisCaptionActor2D(),
                                      axes_actor_->GetZAxisCaptionActor2D()};
    for (auto* caption : captions) {
      SetTextColor(caption->GetCaptionTextProperty(), text_color_);
    }
  }
}

bool RenderPipeline::apply_view_preset(ViewPreset preset) {
  if (!renderer_ || !render_grid_) {
    return false;
  }
  auto* cam = renderer_->GetActiveCamera();
  if (!cam) {
    return false;
  }
  if (preset == ViewPreset::kReset) {
    renderer_->ResetCamera();
    return true;
  }
  double b[6] = {0, 0, 0, 0, 0, 0};
  render_grid_->GetBounds(b);
  const double cx = (b[0] + b[1]) * 0.5;
  const double cy = (b[2] + b[3]) * 0.5;
  const double cz = (b[4] + b[5]) * 0.5;
  double dist = std::max({b[1] - b[0], b[3] - b[2], b[5] - b[4]}) * 3.0;
  if (dist <= 0.0) {
    dist = 1.0;
  }
  if (preset == ViewPreset::kPlusX) {
    cam->SetPosition(cx + dist, cy, cz);
    cam->SetViewUp(0, 0, 1);
  } else if (preset == ViewPreset::kPlusY) {
    cam->SetPosition(cx, cy + dist, cz);
    cam->SetViewUp(0, 0, 1);
  } else {
    cam->SetPosition(cx, cy, cz + dist);
    cam->SetViewUp(0, 1, 0);
  }
  cam->SetFocalPoint(cx, cy, cz);
  renderer_->ResetCameraClippingRange();
  return true;
}

RenderPipeline::CameraState RenderPipeline::capture_camera() const {
  CameraState state;
  auto* cam = renderer_ ? renderer_->GetActiveCamera() : nullptr;
  if (cam) {
    cam->GetPosition(state.position.data());
    cam->GetFocalPoint(state.focal_point.data());
    cam->GetViewUp(state.view_up.data());
  }
  return state;
}

void RenderPipeline::restore_camera(const CameraState& state) {
  auto* cam = renderer_ ? renderer_->GetActiveCamera() : nullptr;
  if (!cam) {
    return;
  }
  cam->SetPosition(state.position.data());
  cam->SetFocalPoint(state.focal_point.data());
  cam->SetViewUp(state.view_up.data());
}

}  // namespace mdv
