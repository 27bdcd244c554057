#pragma once

#include <QString>

#include <array>
#include <map>

#include <vtkSmartPointer.h>

#include "mdv/ColorMaps.h"
#include "mdv/GridFrame.h"
#include "mdv/VisualizationConfig.h"

class vtkActor;
class vtkArrowSource;
class vtkAxesActor;
class vtkClipDataSet;
class vtkContourFilter;
class vtkCubeAxesActor;
class vtkDataArray;
class vtkDataSetMapper;
class vtkGlyph3D;
class vtkMapper;
class vtkOrientationMarkerWidget;
class vtkPlane;
class vtkPolyDataMapper;
class vtkRenderWindowInteractor;
class vtkRenderer;
class vtkScalarBarActor;
class vtkStructuredGrid;

namespace mdv {

enum class ActorSlot { kSurface, kWireframe, kClip, kContour, kGlyph };
constexpr int kActorSlotCount = 5;

enum class ViewPreset { kReset, kPlusX, kPlusY, kPlusZ };

struct RenderReport {
  bool rendered = false;
  QString scalar_name;
  ScalarRange data_range;
  ScalarRange applied_range;
  // Set when a selection or user entry could not be honored. The rest of
  // the scene is still drawn.
  QString message;
};

// Persistent VTK scene for one viewer. Mapper/actor pairs for every mode are
// created once and reconfigured on each render() call. UI thread only.
class RenderPipeline {
 public:
  explicit RenderPipeline(vtkRenderer* renderer);
  ~RenderPipeline();

  RenderPipeline(const RenderPipeline&) = delete;
  RenderPipeline& operator=(const RenderPipeline&) = delete;

  // Enables the orientation-axes overlay, which needs an interactor.
  void set_interactor(vtkRenderWindowInteractor* interactor);

  RenderReport render(const GridFramePtr& frame,
                      const VisualizationConfig& config);
  // Hides every actor and overlay.
  void clear();

  // The next render() frames the whole dataset instead of restoring the
  // previous camera.
  void reset_camera_on_next_render() { reset_camera_ = true; }
  bool camera_reset_pending() const { return reset_camera_; }

  void apply_background(const QString& name);
  bool apply_view_preset(ViewPreset preset);

  vtkActor* actor(ActorSlot slot) const;
  bool actor_visible(ActorSlot slot) const;
  vtkScalarBarActor* scalar_bar() const { return scalar_bar_; }
  vtkCubeAxesActor* cube_axes() const { return cube_axes_; }
  vtkStructuredGrid* render_grid() const { return render_grid_; }
  const LookupTableCache& lookup_table() const { return lut_; }
  const Rgb& text_color() const { return text_color_; }

 private:
  struct CameraState {
    std::array<double, 3> position{{0, 0, 1}};
    std::array<double, 3> focal_point{{0, 0, 0}};
    std::array<double, 3> view_up{{0, 1, 0}};
  };

  void build_actors();
  void hide_mode_actors();
  void prepare_grid(const GridFramePtr& frame, bool include_boundary);
  vtkDataArray* magnitude_array(const QString& field);
  void bind_scalars(vtkMapper* mapper, const QString& scalar_name);

  void update_surface(const QString& scalar_name, bool with_grid,
                      double opacity);
  void update_clip(const QString& scalar_name,
                   const VisualizationConfig& config);
  bool update_contour(const QString& scalar_name,
                      const VisualizationConfig& config);
  bool update_glyph(const VisualizationConfig& config);
  void update_overlays(const QString& scalar_name,
                       const VisualizationConfig& config);
  void apply_text_color();

  CameraState capture_camera() const;
  void restore_camera(const CameraState& state);

  vtkRenderer* renderer_ = nullptr;
  vtkRenderWindowInteractor* interactor_ = nullptr;

  std::array<vtkSmartPointer<vtkActor>, kActorSlotCount> actors_;
  vtkSmartPointer<vtkDataSetMapper> surface_mapper_;
  vtkSmartPointer<vtkDataSetMapper> wire_mapper_;
  vtkSmartPointer<vtkPlane> clip_plane_;
  vtkSmartPointer<vtkClipDataSet> clipper_;
  vtkSmartPointer<vtkDataSetMapper> clip_mapper_;
  vtkSmartPointer<vtkContourFilter> contour_filter_;
  vtkSmartPointer<vtkPolyDataMapper> contour_mapper_;
  vtkSmartPointer<vtkArrowSource> arrow_source_;
  vtkSmartPointer<vtkGlyph3D> glyph_filter_;
  vtkSmartPointer<vtkPolyDataMapper> glyph_mapper_;

  vtkSmartPointer<vtkAxesActor> axes_actor_;
  vtkSmartPointer<vtkOrientationMarkerWidget> orientation_widget_;
  vtkSmartPointer<vtkCubeAxesActor> cube_axes_;
  vtkSmartPointer<vtkScalarBarActor> scalar_bar_;

  LookupTableCache lut_;
  Rgb text_color_{{0.0, 0.0, 0.0}};

  GridFramePtr frame_;
  bool grid_trimmed_ = false;
  vtkSmartPointer<vtkStructuredGrid> render_grid_;
  std::map<QString, vtkSmartPointer<vtkDataArray>> magnitudes_;

  bool reset_camera_ = true;
};

}  // namespace mdv
