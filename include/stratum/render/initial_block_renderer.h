#pragma once
#include <stratum/core/diagnostics.h>
#include <stratum/paint/graphics_surface.h>
#include <stratum/render/element_renderer.h>
#include <memory>

namespace stratum::render {

// Root of the render tree. It establishes the root stacking context, owns
// the surface factory every layer draws its surfaces from, and collects
// the diagnostics of the tree.
class InitialBlockRenderer : public ElementRenderer {
public:
    explicit InitialBlockRenderer(std::unique_ptr<paint::SurfaceFactory> factory,
                                  style::ComputedStyle style = {});
    ~InitialBlockRenderer() override;

    bool is_initial_container() const override { return true; }
    style::ZIndex resolved_z_index() const override { return style::ZIndex::integer(0); }

    paint::SurfaceFactory* surface_factory() const override { return factory_.get(); }
    core::DiagnosticEmitter* diagnostics() const override { return &diagnostics_; }
    core::DiagnosticEmitter& diagnostic_emitter() const { return diagnostics_; }

    LayerRenderer& root_layer() const { return *own_layer_; }
    paint::GraphicsSurface* graphics_surface() const;

    // Sizes the initial containing block to the viewport and paints the
    // whole layer tree.
    void render_layers(int viewport_width, int viewport_height);

    ElementRenderer* element_at_point(const geom::Point& point) const;

private:
    std::unique_ptr<paint::SurfaceFactory> factory_;
    mutable core::DiagnosticEmitter diagnostics_;
};

} // namespace stratum::render
