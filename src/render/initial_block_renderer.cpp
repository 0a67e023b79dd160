#include <stratum/render/initial_block_renderer.h>
#include <stratum/render/layer_renderer.h>

#include <cassert>

namespace stratum::render {

InitialBlockRenderer::InitialBlockRenderer(std::unique_ptr<paint::SurfaceFactory> factory,
                                           style::ComputedStyle style)
    : ElementRenderer(std::move(style)), factory_(std::move(factory)) {
    assert(factory_ != nullptr);
    connect_layers();
    own_layer_->attach();
}

InitialBlockRenderer::~InitialBlockRenderer() {
    // Tear the layer tree down while the factory and diagnostics are alive.
    disconnect_layers();
    if (own_layer_) {
        own_layer_->detach();
    }
}

paint::GraphicsSurface* InitialBlockRenderer::graphics_surface() const {
    return own_layer_->graphics_surface();
}

void InitialBlockRenderer::render_layers(int viewport_width, int viewport_height) {
    bounds_ = {0, 0, static_cast<float>(viewport_width), static_cast<float>(viewport_height)};
    own_layer_->render(viewport_width, viewport_height);
}

ElementRenderer* InitialBlockRenderer::element_at_point(const geom::Point& point) const {
    return own_layer_->get_top_most_element_renderer_at_point(point, 0, 0);
}

} // namespace stratum::render
