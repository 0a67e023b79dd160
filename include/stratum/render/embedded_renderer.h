#pragma once
#include <stratum/render/element_renderer.h>

namespace stratum::render {

// Replaced content decoded outside the render tree (video, plugin). It is
// always composited on a surface of its own.
class EmbeddedRenderer : public ElementRenderer {
public:
    using ElementRenderer::ElementRenderer;

    bool is_compositing_layer() const override { return true; }
};

} // namespace stratum::render
