#pragma once
#include <stratum/geom/matrix.h>
#include <stratum/geom/rect.h>
#include <stratum/style/computed_style.h>
#include <memory>
#include <string>

namespace stratum::paint {

using style::Color;

// A paint target owned by exactly one layer and composed into the surface
// of an ancestor layer. Layers that borrow a surface only paint into it;
// resize, clear and transform are reserved for the owner.
class GraphicsSurface {
public:
    virtual ~GraphicsSurface() = default;

    virtual void resize(int width, int height) = 0;
    virtual void clear() = 0;

    virtual void begin_transparency(float opacity) = 0;
    virtual void end_transparency() = 0;
    virtual void transform(const geom::Matrix& matrix) = 0;

    virtual void append_child_surface(GraphicsSurface& child) = 0;
    virtual void remove_child_surface(GraphicsSurface& child) = 0;

    // Releases the backing store. The surface must not be used afterwards.
    virtual void dispose() = 0;

    virtual void fill_rect(const geom::Rect& rect, const Color& color) = 0;
    virtual void draw_text(const std::string& text, float x, float y,
                           float font_size, const Color& color) = 0;

    virtual int width() const = 0;
    virtual int height() const = 0;
};

class SurfaceFactory {
public:
    virtual ~SurfaceFactory() = default;
    virtual std::unique_ptr<GraphicsSurface> create(int width, int height) = 0;
};

} // namespace stratum::paint
