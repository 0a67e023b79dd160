#include <stratum/paint/recording_surface.h>

#include <algorithm>
#include <cassert>

namespace stratum::paint {

void RecordingSurface::record(SurfaceCommand command) {
    assert(!disposed_ && "surface used after dispose");
    commands_.push_back(std::move(command));
}

void RecordingSurface::resize(int width, int height) {
    width_ = width;
    height_ = height;
    SurfaceCommand cmd{SurfaceCommand::Resize};
    cmd.width = width;
    cmd.height = height;
    record(std::move(cmd));
}

void RecordingSurface::clear() {
    record(SurfaceCommand{SurfaceCommand::Clear});
}

void RecordingSurface::begin_transparency(float opacity) {
    SurfaceCommand cmd{SurfaceCommand::BeginTransparency};
    cmd.opacity = opacity;
    record(std::move(cmd));
    ++transparency_depth_;
}

void RecordingSurface::end_transparency() {
    assert(transparency_depth_ > 0 && "end_transparency without begin");
    record(SurfaceCommand{SurfaceCommand::EndTransparency});
    --transparency_depth_;
}

void RecordingSurface::transform(const geom::Matrix& matrix) {
    SurfaceCommand cmd{SurfaceCommand::Transform};
    cmd.matrix = matrix;
    record(std::move(cmd));
}

void RecordingSurface::append_child_surface(GraphicsSurface& child) {
    assert(std::find(children_.begin(), children_.end(), &child) == children_.end() &&
           "surface registered twice");
    children_.push_back(&child);
    SurfaceCommand cmd{SurfaceCommand::AppendChildSurface};
    cmd.child = &child;
    record(std::move(cmd));
}

void RecordingSurface::remove_child_surface(GraphicsSurface& child) {
    auto it = std::find(children_.begin(), children_.end(), &child);
    assert(it != children_.end() && "surface is not a child of this surface");
    children_.erase(it);
    SurfaceCommand cmd{SurfaceCommand::RemoveChildSurface};
    cmd.child = &child;
    record(std::move(cmd));
}

void RecordingSurface::dispose() {
    record(SurfaceCommand{SurfaceCommand::Dispose});
    disposed_ = true;
    children_.clear();
}

void RecordingSurface::fill_rect(const geom::Rect& rect, const Color& color) {
    SurfaceCommand cmd{SurfaceCommand::FillRect};
    cmd.bounds = rect;
    cmd.color = color;
    record(std::move(cmd));
}

void RecordingSurface::draw_text(const std::string& text, float x, float y,
                                 float font_size, const Color& color) {
    SurfaceCommand cmd{SurfaceCommand::DrawText};
    cmd.bounds = {x, y, 0, 0};
    cmd.text = text;
    cmd.font_size = font_size;
    cmd.color = color;
    record(std::move(cmd));
}

std::size_t RecordingSurface::count(SurfaceCommand::Type type) const {
    return static_cast<std::size_t>(std::count_if(commands_.begin(), commands_.end(),
        [type](const SurfaceCommand& c) { return c.type == type; }));
}

std::unique_ptr<GraphicsSurface> RecordingSurfaceFactory::create(int width, int height) {
    auto surface = std::make_unique<RecordingSurface>(width, height);
    created_.push_back(surface.get());
    return surface;
}

} // namespace stratum::paint
