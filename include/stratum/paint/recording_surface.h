#pragma once
#include <stratum/paint/graphics_surface.h>
#include <cstddef>
#include <vector>

namespace stratum::paint {

struct SurfaceCommand {
    enum Type {
        Resize, Clear, BeginTransparency, EndTransparency, Transform,
        AppendChildSurface, RemoveChildSurface, Dispose, FillRect, DrawText
    };
    Type type;
    geom::Rect bounds;          // FillRect; DrawText origin in x/y
    Color color;
    std::string text;
    float font_size = 0;
    float opacity = 1.0f;       // BeginTransparency
    geom::Matrix matrix;        // Transform
    int width = 0, height = 0;  // Resize
    const GraphicsSurface* child = nullptr; // Append/RemoveChildSurface
};

// Surface that records every call instead of rasterizing. Child surfaces
// are kept in registration order so the composition order can be checked.
class RecordingSurface : public GraphicsSurface {
public:
    RecordingSurface(int width, int height) : width_(width), height_(height) {}

    void resize(int width, int height) override;
    void clear() override;
    void begin_transparency(float opacity) override;
    void end_transparency() override;
    void transform(const geom::Matrix& matrix) override;
    void append_child_surface(GraphicsSurface& child) override;
    void remove_child_surface(GraphicsSurface& child) override;
    void dispose() override;
    void fill_rect(const geom::Rect& rect, const Color& color) override;
    void draw_text(const std::string& text, float x, float y,
                   float font_size, const Color& color) override;

    int width() const override { return width_; }
    int height() const override { return height_; }

    const std::vector<SurfaceCommand>& commands() const { return commands_; }
    const std::vector<GraphicsSurface*>& child_surfaces() const { return children_; }
    std::size_t count(SurfaceCommand::Type type) const;
    bool disposed() const { return disposed_; }
    int transparency_depth() const { return transparency_depth_; }
    void clear_commands() { commands_.clear(); }

private:
    void record(SurfaceCommand command);

    int width_, height_;
    bool disposed_ = false;
    int transparency_depth_ = 0;
    std::vector<SurfaceCommand> commands_;
    std::vector<GraphicsSurface*> children_;
};

class RecordingSurfaceFactory : public SurfaceFactory {
public:
    std::unique_ptr<GraphicsSurface> create(int width, int height) override;

    std::size_t created_count() const { return created_.size(); }
    // Surfaces handed out so far, in creation order. Only valid while
    // their owning layer keeps them alive.
    const std::vector<RecordingSurface*>& created() const { return created_; }

private:
    std::vector<RecordingSurface*> created_;
};

} // namespace stratum::paint
