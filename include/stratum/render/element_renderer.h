#pragma once
#include <stratum/geom/rect.h>
#include <stratum/layout/line_box.h>
#include <stratum/style/computed_style.h>
#include <memory>
#include <vector>

namespace stratum::core { class DiagnosticEmitter; }
namespace stratum::paint { class GraphicsSurface; class SurfaceFactory; }

namespace stratum::render {

class LayerRenderer;
class ScrollBarRenderer;

// A styled box in the render tree. Renderers own their children and, when
// they establish one, their LayerRenderer. The layer tree only keeps
// non-owning handles, so removing a renderer always unlinks its layers
// first.
class ElementRenderer {
public:
    explicit ElementRenderer(style::ComputedStyle style = {});
    virtual ~ElementRenderer();

    ElementRenderer(const ElementRenderer&) = delete;
    ElementRenderer& operator=(const ElementRenderer&) = delete;

    // Tree manipulation. Appending links the child's layers into the
    // nearest stacking context above it; removing unlinks them.
    ElementRenderer& append_child(std::unique_ptr<ElementRenderer> child);
    std::unique_ptr<ElementRenderer> remove_child(ElementRenderer& child);

    ElementRenderer* parent() const { return parent_; }
    const std::vector<std::unique_ptr<ElementRenderer>>& children() const { return children_; }

    template<typename Fn>
    void for_each_child(Fn&& fn) const {
        for (auto& child : children_) {
            fn(*child);
        }
    }

    const style::ComputedStyle& computed_style() const { return style_; }
    style::ComputedStyle& computed_style() { return style_; }
    virtual style::ZIndex resolved_z_index() const { return style_.resolved_z_index(); }

    // Bounds relative to the parent renderer.
    const geom::Rect& bounds() const { return bounds_; }
    void set_bounds(const geom::Rect& bounds) { bounds_ = bounds; }
    geom::Rect global_bounds() const;
    geom::Point relative_offset() const;

    float scroll_left() const { return scroll_left_; }
    float scroll_top() const { return scroll_top_; }
    void set_scroll_left(float value) { scroll_left_ = value; }
    void set_scroll_top(float value) { scroll_top_ = value; }
    // Size of the scrollable content. Defaults to the bounds.
    float scroll_width() const;
    float scroll_height() const;
    void set_scroll_size(float width, float height);

    bool is_transparent() const { return style_.is_transparent(); }
    bool is_transformed() const { return style_.is_transformed(); }
    bool is_positioned() const { return style_.is_positioned(); }
    virtual bool is_compositing_layer() const { return false; }
    virtual bool is_scroll_bar() const { return false; }
    virtual bool is_initial_container() const { return false; }
    virtual bool create_own_layer() const;

    bool has_own_layer() const { return own_layer_ != nullptr; }
    // The layer this renderer paints into: its own, or an ancestor's.
    LayerRenderer* layer_renderer() const { return layer_renderer_; }

    // Provided by the initial container; null while the renderer is not
    // connected to one.
    virtual paint::SurfaceFactory* surface_factory() const;
    virtual core::DiagnosticEmitter* diagnostics() const;

    // Paints the box and its descendants that paint into the same layer,
    // shifted up and left by |scroll_offset|, the scroll accumulated from
    // the scrolled ancestors. Descendants also move with this box's own
    // scroll position; scroll bars of in-layer descendants are painted
    // above their content.
    virtual void render(paint::GraphicsSurface& surface, const geom::Point& scroll_offset) const;
    virtual void render_scroll_bars(paint::GraphicsSurface& surface,
                                    int viewport_width, int viewport_height,
                                    const geom::Point& scroll_offset) const;

    layout::RootLineBox& append_line_box(std::unique_ptr<layout::RootLineBox> line_box);
    const std::vector<std::unique_ptr<layout::RootLineBox>>& line_boxes() const { return line_boxes_; }
    void clear_line_boxes() { line_boxes_.clear(); }

    // Creates or drops the scroll bars required by overflow-x/overflow-y
    // and lays them out along the right and bottom edges.
    void update_scroll_bars();
    ScrollBarRenderer* horizontal_scroll_bar() const { return horizontal_scroll_bar_.get(); }
    ScrollBarRenderer* vertical_scroll_bar() const { return vertical_scroll_bar_.get(); }

    template<typename Fn>
    void for_each_scroll_bar(Fn&& fn) const;

protected:
    void render_box(paint::GraphicsSurface& surface, const geom::Point& scroll_offset) const;
    void render_children(paint::GraphicsSurface& surface, const geom::Point& scroll_offset) const;

    void connect_layers();
    void disconnect_layers();

    ElementRenderer* parent_ = nullptr;
    std::vector<std::unique_ptr<ElementRenderer>> children_;
    style::ComputedStyle style_;
    geom::Rect bounds_;
    float scroll_left_ = 0;
    float scroll_top_ = 0;
    float scroll_width_ = -1;
    float scroll_height_ = -1;

    std::vector<std::unique_ptr<layout::RootLineBox>> line_boxes_;
    std::unique_ptr<ScrollBarRenderer> horizontal_scroll_bar_;
    std::unique_ptr<ScrollBarRenderer> vertical_scroll_bar_;

    std::unique_ptr<LayerRenderer> own_layer_;
    LayerRenderer* layer_renderer_ = nullptr;
};

// Scroll bar of an element with overflow: scroll or auto. Owned by the
// scrolled element, painted on top of its layer and not part of the child
// list.
class ScrollBarRenderer : public ElementRenderer {
public:
    enum class Orientation { Horizontal, Vertical };

    explicit ScrollBarRenderer(Orientation orientation);

    Orientation orientation() const { return orientation_; }
    bool is_scroll_bar() const override { return true; }
    bool create_own_layer() const override { return false; }

    // Thumb rectangle in global coordinates.
    geom::Rect thumb_bounds() const;

    void render(paint::GraphicsSurface& surface, const geom::Point& scroll_offset) const override;

private:
    Orientation orientation_;
};

template<typename Fn>
void ElementRenderer::for_each_scroll_bar(Fn&& fn) const {
    if (horizontal_scroll_bar_) fn(*horizontal_scroll_bar_);
    if (vertical_scroll_bar_) fn(*vertical_scroll_bar_);
}

} // namespace stratum::render
