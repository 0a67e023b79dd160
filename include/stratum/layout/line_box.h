#pragma once
#include <stratum/geom/rect.h>
#include <memory>
#include <string>
#include <vector>

namespace stratum::paint { class GraphicsSurface; }
namespace stratum::render { class ElementRenderer; }

namespace stratum::layout {

// One box generated by inline layout. Bounds are expressed in the
// coordinate space of the block container that established the inline
// formatting context, so a whole line can be painted with a single offset.
class LineBox {
public:
    explicit LineBox(render::ElementRenderer& element_renderer);
    virtual ~LineBox();

    LineBox(const LineBox&) = delete;
    LineBox& operator=(const LineBox&) = delete;

    render::ElementRenderer& element_renderer() const { return element_renderer_; }

    LineBox* parent() const { return parent_; }
    const std::vector<std::unique_ptr<LineBox>>& children() const { return children_; }
    LineBox& append_child(std::unique_ptr<LineBox> child);
    std::unique_ptr<LineBox> remove_child(LineBox& child);

    const geom::Rect& bounds() const { return bounds_; }
    void set_bounds(const geom::Rect& bounds) { bounds_ = bounds; }

    float leaded_ascent() const { return leaded_ascent_; }
    void set_leaded_ascent(float value) { leaded_ascent_ = value; }
    float leaded_descent() const { return leaded_descent_; }
    void set_leaded_descent(float value) { leaded_descent_ = value; }

    const geom::EdgeSizes& margin() const { return margin_; }
    void set_margin(const geom::EdgeSizes& margin) { margin_ = margin; }
    const geom::EdgeSizes& padding() const { return padding_; }
    void set_padding(const geom::EdgeSizes& padding) { padding_ = padding; }

    // Baseline of this box relative to the parent's, applying the owning
    // element's vertical-align.
    float get_baseline_offset(float parent_baseline_offset, float parent_x_height) const;

    virtual bool is_text() const { return false; }
    virtual bool is_space() const { return false; }
    virtual bool is_static_position() const;
    virtual bool is_absolutely_positioned() const;
    virtual bool establishes_new_formatting_context() const { return false; }

    // |offset| is the global origin of the containing block.
    virtual void render(paint::GraphicsSurface& surface, const geom::Point& offset) const;

protected:
    render::ElementRenderer& element_renderer_;
    LineBox* parent_ = nullptr;
    std::vector<std::unique_ptr<LineBox>> children_;

    geom::Rect bounds_;
    float leaded_ascent_ = 0;
    float leaded_descent_ = 0;
    geom::EdgeSizes margin_;
    geom::EdgeSizes padding_;
};

class TextLineBox : public LineBox {
public:
    TextLineBox(render::ElementRenderer& element_renderer, std::string text);

    const std::string& text() const { return text_; }
    bool is_text() const override { return true; }
    void render(paint::GraphicsSurface& surface, const geom::Point& offset) const override;

private:
    std::string text_;
};

class SpaceLineBox : public LineBox {
public:
    using LineBox::LineBox;
    bool is_space() const override { return true; }
    void render(paint::GraphicsSurface&, const geom::Point&) const override {}
};

// Atomic inline (inline-block, replaced element). The element renderer
// paints its own content; the line box only reserves its place.
class EmbeddedLineBox : public LineBox {
public:
    using LineBox::LineBox;
    bool establishes_new_formatting_context() const override { return true; }
    void render(paint::GraphicsSurface&, const geom::Point&) const override {}
};

// One line of an inline formatting context.
class RootLineBox : public LineBox {
public:
    using LineBox::LineBox;

    // Positions the children vertically around a shared baseline and grows
    // the line to enclose them. Absolutely positioned children are left
    // where they are.
    void align_children(float x_height);
};

} // namespace stratum::layout
