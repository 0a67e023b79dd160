#include <stratum/layout/line_box.h>
#include <stratum/paint/graphics_surface.h>
#include <stratum/render/element_renderer.h>

#include <algorithm>
#include <cassert>
#include <limits>

namespace stratum::layout {

LineBox::LineBox(render::ElementRenderer& element_renderer)
    : element_renderer_(element_renderer) {}

LineBox::~LineBox() = default;

LineBox& LineBox::append_child(std::unique_ptr<LineBox> child) {
    assert(child != nullptr);
    assert(child->parent_ == nullptr && "line box already has a parent");
    child->parent_ = this;
    children_.push_back(std::move(child));
    return *children_.back();
}

std::unique_ptr<LineBox> LineBox::remove_child(LineBox& child) {
    auto it = std::find_if(children_.begin(), children_.end(),
        [&child](const std::unique_ptr<LineBox>& c) { return c.get() == &child; });
    assert(it != children_.end() && "line box is not a child of this line box");

    std::unique_ptr<LineBox> removed = std::move(*it);
    children_.erase(it);
    removed->parent_ = nullptr;
    return removed;
}

float LineBox::get_baseline_offset(float parent_baseline_offset, float parent_x_height) const {
    const auto& vertical_align = element_renderer_.computed_style().vertical_align;
    float baseline_offset = parent_baseline_offset + vertical_align.offset;

    // TODO: bottom, text-top, text-bottom, sub and super are laid out as
    // baseline until the line box tracks the parent's font ascent.
    if (vertical_align.is(style::VerticalAlignKeyword::Middle)) {
        baseline_offset -= bounds_.height / 2 - parent_x_height / 2;
    }
    return baseline_offset;
}

bool LineBox::is_static_position() const {
    return element_renderer_.computed_style().position == style::Position::Static;
}

bool LineBox::is_absolutely_positioned() const {
    auto position = element_renderer_.computed_style().position;
    return position == style::Position::Absolute || position == style::Position::Fixed;
}

void LineBox::render(paint::GraphicsSurface& surface, const geom::Point& offset) const {
    for (const auto& child : children_) {
        child->render(surface, offset);
    }
}

TextLineBox::TextLineBox(render::ElementRenderer& element_renderer, std::string text)
    : LineBox(element_renderer), text_(std::move(text)) {}

void TextLineBox::render(paint::GraphicsSurface& surface, const geom::Point& offset) const {
    const auto& style = element_renderer_.computed_style();
    surface.draw_text(text_, offset.x + bounds_.x, offset.y + bounds_.y + leaded_ascent_,
                      style.font_size, style.color);
}

void RootLineBox::align_children(float x_height) {
    float baseline = 0;
    for (const auto& child : children_) {
        if (child->is_absolutely_positioned()) continue;
        baseline = std::max(baseline, child->leaded_ascent());
    }

    float top = std::numeric_limits<float>::max();
    float bottom = std::numeric_limits<float>::lowest();
    for (auto& child : children_) {
        if (child->is_absolutely_positioned()) continue;
        float child_baseline = child->get_baseline_offset(baseline, x_height);
        geom::Rect b = child->bounds();
        b.y = child_baseline - child->leaded_ascent();
        child->set_bounds(b);
        top = std::min(top, b.y);
        bottom = std::max(bottom, b.y + child->leaded_ascent() + child->leaded_descent());
    }

    if (top > bottom) {
        // No in-flow children.
        bounds_.height = 0;
        leaded_ascent_ = 0;
        leaded_descent_ = 0;
        return;
    }

    // Shift so the highest child sits on the top edge of the line.
    float shift = bounds_.y - top;
    for (auto& child : children_) {
        if (child->is_absolutely_positioned()) continue;
        geom::Rect b = child->bounds();
        b.y += shift;
        child->set_bounds(b);
    }

    bounds_.height = bottom - top;
    leaded_ascent_ = baseline - top;
    leaded_descent_ = bounds_.height - leaded_ascent_;
}

} // namespace stratum::layout
