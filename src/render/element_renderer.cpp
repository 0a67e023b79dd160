#include <stratum/render/element_renderer.h>
#include <stratum/core/config.h>
#include <stratum/core/errors.h>
#include <stratum/paint/graphics_surface.h>
#include <stratum/render/layer_renderer.h>

#include <algorithm>
#include <cassert>

namespace stratum::render {

namespace {
const style::Color kScrollTrackColor = {221, 221, 221, 255};
const style::Color kScrollThumbColor = {136, 136, 136, 255};

geom::Rect shifted(geom::Rect rect, const geom::Point& scroll_offset) {
    rect.x -= scroll_offset.x;
    rect.y -= scroll_offset.y;
    return rect;
}
} // namespace

ElementRenderer::ElementRenderer(style::ComputedStyle style) : style_(std::move(style)) {}

ElementRenderer::~ElementRenderer() {
    disconnect_layers();
}

ElementRenderer& ElementRenderer::append_child(std::unique_ptr<ElementRenderer> child) {
    assert(child != nullptr);
    assert(child->parent_ == nullptr && "renderer already has a parent");

    ElementRenderer* new_child = child.get();
    // Layers linked while the subtree was standalone are relinked from
    // the new position.
    new_child->disconnect_layers();
    new_child->parent_ = this;
    children_.push_back(std::move(child));

    try {
        new_child->connect_layers();
    } catch (const core::InvalidStyleValue&) {
        new_child->disconnect_layers();
        std::unique_ptr<ElementRenderer> rejected = std::move(children_.back());
        children_.pop_back();
        rejected->parent_ = nullptr;
        throw;
    }
    return *new_child;
}

std::unique_ptr<ElementRenderer> ElementRenderer::remove_child(ElementRenderer& child) {
    auto it = std::find_if(children_.begin(), children_.end(),
        [&child](const std::unique_ptr<ElementRenderer>& c) { return c.get() == &child; });
    assert(it != children_.end() && "renderer is not a child of this renderer");

    child.disconnect_layers();

    std::unique_ptr<ElementRenderer> removed = std::move(*it);
    children_.erase(it);
    removed->parent_ = nullptr;
    return removed;
}

void ElementRenderer::connect_layers() {
    LayerRenderer* parent_layer = parent_ ? parent_->layer_renderer_ : nullptr;

    if (create_own_layer()) {
        if (!own_layer_) {
            own_layer_ = std::make_unique<LayerRenderer>(*this);
        }
        layer_renderer_ = own_layer_.get();
        LayerRenderer* stacking_context =
            parent_layer ? parent_layer->nearest_stacking_context() : nullptr;
        if (stacking_context) {
            stacking_context->append_child(*own_layer_);
        }
    } else {
        own_layer_.reset();
        layer_renderer_ = parent_layer;
    }

    for (auto& child : children_) {
        child->connect_layers();
    }
}

void ElementRenderer::disconnect_layers() {
    // Post-order, so nested layers leave the tree before their ancestors.
    for (auto it = children_.rbegin(); it != children_.rend(); ++it) {
        (*it)->disconnect_layers();
    }
    if (own_layer_ && own_layer_->parent()) {
        own_layer_->parent()->remove_child(*own_layer_);
    }
    layer_renderer_ = own_layer_.get();
}

geom::Rect ElementRenderer::global_bounds() const {
    geom::Rect global = bounds_;
    for (const ElementRenderer* p = parent_; p; p = p->parent_) {
        global.x += p->bounds_.x;
        global.y += p->bounds_.y;
    }
    return global;
}

geom::Point ElementRenderer::relative_offset() const {
    if (style_.position != style::Position::Relative) return {};
    return {style_.left, style_.top};
}

float ElementRenderer::scroll_width() const {
    return scroll_width_ < 0 ? bounds_.width : scroll_width_;
}

float ElementRenderer::scroll_height() const {
    return scroll_height_ < 0 ? bounds_.height : scroll_height_;
}

void ElementRenderer::set_scroll_size(float width, float height) {
    scroll_width_ = width;
    scroll_height_ = height;
}

bool ElementRenderer::create_own_layer() const {
    return is_initial_container() || is_positioned() || is_transparent() ||
           is_transformed() || is_compositing_layer();
}

paint::SurfaceFactory* ElementRenderer::surface_factory() const {
    return parent_ ? parent_->surface_factory() : nullptr;
}

core::DiagnosticEmitter* ElementRenderer::diagnostics() const {
    return parent_ ? parent_->diagnostics() : nullptr;
}

void ElementRenderer::render(paint::GraphicsSurface& surface, const geom::Point& scroll_offset) const {
    render_box(surface, scroll_offset);
    render_children(surface, scroll_offset);
}

void ElementRenderer::render_box(paint::GraphicsSurface& surface, const geom::Point& scroll_offset) const {
    geom::Rect painted = shifted(global_bounds(), scroll_offset);
    if (style_.background_color.a != 0) {
        surface.fill_rect(painted, style_.background_color);
    }
    for (const auto& line_box : line_boxes_) {
        line_box->render(surface, {painted.x, painted.y});
    }
}

void ElementRenderer::render_children(paint::GraphicsSurface& surface,
                                      const geom::Point& scroll_offset) const {
    geom::Point content_offset{scroll_offset.x + scroll_left_, scroll_offset.y + scroll_top_};
    for (const auto& child : children_) {
        // Renderers with their own layer are painted by it, scroll bars
        // included.
        if (child->has_own_layer()) continue;
        child->render(surface, content_offset);
        child->for_each_scroll_bar([&surface, &content_offset](const ScrollBarRenderer& bar) {
            bar.render(surface, content_offset);
        });
    }
}

void ElementRenderer::render_scroll_bars(paint::GraphicsSurface& surface,
                                         int /*viewport_width*/, int /*viewport_height*/,
                                         const geom::Point& scroll_offset) const {
    for_each_scroll_bar([&surface, &scroll_offset](const ScrollBarRenderer& bar) {
        bar.render(surface, scroll_offset);
    });
}

layout::RootLineBox& ElementRenderer::append_line_box(std::unique_ptr<layout::RootLineBox> line_box) {
    assert(line_box != nullptr);
    assert(&line_box->element_renderer() == this && "line box belongs to another renderer");
    line_boxes_.push_back(std::move(line_box));
    return *line_boxes_.back();
}

void ElementRenderer::update_scroll_bars() {
    using style::Overflow;

    bool needs_horizontal = style_.overflow_x == Overflow::Scroll ||
        (style_.overflow_x == Overflow::Auto && scroll_width() > bounds_.width);
    bool needs_vertical = style_.overflow_y == Overflow::Scroll ||
        (style_.overflow_y == Overflow::Auto && scroll_height() > bounds_.height);

    auto sync = [this](std::unique_ptr<ScrollBarRenderer>& bar, bool needed,
                       ScrollBarRenderer::Orientation orientation) {
        if (!needed) {
            bar.reset();
            return;
        }
        if (!bar) {
            bar = std::make_unique<ScrollBarRenderer>(orientation);
            ElementRenderer* base = bar.get();
            base->parent_ = this;
        }
    };
    sync(horizontal_scroll_bar_, needs_horizontal, ScrollBarRenderer::Orientation::Horizontal);
    sync(vertical_scroll_bar_, needs_vertical, ScrollBarRenderer::Orientation::Vertical);

    const float thickness = core::config::kScrollBarThickness;
    if (horizontal_scroll_bar_) {
        horizontal_scroll_bar_->set_bounds({0, bounds_.height - thickness,
            bounds_.width - (needs_vertical ? thickness : 0), thickness});
    }
    if (vertical_scroll_bar_) {
        vertical_scroll_bar_->set_bounds({bounds_.width - thickness, 0,
            thickness, bounds_.height - (needs_horizontal ? thickness : 0)});
    }
}

ScrollBarRenderer::ScrollBarRenderer(Orientation orientation) : orientation_(orientation) {
    style_.background_color = kScrollTrackColor;
}

geom::Rect ScrollBarRenderer::thumb_bounds() const {
    geom::Rect track = global_bounds();
    if (!parent_) return track;

    if (orientation_ == Orientation::Horizontal) {
        float visible = parent_->bounds().width;
        float content = std::max(parent_->scroll_width(), visible);
        if (content <= 0) return track;
        return {track.x + track.width * parent_->scroll_left() / content, track.y,
                track.width * visible / content, track.height};
    }
    float visible = parent_->bounds().height;
    float content = std::max(parent_->scroll_height(), visible);
    if (content <= 0) return track;
    return {track.x, track.y + track.height * parent_->scroll_top() / content,
            track.width, track.height * visible / content};
}

void ScrollBarRenderer::render(paint::GraphicsSurface& surface, const geom::Point& scroll_offset) const {
    surface.fill_rect(shifted(global_bounds(), scroll_offset), style_.background_color);
    surface.fill_rect(shifted(thumb_bounds(), scroll_offset), kScrollThumbColor);
}

} // namespace stratum::render
