#include <stratum/render/layer_renderer.h>
#include <stratum/core/errors.h>
#include <stratum/render/element_renderer.h>

#include <algorithm>
#include <cassert>

namespace stratum::render {

LayerRenderer::LayerRenderer(ElementRenderer& root_element_renderer)
    : root_element_renderer_(root_element_renderer) {}

LayerRenderer::~LayerRenderer() {
    assert(parent_ == nullptr && "layer destroyed while still in the layer tree");
    detach();
}

// ---------------------------------------------------------------------------
// Structure
// ---------------------------------------------------------------------------

LayerRenderer* LayerRenderer::nearest_stacking_context() {
    LayerRenderer* layer = this;
    while (layer && !layer->establishes_new_stacking_context()) {
        layer = layer->parent_;
    }
    return layer;
}

LayerRenderer& LayerRenderer::append_child(LayerRenderer& child) {
    LayerRenderer* stacking_context = nearest_stacking_context();
    assert(stacking_context && "no stacking context to insert the layer into");
    if (stacking_context != this) {
        return stacking_context->append_child(child);
    }
    assert(&child != this);
    assert(child.parent_ == nullptr && "layer already has a parent");

    // Choosing the partition may throw; nothing is linked before it.
    std::vector<LayerRenderer*>& partition = partition_for(child);
    if (&partition == &zero_or_auto_children_) {
        partition.push_back(&child);
    } else {
        insert_by_z_index(partition, child);
    }
    child.parent_ = this;

    if (is_attached()) {
        child.attach();
        update_graphics_contexts();
    }
    return child;
}

LayerRenderer& LayerRenderer::remove_child(LayerRenderer& child) {
    LayerRenderer* stacking_context = nearest_stacking_context();
    assert(stacking_context && "no stacking context to remove the layer from");
    if (stacking_context != this) {
        return stacking_context->remove_child(child);
    }

    bool removed = erase_from(zero_or_auto_children_, child) ||
                   erase_from(positive_children_, child) ||
                   erase_from(negative_children_, child);
    assert(removed && "layer is not a child of this layer");
    (void)removed;

    child.detach();
    child.parent_ = nullptr;

    update_graphics_contexts();
    return child;
}

std::vector<LayerRenderer*>& LayerRenderer::partition_for(LayerRenderer& child) {
    style::ZIndex z_index = child.root_element_renderer_.resolved_z_index();
    switch (z_index.kind()) {
        case style::ZIndex::Kind::Auto:
            return zero_or_auto_children_;
        case style::ZIndex::Kind::Integer:
            if (z_index.value() == 0) return zero_or_auto_children_;
            return z_index.value() > 0 ? positive_children_ : negative_children_;
        case style::ZIndex::Kind::Keyword:
            break;
    }
    emit(core::Severity::Error, "append", "z-index '" + z_index.to_string() + "' cannot be ordered", &child);
    throw core::InvalidStyleValue("z-index", z_index.to_string());
}

int32_t LayerRenderer::z_index_of(const LayerRenderer& layer) const {
    style::ZIndex z_index = layer.root_element_renderer_.resolved_z_index();
    switch (z_index.kind()) {
        case style::ZIndex::Kind::Auto:
            return 0;
        case style::ZIndex::Kind::Integer:
            return z_index.value();
        case style::ZIndex::Kind::Keyword:
            break;
    }
    emit(core::Severity::Error, "order", "z-index '" + z_index.to_string() + "' cannot be ordered", &layer);
    throw core::InvalidStyleValue("z-index", z_index.to_string());
}

void LayerRenderer::insert_by_z_index(std::vector<LayerRenderer*>& partition, LayerRenderer& child) {
    // Insert before the first strictly greater value so that equal values
    // keep their insertion order.
    int32_t value = z_index_of(child);
    auto it = std::find_if(partition.begin(), partition.end(),
        [this, value](const LayerRenderer* existing) { return value < z_index_of(*existing); });
    partition.insert(it, &child);
}

bool LayerRenderer::erase_from(std::vector<LayerRenderer*>& partition, LayerRenderer& child) {
    auto it = std::find(partition.begin(), partition.end(), &child);
    if (it == partition.end()) return false;
    partition.erase(it);
    return true;
}

bool LayerRenderer::establishes_new_stacking_context() const {
    return !root_element_renderer_.resolved_z_index().is_auto();
}

bool LayerRenderer::is_compositing_layer() const {
    return root_element_renderer_.is_compositing_layer();
}

// ---------------------------------------------------------------------------
// Graphics contexts
// ---------------------------------------------------------------------------

bool LayerRenderer::establishes_new_graphics_context() const {
    if (parent_ == nullptr) return true;
    if (is_compositing_layer()) return true;
    if (root_element_renderer_.is_transformed()) return true;
    if (has_compositing_descendant()) return true;
    return has_compositing_sibling();
}

bool LayerRenderer::has_compositing_descendant() const {
    bool found = false;
    for_each_child([&found](const LayerRenderer& child) {
        if (found) return;
        found = child.is_compositing_layer() || child.has_compositing_descendant();
    });
    return found;
}

bool LayerRenderer::has_compositing_sibling() const {
    if (!parent_) return false;
    bool found = false;
    parent_->for_each_child([this, &found](const LayerRenderer& sibling) {
        if (found || &sibling == this) return;
        found = sibling.is_compositing_layer() && has_lower_z_index(sibling);
    });
    return found;
}

bool LayerRenderer::has_lower_z_index(const LayerRenderer& /*sibling*/) const {
    // Any compositing sibling forces a separate surface, whatever its
    // order relative to this layer.
    return true;
}

void LayerRenderer::update_graphics_contexts() {
    if (!is_attached()) return;

    // Whether ancestors need a surface depends on their descendants; the
    // highest stale one is rebuilt along with everything below it.
    LayerRenderer* stale = nullptr;
    for (LayerRenderer* layer = this; layer; layer = layer->parent_) {
        if (layer->has_own_graphics_context() != layer->establishes_new_graphics_context()) {
            stale = layer;
        }
    }
    if (stale) {
        stale->invalidate();
        return;
    }

    // Siblings of the changed child depend on it through the compositing
    // sibling rule.
    std::vector<LayerRenderer*> stale_children;
    for_each_child([&stale_children](LayerRenderer& child) {
        if (child.is_attached() &&
            child.has_own_graphics_context() != child.establishes_new_graphics_context()) {
            stale_children.push_back(&child);
        }
    });
    for (auto* child : stale_children) {
        child->invalidate();
    }
}

paint::GraphicsSurface* LayerRenderer::graphics_surface() const {
    if (auto* owned = std::get_if<OwnedSurface>(&surface_)) {
        return owned->surface.get();
    }
    if (auto* borrowed = std::get_if<paint::GraphicsSurface*>(&surface_)) {
        return *borrowed;
    }
    return nullptr;
}

void LayerRenderer::attach() {
    if (!is_attached()) {
        attach_graphics_context();
    }
    if (!is_attached()) return;

    for_each_child([](LayerRenderer& child) {
        child.attach();
    });
}

void LayerRenderer::attach_graphics_context() {
    paint::GraphicsSurface* parent_surface = parent_ ? parent_->graphics_surface() : nullptr;
    if (parent_ && !parent_surface) return;

    if (!establishes_new_graphics_context()) {
        surface_ = parent_surface;
        return;
    }

    paint::SurfaceFactory* factory = root_element_renderer_.surface_factory();
    if (!factory) return;

    if (parent_) {
        viewport_width_ = parent_->viewport_width_;
        viewport_height_ = parent_->viewport_height_;
    }
    OwnedSurface owned;
    owned.surface = factory->create(viewport_width_, viewport_height_);
    owned.registered_parent = parent_surface;
    if (parent_surface) {
        parent_surface->append_child_surface(*owned.surface);
    }
    surface_ = std::move(owned);
    emit(core::Severity::Info, "attach", "created graphics surface " +
         std::to_string(viewport_width_) + "x" + std::to_string(viewport_height_));
}

void LayerRenderer::detach() {
    for_each_child([](LayerRenderer& child) {
        child.detach();
    });
    detach_graphics_context();
}

void LayerRenderer::detach_graphics_context() {
    if (auto* owned = std::get_if<OwnedSurface>(&surface_)) {
        if (owned->registered_parent) {
            owned->registered_parent->remove_child_surface(*owned->surface);
        }
        owned->surface->dispose();
        emit(core::Severity::Info, "detach", "disposed graphics surface");
    }
    surface_ = std::monostate{};
}

void LayerRenderer::invalidate() {
    emit(core::Severity::Info, "invalidate", "rebuilding graphics surfaces");
    detach();
    attach();
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

void LayerRenderer::render(int viewport_width, int viewport_height, const geom::Point& scroll_offset) {
    paint::GraphicsSurface* surface = graphics_surface();
    if (!surface) {
        emit(core::Severity::Warning, "render", "layer is not attached");
        return;
    }
    bool owns_surface = has_own_graphics_context();

    if (viewport_width != viewport_width_ || viewport_height != viewport_height_) {
        if (owns_surface) {
            surface->resize(viewport_width, viewport_height);
        }
        viewport_width_ = viewport_width;
        viewport_height_ = viewport_height;
    }
    if (owns_surface) {
        surface->clear();
    }

    render_children(negative_children_, viewport_width, viewport_height, scroll_offset);

    const ElementRenderer& element = root_element_renderer_;
    bool transparent = element.is_transparent();
    if (transparent) {
        surface->begin_transparency(element.computed_style().opacity);
    }
    element.render(*surface, scroll_offset);
    if (transparent) {
        surface->end_transparency();
    }

    render_children(zero_or_auto_children_, viewport_width, viewport_height, scroll_offset);
    render_children(positive_children_, viewport_width, viewport_height, scroll_offset);

    // Scroll bars always paint on top of the layer content.
    element.render_scroll_bars(*surface, viewport_width, viewport_height, scroll_offset);

    if (owns_surface && element.is_transformed()) {
        surface->transform(transformation_matrix(scroll_offset));
    }
}

void LayerRenderer::render_children(const std::vector<LayerRenderer*>& children,
                                    int viewport_width, int viewport_height,
                                    const geom::Point& scroll_offset) {
    for (auto* child : children) {
        child->render(viewport_width, viewport_height, child_scroll_offset(*child, scroll_offset));
    }
}

geom::Point LayerRenderer::child_scroll_offset(const LayerRenderer& child,
                                               const geom::Point& incoming) const {
    // Fixed boxes do not move with the content they are nested in.
    if (child.root_element_renderer().computed_style().position == style::Position::Fixed) {
        return incoming;
    }
    return {incoming.x + root_element_renderer_.scroll_left(),
            incoming.y + root_element_renderer_.scroll_top()};
}

geom::Matrix LayerRenderer::transformation_matrix(const geom::Point& scroll_offset) const {
    const ElementRenderer& element = root_element_renderer_;
    const auto& style = element.computed_style();
    geom::Rect bounds = element.global_bounds();
    geom::Point relative = element.relative_offset();

    float origin_x = bounds.x - scroll_offset.x + relative.x + bounds.width * style.transform_origin_x;
    float origin_y = bounds.y - scroll_offset.y + relative.y + bounds.height * style.transform_origin_y;
    return geom::Matrix::translation(origin_x, origin_y) * style.transform *
           geom::Matrix::translation(-origin_x, -origin_y);
}

// ---------------------------------------------------------------------------
// Hit testing
// ---------------------------------------------------------------------------

std::vector<ElementRenderer*> LayerRenderer::get_element_renderers_at_point(
        const geom::Point& point, float scroll_x, float scroll_y) const {
    std::vector<ElementRenderer*> hits;
    collect_in_layer(root_element_renderer_, point, scroll_x, scroll_y, hits);

    for_each_child([&](const LayerRenderer& child) {
        geom::Point child_scroll = child_scroll_offset(child, {scroll_x, scroll_y});
        std::vector<ElementRenderer*> child_hits =
            child.get_element_renderers_at_point(point, child_scroll.x, child_scroll.y);
        hits.insert(hits.end(), child_hits.begin(), child_hits.end());
    });

    root_element_renderer_.for_each_scroll_bar([&](ScrollBarRenderer& bar) {
        if (bar.global_bounds().contains(point.x + scroll_x, point.y + scroll_y)) {
            hits.push_back(&bar);
        }
    });
    return hits;
}

ElementRenderer* LayerRenderer::get_top_most_element_renderer_at_point(
        const geom::Point& point, float scroll_x, float scroll_y) const {
    // TODO: walk the layers in reverse paint order and stop at the first
    // hit instead of collecting the whole list.
    std::vector<ElementRenderer*> hits = get_element_renderers_at_point(point, scroll_x, scroll_y);
    if (hits.empty()) return nullptr;
    return hits.back();
}

void LayerRenderer::collect_in_layer(ElementRenderer& renderer, const geom::Point& point,
                                     float scroll_x, float scroll_y,
                                     std::vector<ElementRenderer*>& hits) const {
    if (renderer.global_bounds().contains(point.x + scroll_x, point.y + scroll_y)) {
        hits.push_back(&renderer);
    }

    float child_scroll_x = scroll_x + renderer.scroll_left();
    float child_scroll_y = scroll_y + renderer.scroll_top();
    for (const auto& child : renderer.children()) {
        if (child->has_own_layer()) continue;
        collect_in_layer(*child, point, child_scroll_x, child_scroll_y, hits);
        // Scroll bars sit above the content they scroll, as painted.
        child->for_each_scroll_bar([&](ScrollBarRenderer& bar) {
            if (bar.global_bounds().contains(point.x + child_scroll_x, point.y + child_scroll_y)) {
                hits.push_back(&bar);
            }
        });
    }
}

void LayerRenderer::emit(core::Severity severity, const std::string& stage,
                         const std::string& message, const LayerRenderer* about) const {
    core::DiagnosticEmitter* diagnostics = root_element_renderer_.diagnostics();
    if (!diagnostics) return;
    const LayerRenderer& subject = about ? *about : *this;
    diagnostics->emit(severity, core::config::kLayerModule, stage, message,
        "layer(z=" + subject.root_element_renderer_.resolved_z_index().to_string() + ")");
}

} // namespace stratum::render
