#pragma once
#include <stratum/core/config.h>
#include <stratum/core/diagnostics.h>
#include <stratum/geom/matrix.h>
#include <stratum/geom/rect.h>
#include <stratum/paint/graphics_surface.h>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace stratum::render {

class ElementRenderer;

// Node of the stacking context tree. A layer is created by, and paints,
// exactly one element renderer together with the descendants that do not
// have a layer of their own. Child layers are kept in three partitions by
// z-index and painted negative, own content, zero/auto, positive.
//
// Layers are owned by their element renderer; the partitions only hold
// non-owning handles.
class LayerRenderer {
public:
    explicit LayerRenderer(ElementRenderer& root_element_renderer);
    ~LayerRenderer();

    LayerRenderer(const LayerRenderer&) = delete;
    LayerRenderer& operator=(const LayerRenderer&) = delete;

    ElementRenderer& root_element_renderer() const { return root_element_renderer_; }
    LayerRenderer* parent() const { return parent_; }

    const std::vector<LayerRenderer*>& negative_z_index_children() const { return negative_children_; }
    const std::vector<LayerRenderer*>& zero_or_auto_z_index_children() const { return zero_or_auto_children_; }
    const std::vector<LayerRenderer*>& positive_z_index_children() const { return positive_children_; }

    // Visits child layers in paint order.
    template<typename Fn>
    void for_each_child(Fn&& fn) const {
        for (auto* child : negative_children_) fn(*child);
        for (auto* child : zero_or_auto_children_) fn(*child);
        for (auto* child : positive_children_) fn(*child);
    }

    // Files |child| by the z-index of its root element. On a layer that
    // does not establish a stacking context the call is forwarded to the
    // nearest ancestor that does. Throws core::InvalidStyleValue when the
    // z-index is neither auto nor an integer.
    LayerRenderer& append_child(LayerRenderer& child);
    LayerRenderer& remove_child(LayerRenderer& child);

    // Nearest layer, starting at this one, that establishes a stacking
    // context. Null when none is connected.
    LayerRenderer* nearest_stacking_context();

    void attach();
    void detach();
    void invalidate();

    bool is_attached() const { return !std::holds_alternative<std::monostate>(surface_); }
    bool has_own_graphics_context() const { return std::holds_alternative<OwnedSurface>(surface_); }
    paint::GraphicsSurface* graphics_surface() const;

    bool establishes_new_stacking_context() const;
    bool establishes_new_graphics_context() const;
    bool is_compositing_layer() const;

    // |scroll_offset| is the scroll of the layers above; it is zero for
    // the root layer.
    void render(int viewport_width, int viewport_height, const geom::Point& scroll_offset = {});

    // Every element renderer under |point|, in paint order (topmost last).
    std::vector<ElementRenderer*> get_element_renderers_at_point(
        const geom::Point& point, float scroll_x, float scroll_y) const;
    ElementRenderer* get_top_most_element_renderer_at_point(
        const geom::Point& point, float scroll_x, float scroll_y) const;

    int viewport_width() const { return viewport_width_; }
    int viewport_height() const { return viewport_height_; }

private:
    struct OwnedSurface {
        std::unique_ptr<paint::GraphicsSurface> surface;
        paint::GraphicsSurface* registered_parent = nullptr;
    };
    using SurfaceSlot = std::variant<std::monostate, OwnedSurface, paint::GraphicsSurface*>;

    std::vector<LayerRenderer*>& partition_for(LayerRenderer& child);
    int32_t z_index_of(const LayerRenderer& layer) const;
    void insert_by_z_index(std::vector<LayerRenderer*>& partition, LayerRenderer& child);
    static bool erase_from(std::vector<LayerRenderer*>& partition, LayerRenderer& child);

    bool has_compositing_descendant() const;
    bool has_compositing_sibling() const;
    bool has_lower_z_index(const LayerRenderer& sibling) const;
    void update_graphics_contexts();

    void attach_graphics_context();
    void detach_graphics_context();

    void render_children(const std::vector<LayerRenderer*>& children,
                         int viewport_width, int viewport_height, const geom::Point& scroll_offset);
    geom::Matrix transformation_matrix(const geom::Point& scroll_offset) const;
    // Scroll handed to |child|: fixed layers keep |incoming|, others also
    // move with this layer's root element.
    geom::Point child_scroll_offset(const LayerRenderer& child, const geom::Point& incoming) const;

    void collect_in_layer(ElementRenderer& renderer, const geom::Point& point,
                          float scroll_x, float scroll_y,
                          std::vector<ElementRenderer*>& hits) const;

    // |about| defaults to this layer.
    void emit(core::Severity severity, const std::string& stage, const std::string& message,
              const LayerRenderer* about = nullptr) const;

    ElementRenderer& root_element_renderer_;
    LayerRenderer* parent_ = nullptr;
    std::vector<LayerRenderer*> negative_children_;
    std::vector<LayerRenderer*> zero_or_auto_children_;
    std::vector<LayerRenderer*> positive_children_;

    SurfaceSlot surface_;
    int viewport_width_ = static_cast<int>(core::config::kDefaultViewportWidth);
    int viewport_height_ = static_cast<int>(core::config::kDefaultViewportHeight);
};

} // namespace stratum::render
