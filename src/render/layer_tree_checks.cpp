#include <stratum/render/layer_tree_checks.h>
#include <stratum/render/element_renderer.h>
#include <stratum/render/layer_renderer.h>

#include <functional>
#include <string>
#include <vector>

namespace stratum::render {

namespace {

constexpr const char kSubject[] = "layer-tree";

void visit(const LayerRenderer& layer, const std::function<void(const LayerRenderer&)>& fn) {
    fn(layer);
    layer.for_each_child([&fn](const LayerRenderer& child) {
        visit(child, fn);
    });
}

std::string describe(const LayerRenderer& layer) {
    return "layer(z=" + layer.root_element_renderer().resolved_z_index().to_string() + ")";
}

bool check_partition(const std::vector<LayerRenderer*>& partition, int sign,
                     const char* name, std::string& detail) {
    bool has_previous = false;
    int32_t previous = 0;
    for (const auto* child : partition) {
        style::ZIndex z_index = child->root_element_renderer().resolved_z_index();
        if (!z_index.is_integer()) {
            detail = std::string(name) + " holds " + describe(*child);
            return false;
        }
        int32_t value = z_index.value();
        if ((sign > 0 && value <= 0) || (sign < 0 && value >= 0)) {
            detail = std::string(name) + " holds misfiled " + describe(*child);
            return false;
        }
        if (has_previous && value < previous) {
            detail = std::string(name) + " is out of order at " + describe(*child);
            return false;
        }
        previous = value;
        has_previous = true;
    }
    return true;
}

} // namespace

void add_layer_tree_checks(core::InvariantValidator& validator, const LayerRenderer& root) {
    const LayerRenderer* tree = &root;

    validator.add_check(kSubject, "partition-order", [tree](std::string& detail) {
        bool ok = true;
        visit(*tree, [&](const LayerRenderer& layer) {
            if (!ok) return;
            ok = check_partition(layer.negative_z_index_children(), -1, "negative", detail) &&
                 check_partition(layer.positive_z_index_children(), 1, "positive", detail);
            if (!ok) return;
            for (const auto* child : layer.zero_or_auto_z_index_children()) {
                style::ZIndex z_index = child->root_element_renderer().resolved_z_index();
                if (!z_index.is_auto() && !(z_index.is_integer() && z_index.value() == 0)) {
                    detail = "zero/auto holds misfiled " + describe(*child);
                    ok = false;
                    return;
                }
            }
        });
        return ok;
    });

    validator.add_check(kSubject, "auto-layers-childless", [tree](std::string& detail) {
        bool ok = true;
        visit(*tree, [&](const LayerRenderer& layer) {
            if (!ok || layer.establishes_new_stacking_context()) return;
            bool has_children = false;
            layer.for_each_child([&has_children](const LayerRenderer&) { has_children = true; });
            if (has_children) {
                detail = describe(layer) + " has structural children";
                ok = false;
            }
        });
        return ok;
    });

    validator.add_check(kSubject, "parent-links", [tree](std::string& detail) {
        bool ok = true;
        visit(*tree, [&](const LayerRenderer& layer) {
            layer.for_each_child([&](const LayerRenderer& child) {
                if (ok && child.parent() != &layer) {
                    detail = describe(child) + " has a stale parent link";
                    ok = false;
                }
            });
        });
        return ok;
    });

    validator.add_check(kSubject, "surface-ownership", [tree](std::string& detail) {
        bool ok = true;
        bool live = tree->is_attached();
        visit(*tree, [&](const LayerRenderer& layer) {
            if (!ok) return;
            if (layer.is_attached() != live) {
                detail = describe(layer) + (live ? " is not attached" : " is attached in a dead tree");
                ok = false;
                return;
            }
            if (live && layer.has_own_graphics_context() != layer.establishes_new_graphics_context()) {
                detail = describe(layer) + " has a stale graphics context";
                ok = false;
                return;
            }
            if (live && !layer.has_own_graphics_context() && layer.parent() &&
                layer.graphics_surface() != layer.parent()->graphics_surface()) {
                detail = describe(layer) + " borrows a surface that is not its parent's";
                ok = false;
            }
        });
        return ok;
    });
}

} // namespace stratum::render
