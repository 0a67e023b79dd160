#pragma once
#include <stratum/core/invariants.h>

namespace stratum::render {

class LayerRenderer;

// Registers the structural invariants of the layer tree rooted at |root|
// with |validator|. The checks read the tree when validate_all() runs, so
// they can be re-run after every mutation.
void add_layer_tree_checks(core::InvariantValidator& validator, const LayerRenderer& root);

} // namespace stratum::render
