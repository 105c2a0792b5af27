// src/rebalancing/restriction_calculator.cpp

#include "rebalance_ngin/rebalancing/restriction_calculator.hpp"
#include "rebalance_ngin/core/logger.hpp"

namespace rebalance_ngin {

Result<void> RestrictionCalculator::calculate(AssetTree& tree) const {
    calculate_node(tree, AssetTree::ROOT);

    for (NodeId id = 0; id < tree.size(); ++id) {
        const AssetNode& node = tree.node(id);
        if (node.max_value && node.min_value > *node.max_value) {
            return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                    "Inconsistent bounds for " + tree.full_name(id) +
                                        ": min " + node.min_value.to_string() + " > max " +
                                        node.max_value->to_string(),
                                    "RestrictionCalculator");
        }
    }

    return Result<void>();
}

void RestrictionCalculator::calculate_node(AssetTree& tree, NodeId id) const {
    if (!tree.node(id).is_group()) {
        AssetNode& leaf = tree.node(id);
        leaf.min_value = leaf.restrict_selling ? leaf.current_value : Amount();
        if (leaf.restrict_buying) {
            leaf.max_value = leaf.current_value;
        } else {
            leaf.max_value.reset();
        }
        return;
    }

    Amount min_value;
    Amount max_value;
    bool bounded = true;

    for (NodeId child : tree.children(id)) {
        calculate_node(tree, child);

        const AssetNode& child_node = tree.node(child);
        min_value += child_node.min_value;
        if (child_node.max_value) {
            max_value += *child_node.max_value;
        } else {
            bounded = false;
        }
    }

    AssetNode& group = tree.node(id);
    group.min_value = min_value;
    if (bounded) {
        group.max_value = max_value;
    } else {
        group.max_value.reset();
    }

    TRACE(tree.full_name(id) << ": min " << group.min_value << ", max "
                             << (group.max_value ? group.max_value->to_string() : "inf"));
}

}  // namespace rebalance_ngin
