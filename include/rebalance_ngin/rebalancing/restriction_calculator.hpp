// include/rebalance_ngin/rebalancing/restriction_calculator.hpp
#pragma once

#include "rebalance_ngin/core/error.hpp"
#include "rebalance_ngin/portfolio/asset_tree.hpp"

namespace rebalance_ngin {

/**
 * @brief Computes feasible value bounds for every node of a tree
 *
 * Leaves: min_value is the current value when selling is restricted, zero
 * otherwise; max_value is the current value when buying is restricted,
 * unbounded otherwise. Groups aggregate their children: min is the sum of
 * children minimums, max is the sum of children maximums if all are bounded.
 */
class RestrictionCalculator {
public:
    /**
     * @brief Compute bounds bottom-up for the whole tree
     * @param tree Tree to annotate in place
     * @return CONFIGURATION_ERROR if any node ends up with min_value > max_value
     */
    Result<void> calculate(AssetTree& tree) const;

private:
    void calculate_node(AssetTree& tree, NodeId id) const;
};

}  // namespace rebalance_ngin
