// include/rebalance_ngin/rebalancing/target_allocator.hpp
#pragma once

#include <vector>
#include "rebalance_ngin/core/error.hpp"
#include "rebalance_ngin/core/types.hpp"
#include "rebalance_ngin/portfolio/asset_tree.hpp"

namespace rebalance_ngin {

/**
 * @brief Clip a trade adjustment so the resulting trade is zero or at least min_trade_volume
 *
 * Works in the direction of the adjustment: diff is the pending trade
 * (target - current) signed so that step moves it upwards.
 *
 * @param diff Pending trade before the adjustment
 * @param step Requested adjustment, non-negative and already capped to what is available
 * @param min_trade_volume Minimum tradable volume
 * @return Largest usable adjustment not exceeding step, possibly zero
 */
Amount fit_volume(const Amount& diff, const Amount& step, const Amount& min_trade_volume);

/**
 * @brief Distributes a target value across a subtree
 *
 * For every group the allocator runs a proportional pass followed by
 * max and min clamping, dust snapping, redistribution of the remaining
 * balance and a spillover pass that ignores the minimum trade volume.
 * Group children are processed recursively with their resolved target
 * as budget. Bounds must have been computed by RestrictionCalculator.
 */
class TargetAllocator {
public:
    explicit TargetAllocator(Amount min_trade_volume);

    /**
     * @brief Set target values for a node and all of its descendants
     * @param tree Tree with computed bounds
     * @param id Node to allocate
     * @param target_total Target value of the node
     * @return RECONCILIATION_FAILURE naming the first group whose children
     *         cannot absorb its target, the tree is fully populated either way
     */
    Result<void> allocate(AssetTree& tree, NodeId id, const Amount& target_total) const;

    const Amount& min_trade_volume() const {
        return min_trade_volume_;
    }

private:
    /**
     * @brief Children eligible for redistribution
     *
     * Children whose pending trade the balance would shrink come first, so a
     * rerun on an already rebalanced portfolio cancels trades instead of
     * opening new ones. Within each class the order is ascending
     * |target - current|, ties keep sibling order.
     */
    std::vector<NodeId> redistribution_order(const AssetTree& tree,
                                             const std::vector<NodeId>& children,
                                             const Amount& balance, bool eligible_only) const;

    Amount redistribute(AssetTree& tree, const std::vector<NodeId>& order, Amount balance) const;
    Amount spill_over(AssetTree& tree, const std::vector<NodeId>& order, Amount balance) const;

    Amount min_trade_volume_;
};

}  // namespace rebalance_ngin
