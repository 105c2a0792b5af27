// include/rebalance_ngin/rebalancing/debt_resolver.hpp
#pragma once

#include "rebalance_ngin/core/error.hpp"
#include "rebalance_ngin/core/types.hpp"
#include "rebalance_ngin/portfolio/asset_tree.hpp"

namespace rebalance_ngin {

/**
 * @brief Outcome of shrinking a subtree to a budget
 */
struct DebtResolution {
    enum class Status {
        OK,   // Children fit the budget, up to a surplus smaller than min_trade_volume
        DEBT  // Children could not be brought to the budget
    };

    Status status{Status::OK};
    Amount debt;     // Children total minus budget when status is DEBT, negative for surplus
    Amount surplus;  // Budget left unplaced when status is OK
    NodeId origin{AssetTree::ROOT};  // Deepest group where the debt was detected

    bool is_ok() const {
        return status == Status::OK;
    }
};

/**
 * @brief Shrinks a subtree to a budget below its current value
 *
 * Every group splits its budget in proportion to the child weights, with
 * each child clamped to its [min_value, max_value] bounds; a clamped child
 * hands its excess or shortfall to the unclamped ones. Group children are
 * resolved recursively on their share. Trades smaller than
 * min_trade_volume are dropped, and the value left over by dust and by
 * child groups is then moved onto siblings that can still trade. A
 * shortfall below min_trade_volume is covered by forced minimum sales.
 * Debt that no child can absorb is reported to the caller.
 */
class DebtResolver {
public:
    explicit DebtResolver(Amount min_trade_volume);

    /**
     * @brief Resolve the targets of a group and all of its descendants
     * @param tree Tree with computed bounds
     * @param id Group to resolve
     * @param budget Target value of the group
     * @return Result containing the resolution, INVALID_ARGUMENT for a holding,
     *         UNKNOWN_ERROR if the bounded split does not settle within the pass bound
     */
    Result<DebtResolution> resolve(AssetTree& tree, NodeId id, const Amount& budget) const;

    const Amount& min_trade_volume() const {
        return min_trade_volume_;
    }

private:
    /**
     * @brief Split a budget across children in proportion to weight, within their bounds
     *
     * Clamps are applied one side at a time: when the children below
     * min_value need more than the children above max_value release, the
     * low ones are pinned at min_value, otherwise the high ones are pinned
     * at max_value. Remaining children share what is left.
     */
    Result<void> split_within_bounds(AssetTree& tree, NodeId id, const Amount& budget) const;

    /**
     * @brief Budget share of every free child, rounding remainder to the heaviest
     */
    void assign_fair_targets(AssetTree& tree, const std::vector<NodeId>& free,
                             const Amount& available, const Decimal& free_weight) const;

    /**
     * @brief Move a child's target to absorb part of the balance
     * @param request Budget last passed to a group child, updated on success
     * @return Balance left for the other children
     */
    Result<Amount> shift(AssetTree& tree, NodeId id, Amount& request, DebtResolution& outcome,
                         const Amount& balance) const;

    /**
     * @brief Cancel small buys, then sell min_trade_volume from idle positions
     * @return Remaining balance, positive after an oversell
     */
    Amount force_sell(AssetTree& tree, const std::vector<NodeId>& children,
                      const std::vector<Amount>& shortfalls, Amount balance) const;

    Amount min_trade_volume_;
};

}  // namespace rebalance_ngin
