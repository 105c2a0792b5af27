// include/rebalance_ngin/portfolio/asset_tree.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "rebalance_ngin/core/error.hpp"
#include "rebalance_ngin/core/types.hpp"

namespace rebalance_ngin {

/**
 * @brief Index of a node inside an AssetTree arena
 */
using NodeId = size_t;

/**
 * @brief Rebalancing status of a node
 *
 * PENDING -> {BUY_BLOCKED | SELL_BLOCKED | DUST | CORRECTABLE} -> {RESOLVED | UNCORRECTABLE}
 */
enum class NodeStatus {
    PENDING,
    BUY_BLOCKED,
    SELL_BLOCKED,
    DUST,
    CORRECTABLE,
    RESOLVED,
    UNCORRECTABLE
};

std::string node_status_to_string(NodeStatus status);

/**
 * @brief Asset group holding an ordered list of child nodes
 */
struct GroupHolding {
    std::vector<NodeId> children;
};

/**
 * @brief Single tradable instrument position
 */
struct StockHolding {
    std::string symbol;
    Quantity quantity;
    Price price;
};

using Holding = std::variant<GroupHolding, StockHolding>;

/**
 * @brief Node of the asset allocation tree
 */
struct AssetNode {
    std::string name;
    std::optional<NodeId> parent;

    Decimal expected_weight{1};  // Fraction of the parent's target value
    Amount current_value;
    Amount target_value;

    Amount min_value;
    std::optional<Amount> max_value;  // Unbounded when empty

    bool restrict_buying{false};
    bool restrict_selling{false};

    bool buy_blocked{false};
    bool sell_blocked{false};
    bool dust{false};
    bool forced_sale{false};
    NodeStatus status{NodeStatus::PENDING};

    // Sum of children targets minus target_value, groups only
    Amount residual;

    Holding holding;

    bool is_group() const {
        return std::holds_alternative<GroupHolding>(holding);
    }

    /**
     * @brief Target minus current value, positive when buying
     */
    Amount difference() const {
        return target_value - current_value;
    }

    /**
     * @brief Check min_value <= value <= max_value
     */
    bool within_bounds(const Amount& value) const {
        return value >= min_value && (!max_value || value <= *max_value);
    }
};

/**
 * @brief Arena-backed portfolio tree
 *
 * Node 0 is the root group representing the whole portfolio. Nodes refer to
 * each other by index only, so passes can hold several indices of one
 * sibling set while mutating nodes.
 */
class AssetTree {
public:
    static constexpr NodeId ROOT = 0;

    /**
     * @brief Create a tree containing only the root group
     * @param portfolio_name Name of the root node
     */
    explicit AssetTree(std::string portfolio_name = "");

    /**
     * @brief Append a group under an existing group
     * @return Result containing the new node id, INVALID_ARGUMENT if parent is not a group
     */
    Result<NodeId> add_group(NodeId parent, const std::string& name, Decimal weight,
                             bool restrict_buying = false, bool restrict_selling = false);

    /**
     * @brief Append a holding under an existing group
     *
     * The holding's current value (quantity x price) is added to every ancestor.
     */
    Result<NodeId> add_holding(NodeId parent, const std::string& name, Decimal weight,
                               const std::string& symbol, Quantity quantity, Price price,
                               bool restrict_buying = false, bool restrict_selling = false);

    AssetNode& node(NodeId id) {
        return nodes_.at(id);
    }
    const AssetNode& node(NodeId id) const {
        return nodes_.at(id);
    }

    AssetNode& root() {
        return nodes_.front();
    }
    const AssetNode& root() const {
        return nodes_.front();
    }

    /**
     * @brief Children of a group, empty for holdings
     */
    const std::vector<NodeId>& children(NodeId id) const;

    size_t size() const {
        return nodes_.size();
    }

    /**
     * @brief Number of nodes in the subtree rooted at id, id included
     */
    size_t subtree_size(NodeId id) const;

    /**
     * @brief Ancestor names joined with " / ", root excluded unless id is the root
     */
    std::string full_name(NodeId id) const;

    /**
     * @brief Ids of all holdings below id in depth-first order
     */
    std::vector<NodeId> leaves(NodeId id = ROOT) const;

    /**
     * @brief Verify that every group has children whose weights sum to exactly 1
     * @return CONFIGURATION_ERROR naming the first offending group
     */
    Result<void> validate_weights() const;

    /**
     * @brief Set every leaf's current value to its target value and recompute groups
     *
     * Models a portfolio after the planned trades have been executed.
     */
    void apply_targets();

    /**
     * @brief Clear computed state (targets, bounds, flags) from a previous run
     */
    void reset_computed_state();

    /**
     * @brief Serialize the resolved tree for order planning
     */
    nlohmann::json to_json(NodeId id = ROOT) const;

private:
    Result<NodeId> add_node(NodeId parent, AssetNode node);
    void recompute_current_values(NodeId id);

    std::vector<AssetNode> nodes_;
    static const std::vector<NodeId> no_children_;
};

}  // namespace rebalance_ngin
