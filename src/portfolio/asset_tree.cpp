// src/portfolio/asset_tree.cpp

#include "rebalance_ngin/portfolio/asset_tree.hpp"
#include <stdexcept>
#include <utility>

namespace rebalance_ngin {

const std::vector<NodeId> AssetTree::no_children_{};

std::string node_status_to_string(NodeStatus status) {
    switch (status) {
        case NodeStatus::PENDING:
            return "PENDING";
        case NodeStatus::BUY_BLOCKED:
            return "BUY_BLOCKED";
        case NodeStatus::SELL_BLOCKED:
            return "SELL_BLOCKED";
        case NodeStatus::DUST:
            return "DUST";
        case NodeStatus::CORRECTABLE:
            return "CORRECTABLE";
        case NodeStatus::RESOLVED:
            return "RESOLVED";
        case NodeStatus::UNCORRECTABLE:
            return "UNCORRECTABLE";
        default:
            return "UNKNOWN";
    }
}

AssetTree::AssetTree(std::string portfolio_name) {
    AssetNode root;
    root.name = std::move(portfolio_name);
    root.holding = GroupHolding{};
    nodes_.push_back(std::move(root));
}

Result<NodeId> AssetTree::add_node(NodeId parent, AssetNode node) {
    if (parent >= nodes_.size()) {
        return make_error<NodeId>(ErrorCode::INVALID_ARGUMENT,
                                  "Unknown parent node " + std::to_string(parent), "AssetTree");
    }

    auto* group = std::get_if<GroupHolding>(&nodes_[parent].holding);
    if (group == nullptr) {
        return make_error<NodeId>(ErrorCode::INVALID_ARGUMENT,
                                  "Cannot add " + node.name + " under holding " +
                                      full_name(parent),
                                  "AssetTree");
    }

    // Ancestor totals are computed before anything is modified
    std::vector<std::pair<NodeId, Amount>> totals;
    try {
        for (std::optional<NodeId> ancestor = parent; ancestor;
             ancestor = nodes_[*ancestor].parent) {
            totals.emplace_back(*ancestor, nodes_[*ancestor].current_value + node.current_value);
        }
    } catch (const std::overflow_error&) {
        return make_error<NodeId>(ErrorCode::CONVERSION_ERROR,
                                  "Adding " + node.name + " overflows the value of " +
                                      full_name(parent),
                                  "AssetTree");
    }

    NodeId id = nodes_.size();
    node.parent = parent;
    group->children.push_back(id);
    nodes_.push_back(std::move(node));

    for (const auto& [ancestor, total] : totals) {
        nodes_[ancestor].current_value = total;
    }

    return id;
}

Result<NodeId> AssetTree::add_group(NodeId parent, const std::string& name, Decimal weight,
                                    bool restrict_buying, bool restrict_selling) {
    AssetNode node;
    node.name = name;
    node.expected_weight = weight;
    node.restrict_buying = restrict_buying;
    node.restrict_selling = restrict_selling;
    node.holding = GroupHolding{};
    return add_node(parent, std::move(node));
}

Result<NodeId> AssetTree::add_holding(NodeId parent, const std::string& name, Decimal weight,
                                      const std::string& symbol, Quantity quantity, Price price,
                                      bool restrict_buying, bool restrict_selling) {
    AssetNode node;
    node.name = name;
    node.expected_weight = weight;
    node.restrict_buying = restrict_buying;
    node.restrict_selling = restrict_selling;
    try {
        node.current_value = quantity * price;
    } catch (const std::overflow_error&) {
        return make_error<NodeId>(ErrorCode::CONVERSION_ERROR,
                                  "Value of " + name + " (" + quantity.to_string() + " x " +
                                      price.to_string() + ") is out of range",
                                  "AssetTree");
    }
    node.holding = StockHolding{symbol, quantity, price};
    return add_node(parent, std::move(node));
}

const std::vector<NodeId>& AssetTree::children(NodeId id) const {
    if (const auto* group = std::get_if<GroupHolding>(&nodes_.at(id).holding)) {
        return group->children;
    }
    return no_children_;
}

size_t AssetTree::subtree_size(NodeId id) const {
    size_t count = 1;
    for (NodeId child : children(id)) {
        count += subtree_size(child);
    }
    return count;
}

std::string AssetTree::full_name(NodeId id) const {
    if (id == ROOT) {
        return root().name;
    }

    std::string name = nodes_.at(id).name;
    for (std::optional<NodeId> ancestor = nodes_[id].parent; ancestor && *ancestor != ROOT;
         ancestor = nodes_[*ancestor].parent) {
        name = nodes_[*ancestor].name + " / " + name;
    }
    return name;
}

std::vector<NodeId> AssetTree::leaves(NodeId id) const {
    std::vector<NodeId> result;
    if (!nodes_.at(id).is_group()) {
        result.push_back(id);
        return result;
    }

    for (NodeId child : children(id)) {
        auto child_leaves = leaves(child);
        result.insert(result.end(), child_leaves.begin(), child_leaves.end());
    }
    return result;
}

Result<void> AssetTree::validate_weights() const {
    for (NodeId id = 0; id < nodes_.size(); ++id) {
        const auto* group = std::get_if<GroupHolding>(&nodes_[id].holding);
        if (group == nullptr) {
            continue;
        }

        if (group->children.empty()) {
            return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                    full_name(id) + " has no assets", "AssetTree");
        }

        Decimal total;
        for (NodeId child : group->children) {
            if (nodes_[child].expected_weight.is_negative()) {
                return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                        "Negative weight for " + full_name(child), "AssetTree");
            }
            total += nodes_[child].expected_weight;
        }

        if (total != Decimal(1)) {
            return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                    "Weights of " + full_name(id) + " sum to " +
                                        (total * Decimal(100)).to_string() + "% instead of 100%",
                                    "AssetTree");
        }
    }

    return Result<void>();
}

void AssetTree::recompute_current_values(NodeId id) {
    auto& node = nodes_[id];
    if (!node.is_group()) {
        return;
    }

    Amount total;
    for (NodeId child : children(id)) {
        recompute_current_values(child);
        total += nodes_[child].current_value;
    }
    nodes_[id].current_value = total;
}

void AssetTree::apply_targets() {
    for (auto& node : nodes_) {
        if (auto* stock = std::get_if<StockHolding>(&node.holding)) {
            node.current_value = node.target_value;
            if (!stock->price.is_zero()) {
                stock->quantity = node.target_value / stock->price;
            }
        }
    }
    recompute_current_values(ROOT);
}

void AssetTree::reset_computed_state() {
    for (auto& node : nodes_) {
        node.target_value = Amount();
        node.min_value = Amount();
        node.max_value.reset();
        node.buy_blocked = false;
        node.sell_blocked = false;
        node.dust = false;
        node.forced_sale = false;
        node.status = NodeStatus::PENDING;
        node.residual = Amount();
    }
}

nlohmann::json AssetTree::to_json(NodeId id) const {
    const AssetNode& node = nodes_.at(id);

    nlohmann::json j;
    j["name"] = node.name;
    j["weight"] = node.expected_weight.to_string();
    j["current_value"] = node.current_value.to_string();
    j["target_value"] = node.target_value.to_string();
    j["min_value"] = node.min_value.to_string();
    j["max_value"] = node.max_value ? nlohmann::json(node.max_value->to_string())
                                    : nlohmann::json(nullptr);
    j["status"] = node_status_to_string(node.status);
    j["buy_blocked"] = node.buy_blocked;
    j["sell_blocked"] = node.sell_blocked;

    std::visit(
        [&](const auto& holding) {
            using T = std::decay_t<decltype(holding)>;
            if constexpr (std::is_same_v<T, StockHolding>) {
                j["symbol"] = holding.symbol;
                j["quantity"] = holding.quantity.to_string();
                j["price"] = holding.price.to_string();
                j["dust"] = node.dust;
                j["forced_sale"] = node.forced_sale;
            } else {
                if (!node.residual.is_zero()) {
                    j["residual"] = node.residual.to_string();
                }
                nlohmann::json children = nlohmann::json::array();
                for (NodeId child : holding.children) {
                    children.push_back(to_json(child));
                }
                j["assets"] = children;
            }
        },
        node.holding);

    return j;
}

}  // namespace rebalance_ngin
