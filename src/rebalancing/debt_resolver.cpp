// src/rebalancing/debt_resolver.cpp

#include "rebalance_ngin/rebalancing/debt_resolver.hpp"
#include <algorithm>
#include <vector>
#include "rebalance_ngin/core/logger.hpp"
#include "rebalance_ngin/rebalancing/target_allocator.hpp"

namespace rebalance_ngin {

namespace {

enum class Pin { NONE, LOW, HIGH };

// Value a group actually holds after being resolved on a budget
Amount settled_value(const Amount& budget, const DebtResolution& resolution) {
    return resolution.is_ok() ? budget - resolution.surplus : budget + resolution.debt;
}

bool cancels_pending_trade(const AssetNode& node, const Amount& balance) {
    Amount diff = node.difference();
    return (balance.is_positive() && diff.is_negative()) ||
           (balance.is_negative() && diff.is_positive());
}

}  // namespace

DebtResolver::DebtResolver(Amount min_trade_volume)
    : min_trade_volume_(std::move(min_trade_volume)) {
    Logger::register_component("DebtResolver");
}

void DebtResolver::assign_fair_targets(AssetTree& tree, const std::vector<NodeId>& free,
                                       const Amount& available,
                                       const Decimal& free_weight) const {
    Amount assigned;
    NodeId heaviest = free.front();

    for (NodeId id : free) {
        AssetNode& child = tree.node(id);
        child.target_value = free_weight.is_positive()
                                 ? available * child.expected_weight / free_weight
                                 : Amount();
        child.status = NodeStatus::CORRECTABLE;
        assigned += child.target_value;

        if (child.expected_weight > tree.node(heaviest).expected_weight) {
            heaviest = id;
        }
    }

    // Zero-weight children take nothing, what they leave goes through the balance
    if (free_weight.is_positive()) {
        tree.node(heaviest).target_value += available - assigned;
    }
}

Result<void> DebtResolver::split_within_bounds(AssetTree& tree, NodeId id,
                                               const Amount& budget) const {
    const std::vector<NodeId>& children = tree.children(id);
    std::vector<Pin> pins(children.size(), Pin::NONE);

    // Every pass but the last pins at least one child
    const size_t pass_bound = tree.subtree_size(id);

    for (size_t pass = 0; pass < pass_bound; ++pass) {
        Amount pinned_total;
        Decimal free_weight;
        std::vector<NodeId> free;

        for (size_t i = 0; i < children.size(); ++i) {
            const AssetNode& child = tree.node(children[i]);
            if (pins[i] != Pin::NONE) {
                pinned_total += child.target_value;
            } else {
                free.push_back(children[i]);
                free_weight += child.expected_weight;
            }
        }

        if (free.empty()) {
            return Result<void>();
        }

        assign_fair_targets(tree, free, max(budget - pinned_total, Amount()), free_weight);

        Amount needed;
        Amount released;
        for (NodeId child_id : free) {
            const AssetNode& child = tree.node(child_id);
            if (child.target_value < child.min_value) {
                needed += child.min_value - child.target_value;
            } else if (child.max_value && child.target_value > *child.max_value) {
                released += child.target_value - *child.max_value;
            }
        }

        if (needed.is_zero() && released.is_zero()) {
            return Result<void>();
        }

        // The side that outweighs the other stays clamped once the free children rebalance
        const bool pin_low = needed >= released;
        const bool pin_high = released >= needed;

        for (size_t i = 0; i < children.size(); ++i) {
            if (pins[i] != Pin::NONE) {
                continue;
            }

            AssetNode& child = tree.node(children[i]);
            if (pin_low && child.target_value < child.min_value) {
                DEBUG(tree.full_name(children[i]) << ": cannot sell down to " << child.target_value
                                                  << ", pinned at " << child.min_value);
                child.target_value = child.min_value;
                child.sell_blocked = true;
                child.status = NodeStatus::SELL_BLOCKED;
                pins[i] = Pin::LOW;
            } else if (pin_high && child.max_value && child.target_value > *child.max_value) {
                DEBUG(tree.full_name(children[i]) << ": cannot buy up to " << child.target_value
                                                  << ", pinned at " << *child.max_value);
                child.target_value = *child.max_value;
                child.buy_blocked = true;
                child.status = NodeStatus::BUY_BLOCKED;
                pins[i] = Pin::HIGH;
            }
        }
    }

    return make_error<void>(ErrorCode::UNKNOWN_ERROR,
                            "No bounded split for " + tree.full_name(id) + " within " +
                                std::to_string(pass_bound) + " passes",
                            "DebtResolver");
}

Result<Amount> DebtResolver::shift(AssetTree& tree, NodeId id, Amount& request,
                                   DebtResolution& outcome, const Amount& balance) const {
    AssetNode& child = tree.node(id);

    if (!child.is_group()) {
        Amount step;
        if (balance.is_positive()) {
            Amount room = child.max_value ? *child.max_value - child.target_value : balance;
            step = fit_volume(child.difference(), min(balance, room), min_trade_volume_);
            child.target_value += step;
        } else {
            Amount room = child.target_value - child.min_value;
            step = -fit_volume(-child.difference(), min(-balance, room), min_trade_volume_);
            child.target_value += step;
        }

        if (step.is_zero()) {
            return balance;
        }

        DEBUG(tree.full_name(id) << ": target moved by " << step << " to " << child.target_value);
        child.dust = child.dust && child.target_value == child.current_value;
        child.sell_blocked = child.sell_blocked && child.target_value == child.min_value;
        child.buy_blocked = child.buy_blocked && child.max_value &&
                            child.target_value == *child.max_value;
        return balance - step;
    }

    Amount goal = max(child.target_value + balance, child.min_value);
    if (child.max_value) {
        goal = min(goal, *child.max_value);
    }
    if (goal == request) {
        return balance;
    }

    const Amount before = child.target_value;
    auto attempt = resolve(tree, id, goal);
    if (attempt.is_error()) {
        return forward_error<Amount>(attempt);
    }

    Amount realized = settled_value(goal, attempt.value());
    Amount remaining = balance - (realized - before);
    bool improved = remaining.abs() < balance.abs() ||
                    (balance.is_negative() && !remaining.is_negative() &&
                     remaining < min_trade_volume_);

    if (improved) {
        DEBUG(tree.full_name(id) << ": budget moved from " << request << " to " << goal);
        child.target_value = realized;
        child.residual = Amount();
        request = goal;
        outcome = attempt.value();
        return remaining;
    }

    // Put the subtree back the way it was resolved before
    auto restored = resolve(tree, id, request);
    if (restored.is_error()) {
        return forward_error<Amount>(restored);
    }
    child.target_value = settled_value(request, restored.value());
    child.residual = Amount();
    return balance;
}

Amount DebtResolver::force_sell(AssetTree& tree, const std::vector<NodeId>& children,
                                const std::vector<Amount>& shortfalls, Amount balance) const {
    for (NodeId id : children) {
        if (!balance.is_negative()) {
            return balance;
        }

        AssetNode& leaf = tree.node(id);
        Amount buy = leaf.difference();
        if (leaf.is_group() || !buy.is_positive() || balance + buy >= min_trade_volume_) {
            continue;
        }

        DEBUG(tree.full_name(id) << ": buy of " << buy << " cancelled");
        leaf.target_value = leaf.current_value;
        balance += buy;
    }

    // Idle positions sell in order of descending shortfall, ties keep sibling order
    std::vector<size_t> order;
    for (size_t i = 0; i < children.size(); ++i) {
        const AssetNode& leaf = tree.node(children[i]);
        if (!leaf.is_group() && leaf.target_value == leaf.current_value) {
            order.push_back(i);
        }
    }
    std::stable_sort(order.begin(), order.end(),
                     [&shortfalls](size_t a, size_t b) { return shortfalls[a] > shortfalls[b]; });

    for (size_t i : order) {
        if (!balance.is_negative()) {
            break;
        }

        AssetNode& leaf = tree.node(children[i]);
        Amount target = leaf.current_value - min_trade_volume_;
        if (target < leaf.min_value) {
            continue;
        }

        DEBUG(tree.full_name(children[i]) << ": forced sale of " << min_trade_volume_);
        leaf.target_value = target;
        leaf.dust = false;
        leaf.forced_sale = true;
        balance += min_trade_volume_;
    }

    return balance;
}

Result<DebtResolution> DebtResolver::resolve(AssetTree& tree, NodeId id,
                                             const Amount& budget) const {
    if (!tree.node(id).is_group()) {
        return make_error<DebtResolution>(ErrorCode::INVALID_ARGUMENT,
                                          tree.full_name(id) + " is not an asset group",
                                          "DebtResolver");
    }

    AssetNode& node = tree.node(id);
    node.target_value = budget;
    node.residual = Amount();

    const std::vector<NodeId>& children = tree.children(id);
    for (NodeId child_id : children) {
        AssetNode& child = tree.node(child_id);
        child.buy_blocked = false;
        child.sell_blocked = false;
        child.dust = false;
        child.forced_sale = false;
        child.status = NodeStatus::PENDING;
    }

    auto split = split_within_bounds(tree, id, budget);
    if (split.is_error()) {
        return forward_error<DebtResolution>(split);
    }

    std::vector<Amount> requests(children.size());
    std::vector<DebtResolution> outcomes(children.size());
    std::vector<Amount> shortfalls(children.size());
    Amount balance = budget;

    for (size_t i = 0; i < children.size(); ++i) {
        NodeId child_id = children[i];
        AssetNode& child = tree.node(child_id);

        if (child.is_group()) {
            requests[i] = child.target_value;
            auto result = resolve(tree, child_id, requests[i]);
            if (result.is_error()) {
                return result;
            }

            outcomes[i] = result.value();
            child.target_value = settled_value(requests[i], outcomes[i]);
            child.residual = Amount();
            if (!outcomes[i].is_ok()) {
                DEBUG(tree.full_name(child_id) << ": debt of " << outcomes[i].debt
                                               << " moved to " << tree.full_name(id));
            }
        } else {
            Amount diff = child.difference();
            if (!diff.is_zero() && diff.abs() < min_trade_volume_) {
                DEBUG(tree.full_name(child_id) << ": trade of " << diff << " is dust, kept at "
                                               << child.current_value);
                if (diff.is_negative()) {
                    shortfalls[i] = -diff;
                }
                child.target_value = child.current_value;
                child.dust = true;
                child.status = NodeStatus::DUST;
            }
        }

        balance -= child.target_value;
    }

    if (!balance.is_zero()) {
        std::vector<size_t> order(children.size());
        for (size_t i = 0; i < order.size(); ++i) {
            order[i] = i;
        }
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            const AssetNode& node_a = tree.node(children[a]);
            const AssetNode& node_b = tree.node(children[b]);
            bool cancels_a = cancels_pending_trade(node_a, balance);
            bool cancels_b = cancels_pending_trade(node_b, balance);
            if (cancels_a != cancels_b) {
                return cancels_a;
            }
            return node_a.difference().abs() < node_b.difference().abs();
        });

        for (size_t i : order) {
            if (balance.is_zero()) {
                break;
            }

            auto shifted = shift(tree, children[i], requests[i], outcomes[i], balance);
            if (shifted.is_error()) {
                return forward_error<DebtResolution>(shifted);
            }
            balance = shifted.value();
        }
    }

    if (balance.is_negative()) {
        balance = force_sell(tree, children, shortfalls, balance);
    }

    Amount debt = -balance;
    DebtResolution resolution;
    node.residual = debt;

    if (debt.is_zero() || (debt.is_negative() && -debt < min_trade_volume_)) {
        resolution.status = DebtResolution::Status::OK;
        resolution.surplus = -debt;
        resolution.origin = id;
        node.status = NodeStatus::RESOLVED;
        for (NodeId child_id : children) {
            tree.node(child_id).status = NodeStatus::RESOLVED;
        }
        return resolution;
    }

    resolution.status = DebtResolution::Status::DEBT;
    resolution.debt = debt;
    resolution.origin = id;
    node.status = NodeStatus::UNCORRECTABLE;

    bool origin_found = false;
    for (size_t i = 0; i < children.size(); ++i) {
        AssetNode& child = tree.node(children[i]);
        bool indebted = child.is_group() && !outcomes[i].is_ok();
        if (indebted && !origin_found) {
            resolution.origin = outcomes[i].origin;
            origin_found = true;
        }

        bool at_limit = debt.is_positive()
                            ? child.target_value == child.min_value
                            : child.max_value && child.target_value == *child.max_value;
        child.status = indebted || at_limit ? NodeStatus::UNCORRECTABLE : NodeStatus::RESOLVED;
    }

    DEBUG(tree.full_name(id) << ": unresolved debt of " << debt);
    return resolution;
}

}  // namespace rebalance_ngin
