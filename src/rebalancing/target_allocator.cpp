// src/rebalancing/target_allocator.cpp

#include "rebalance_ngin/rebalancing/target_allocator.hpp"
#include <algorithm>
#include "rebalance_ngin/core/logger.hpp"

namespace rebalance_ngin {

namespace {

bool is_adjustable(const AssetNode& node) {
    return !node.buy_blocked && !node.sell_blocked && !node.dust;
}

// Moving this node's target by the balance shrinks its pending trade
bool cancels_pending_trade(const AssetNode& node, const Amount& balance) {
    Amount diff = node.difference();
    return (balance.is_positive() && diff.is_negative()) ||
           (balance.is_negative() && diff.is_positive());
}

}  // namespace

Amount fit_volume(const Amount& diff, const Amount& step, const Amount& min_trade_volume) {
    if (!step.is_positive()) {
        return Amount();
    }

    Amount trade = diff + step;
    if (trade.is_zero() || trade.abs() >= min_trade_volume) {
        return step;
    }

    if (trade.is_positive()) {
        // Crossed over the current value by less than the minimum: stop at the current value
        return diff.is_positive() ? Amount() : -diff;
    }

    // Still selling, but less than the minimum: keep a full minimum sale
    Amount reduced = -min_trade_volume - diff;
    return reduced.is_positive() ? reduced : Amount();
}

TargetAllocator::TargetAllocator(Amount min_trade_volume)
    : min_trade_volume_(std::move(min_trade_volume)) {
    Logger::register_component("TargetAllocator");
}

std::vector<NodeId> TargetAllocator::redistribution_order(const AssetTree& tree,
                                                          const std::vector<NodeId>& children,
                                                          const Amount& balance,
                                                          bool eligible_only) const {
    std::vector<NodeId> order;
    order.reserve(children.size());
    for (NodeId child : children) {
        if (!eligible_only || is_adjustable(tree.node(child))) {
            order.push_back(child);
        }
    }

    std::stable_sort(order.begin(), order.end(), [&tree, &balance](NodeId a, NodeId b) {
        bool cancels_a = cancels_pending_trade(tree.node(a), balance);
        bool cancels_b = cancels_pending_trade(tree.node(b), balance);
        if (cancels_a != cancels_b) {
            return cancels_a;
        }
        return tree.node(a).difference().abs() < tree.node(b).difference().abs();
    });
    return order;
}

Amount TargetAllocator::redistribute(AssetTree& tree, const std::vector<NodeId>& order,
                                     Amount balance) const {
    for (NodeId id : order) {
        if (balance.is_zero() || balance.abs() < min_trade_volume_) {
            break;
        }

        AssetNode& child = tree.node(id);
        if (balance.is_positive()) {
            Amount room = child.max_value ? *child.max_value - child.target_value : balance;
            Amount step = fit_volume(child.difference(), min(balance, room), min_trade_volume_);
            if (step.is_positive()) {
                child.target_value += step;
                balance -= step;
            }
        } else {
            Amount room = child.target_value - child.min_value;
            Amount step = fit_volume(-child.difference(), min(-balance, room), min_trade_volume_);
            if (step.is_positive()) {
                child.target_value -= step;
                balance += step;
            }
        }
    }
    return balance;
}

Amount TargetAllocator::spill_over(AssetTree& tree, const std::vector<NodeId>& order,
                                   Amount balance) const {
    for (NodeId id : order) {
        if (balance.is_zero()) {
            break;
        }

        AssetNode& child = tree.node(id);
        Amount step;
        if (balance.is_positive()) {
            step = child.max_value ? min(balance, *child.max_value - child.target_value) : balance;
        } else {
            step = -min(-balance, child.target_value - child.min_value);
        }

        if (step.is_zero() || step.is_positive() != balance.is_positive()) {
            continue;
        }

        DEBUG("Spilling " << step << " into " << tree.full_name(id));
        child.target_value += step;
        balance -= step;
        if (child.dust && child.target_value != child.current_value) {
            child.dust = false;
        }
    }
    return balance;
}

Result<void> TargetAllocator::allocate(AssetTree& tree, NodeId id,
                                       const Amount& target_total) const {
    AssetNode& node = tree.node(id);
    node.target_value = target_total;
    node.residual = Amount();

    if (!node.is_group()) {
        node.status = NodeStatus::RESOLVED;
        return Result<void>();
    }

    const std::vector<NodeId>& children = tree.children(id);
    Amount balance = target_total;

    // Proportional pass
    for (NodeId child_id : children) {
        AssetNode& child = tree.node(child_id);
        child.buy_blocked = false;
        child.sell_blocked = false;
        child.dust = false;
        child.forced_sale = false;
        child.status = NodeStatus::PENDING;
        child.target_value = target_total * child.expected_weight;
        balance -= child.target_value;
    }

    // Max clamp
    for (NodeId child_id : children) {
        AssetNode& child = tree.node(child_id);
        if (child.max_value && child.target_value > *child.max_value) {
            DEBUG(tree.full_name(child_id) << ": clamped from " << child.target_value
                                           << " to max " << *child.max_value);
            balance += child.target_value - *child.max_value;
            child.target_value = *child.max_value;
            child.buy_blocked = true;
            child.status = NodeStatus::BUY_BLOCKED;
        }
    }

    // Min clamp
    for (NodeId child_id : children) {
        AssetNode& child = tree.node(child_id);
        if (child.target_value < child.min_value) {
            DEBUG(tree.full_name(child_id) << ": clamped from " << child.target_value
                                           << " to min " << child.min_value);
            balance -= child.min_value - child.target_value;
            child.target_value = child.min_value;
            child.sell_blocked = true;
            child.status = NodeStatus::SELL_BLOCKED;
        }
    }

    // Dust
    for (NodeId child_id : children) {
        AssetNode& child = tree.node(child_id);
        if (child.buy_blocked || child.sell_blocked) {
            continue;
        }

        Amount diff = child.difference();
        if (!diff.is_zero() && diff.abs() < min_trade_volume_) {
            DEBUG(tree.full_name(child_id) << ": trade of " << diff << " is dust");
            balance += diff;
            child.target_value = child.current_value;
            child.dust = true;
            child.status = NodeStatus::DUST;
        }
    }

    std::vector<NodeId> order = redistribution_order(tree, children, balance, true);
    for (NodeId child_id : order) {
        tree.node(child_id).status = NodeStatus::CORRECTABLE;
    }

    balance = redistribute(tree, order, balance);

    if (!balance.is_zero()) {
        // Adjustable children first, then the blocked and dust-snapped ones
        std::vector<NodeId> spill_order = order;
        for (NodeId child_id : redistribution_order(tree, children, balance, false)) {
            if (!is_adjustable(tree.node(child_id))) {
                spill_order.push_back(child_id);
            }
        }
        balance = spill_over(tree, spill_order, balance);
    }

    Result<void> outcome;
    if (balance.is_zero()) {
        node.status = NodeStatus::RESOLVED;
    } else {
        node.residual = -balance;
        node.status = NodeStatus::UNCORRECTABLE;
        DEBUG(tree.full_name(id) << ": " << balance << " could not be allocated");
        outcome = make_reconciliation_failure<void>(node.residual.to_string(), tree.full_name(id),
                                                    "TargetAllocator");
    }

    for (NodeId child_id : children) {
        auto result = allocate(tree, child_id, tree.node(child_id).target_value);
        if (result.is_error() && outcome.is_ok()) {
            outcome = std::move(result);
        }
    }

    return outcome;
}

}  // namespace rebalance_ngin
