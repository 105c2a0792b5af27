// src/rebalancing/rebalancer.cpp

#include "rebalance_ngin/rebalancing/rebalancer.hpp"
#include <stdexcept>
#include "rebalance_ngin/core/logger.hpp"
#include "rebalance_ngin/rebalancing/debt_resolver.hpp"
#include "rebalance_ngin/rebalancing/restriction_calculator.hpp"
#include "rebalance_ngin/rebalancing/target_allocator.hpp"

namespace rebalance_ngin {

nlohmann::json RebalanceConfig::to_json() const {
    nlohmann::json j;
    j["min_trade_volume"] = min_trade_volume.to_string();
    j["min_cash_assets"] = min_cash_assets.to_string();
    j["cash"] = cash.to_string();
    j["target_value"] =
        target_value ? nlohmann::json(target_value->to_string()) : nlohmann::json(nullptr);
    return j;
}

void RebalanceConfig::from_json(const nlohmann::json& j) {
    if (j.contains("min_trade_volume")) {
        min_trade_volume = decimal_from_json(j.at("min_trade_volume"), "min_trade_volume");
    }
    if (j.contains("min_cash_assets")) {
        min_cash_assets = decimal_from_json(j.at("min_cash_assets"), "min_cash_assets");
    }
    if (j.contains("cash")) {
        cash = decimal_from_json(j.at("cash"), "cash");
    }
    if (j.contains("target_value")) {
        if (j.at("target_value").is_null()) {
            target_value.reset();
        } else {
            target_value = decimal_from_json(j.at("target_value"), "target_value");
        }
    }
}

nlohmann::json RebalanceReport::to_json() const {
    nlohmann::json j;
    j["current_total"] = current_total.to_string();
    j["target_total"] = target_total.to_string();
    j["total_buys"] = total_buys.to_string();
    j["total_sells"] = total_sells.to_string();
    j["unallocated"] = unallocated.to_string();
    j["trade_count"] = trade_count;
    return j;
}

Rebalancer::Rebalancer(RebalanceConfig config) : config_(std::move(config)) {
    Logger::register_component("Rebalancer");
}

Result<void> Rebalancer::validate_config() const {
    if (config_.min_trade_volume.is_negative()) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "Minimum trade volume must not be negative", "Rebalancer");
    }
    if (config_.min_cash_assets.is_negative()) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "Minimum cash assets must not be negative", "Rebalancer");
    }
    if (config_.cash.is_negative()) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR, "Cash must not be negative",
                                "Rebalancer");
    }
    return Result<void>();
}

Result<Amount> Rebalancer::target_total(const AssetTree& tree) const {
    Amount total;
    try {
        total = config_.target_value
                    ? *config_.target_value
                    : tree.root().current_value + config_.cash - config_.min_cash_assets;
    } catch (const std::overflow_error&) {
        return make_error<Amount>(ErrorCode::CONVERSION_ERROR,
                                  "Target portfolio value exceeds the decimal range",
                                  "Rebalancer");
    }

    if (total.is_negative()) {
        return make_error<Amount>(ErrorCode::CONFIGURATION_ERROR,
                                  "Target portfolio value is negative: " + total.to_string(),
                                  "Rebalancer");
    }
    return total;
}

RebalanceReport Rebalancer::build_report(const AssetTree& tree) const {
    RebalanceReport report;
    report.current_total = tree.root().current_value;
    report.target_total = tree.root().target_value;

    Amount allocated;
    for (NodeId id : tree.leaves()) {
        const AssetNode& leaf = tree.node(id);
        Amount diff = leaf.difference();
        allocated += leaf.target_value;

        if (diff.is_positive()) {
            report.total_buys += diff;
        } else if (diff.is_negative()) {
            report.total_sells -= diff;
        }
        if (!diff.is_zero()) {
            ++report.trade_count;
        }
    }

    report.unallocated = report.target_total - allocated;
    return report;
}

Result<RebalanceReport> Rebalancer::rebalance(AssetTree& tree) const {
    try {
        return run(tree);
    } catch (const std::overflow_error& e) {
        Logger::register_component("Rebalancer");
        auto error = make_error<RebalanceReport>(
            ErrorCode::CONVERSION_ERROR,
            "Values of " + tree.root().name + " exceed the decimal range: " + e.what(),
            "Rebalancer");
        ERROR(error.error()->to_string());
        return error;
    }
}

Result<RebalanceReport> Rebalancer::run(AssetTree& tree) const {
    auto config_result = validate_config();
    if (config_result.is_error()) {
        ERROR(config_result.error()->to_string());
        return forward_error<RebalanceReport>(config_result);
    }

    tree.reset_computed_state();

    auto weights_result = tree.validate_weights();
    if (weights_result.is_error()) {
        ERROR(weights_result.error()->to_string());
        return forward_error<RebalanceReport>(weights_result);
    }

    auto total_result = target_total(tree);
    if (total_result.is_error()) {
        ERROR(total_result.error()->to_string());
        return forward_error<RebalanceReport>(total_result);
    }
    const Amount total = total_result.value();

    RestrictionCalculator restrictions;
    auto bounds_result = restrictions.calculate(tree);
    if (bounds_result.is_error()) {
        ERROR(bounds_result.error()->to_string());
        return forward_error<RebalanceReport>(bounds_result);
    }

    const Amount current = tree.root().current_value;
    INFO("Rebalancing " << tree.root().name << " from " << current << " to " << total
                        << " with minimum trade volume " << config_.min_trade_volume);

    if (total >= current) {
        TargetAllocator allocator(config_.min_trade_volume);
        auto allocation = allocator.allocate(tree, AssetTree::ROOT, total);
        if (allocation.is_error()) {
            ERROR(allocation.error()->to_string());
            return forward_error<RebalanceReport>(allocation);
        }
    } else {
        DebtResolver resolver(config_.min_trade_volume);
        auto resolution_result = resolver.resolve(tree, AssetTree::ROOT, total);
        if (resolution_result.is_error()) {
            ERROR(resolution_result.error()->to_string());
            return forward_error<RebalanceReport>(resolution_result);
        }

        const DebtResolution& resolution = resolution_result.value();
        if (!resolution.is_ok()) {
            Logger::register_component("Rebalancer");
            auto failure = make_reconciliation_failure<RebalanceReport>(
                resolution.debt.to_string(), tree.full_name(resolution.origin), "Rebalancer");
            ERROR(failure.error()->to_string());
            return failure;
        }
    }

    Logger::register_component("Rebalancer");
    RebalanceReport report = build_report(tree);
    INFO("Rebalanced " << tree.root().name << ": " << report.trade_count << " trades, buys "
                       << report.total_buys << ", sells " << report.total_sells
                       << ", unallocated " << report.unallocated);
    return report;
}

}  // namespace rebalance_ngin
