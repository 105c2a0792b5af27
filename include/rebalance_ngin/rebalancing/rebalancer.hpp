// include/rebalance_ngin/rebalancing/rebalancer.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "rebalance_ngin/core/config_base.hpp"
#include "rebalance_ngin/core/error.hpp"
#include "rebalance_ngin/core/types.hpp"
#include "rebalance_ngin/portfolio/asset_tree.hpp"

namespace rebalance_ngin {

/**
 * @brief Parameters of a rebalancing run
 */
struct RebalanceConfig : public ConfigBase {
    Amount min_trade_volume;              // Smallest trade worth placing
    Amount min_cash_assets;               // Cash kept out of the portfolio
    Amount cash;                          // Free cash available for buying
    std::optional<Amount> target_value;   // Overrides current value + cash when set

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Summary of a rebalancing run
 */
struct RebalanceReport {
    Amount current_total;
    Amount target_total;
    Amount total_buys;
    Amount total_sells;
    Amount unallocated;  // Part of the target total left in cash
    size_t trade_count{0};

    nlohmann::json to_json() const;
};

/**
 * @brief Entry point of the rebalancing engine
 *
 * Validates the tree, computes restriction bounds and then either grows
 * the portfolio with TargetAllocator or shrinks it with DebtResolver.
 */
class Rebalancer {
public:
    explicit Rebalancer(RebalanceConfig config);

    /**
     * @brief Compute target values for every node of the tree
     * @param tree Portfolio tree, modified in place
     * @return Result containing the run summary, CONFIGURATION_ERROR for an
     *         invalid tree or parameters, RECONCILIATION_FAILURE when part of
     *         the target cannot be reached (the tree then shows the residuals),
     *         CONVERSION_ERROR when an intermediate value leaves the Decimal range
     */
    Result<RebalanceReport> rebalance(AssetTree& tree) const;

    /**
     * @brief Portfolio value the run aims for
     * @return CONFIGURATION_ERROR when the value would be negative
     */
    Result<Amount> target_total(const AssetTree& tree) const;

    const RebalanceConfig& get_config() const {
        return config_;
    }

private:
    Result<RebalanceReport> run(AssetTree& tree) const;
    Result<void> validate_config() const;
    RebalanceReport build_report(const AssetTree& tree) const;

    RebalanceConfig config_;
};

}  // namespace rebalance_ngin
