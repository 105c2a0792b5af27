// include/rebalance_ngin/config/allocation_config.hpp

#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "rebalance_ngin/core/error.hpp"
#include "rebalance_ngin/core/types.hpp"

namespace rebalance_ngin {

/**
 * @brief Parse a weight written as an integer percentage ("40%")
 * @return Result containing the weight as a fraction, CONFIGURATION_ERROR otherwise
 */
Result<Decimal> parse_weight(const std::string& text);

/**
 * @brief Format a fractional weight as a percentage ("40%")
 */
std::string format_weight(const Decimal& weight);

/**
 * @brief One asset of the allocation tree, either a holding or a group
 */
struct AssetConfig {
    std::string name;
    std::optional<std::string> symbol;
    Decimal weight;
    std::optional<bool> restrict_buying;
    std::optional<bool> restrict_selling;
    std::optional<std::vector<AssetConfig>> assets;

    bool is_group() const {
        return assets.has_value();
    }

    nlohmann::json to_json() const;

    /**
     * @throws RebalanceError with CONFIGURATION_ERROR for an invalid weight
     */
    void from_json(const nlohmann::json& j);
};

/**
 * @brief Allocation configuration of a portfolio
 */
struct PortfolioConfig {
    std::string name;
    std::string currency;
    Amount min_trade_volume;
    Amount min_cash_assets;
    bool restrict_buying{false};
    bool restrict_selling{false};
    std::vector<AssetConfig> assets;

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j);

    /**
     * @brief Symbols of every holding in the allocation tree
     */
    std::set<std::string> stock_symbols() const;
};

/**
 * @brief Loads and validates allocation configuration files
 */
class AllocationConfigLoader {
public:
    /**
     * @brief Load an allocation configuration from a JSON file
     * @param file_path Path to the configuration
     * @return Result containing the validated configuration
     */
    static Result<PortfolioConfig> load(const std::filesystem::path& file_path);

    /**
     * @brief Build a configuration from an already parsed document
     */
    static Result<PortfolioConfig> extract_config(const nlohmann::json& j);

    /**
     * @brief Check structural rules of the allocation tree
     *
     * Every holding needs a symbol, every group needs assets, an asset cannot
     * be both, and a symbol may appear only once.
     */
    static Result<void> validate(const PortfolioConfig& config);

private:
    static Result<nlohmann::json> load_json_file(const std::filesystem::path& file_path);
    static Result<void> validate_assets(const std::vector<AssetConfig>& assets,
                                        const std::string& parent,
                                        std::set<std::string>& symbols);
};

}  // namespace rebalance_ngin
