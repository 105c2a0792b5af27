// src/config/allocation_config.cpp

#include "rebalance_ngin/config/allocation_config.hpp"

#include <cctype>
#include <fstream>

#include "rebalance_ngin/core/config_base.hpp"
#include "rebalance_ngin/core/logger.hpp"

namespace rebalance_ngin {

Result<Decimal> parse_weight(const std::string& text) {
    const std::string invalid = "Invalid weight: " + text;

    if (text.size() < 2 || text.back() != '%' || text.size() > 4) {
        return make_error<Decimal>(ErrorCode::CONFIGURATION_ERROR, invalid, "AllocationConfig");
    }

    int percent = 0;
    for (size_t i = 0; i + 1 < text.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return make_error<Decimal>(ErrorCode::CONFIGURATION_ERROR, invalid,
                                       "AllocationConfig");
        }
        percent = percent * 10 + (text[i] - '0');
    }

    if (percent > 100) {
        return make_error<Decimal>(ErrorCode::CONFIGURATION_ERROR, invalid, "AllocationConfig");
    }

    return Decimal(percent) / Decimal(100);
}

std::string format_weight(const Decimal& weight) {
    return (weight * Decimal(100)).to_string() + "%";
}

nlohmann::json AssetConfig::to_json() const {
    nlohmann::json j;
    j["name"] = name;
    if (symbol)
        j["symbol"] = *symbol;
    j["weight"] = format_weight(weight);
    if (restrict_buying)
        j["restrict_buying"] = *restrict_buying;
    if (restrict_selling)
        j["restrict_selling"] = *restrict_selling;
    if (assets) {
        nlohmann::json children = nlohmann::json::array();
        for (const auto& asset : *assets) {
            children.push_back(asset.to_json());
        }
        j["assets"] = children;
    }
    return j;
}

void AssetConfig::from_json(const nlohmann::json& j) {
    name = j.at("name").get<std::string>();

    auto parsed_weight = parse_weight(j.at("weight").get<std::string>());
    if (parsed_weight.is_error()) {
        throw RebalanceError(ErrorCode::CONFIGURATION_ERROR,
                             std::string(parsed_weight.error()->what()) + " (" + name + ")",
                             "AllocationConfig");
    }
    weight = parsed_weight.value();

    if (j.contains("symbol"))
        symbol = j.at("symbol").get<std::string>();
    if (j.contains("restrict_buying"))
        restrict_buying = j.at("restrict_buying").get<bool>();
    if (j.contains("restrict_selling"))
        restrict_selling = j.at("restrict_selling").get<bool>();

    if (j.contains("assets")) {
        std::vector<AssetConfig> children;
        for (const auto& child_json : j.at("assets")) {
            AssetConfig child;
            child.from_json(child_json);
            children.push_back(std::move(child));
        }
        assets = std::move(children);
    }
}

nlohmann::json PortfolioConfig::to_json() const {
    nlohmann::json j;
    j["name"] = name;
    j["currency"] = currency;
    j["min_trade_volume"] = min_trade_volume.to_string();
    j["min_cash_assets"] = min_cash_assets.to_string();
    j["restrict_buying"] = restrict_buying;
    j["restrict_selling"] = restrict_selling;

    nlohmann::json children = nlohmann::json::array();
    for (const auto& asset : assets) {
        children.push_back(asset.to_json());
    }
    j["assets"] = children;
    return j;
}

void PortfolioConfig::from_json(const nlohmann::json& j) {
    name = j.at("name").get<std::string>();
    if (j.contains("currency"))
        currency = j.at("currency").get<std::string>();
    if (j.contains("min_trade_volume"))
        min_trade_volume = decimal_from_json(j.at("min_trade_volume"), "min_trade_volume");
    if (j.contains("min_cash_assets"))
        min_cash_assets = decimal_from_json(j.at("min_cash_assets"), "min_cash_assets");
    if (j.contains("restrict_buying"))
        restrict_buying = j.at("restrict_buying").get<bool>();
    if (j.contains("restrict_selling"))
        restrict_selling = j.at("restrict_selling").get<bool>();

    assets.clear();
    if (j.contains("assets")) {
        for (const auto& asset_json : j.at("assets")) {
            AssetConfig asset;
            asset.from_json(asset_json);
            assets.push_back(std::move(asset));
        }
    }
}

namespace {

void collect_symbols(const std::vector<AssetConfig>& assets, std::set<std::string>& symbols) {
    for (const auto& asset : assets) {
        if (asset.symbol) {
            symbols.insert(*asset.symbol);
        }
        if (asset.assets) {
            collect_symbols(*asset.assets, symbols);
        }
    }
}

}  // namespace

std::set<std::string> PortfolioConfig::stock_symbols() const {
    std::set<std::string> symbols;
    collect_symbols(assets, symbols);
    return symbols;
}

Result<nlohmann::json> AllocationConfigLoader::load_json_file(
    const std::filesystem::path& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return make_error<nlohmann::json>(ErrorCode::FILE_NOT_FOUND,
                                          "Failed to open allocation config: " +
                                              file_path.string(),
                                          "AllocationConfigLoader");
    }

    try {
        nlohmann::json j;
        file >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<nlohmann::json>(
            ErrorCode::JSON_PARSE_ERROR,
            "Failed to parse JSON file " + file_path.string() + ": " + e.what(),
            "AllocationConfigLoader");
    } catch (const std::exception& e) {
        return make_error<nlohmann::json>(ErrorCode::FILE_IO_ERROR,
                                          "Error reading allocation config " +
                                              file_path.string() + ": " + e.what(),
                                          "AllocationConfigLoader");
    }
}

Result<PortfolioConfig> AllocationConfigLoader::extract_config(const nlohmann::json& j) {
    PortfolioConfig config;
    try {
        config.from_json(j);
    } catch (const RebalanceError& e) {
        return make_error<PortfolioConfig>(e.code(), e.what(), "AllocationConfigLoader");
    } catch (const nlohmann::json::exception& e) {
        return make_error<PortfolioConfig>(ErrorCode::INVALID_DATA,
                                           std::string("Invalid allocation config: ") + e.what(),
                                           "AllocationConfigLoader");
    }

    auto validation = validate(config);
    if (validation.is_error()) {
        return forward_error<PortfolioConfig>(validation);
    }
    return config;
}

Result<PortfolioConfig> AllocationConfigLoader::load(const std::filesystem::path& file_path) {
    auto json_result = load_json_file(file_path);
    if (json_result.is_error()) {
        return forward_error<PortfolioConfig>(json_result);
    }

    auto config = extract_config(json_result.value());
    if (config.is_ok()) {
        INFO("Loaded allocation config " << config.value().name << " from "
                                         << file_path.string());
    }
    return config;
}

Result<void> AllocationConfigLoader::validate_assets(const std::vector<AssetConfig>& assets,
                                                     const std::string& parent,
                                                     std::set<std::string>& symbols) {
    for (const auto& asset : assets) {
        std::string name = parent.empty() ? asset.name : parent + " / " + asset.name;

        if (asset.symbol && asset.assets) {
            return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                    name + " has both a symbol and assets",
                                    "AllocationConfigLoader");
        }

        if (asset.assets) {
            if (asset.assets->empty()) {
                return make_error<void>(ErrorCode::CONFIGURATION_ERROR, name + " has no assets",
                                        "AllocationConfigLoader");
            }
            auto children = validate_assets(*asset.assets, name, symbols);
            if (children.is_error()) {
                return children;
            }
            continue;
        }

        if (!asset.symbol || asset.symbol->empty()) {
            return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                    name + " has neither a symbol nor assets",
                                    "AllocationConfigLoader");
        }

        if (!symbols.insert(*asset.symbol).second) {
            return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                    "Duplicate symbol " + *asset.symbol + " in " + name,
                                    "AllocationConfigLoader");
        }
    }

    return Result<void>();
}

Result<void> AllocationConfigLoader::validate(const PortfolioConfig& config) {
    if (config.name.empty()) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR, "Portfolio name is empty",
                                "AllocationConfigLoader");
    }
    if (config.assets.empty()) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                config.name + " has no assets", "AllocationConfigLoader");
    }
    if (config.min_trade_volume.is_negative() || config.min_cash_assets.is_negative()) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "Trade volume and cash limits must not be negative",
                                "AllocationConfigLoader");
    }

    std::set<std::string> symbols;
    return validate_assets(config.assets, "", symbols);
}

}  // namespace rebalance_ngin
