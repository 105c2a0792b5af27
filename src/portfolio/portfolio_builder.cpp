// src/portfolio/portfolio_builder.cpp

#include "rebalance_ngin/portfolio/portfolio_builder.hpp"
#include <set>
#include <unordered_map>
#include "rebalance_ngin/core/logger.hpp"

namespace rebalance_ngin {

namespace {

using HoldingIndex = std::unordered_map<std::string, const HoldingRecord*>;

Result<void> add_assets(AssetTree& tree, NodeId parent, const std::vector<AssetConfig>& assets,
                        bool restrict_buying, bool restrict_selling, const HoldingIndex& index,
                        std::set<std::string>& assigned) {
    for (const auto& asset : assets) {
        bool buying = asset.restrict_buying.value_or(restrict_buying);
        bool selling = asset.restrict_selling.value_or(restrict_selling);

        if (asset.assets) {
            auto group = tree.add_group(parent, asset.name, asset.weight, buying, selling);
            if (group.is_error()) {
                return forward_error<void>(group);
            }

            auto children = add_assets(tree, group.value(), *asset.assets, buying, selling,
                                       index, assigned);
            if (children.is_error()) {
                return children;
            }
            continue;
        }

        if (!asset.symbol) {
            return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                    asset.name + " has neither a symbol nor assets",
                                    "PortfolioBuilder");
        }

        auto it = index.find(*asset.symbol);
        if (it == index.end()) {
            return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                    "No price for " + *asset.symbol + " (" + asset.name + ")",
                                    "PortfolioBuilder");
        }

        const HoldingRecord& holding = *it->second;
        auto leaf = tree.add_holding(parent, asset.name, asset.weight, holding.symbol,
                                     holding.quantity, holding.price, buying, selling);
        if (leaf.is_error()) {
            return forward_error<void>(leaf);
        }
        assigned.insert(holding.symbol);
    }

    return Result<void>();
}

}  // namespace

Result<AssetTree> PortfolioBuilder::build(const PortfolioConfig& config,
                                          const std::vector<HoldingRecord>& holdings) {
    HoldingIndex index;
    for (const auto& holding : holdings) {
        index[holding.symbol] = &holding;
    }

    AssetTree tree(config.name);
    tree.root().restrict_buying = config.restrict_buying;
    tree.root().restrict_selling = config.restrict_selling;

    std::set<std::string> assigned;
    auto added = add_assets(tree, AssetTree::ROOT, config.assets, config.restrict_buying,
                            config.restrict_selling, index, assigned);
    if (added.is_error()) {
        return forward_error<AssetTree>(added);
    }

    for (const auto& holding : holdings) {
        if (assigned.count(holding.symbol) == 0 && !holding.quantity.is_zero()) {
            return make_error<AssetTree>(ErrorCode::CONFIGURATION_ERROR,
                                         "Holding " + holding.symbol +
                                             " is not assigned to any asset",
                                         "PortfolioBuilder");
        }
    }

    auto weights = tree.validate_weights();
    if (weights.is_error()) {
        return forward_error<AssetTree>(weights);
    }

    DEBUG("Built " << config.name << " with " << tree.size() << " nodes worth "
                   << tree.root().current_value);
    return tree;
}

}  // namespace rebalance_ngin
