// include/rebalance_ngin/portfolio/portfolio_builder.hpp
#pragma once

#include <vector>
#include "rebalance_ngin/config/allocation_config.hpp"
#include "rebalance_ngin/core/error.hpp"
#include "rebalance_ngin/data/snapshot_loader.hpp"
#include "rebalance_ngin/portfolio/asset_tree.hpp"

namespace rebalance_ngin {

/**
 * @brief Builds the asset tree of a portfolio from its allocation and a snapshot
 *
 * Restriction flags not set on an asset are inherited from its parent, the
 * portfolio flags being the defaults for top-level assets. Assets missing
 * from the snapshot must still be listed there with a zero quantity so that
 * their price is known.
 */
class PortfolioBuilder {
public:
    /**
     * @brief Join configuration and holdings
     * @param config Validated allocation configuration
     * @param holdings Snapshot positions
     * @return Result containing the tree, CONFIGURATION_ERROR for missing
     *         prices, unassigned holdings or invalid weights
     */
    static Result<AssetTree> build(const PortfolioConfig& config,
                                   const std::vector<HoldingRecord>& holdings);
};

}  // namespace rebalance_ngin
