#include <gtest/gtest.h>
#include "rebalance_ngin/rebalancing/rebalancer.hpp"
#include "test_utils.hpp"

using namespace rebalance_ngin;
using namespace rebalance_ngin::testing;

class RebalancerTest : public TestBase {
protected:
    RebalanceConfig make_config(const std::string& mtv = "1") {
        RebalanceConfig config;
        config.min_trade_volume = dec(mtv);
        return config;
    }

    // Stocks 60% (VTI 70%, VXUS 30% no buying), Bonds 40% (BND no selling)
    AssetTree build_retirement_tree() {
        AssetTree tree("Retirement");
        NodeId stocks = tree.add_group(AssetTree::ROOT, "Stocks", percent(60)).value();
        EXPECT_TRUE(
            tree.add_holding(stocks, "VTI", percent(70), "VTI", dec("10"), dec("200")).is_ok());
        EXPECT_TRUE(tree.add_holding(stocks, "VXUS", percent(30), "VXUS", dec("20"), dec("50"),
                                     true, false)
                        .is_ok());
        NodeId bonds = tree.add_group(AssetTree::ROOT, "Bonds", percent(40)).value();
        EXPECT_TRUE(tree.add_holding(bonds, "BND", percent(100), "BND", dec("15"), dec("72.5"),
                                     false, true)
                        .is_ok());
        return tree;
    }

    void expect_properties(const AssetTree& tree, const std::string& mtv) {
        expect_conservation(tree);
        expect_within_bounds(tree);
        expect_restrictions_respected(tree);
        expect_trade_granularity(tree, dec(mtv));
    }

    const AssetNode& at(const AssetTree& tree, const std::string& name) {
        return tree.node(find_node(tree, name));
    }
};

TEST_F(RebalancerTest, InitialInvestment) {
    AssetTree tree = build_flat_tree({{"A", 50, "0"}, {"B", 50, "0"}});
    RebalanceConfig config = make_config();
    config.cash = dec("1000");

    auto result = Rebalancer(config).rebalance(tree);
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();

    EXPECT_THAT(at(tree, "A"), HasTarget("500"));
    EXPECT_THAT(at(tree, "B"), HasTarget("500"));

    const RebalanceReport& report = result.value();
    EXPECT_TRUE(report.current_total.is_zero());
    EXPECT_EQ(report.target_total, dec("1000"));
    EXPECT_EQ(report.total_buys, dec("1000"));
    EXPECT_TRUE(report.total_sells.is_zero());
    EXPECT_TRUE(report.unallocated.is_zero());
    EXPECT_EQ(report.trade_count, 2u);
    expect_properties(tree, "1");
}

TEST_F(RebalancerTest, BuyRestriction) {
    AssetTree tree = build_flat_tree({{"A", 50, "300", true, false}, {"B", 50, "0"}});
    RebalanceConfig config = make_config();
    config.target_value = dec("1000");

    auto result = Rebalancer(config).rebalance(tree);
    ASSERT_TRUE(result.is_ok());
    EXPECT_THAT(at(tree, "A"), HasTarget("300"));
    EXPECT_THAT(at(tree, "B"), HasTarget("700"));
    EXPECT_EQ(result.value().trade_count, 1u);
    expect_properties(tree, "1");
}

TEST_F(RebalancerTest, UncorrectableSellRestriction) {
    AssetTree tree = build_flat_tree({{"A", 100, "900", false, true}});
    RebalanceConfig config = make_config();
    config.target_value = dec("400");

    auto result = Rebalancer(config).rebalance(tree);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::RECONCILIATION_FAILURE);

    const auto* failure = dynamic_cast<const ReconciliationFailure*>(result.error());
    ASSERT_NE(failure, nullptr);
    EXPECT_EQ(failure->unresolved_amount(), "500");
    EXPECT_EQ(failure->subtree(), "Portfolio");
    EXPECT_EQ(failure->component(), "Rebalancer");

    EXPECT_THAT(at(tree, "A"), HasTarget("900"));
    EXPECT_THAT(at(tree, "A"), HasNodeStatus(NodeStatus::UNCORRECTABLE));
}

TEST_F(RebalancerTest, FailureNamesInnermostGroup) {
    AssetTree tree("Portfolio");
    NodeId small = tree.add_group(AssetTree::ROOT, "Small", percent(50)).value();
    ASSERT_TRUE(tree.add_holding(small, "X", percent(100), "X", dec("5"), dec("1")).is_ok());
    ASSERT_TRUE(tree.add_holding(AssetTree::ROOT, "H", percent(50), "H", dec("100"), dec("10"),
                                 false, true)
                    .is_ok());

    RebalanceConfig config = make_config("10");
    config.target_value = dec("1004");

    auto result = Rebalancer(config).rebalance(tree);
    ASSERT_TRUE(result.is_error());
    const auto* failure = dynamic_cast<const ReconciliationFailure*>(result.error());
    ASSERT_NE(failure, nullptr);
    EXPECT_EQ(failure->subtree(), "Small");
    EXPECT_EQ(failure->unresolved_amount(), "1");
}

TEST_F(RebalancerTest, FrozenGroupFailureNamesParent) {
    AssetTree tree("Portfolio");
    NodeId frozen = tree.add_group(AssetTree::ROOT, "Frozen", percent(100)).value();
    ASSERT_TRUE(
        tree.add_holding(frozen, "A", percent(100), "A", dec("10"), dec("10"), false, true).is_ok());

    RebalanceConfig config = make_config();
    config.target_value = dec("50");

    auto result = Rebalancer(config).rebalance(tree);
    ASSERT_TRUE(result.is_error());
    const auto* failure = dynamic_cast<const ReconciliationFailure*>(result.error());
    ASSERT_NE(failure, nullptr);
    EXPECT_EQ(failure->subtree(), "Portfolio");
    EXPECT_EQ(failure->unresolved_amount(), "50");
    EXPECT_THAT(tree.node(frozen), HasNodeStatus(NodeStatus::UNCORRECTABLE));
}

TEST_F(RebalancerTest, NestedGroups) {
    AssetTree tree("Portfolio");
    NodeId group = tree.add_group(AssetTree::ROOT, "G", percent(40)).value();
    ASSERT_TRUE(tree.add_holding(group, "G1", percent(50), "G1", dec("0"), dec("1")).is_ok());
    ASSERT_TRUE(tree.add_holding(group, "G2", percent(50), "G2", dec("0"), dec("1")).is_ok());
    ASSERT_TRUE(tree.add_holding(AssetTree::ROOT, "H", percent(60), "H", dec("0"), dec("1")).is_ok());

    RebalanceConfig config = make_config();
    config.cash = dec("1000");

    ASSERT_TRUE(Rebalancer(config).rebalance(tree).is_ok());
    EXPECT_THAT(tree.node(group), HasTarget("400"));
    EXPECT_THAT(at(tree, "G1"), HasTarget("200"));
    EXPECT_THAT(at(tree, "G2"), HasTarget("200"));
    EXPECT_THAT(at(tree, "H"), HasTarget("600"));
    expect_properties(tree, "1");
}

TEST_F(RebalancerTest, DustSnapping) {
    AssetTree tree = build_flat_tree({{"A", 50, "499.7"}, {"B", 50, "400.3"}});
    RebalanceConfig config = make_config();
    config.cash = dec("100");

    auto result = Rebalancer(config).rebalance(tree);
    ASSERT_TRUE(result.is_ok());
    EXPECT_THAT(at(tree, "A"), HasTarget("499.7"));
    EXPECT_THAT(at(tree, "B"), HasTarget("500.3"));
    EXPECT_EQ(result.value().trade_count, 1u);
    EXPECT_EQ(result.value().total_buys, dec("100"));
    expect_properties(tree, "1");
}

TEST_F(RebalancerTest, MinimumCashIsKeptOut) {
    AssetTree tree = build_flat_tree({{"A", 50, "600", false, true}, {"B", 50, "400"}});
    RebalanceConfig config = make_config();
    config.min_cash_assets = dec("200");

    auto total = Rebalancer(config).target_total(tree);
    ASSERT_TRUE(total.is_ok());
    EXPECT_EQ(total.value(), dec("800"));

    auto result = Rebalancer(config).rebalance(tree);
    ASSERT_TRUE(result.is_ok());
    EXPECT_THAT(at(tree, "A"), HasTarget("600"));
    EXPECT_THAT(at(tree, "B"), HasTarget("200"));
    EXPECT_EQ(result.value().total_sells, dec("200"));
    EXPECT_TRUE(result.value().total_buys.is_zero());
    expect_properties(tree, "1");
}

TEST_F(RebalancerTest, CashAndRestrictionsOnNestedTree) {
    AssetTree tree = build_retirement_tree();
    RebalanceConfig config = make_config();
    config.cash = dec("1000");

    auto result = Rebalancer(config).rebalance(tree);
    ASSERT_TRUE(result.is_ok());

    EXPECT_EQ(result.value().current_total, dec("4087.5"));
    EXPECT_EQ(result.value().target_total, dec("5087.5"));
    EXPECT_THAT(at(tree, "Stocks"), HasTarget("3052.5"));
    EXPECT_THAT(at(tree, "Bonds"), HasTarget("2035"));
    EXPECT_THAT(at(tree, "VTI"), HasTarget("2136.75"));
    EXPECT_THAT(at(tree, "VXUS"), HasTarget("915.75"));
    EXPECT_THAT(at(tree, "BND"), HasTarget("2035"));
    expect_properties(tree, "1");
}

TEST_F(RebalancerTest, RebalancingIsIdempotent) {
    AssetTree tree = build_retirement_tree();
    RebalanceConfig config = make_config();
    config.cash = dec("1000");
    ASSERT_TRUE(Rebalancer(config).rebalance(tree).is_ok());

    tree.apply_targets();

    auto result = Rebalancer(make_config()).rebalance(tree);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().trade_count, 0u);
    for (NodeId id : tree.leaves()) {
        EXPECT_EQ(tree.node(id).target_value, tree.node(id).current_value)
            << tree.full_name(id);
    }
}

TEST_F(RebalancerTest, RebalancingWithRestrictionsIsIdempotent) {
    struct Case {
        std::vector<LeafSpec> leaves;
        std::string target;
    };

    const std::vector<Case> cases = {
        // Sell-restricted A takes more than its share from two empty siblings
        {{{"A", 50, "600", false, true}, {"B", 25, "0"}, {"C", 25, "0"}}, "1000"},
        {{{"A", 40, "600", false, true}, {"B", 30, "100"}, {"C", 30, "300"}}, "1000"},
        {{{"A", 50, "300", true, false}, {"B", 50, "0"}}, "1000"},
        {{{"A", 50, "499.7"}, {"B", 50, "400.3"}}, "1000"},
    };

    for (size_t i = 0; i < cases.size(); ++i) {
        SCOPED_TRACE("case " + std::to_string(i));
        AssetTree tree = build_flat_tree(cases[i].leaves);
        RebalanceConfig config = make_config();
        config.target_value = dec(cases[i].target);

        auto first = Rebalancer(config).rebalance(tree);
        ASSERT_TRUE(first.is_ok());
        expect_properties(tree, "1");
        tree.apply_targets();

        auto second = Rebalancer(config).rebalance(tree);
        ASSERT_TRUE(second.is_ok());
        EXPECT_EQ(second.value().trade_count, 0u);
        for (NodeId id : tree.leaves()) {
            EXPECT_EQ(tree.node(id).target_value, tree.node(id).current_value)
                << tree.full_name(id);
        }
    }

    AssetTree tree = build_flat_tree(cases.front().leaves);
    RebalanceConfig config = make_config();
    config.target_value = dec("1000");
    ASSERT_TRUE(Rebalancer(config).rebalance(tree).is_ok());
    EXPECT_THAT(at(tree, "A"), HasTarget("600"));
    EXPECT_THAT(at(tree, "B"), HasTarget("150"));
    EXPECT_THAT(at(tree, "C"), HasTarget("250"));
}

TEST_F(RebalancerTest, DecimalOverflowIsReported) {
    AssetTree tree = build_flat_tree({{"A", 50, "40000000000"}, {"B", 50, "40000000000"}});
    RebalanceConfig config = make_config();
    config.cash = dec("20000000000");

    auto total = Rebalancer(config).target_total(tree);
    ASSERT_TRUE(total.is_error());
    EXPECT_EQ(total.error()->code(), ErrorCode::CONVERSION_ERROR);

    auto result = Rebalancer(config).rebalance(tree);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONVERSION_ERROR);
}

TEST_F(RebalancerTest, InvalidConfiguration) {
    AssetTree tree = build_flat_tree({{"A", 100, "100"}});

    RebalanceConfig negative_volume = make_config("-1");
    auto result = Rebalancer(negative_volume).rebalance(tree);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONFIGURATION_ERROR);

    RebalanceConfig negative_cash = make_config();
    negative_cash.cash = dec("-5");
    EXPECT_TRUE(Rebalancer(negative_cash).rebalance(tree).is_error());

    RebalanceConfig too_much_reserve = make_config();
    too_much_reserve.min_cash_assets = dec("150");
    result = Rebalancer(too_much_reserve).rebalance(tree);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONFIGURATION_ERROR);
}

TEST_F(RebalancerTest, InvalidWeights) {
    AssetTree tree = build_flat_tree({{"A", 50, "100"}, {"B", 40, "100"}});

    auto result = Rebalancer(make_config()).rebalance(tree);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONFIGURATION_ERROR);
}

TEST_F(RebalancerTest, ReportJson) {
    AssetTree tree = build_flat_tree({{"A", 50, "0"}, {"B", 50, "0"}});
    RebalanceConfig config = make_config();
    config.cash = dec("1000");

    auto result = Rebalancer(config).rebalance(tree);
    ASSERT_TRUE(result.is_ok());

    nlohmann::json j = result.value().to_json();
    EXPECT_EQ(j["target_total"], "1000");
    EXPECT_EQ(j["total_buys"], "1000");
    EXPECT_EQ(j["trade_count"], 2);
}
