#include <gtest/gtest.h>
#include <random>
#include "rebalance_ngin/rebalancing/debt_resolver.hpp"
#include "rebalance_ngin/rebalancing/restriction_calculator.hpp"
#include "test_utils.hpp"

using namespace rebalance_ngin;
using namespace rebalance_ngin::testing;

class DebtResolverTest : public TestBase {
protected:
    DebtResolution resolve(AssetTree& tree, const std::string& budget, const std::string& mtv = "1") {
        EXPECT_TRUE(RestrictionCalculator().calculate(tree).is_ok());
        DebtResolver resolver(dec(mtv));
        auto result = resolver.resolve(tree, AssetTree::ROOT, dec(budget));
        EXPECT_TRUE(result.is_ok());
        expect_conservation(tree);
        return result.is_ok() ? result.value() : DebtResolution{};
    }

    const AssetNode& at(const AssetTree& tree, const std::string& name) {
        return tree.node(find_node(tree, name));
    }
};

TEST_F(DebtResolverTest, SellRestrictedLeafLeavesDebt) {
    AssetTree tree = build_flat_tree({{"A", 100, "900", false, true}});
    DebtResolution resolution = resolve(tree, "400");

    EXPECT_FALSE(resolution.is_ok());
    EXPECT_EQ(resolution.debt, dec("500"));
    EXPECT_EQ(resolution.origin, AssetTree::ROOT);

    EXPECT_THAT(at(tree, "A"), HasTarget("900"));
    EXPECT_THAT(at(tree, "A"), HasNodeStatus(NodeStatus::UNCORRECTABLE));
    EXPECT_TRUE(at(tree, "A").sell_blocked);
    EXPECT_THAT(tree.root(), HasNodeStatus(NodeStatus::UNCORRECTABLE));
    EXPECT_EQ(tree.root().residual, dec("500"));
}

TEST_F(DebtResolverTest, PinnedChildShiftsSellingToSiblings) {
    AssetTree tree = build_flat_tree({{"A", 50, "600", false, true}, {"B", 50, "400"}});
    DebtResolution resolution = resolve(tree, "800");

    EXPECT_TRUE(resolution.is_ok());
    EXPECT_TRUE(resolution.surplus.is_zero());
    EXPECT_THAT(at(tree, "A"), HasTarget("600"));
    EXPECT_THAT(at(tree, "B"), HasTarget("200"));
    EXPECT_THAT(at(tree, "A"), HasNodeStatus(NodeStatus::RESOLVED));
    EXPECT_THAT(tree.root(), HasNodeStatus(NodeStatus::RESOLVED));
    expect_within_bounds(tree);
    expect_restrictions_respected(tree);
    expect_trade_granularity(tree, dec("1"));
}

TEST_F(DebtResolverTest, DustBuyReleasesBudget) {
    AssetTree tree = build_flat_tree({{"A", 1, "0"}, {"B", 99, "1000"}});
    DebtResolution resolution = resolve(tree, "500", "10");

    EXPECT_TRUE(resolution.is_ok());
    EXPECT_THAT(at(tree, "A"), HasTarget("0"));
    EXPECT_TRUE(at(tree, "A").dust);
    EXPECT_THAT(at(tree, "B"), HasTarget("500"));
    expect_trade_granularity(tree, dec("10"));
}

TEST_F(DebtResolverTest, DustSalesCombineIntoOneTrade) {
    AssetTree tree = build_flat_tree({{"A", 50, "100"}, {"B", 50, "100"}});
    DebtResolution resolution = resolve(tree, "190", "10");

    EXPECT_TRUE(resolution.is_ok());
    EXPECT_TRUE(resolution.surplus.is_zero());

    // Two sales of 5 become one sale of 10 on the first sibling
    EXPECT_THAT(at(tree, "A"), HasTarget("90"));
    EXPECT_FALSE(at(tree, "A").forced_sale);
    EXPECT_FALSE(at(tree, "A").dust);
    EXPECT_THAT(at(tree, "B"), HasTarget("100"));
    EXPECT_TRUE(at(tree, "B").dust);
    expect_trade_granularity(tree, dec("10"));
}

TEST_F(DebtResolverTest, ForcedSaleSurplusBelowMinimumIsAccepted) {
    AssetTree tree = build_flat_tree({{"A", 50, "100"}, {"B", 50, "100"}});
    DebtResolution resolution = resolve(tree, "195", "10");

    EXPECT_TRUE(resolution.is_ok());
    EXPECT_EQ(resolution.surplus, dec("5"));
    EXPECT_EQ(tree.root().residual, dec("-5"));
    EXPECT_THAT(at(tree, "A"), HasTarget("90"));
    EXPECT_TRUE(at(tree, "A").forced_sale);
    EXPECT_THAT(at(tree, "B"), HasTarget("100"));
    EXPECT_FALSE(at(tree, "B").forced_sale);
}

TEST_F(DebtResolverTest, ForcedSaleLargestShortfallFirst) {
    AssetTree tree = build_flat_tree({{"A", 20, "40"}, {"B", 80, "160"}});
    // Fair targets 38.4 and 153.6: shortfalls 1.6 and 6.4
    DebtResolution resolution = resolve(tree, "192", "10");

    EXPECT_TRUE(resolution.is_ok());
    EXPECT_THAT(at(tree, "A"), HasTarget("40"));
    EXPECT_THAT(at(tree, "B"), HasTarget("150"));
    EXPECT_TRUE(at(tree, "B").forced_sale);
    EXPECT_EQ(resolution.surplus, dec("2"));
}

TEST_F(DebtResolverTest, GroupDebtAbsorbedBySibling) {
    AssetTree tree("Portfolio");
    NodeId group = tree.add_group(AssetTree::ROOT, "G", percent(50)).value();
    ASSERT_TRUE(
        tree.add_holding(group, "L1", percent(50), "L1", dec("400"), dec("1"), false, true).is_ok());
    ASSERT_TRUE(tree.add_holding(group, "L2", percent(50), "L2", dec("100"), dec("1")).is_ok());
    ASSERT_TRUE(tree.add_holding(AssetTree::ROOT, "H", percent(50), "H", dec("500"), dec("1")).is_ok());

    DebtResolution resolution = resolve(tree, "600");

    EXPECT_TRUE(resolution.is_ok());
    EXPECT_THAT(tree.node(group), HasTarget("400"));
    EXPECT_TRUE(tree.node(group).residual.is_zero());
    EXPECT_THAT(at(tree, "L1"), HasTarget("400"));
    EXPECT_THAT(at(tree, "L2"), HasTarget("0"));
    EXPECT_THAT(at(tree, "H"), HasTarget("200"));
    expect_restrictions_respected(tree);
}

TEST_F(DebtResolverTest, SellRestrictedGroupLeavesDebtInParent) {
    AssetTree tree("Portfolio");
    NodeId group = tree.add_group(AssetTree::ROOT, "G", percent(100)).value();
    ASSERT_TRUE(
        tree.add_holding(group, "L1", percent(50), "L1", dec("400"), dec("1"), false, true).is_ok());
    ASSERT_TRUE(
        tree.add_holding(group, "L2", percent(50), "L2", dec("100"), dec("1"), false, true).is_ok());

    DebtResolution resolution = resolve(tree, "200");

    // G is held at its minimum before recursion, so the debt appears in the root
    EXPECT_FALSE(resolution.is_ok());
    EXPECT_EQ(resolution.debt, dec("300"));
    EXPECT_EQ(resolution.origin, AssetTree::ROOT);
    EXPECT_THAT(tree.node(group), HasTarget("500"));
    EXPECT_TRUE(tree.node(group).sell_blocked);
    EXPECT_THAT(tree.node(group), HasNodeStatus(NodeStatus::UNCORRECTABLE));
    expect_debt_unabsorbable(tree, dec("1"));
}

TEST_F(DebtResolverTest, GranularityDebtNamesInnermostGroup) {
    AssetTree tree("Portfolio");
    NodeId group = tree.add_group(AssetTree::ROOT, "Small", percent(50)).value();
    ASSERT_TRUE(tree.add_holding(group, "X", percent(100), "X", dec("5"), dec("1")).is_ok());
    ASSERT_TRUE(tree.add_holding(AssetTree::ROOT, "H", percent(50), "H", dec("1000"), dec("1"),
                                 false, true)
                    .is_ok());

    // Small has to sell 1 but only holds 5, below the minimum trade of 10
    DebtResolution resolution = resolve(tree, "1004", "10");

    EXPECT_FALSE(resolution.is_ok());
    EXPECT_EQ(resolution.debt, dec("1"));
    EXPECT_EQ(resolution.origin, group);
    EXPECT_THAT(tree.node(group), HasTarget("5"));
    EXPECT_TRUE(tree.node(group).residual.is_zero());
    EXPECT_THAT(tree.node(group), HasNodeStatus(NodeStatus::UNCORRECTABLE));
    EXPECT_THAT(at(tree, "X"), HasTarget("5"));
    EXPECT_THAT(at(tree, "H"), HasTarget("1000"));
    expect_debt_unabsorbable(tree, dec("10"));
}

TEST_F(DebtResolverTest, DustLeafStaysAvailableForSelling) {
    // A's fair share of 500 is a dust sale, B cannot sell: A has to go to zero
    AssetTree tree = build_flat_tree({{"A", 50, "500.5"}, {"B", 50, "1000", false, true}});
    DebtResolution resolution = resolve(tree, "1000");

    EXPECT_TRUE(resolution.is_ok());
    EXPECT_TRUE(resolution.surplus.is_zero());
    EXPECT_THAT(at(tree, "A"), HasTarget("0"));
    EXPECT_THAT(at(tree, "B"), HasTarget("1000"));
    expect_all_within_bounds(tree);
    expect_restrictions_respected(tree);
    expect_trade_granularity(tree, dec("1"));
}

TEST_F(DebtResolverTest, BuyRestrictedLeafCanStillSell) {
    AssetTree tree = build_flat_tree({{"A", 80, "400", true, false}, {"B", 20, "300", false, true}});
    DebtResolution resolution = resolve(tree, "600");

    // A's fair share of 480 is above its maximum, but B's minimum wins and A sells
    EXPECT_TRUE(resolution.is_ok());
    EXPECT_THAT(at(tree, "A"), HasTarget("300"));
    EXPECT_THAT(at(tree, "B"), HasTarget("300"));
    EXPECT_FALSE(at(tree, "A").buy_blocked);
    EXPECT_TRUE(at(tree, "B").sell_blocked);
    expect_all_within_bounds(tree);
    expect_restrictions_respected(tree);
}

TEST_F(DebtResolverTest, BoundedGroupClampedBeforeRecursion) {
    AssetTree tree("Portfolio");
    NodeId group = tree.add_group(AssetTree::ROOT, "G", percent(50)).value();
    ASSERT_TRUE(
        tree.add_holding(group, "G1", percent(50), "G1", dec("100"), dec("1"), true, false).is_ok());
    ASSERT_TRUE(
        tree.add_holding(group, "G2", percent(50), "G2", dec("50"), dec("1"), true, false).is_ok());
    ASSERT_TRUE(
        tree.add_holding(AssetTree::ROOT, "L", percent(50), "L", dec("1000"), dec("1")).is_ok());

    DebtResolution resolution = resolve(tree, "1000");

    // G cannot grow past 150, L takes the rest of the budget
    EXPECT_TRUE(resolution.is_ok());
    EXPECT_TRUE(resolution.surplus.is_zero());
    EXPECT_THAT(tree.node(group), HasTarget("150"));
    EXPECT_TRUE(tree.node(group).buy_blocked);
    EXPECT_THAT(at(tree, "G1"), HasTarget("100"));
    EXPECT_THAT(at(tree, "G2"), HasTarget("50"));
    EXPECT_THAT(at(tree, "L"), HasTarget("850"));
    expect_all_within_bounds(tree);
    expect_restrictions_respected(tree);
}

TEST_F(DebtResolverTest, GroupSurplusReturnedToParent) {
    AssetTree tree("Portfolio");
    NodeId group = tree.add_group(AssetTree::ROOT, "G", percent(50)).value();
    ASSERT_TRUE(tree.add_holding(group, "X", percent(50), "X", dec("100"), dec("1")).is_ok());
    ASSERT_TRUE(tree.add_holding(group, "Y", percent(50), "Y", dec("100"), dec("1")).is_ok());
    ASSERT_TRUE(
        tree.add_holding(AssetTree::ROOT, "H", percent(50), "H", dec("400"), dec("1")).is_ok());

    DebtResolution resolution = resolve(tree, "395", "10");

    // G oversells 7.5 with a forced sale of X, H sells that much less
    EXPECT_TRUE(resolution.is_ok());
    EXPECT_TRUE(resolution.surplus.is_zero());
    EXPECT_TRUE(tree.root().residual.is_zero());
    EXPECT_THAT(tree.node(group), HasTarget("190"));
    EXPECT_TRUE(tree.node(group).residual.is_zero());
    EXPECT_THAT(at(tree, "X"), HasTarget("90"));
    EXPECT_TRUE(at(tree, "X").forced_sale);
    EXPECT_THAT(at(tree, "Y"), HasTarget("100"));
    EXPECT_THAT(at(tree, "H"), HasTarget("205"));
    expect_trade_granularity(tree, dec("10"));
}

TEST_F(DebtResolverTest, RandomTreesResolveOrExhaustSelling) {
    std::mt19937 rng(20240611);

    for (int round = 0; round < 150; ++round) {
        const AssetTree base = build_random_tree(rng);

        for (const char* mtv : {"0.01", "5", "25"}) {
            for (int tenths : {1, 4, 7, 9}) {
                AssetTree tree = base;
                ASSERT_TRUE(RestrictionCalculator().calculate(tree).is_ok());
                Amount budget = tree.root().current_value * Decimal(tenths) / Decimal(10);

                SCOPED_TRACE("round " + std::to_string(round) + ", budget " +
                             budget.to_string() + ", min trade " + mtv);

                DebtResolver resolver(dec(mtv));
                auto result = resolver.resolve(tree, AssetTree::ROOT, budget);
                ASSERT_TRUE(result.is_ok());

                const DebtResolution& resolution = result.value();
                expect_conservation(tree);
                expect_all_within_bounds(tree);
                expect_restrictions_respected(tree);

                if (resolution.is_ok()) {
                    EXPECT_LT(resolution.surplus, dec(mtv));
                    expect_trade_granularity(tree, dec(mtv));
                } else if (resolution.debt.is_positive()) {
                    expect_debt_unabsorbable(tree, dec(mtv));
                }
            }
        }
    }
}

TEST_F(DebtResolverTest, LeafIsRejected) {
    AssetTree tree = build_flat_tree({{"A", 100, "10"}});
    DebtResolver resolver(dec("1"));

    auto result = resolver.resolve(tree, find_node(tree, "A"), dec("5"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}
