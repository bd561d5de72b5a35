#include "cca/metrics/hotspot_selector.hpp"
#include "../../fixtures/profiler_text.hpp"

#include <gtest/gtest.h>

namespace cca::metrics
{
    using test::costs;
    using test::line_metric;

    class HotspotSelectorTest : public ::testing::Test {
    protected:
        void SetUp() override {
            lines = {
                line_metric(1, costs(4, 0, 40), 4.0),
                line_metric(2, costs(30, 0, 300), 30.0),
                line_metric(3, costs(6, 0, 60), 6.0),
                line_metric(4, costs(50, 0, 500), 50.0),
                line_metric(5, costs(10, 0, 100), 10.0)
            };
        }

        std::vector<LineMetric> lines;
    };

    TEST_F(HotspotSelectorTest, KeepsLinesAtOrAboveThresholdOrderedByShare) {
        const HotspotSelector selector;
        const auto hotspots = selector.select(lines);

        ASSERT_EQ(hotspots.size(), 4u);
        EXPECT_EQ(hotspots[0].line_number, 4u);
        EXPECT_EQ(hotspots[1].line_number, 2u);
        EXPECT_EQ(hotspots[2].line_number, 5u);
        EXPECT_EQ(hotspots[3].line_number, 3u);
    }

    TEST_F(HotspotSelectorTest, NeverReturnsMoreThanMaxResults) {
        HotspotCriteria criteria;
        criteria.minimum_threshold = 0.0;
        criteria.max_results = 2;

        const auto hotspots = HotspotSelector(criteria).select(lines);

        ASSERT_EQ(hotspots.size(), 2u);
        EXPECT_EQ(hotspots[0].line_number, 4u);
        EXPECT_EQ(hotspots[1].line_number, 2u);
        for (std::size_t i = 1; i < hotspots.size(); ++i) {
            EXPECT_GE(hotspots[i - 1].percent_of_circuit, hotspots[i].percent_of_circuit);
        }
    }

    TEST_F(HotspotSelectorTest, AbsoluteModeComparesRawMetric) {
        HotspotCriteria criteria;
        criteria.metric = MetricKind::Gates;
        criteria.sort_by = HotspotSortKey::Absolute;
        criteria.minimum_threshold = 100.0;

        const auto hotspots = HotspotSelector(criteria).select(lines);

        ASSERT_EQ(hotspots.size(), 3u);
        EXPECT_EQ(hotspots[0].costs.gate_count, 500);
        EXPECT_EQ(hotspots[1].costs.gate_count, 300);
        EXPECT_EQ(hotspots[2].costs.gate_count, 100);
    }

    TEST_F(HotspotSelectorTest, TiesKeepInputOrder) {
        const std::vector<LineMetric> tied = {
            line_metric(7, costs(1, 0, 0), 25.0),
            line_metric(3, costs(1, 0, 0), 25.0),
            line_metric(9, costs(1, 0, 0), 25.0)
        };

        const auto hotspots = HotspotSelector().select(tied);

        ASSERT_EQ(hotspots.size(), 3u);
        EXPECT_EQ(hotspots[0].line_number, 7u);
        EXPECT_EQ(hotspots[1].line_number, 3u);
        EXPECT_EQ(hotspots[2].line_number, 9u);
    }

    TEST_F(HotspotSelectorTest, EmptyInput) {
        EXPECT_TRUE(HotspotSelector().select({}).empty());
    }

    TEST(SelectTopFunctionsTest, OrdersByTotalCostAndTruncates) {
        std::vector<FunctionMetric> functions(4);
        functions[0].name = "a";
        functions[0].total_cost = 5;
        functions[1].name = "b";
        functions[1].total_cost = 50;
        functions[2].name = "c";
        functions[2].total_cost = 20;
        functions[3].name = "d";
        functions[3].total_cost = 50;

        const auto top = select_top_functions(functions, 3);

        ASSERT_EQ(top.size(), 3u);
        EXPECT_EQ(top[0].name, "b");
        EXPECT_EQ(top[1].name, "d");
        EXPECT_EQ(top[2].name, "c");
    }

}  // namespace cca::metrics
