#include "cca/metrics/aggregator.hpp"
#include "cca/utils/hash_utils.hpp"
#include "../../fixtures/profiler_text.hpp"

#include <gtest/gtest.h>

#include <cstdint>

namespace cca::metrics
{
    using test::record;

    namespace {

        const char* const TWO_FUNCTION_SOURCE =
            "fn main(x: Field) {\n"
            "    let y = helper(x);\n"
            "    assert(y != 0);\n"
            "}\n"
            "pub fn helper(x: Field) -> Field {\n"
            "    x * x\n"
            "}\n";

    }  // namespace

    class MetricsAggregatorTest : public ::testing::Test {
    protected:
        ReportCache cache;
        MetricsAggregator aggregator{cache};
    };

    TEST_F(MetricsAggregatorTest, HeatIsRelativeToCostliestLine) {
        DomainRecords domains;
        domains.constrained = std::vector<CostRecord>{
            record(1, 1, "a", 10),
            record(2, 1, "b", 40),
            record(3, 1, "c", 0)
        };

        const auto report = aggregator.aggregate(domains, "", "main.nr");
        const auto& lines = report.files.front().lines;

        ASSERT_EQ(lines.size(), 3u);
        EXPECT_DOUBLE_EQ(lines[0].normalized_heat, 0.25);
        EXPECT_DOUBLE_EQ(lines[1].normalized_heat, 1.0);
        EXPECT_DOUBLE_EQ(lines[2].normalized_heat, 0.0);
        for (const auto& line : lines) {
            EXPECT_GE(line.normalized_heat, 0.0);
            EXPECT_LE(line.normalized_heat, 1.0);
        }
    }

    TEST_F(MetricsAggregatorTest, HugeCostsSaturateInsteadOfWrapping) {
        DomainRecords domains;
        domains.constrained = std::vector<CostRecord>{
            record(1, 1, "a", INT64_MAX),
            record(1, 5, "b", INT64_MAX),
            record(2, 1, "c", INT64_MAX)
        };
        domains.gates = std::vector<CostRecord>{record(1, 1, "a", INT64_MAX)};

        const auto report = aggregator.aggregate(domains, "", "main.nr");
        const auto& lines = report.files.front().lines;

        ASSERT_EQ(lines.size(), 2u);
        EXPECT_EQ(lines[0].costs.constrained_ops, INT64_MAX);
        EXPECT_EQ(lines[0].total_cost, INT64_MAX);
        EXPECT_EQ(report.totals.constrained_ops, INT64_MAX);
        EXPECT_EQ(report.total_cost(), INT64_MAX);
        for (const auto& line : lines) {
            EXPECT_GE(line.percent_of_circuit, 0.0);
            EXPECT_LE(line.percent_of_circuit, 100.0);
        }
    }

    TEST_F(MetricsAggregatorTest, LineCostsAddUpToTotals) {
        DomainRecords domains;
        domains.constrained = std::vector<CostRecord>{record(1, 1, "a", 3), record(2, 4, "b", 7)};
        domains.unconstrained = std::vector<CostRecord>{record(2, 4, "b", 11)};
        domains.gates = std::vector<CostRecord>{
            record(1, 1, "a", 100),
            record(5, 2, "c", 50),
            record(9, 1, "d", 25, "dep.nr")
        };

        const auto report = aggregator.aggregate(domains, "", "main.nr");

        CostTriple line_sum;
        double percent_sum = 0.0;
        for (const auto& file : report.files) {
            for (const auto& line : file.lines) {
                line_sum += line.costs;
                percent_sum += line.percent_of_circuit;
                EXPECT_EQ(line.total_cost, line.costs.total());
            }
        }

        EXPECT_EQ(line_sum, report.totals);
        EXPECT_EQ(report.totals.constrained_ops, 10);
        EXPECT_EQ(report.totals.unconstrained_ops, 11);
        EXPECT_EQ(report.totals.gate_count, 175);
        EXPECT_NEAR(percent_sum, 100.0, 1e-9);
    }

    TEST_F(MetricsAggregatorTest, MergesExpressionsReportedBySeveralDomains) {
        DomainRecords domains;
        domains.constrained = std::vector<CostRecord>{record(4, 9, "x * y", 2)};
        domains.gates = std::vector<CostRecord>{record(4, 9, "x * y", 30), record(4, 20, "z", 5)};

        const auto report = aggregator.aggregate(domains, "", "main.nr");
        const LineMetric* line = report.files.front().find_line(4);

        ASSERT_NE(line, nullptr);
        ASSERT_EQ(line->expressions.size(), 2u);

        const auto& merged = line->expressions[0];
        EXPECT_EQ(merged.expression, "x * y");
        EXPECT_EQ(merged.costs.constrained_ops, 2);
        EXPECT_EQ(merged.costs.gate_count, 30);
        ASSERT_EQ(merged.domains.size(), 2u);
        EXPECT_EQ(merged.domains[0], CostDomain::Constrained);
        EXPECT_EQ(merged.domains[1], CostDomain::Gates);

        EXPECT_EQ(line->costs.gate_count, 35);
    }

    TEST_F(MetricsAggregatorTest, AbsentDomainContributesZero) {
        DomainRecords domains;
        domains.gates = std::vector<CostRecord>{record(1, 1, "a", 8)};

        const auto report = aggregator.aggregate(domains, "", "main.nr");

        EXPECT_EQ(report.totals.constrained_ops, 0);
        EXPECT_EQ(report.totals.unconstrained_ops, 0);
        EXPECT_EQ(report.totals.gate_count, 8);
    }

    TEST_F(MetricsAggregatorTest, ZeroCostReportIsValid) {
        const auto report = aggregator.aggregate(DomainRecords{}, "fn main() {}\n", "main.nr");

        ASSERT_EQ(report.files.size(), 1u);
        EXPECT_EQ(report.files.front().file_name, "main.nr");
        EXPECT_TRUE(report.files.front().lines.empty());
        EXPECT_EQ(report.total_cost(), 0);
        EXPECT_TRUE(report.hotspots.empty());
        ASSERT_EQ(report.top_functions.size(), 1u);
        EXPECT_DOUBLE_EQ(report.top_functions[0].percent_of_circuit, 0.0);
    }

    TEST_F(MetricsAggregatorTest, SeparatesFilesAndKeepsAnalysedFileFirst) {
        DomainRecords domains;
        domains.constrained = std::vector<CostRecord>{
            record(3, 1, "dep call", 20, "lib/utils.nr"),
            record(3, 1, "local", 5, "main.nr"),
            record(4, 1, "prefixed", 5, "src/main.nr")
        };

        const auto report = aggregator.aggregate(domains, "", "main.nr");

        ASSERT_EQ(report.files.size(), 2u);
        EXPECT_EQ(report.files[0].file_name, "main.nr");
        EXPECT_EQ(report.files[1].file_name, "lib/utils.nr");

        const LineMetric* local = report.files[0].find_line(3);
        ASSERT_NE(local, nullptr);
        EXPECT_EQ(local->costs.constrained_ops, 5);
        ASSERT_EQ(local->expressions.size(), 1u);
        EXPECT_EQ(local->expressions[0].expression, "local");

        EXPECT_NE(report.files[0].find_line(4), nullptr);
        EXPECT_EQ(report.files[0].totals.constrained_ops, 10);
        EXPECT_EQ(report.files[1].totals.constrained_ops, 20);
        EXPECT_EQ(report.files[1].find_line(3)->file, "lib/utils.nr");
    }

    TEST_F(MetricsAggregatorTest, RollsLinesUpIntoFunctions) {
        DomainRecords domains;
        domains.gates = std::vector<CostRecord>{
            record(2, 13, "helper(x)", 10),
            record(3, 5, "assert(y != 0)", 20),
            record(6, 5, "x * x", 10)
        };

        const auto report = aggregator.aggregate(domains, TWO_FUNCTION_SOURCE, "main.nr");
        const auto& functions = report.files.front().functions;

        ASSERT_EQ(functions.size(), 2u);
        EXPECT_EQ(functions[0].name, "main");
        EXPECT_EQ(functions[0].start_line, 1u);
        EXPECT_EQ(functions[0].end_line, 5u);
        EXPECT_EQ(functions[0].total_cost, 30);
        EXPECT_DOUBLE_EQ(functions[0].normalized_heat, 1.0);
        EXPECT_DOUBLE_EQ(functions[0].percent_of_circuit, 75.0);

        EXPECT_EQ(functions[1].name, "helper");
        EXPECT_EQ(functions[1].start_line, 5u);
        EXPECT_EQ(functions[1].total_cost, 10);
        EXPECT_DOUBLE_EQ(functions[1].percent_of_circuit, 25.0);

        ASSERT_FALSE(report.top_functions.empty());
        EXPECT_EQ(report.top_functions[0].name, "main");
    }

    TEST_F(MetricsAggregatorTest, StampsSourceHash) {
        const auto report = aggregator.aggregate(DomainRecords{}, TWO_FUNCTION_SOURCE, "main.nr");

        EXPECT_EQ(report.source_hash, hash_utils::content_hash(TWO_FUNCTION_SOURCE));
    }

    TEST_F(MetricsAggregatorTest, CachedAggregationLoadsOnce) {
        int loads = 0;
        const auto loader = [&loads]() {
            ++loads;
            DomainRecords domains;
            domains.constrained = std::vector<CostRecord>{record(2, 1, "a", 4)};
            return Result<DomainRecords, Error>::success(domains);
        };

        auto first = aggregator.aggregate_cached(TWO_FUNCTION_SOURCE, "main.nr", loader);
        auto second = aggregator.aggregate_cached(TWO_FUNCTION_SOURCE, "main.nr", loader);

        ASSERT_TRUE(first.is_ok());
        ASSERT_TRUE(second.is_ok());
        EXPECT_EQ(loads, 1);
        EXPECT_TRUE(first.value().same_values(second.value()));
    }

    TEST_F(MetricsAggregatorTest, LoaderErrorIsReturnedAndNotCached) {
        int loads = 0;
        const auto failing = [&loads]() {
            ++loads;
            return Result<DomainRecords, Error>::failure(Error::profiler_error("compiler crashed"));
        };

        auto first = aggregator.aggregate_cached("fn main() {}", "main.nr", failing);
        auto second = aggregator.aggregate_cached("fn main() {}", "main.nr", failing);

        ASSERT_TRUE(first.is_err());
        EXPECT_EQ(first.error().code(), ErrorCode::ProfilerError);
        ASSERT_TRUE(second.is_err());
        EXPECT_EQ(loads, 2);
        EXPECT_EQ(cache.size(), 0u);
    }

    // ============================================================================
    // Function detection
    // ============================================================================

    TEST(DetectFunctionsTest, FindsPublicAndIndentedDeclarations) {
        const auto spans = detect_functions(
            "use dep::std;\n"
            "\n"
            "fn main() {\n"
            "}\n"
            "    pub fn inner_helper(a: u8) {\n"
            "    }\n"
            "// fn commented_out()\n"
        );

        ASSERT_EQ(spans.size(), 2u);
        EXPECT_EQ(spans[0].name, "main");
        EXPECT_EQ(spans[0].start_line, 3u);
        EXPECT_EQ(spans[0].end_line, 5u);
        EXPECT_EQ(spans[1].name, "inner_helper");
        EXPECT_EQ(spans[1].start_line, 5u);
        EXPECT_EQ(spans[1].end_line, 9u);
    }

    TEST(DetectFunctionsTest, NoFunctionsInEmptySource) {
        EXPECT_TRUE(detect_functions("").empty());
        EXPECT_TRUE(detect_functions("let x = 1;").empty());
    }

}  // namespace cca::metrics
