#include "cca/engine.hpp"
#include "../../fixtures/profiler_text.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>

namespace cca
{
    using ::testing::_;
    using ::testing::Return;

    namespace {

        class MockProfilerBackend : public profiler::IProfilerBackend {
        public:
            MOCK_METHOD((Result<profiler::ProfilerOutput, Error>), profile,
                        (std::string_view source_code, const std::optional<std::string>& manifest,
                         const std::string& file_name),
                        (override));
        };

        const char* const SOURCE =
            "fn main(x: Field, y: Field) {\n"
            "    let z = x * y;\n"
            "    assert(z != 0);\n"
            "}\n";

        profiler::ProfilerOutput sample_output() {
            profiler::ProfilerOutput output;
            output.constrained_text = test::svg({
                test::tag("main.nr", 2, 13, "x * y", 30),
                test::tag("main.nr", 3, 5, "assert(z != 0)", 10)
            });
            output.gates_text = test::svg({
                test::tag("main.nr", 2, 13, "x * y", 300)
            });
            return output;
        }

    }  // namespace

    class ComplexityEngineTest : public ::testing::Test {
    protected:
        ReportInput input() const {
            return ReportInput::from(sample_output(), SOURCE, "");
        }

        ComplexityEngine engine;
    };

    TEST_F(ComplexityEngineTest, EmptyInputIsInvalidArgument) {
        ReportInput empty;
        empty.constrained_text = "";

        const auto result = engine.generate_complexity_report(empty);

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    }

    TEST_F(ComplexityEngineTest, ParseCostRecords) {
        const auto records = engine.parse_cost_records(*sample_output().constrained_text);

        ASSERT_EQ(records.size(), 2u);
        EXPECT_EQ(records[0].line, 2u);
        EXPECT_EQ(records[0].cost, 30);
        EXPECT_EQ(records[1].expression, "assert(z != 0)");
    }

    TEST_F(ComplexityEngineTest, GeneratesReportFromProfilerText) {
        const auto result = engine.generate_complexity_report(input());

        ASSERT_TRUE(result.is_ok()) << result.error().to_string();
        const auto& report = result.value();
        ASSERT_EQ(report.files.size(), 1u);
        EXPECT_EQ(report.files[0].file_name, "main.nr");
        EXPECT_EQ(report.totals, test::costs(40, 0, 300));

        const LineMetric* line = report.files[0].find_line(2);
        ASSERT_NE(line, nullptr);
        EXPECT_EQ(line->costs, test::costs(30, 0, 300));
        EXPECT_DOUBLE_EQ(line->normalized_heat, 1.0);
        EXPECT_FALSE(report.source_hash.empty());
    }

    TEST_F(ComplexityEngineTest, SecondRequestForSameSourceHitsCache) {
        ASSERT_TRUE(engine.generate_complexity_report(input()).is_ok());

        ReportInput other = input();
        other.constrained_text = test::svg({test::tag("main.nr", 2, 13, "x * y", 999)});
        const auto cached = engine.generate_complexity_report(other);

        ASSERT_TRUE(cached.is_ok());
        EXPECT_EQ(cached.value().totals.constrained_ops, 40);
        EXPECT_EQ(engine.cache_stats().hits, 1u);
        EXPECT_EQ(engine.cache_stats().misses, 1u);
    }

    TEST_F(ComplexityEngineTest, ClearCacheForcesRecompute) {
        ASSERT_TRUE(engine.generate_complexity_report(input()).is_ok());
        engine.clear_cache();

        ReportInput other = input();
        other.constrained_text = test::svg({test::tag("main.nr", 2, 13, "x * y", 7)});
        const auto result = engine.generate_complexity_report(other);

        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().totals.constrained_ops, 7);
    }

    TEST_F(ComplexityEngineTest, GetReportWithoutBackendOnlyLooksUp) {
        EXPECT_FALSE(engine.has_backend());

        const auto miss = engine.get_complexity_report(SOURCE);
        ASSERT_TRUE(miss.is_ok());
        EXPECT_FALSE(miss.value().has_value());

        ASSERT_TRUE(engine.generate_complexity_report(input()).is_ok());
        const auto hit = engine.get_complexity_report(SOURCE);
        ASSERT_TRUE(hit.is_ok());
        ASSERT_TRUE(hit.value().has_value());
        EXPECT_EQ(hit.value()->totals.constrained_ops, 40);
    }

    TEST_F(ComplexityEngineTest, GetReportProfilesThroughBackendOnce) {
        auto backend = std::make_shared<MockProfilerBackend>();
        EXPECT_CALL(*backend, profile(_, _, std::string("main.nr")))
            .WillOnce(Return(Result<profiler::ProfilerOutput, Error>::success(sample_output())));
        engine.attach_backend(backend);

        const auto first = engine.get_complexity_report(SOURCE);
        const auto second = engine.get_complexity_report(SOURCE);

        ASSERT_TRUE(first.is_ok());
        ASSERT_TRUE(first.value().has_value());
        EXPECT_EQ(first.value()->totals.gate_count, 300);
        ASSERT_TRUE(second.is_ok());
        EXPECT_TRUE(second.value().has_value());
    }

    TEST_F(ComplexityEngineTest, BackendFailureIsProfilerError) {
        auto backend = std::make_shared<MockProfilerBackend>();
        EXPECT_CALL(*backend, profile(_, _, _))
            .WillOnce(Return(Result<profiler::ProfilerOutput, Error>::failure(
                Error::io_error("nargo not found", "PATH"))))
            .WillOnce(Return(Result<profiler::ProfilerOutput, Error>::failure(
                Error::profiler_error("nargo exited with status 1", "lib.nr"))));
        engine.attach_backend(backend);

        const auto wrapped = engine.get_complexity_report(SOURCE);
        ASSERT_TRUE(wrapped.is_err());
        EXPECT_EQ(wrapped.error().code(), ErrorCode::ProfilerError);
        EXPECT_EQ(wrapped.error().message(), "nargo not found");

        const auto passed = engine.get_complexity_report(SOURCE);
        ASSERT_TRUE(passed.is_err());
        EXPECT_EQ(passed.error(), Error::profiler_error("nargo exited with status 1", "lib.nr"));
    }

    TEST_F(ComplexityEngineTest, CompareWithPreviousRun) {
        const auto first = engine.generate_complexity_report(input());
        ASSERT_TRUE(first.is_ok());
        EXPECT_FALSE(engine.compare_with_previous(first.value()).has_value());

        ReportInput edited = input();
        edited.source_code = std::string(SOURCE) + "// edited\n";
        edited.constrained_text = test::svg({
            test::tag("main.nr", 2, 13, "x * y", 20),
            test::tag("main.nr", 3, 5, "assert(z != 0)", 10)
        });
        const auto second = engine.generate_complexity_report(edited);
        ASSERT_TRUE(second.is_ok());

        const auto comparison = engine.compare_with_previous(second.value());

        ASSERT_TRUE(comparison.has_value());
        ASSERT_EQ(comparison->deltas.size(), 1u);
        EXPECT_EQ(comparison->deltas[0].line_number, 2u);
        EXPECT_EQ(comparison->deltas[0].delta, -10);
        EXPECT_TRUE(comparison->deltas[0].is_improvement);
    }

    TEST_F(ComplexityEngineTest, AnalyzeAndHeatmap) {
        const auto report = engine.generate_complexity_report(input());
        ASSERT_TRUE(report.is_ok());

        const InsightReport insights = engine.analyze_circuit(report.value(), SOURCE);
        EXPECT_EQ(insights.totals, report.value().totals);
        EXPECT_EQ(insights.complexity_class, ComplexityClass::Low);

        const auto entries = engine.heatmap(report.value());
        ASSERT_EQ(entries.size(), 2u);
        EXPECT_EQ(entries[0].line_number, 2u);
        EXPECT_EQ(entries[0].badge_text, "30ops");
    }

    TEST_F(ComplexityEngineTest, InvalidPatchIsRejectedWithoutChanges) {
        MetricsConfig metrics;
        metrics.history_depth = 0;
        ConfigPatch patch;
        patch.metrics = metrics;

        const auto result = engine.update_configuration(patch);

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
        EXPECT_EQ(engine.get_configuration().metrics.history_depth, 10u);
    }

    TEST_F(ComplexityEngineTest, ValidPatchIsApplied) {
        EXPECT_TRUE(engine.update_configuration(ConfigPatch{}).is_ok());

        AnalysisConfig analysis;
        analysis.complexity_low = 10;
        analysis.complexity_medium = 100;
        ConfigPatch patch;
        patch.analysis = analysis;

        ASSERT_TRUE(engine.update_configuration(patch).is_ok());
        EXPECT_EQ(engine.get_configuration().analysis.complexity_low, 10);

        const auto report = engine.generate_complexity_report(input());
        ASSERT_TRUE(report.is_ok());
        EXPECT_EQ(engine.analyze_circuit(report.value(), SOURCE).complexity_class, ComplexityClass::High);
    }

    TEST_F(ComplexityEngineTest, SourceExtensionChangeRebuildsParser) {
        MetricsConfig metrics;
        metrics.source_extension = ".sw";
        ConfigPatch patch;
        patch.metrics = metrics;

        ASSERT_TRUE(engine.update_configuration(patch).is_ok());

        EXPECT_TRUE(engine.parse_cost_records(test::tag("main.nr", 1, 1, "a", 1)).empty());
        EXPECT_EQ(engine.parse_cost_records(test::tag("main.sw", 1, 1, "a", 1)).size(), 1u);
    }

}  // namespace cca
