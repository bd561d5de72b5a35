#include "cca/config.hpp"

#include <gtest/gtest.h>

#include <filesystem>

namespace cca
{
    namespace fs = std::filesystem;

    class ConfigTest : public ::testing::Test {
    protected:
        void SetUp() override {
            temp_dir = fs::temp_directory_path() / "cca_config_test";
            fs::create_directories(temp_dir);
        }

        void TearDown() override {
            if (fs::exists(temp_dir)) {
                fs::remove_all(temp_dir);
            }
        }

        fs::path temp_dir;
    };

    TEST_F(ConfigTest, DefaultConfig) {
        const auto config = Config::default_config();

        EXPECT_EQ(config.metrics.cache_ttl_ms, 300000);
        EXPECT_EQ(config.metrics.history_depth, 10u);
        EXPECT_EQ(config.metrics.update_debounce_ms, 500);
        EXPECT_EQ(config.metrics.source_extension, ".nr");
        EXPECT_EQ(config.metrics.default_file_name, "main.nr");
        EXPECT_EQ(config.hotspots.metric, MetricKind::Constrained);
        EXPECT_DOUBLE_EQ(config.hotspots.minimum_threshold, 0.05);
        EXPECT_EQ(config.hotspots.sort_by, HotspotSortKey::Percentage);
        EXPECT_EQ(config.hotspots.max_results, 10u);
        EXPECT_DOUBLE_EQ(config.analysis.hotspot_threshold_percent, 5.0);
        EXPECT_EQ(config.analysis.complexity_low, 1000);
        EXPECT_EQ(config.analysis.complexity_medium, 10000);
        EXPECT_EQ(config.heuristics.loops.max_iterations, 10);
        EXPECT_EQ(config.logging.level, "info");
        EXPECT_TRUE(config.validate().is_ok());
    }

    TEST_F(ConfigTest, LoadFromString) {
        const auto result = Config::load_from_string(R"(
            [metrics]
            cache_ttl_ms = 1000
            history_depth = 4

            [hotspots]
            metric = "gates"
            minimum_threshold = 250.0
            sort_by = "absolute"
            max_results = 3

            [analysis]
            enable_array_rule = false
            entry_function = "entry"

            [heuristics.loops]
            max_iterations = 16

            [heuristics.best_practice]
            large_circuit_gates = 5000

            [logging]
            level = "debug"
        )");

        ASSERT_TRUE(result.is_ok()) << result.error().to_string();
        const auto& config = result.value();
        EXPECT_EQ(config.metrics.cache_ttl_ms, 1000);
        EXPECT_EQ(config.metrics.history_depth, 4u);
        EXPECT_EQ(config.hotspots.metric, MetricKind::Gates);
        EXPECT_DOUBLE_EQ(config.hotspots.minimum_threshold, 250.0);
        EXPECT_EQ(config.hotspots.sort_by, HotspotSortKey::Absolute);
        EXPECT_EQ(config.hotspots.max_results, 3u);
        EXPECT_FALSE(config.analysis.enable_array_rule);
        EXPECT_TRUE(config.analysis.enable_loop_rule);
        EXPECT_EQ(config.analysis.entry_function, "entry");
        EXPECT_EQ(config.heuristics.loops.max_iterations, 16);
        EXPECT_EQ(config.heuristics.best_practice.large_circuit_gates, 5000);
        EXPECT_EQ(config.logging.level, "debug");
    }

    TEST_F(ConfigTest, MissingSectionsKeepDefaults) {
        const auto result = Config::load_from_string("[analysis]\ncomplexity_low = 10\n");

        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().analysis.complexity_low, 10);
        EXPECT_EQ(result.value().metrics.history_depth, 10u);
        EXPECT_EQ(result.value().hotspots.max_results, 10u);
    }

    TEST_F(ConfigTest, MalformedTomlIsParseError) {
        const auto result = Config::load_from_string("[metrics\ncache_ttl_ms = ");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
    }

    TEST_F(ConfigTest, WrongTypeIsConfigError) {
        const auto result = Config::load_from_string("[metrics]\nhistory_depth = \"ten\"\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
        EXPECT_NE(result.error().message().find("metrics.history_depth"), std::string::npos);
    }

    TEST_F(ConfigTest, UnknownEnumValuesAreRejected) {
        const auto metric = Config::load_from_string("[hotspots]\nmetric = \"wires\"\n");
        ASSERT_TRUE(metric.is_err());
        EXPECT_EQ(metric.error().code(), ErrorCode::ConfigError);

        const auto sort_key = Config::load_from_string("[hotspots]\nsort_by = \"\"\n");
        ASSERT_TRUE(sort_key.is_err());
        EXPECT_EQ(sort_key.error().code(), ErrorCode::ConfigError);
    }

    TEST_F(ConfigTest, ValidationCollectsEveryProblem) {
        Config config;
        config.metrics.history_depth = 1;
        config.analysis.complexity_low = 500;
        config.analysis.complexity_medium = 100;
        config.logging.level = "verbose";

        const auto result = config.validate();

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
        const auto& message = result.error().message();
        EXPECT_NE(message.find("history_depth"), std::string::npos);
        EXPECT_NE(message.find("complexity"), std::string::npos);
        EXPECT_NE(message.find("verbose"), std::string::npos);
    }

    TEST_F(ConfigTest, PercentageThresholdMustBeFraction) {
        Config config;
        config.hotspots.minimum_threshold = 5.0;
        EXPECT_TRUE(config.validate().is_err());

        config.hotspots.sort_by = HotspotSortKey::Absolute;
        EXPECT_TRUE(config.validate().is_ok());
    }

    TEST_F(ConfigTest, ToStringRoundTrips) {
        Config config;
        config.metrics.cache_ttl_ms = 42;
        config.hotspots.metric = MetricKind::Total;
        config.hotspots.sort_by = HotspotSortKey::Absolute;
        config.hotspots.minimum_threshold = 12.5;
        config.analysis.recursive_marker = "#[recursive]";
        config.analysis.enable_hash_rule = false;
        config.heuristics.arithmetic.division_factor = 0.25;

        const auto reloaded = Config::load_from_string(config.to_string());

        ASSERT_TRUE(reloaded.is_ok()) << reloaded.error().to_string();
        EXPECT_EQ(reloaded.value().metrics.cache_ttl_ms, 42);
        EXPECT_EQ(reloaded.value().hotspots.metric, MetricKind::Total);
        EXPECT_EQ(reloaded.value().hotspots.sort_by, HotspotSortKey::Absolute);
        EXPECT_DOUBLE_EQ(reloaded.value().hotspots.minimum_threshold, 12.5);
        EXPECT_EQ(reloaded.value().analysis.recursive_marker, "#[recursive]");
        EXPECT_FALSE(reloaded.value().analysis.enable_hash_rule);
        EXPECT_DOUBLE_EQ(reloaded.value().heuristics.arithmetic.division_factor, 0.25);
    }

    TEST_F(ConfigTest, SaveAndLoadFile) {
        Config config;
        config.metrics.max_top_functions = 3;
        const std::string path = (temp_dir / "cca.toml").string();

        ASSERT_TRUE(config.save_to_file(path).is_ok());
        const auto loaded = Config::load_from_file(path);

        ASSERT_TRUE(loaded.is_ok());
        EXPECT_EQ(loaded.value().metrics.max_top_functions, 3u);
    }

    TEST_F(ConfigTest, LoadMissingFileIsNotFound) {
        const auto result = Config::load_from_file((temp_dir / "absent.toml").string());

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
    }

    TEST_F(ConfigTest, PatchReplacesOnlyGivenSections) {
        Config base;
        base.analysis.complexity_low = 7;

        ConfigPatch patch;
        EXPECT_TRUE(patch.empty());

        HotspotCriteria criteria;
        criteria.max_results = 1;
        patch.hotspots = criteria;
        EXPECT_FALSE(patch.empty());

        const Config merged = patch.apply_to(base);
        EXPECT_EQ(merged.hotspots.max_results, 1u);
        EXPECT_EQ(merged.analysis.complexity_low, 7);
    }

    TEST_F(ConfigTest, PatchFromConfigCoversEverySection) {
        Config config;
        config.logging.level = "warn";

        const ConfigPatch patch = ConfigPatch::from(config);

        EXPECT_TRUE(patch.metrics.has_value());
        EXPECT_TRUE(patch.hotspots.has_value());
        EXPECT_TRUE(patch.analysis.has_value());
        EXPECT_TRUE(patch.heuristics.has_value());
        ASSERT_TRUE(patch.logging.has_value());
        EXPECT_EQ(patch.logging->level, "warn");
    }

    TEST_F(ConfigTest, SortKeyNames) {
        EXPECT_STREQ(to_string(HotspotSortKey::Percentage), "percentage");
        EXPECT_EQ(hotspot_sort_key_from_string("absolute"), HotspotSortKey::Absolute);
        EXPECT_FALSE(hotspot_sort_key_from_string("ABS").has_value());
    }

}  // namespace cca
