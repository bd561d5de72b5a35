#ifndef CCA_CONFIG_HPP
#define CCA_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Engine configuration, loadable from TOML.
 *
 * Example file:
 * @code
 *     [metrics]
 *     cache_ttl_ms = 300000
 *     history_depth = 10
 *
 *     [hotspots]
 *     metric = "gates"
 *     minimum_threshold = 0.02
 *     sort_by = "absolute"
 *
 *     [analysis]
 *     enable_array_rule = false
 *
 *     [heuristics.loops]
 *     max_iterations = 16
 *
 *     [logging]
 *     level = "debug"
 * @endcode
 *
 * Every key is optional; missing keys keep their defaults.
 */

#include "cca/error.hpp"
#include "cca/result.hpp"
#include "cca/types.hpp"
#include "cca/heuristics/config.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace cca {

    struct MetricsConfig {
        /// Age after which a cached report is treated as a miss
        std::int64_t cache_ttl_ms = 300000;

        /// Reports retained for delta comparison
        std::size_t history_depth = 10;

        /// Suggested debounce for callers that profile on edit; unused by the engine
        std::int64_t update_debounce_ms = 500;

        std::string source_extension = ".nr";
        std::string default_file_name = "main.nr";
        std::size_t max_top_functions = 5;
    };

    enum class HotspotSortKey {
        Percentage,
        Absolute
    };

    inline const char* to_string(HotspotSortKey key) noexcept {
        switch (key) {
            case HotspotSortKey::Percentage: return "percentage";
            case HotspotSortKey::Absolute:   return "absolute";
        }
        return "unknown";
    }

    std::optional<HotspotSortKey> hotspot_sort_key_from_string(const std::string& str) noexcept;

    /**
     * Selection criteria for hotspot lines.
     *
     * In Percentage mode minimum_threshold is a fraction of the circuit
     * (0.05 keeps lines at 5% or more). In Absolute mode it is compared
     * against the raw metric value.
     */
    struct HotspotCriteria {
        MetricKind metric = MetricKind::Constrained;
        double minimum_threshold = 0.05;
        HotspotSortKey sort_by = HotspotSortKey::Percentage;
        std::size_t max_results = 10;
    };

    struct AnalysisConfig {
        /// Hotspot lines below this share of the circuit get no suggestion
        double hotspot_threshold_percent = 5.0;

        /// Gate counts separating the low, medium and high complexity classes
        std::int64_t complexity_low = 1000;
        std::int64_t complexity_medium = 10000;

        /// Function never reported as dominating the circuit
        std::string entry_function = "main";

        /// Source marker whose presence means recursion is already in use
        std::string recursive_marker = "#[recursive]";

        bool enable_hotspot_rule = true;
        bool enable_loop_rule = true;
        bool enable_arithmetic_rule = true;
        bool enable_array_rule = true;
        bool enable_hash_rule = true;
        bool enable_best_practice_rule = true;
    };

    struct LoggingConfig {
        std::string level = "info";
        std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";
    };

    struct Config {
        MetricsConfig metrics;
        HotspotCriteria hotspots;
        AnalysisConfig analysis;
        heuristics::HeuristicsConfig heuristics;
        LoggingConfig logging;

        static Config default_config();

        /**
         * Parses TOML text and validates the result.
         *
         * @return The configuration, ParseError for malformed TOML or
         *         ConfigError for out-of-range values
         */
        static Result<Config, Error> load_from_string(const std::string& content);

        static Result<Config, Error> load_from_file(const std::string& path);

        [[nodiscard]] Result<void, Error> save_to_file(const std::string& path) const;

        /**
         * Serializes every setting as TOML accepted by load_from_string.
         */
        [[nodiscard]] std::string to_string() const;

        /**
         * Checks value ranges; all problems are reported in one ConfigError.
         */
        [[nodiscard]] Result<void, Error> validate() const;
    };

    /**
     * Partial configuration update. Sections left empty are kept.
     */
    struct ConfigPatch {
        std::optional<MetricsConfig> metrics;
        std::optional<HotspotCriteria> hotspots;
        std::optional<AnalysisConfig> analysis;
        std::optional<heuristics::HeuristicsConfig> heuristics;
        std::optional<LoggingConfig> logging;

        /**
         * Patch replacing every section with those of @p config.
         */
        static ConfigPatch from(const Config& config);

        [[nodiscard]] bool empty() const noexcept {
            return !metrics && !hotspots && !analysis && !heuristics && !logging;
        }

        [[nodiscard]] Config apply_to(const Config& base) const;
    };

}  // namespace cca

#endif //CCA_CONFIG_HPP
