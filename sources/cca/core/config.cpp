#include "cca/config.hpp"

#include "cca/utils/file_utils.hpp"
#include "cca/utils/string_utils.hpp"

#include <toml++/toml.h>

#include <algorithm>
#include <array>
#include <sstream>
#include <string_view>
#include <utility>
#include <vector>

namespace cca
{
    namespace {

        /**
         * Reads optional keys from one TOML table, recording type mismatches.
         */
        class SectionReader {
        public:
            SectionReader(const toml::table* table, std::string prefix, std::vector<std::string>& errors)
                : table_(table), prefix_(std::move(prefix)), errors_(errors) {}

            template<typename T>
            void read(const std::string_view key, T& out) {
                if (!table_) {
                    return;
                }
                const auto node = (*table_)[key];
                if (!node) {
                    return;
                }
                if (auto value = node.template value<T>()) {
                    out = *value;
                } else {
                    errors_.push_back(prefix_ + "." + std::string(key) + " has an invalid type or range");
                }
            }

            void read_metric(const std::string_view key, MetricKind& out) {
                std::string text;
                if (!read_string(key, text)) {
                    return;
                }
                if (auto metric = metric_kind_from_string(text)) {
                    out = *metric;
                } else {
                    errors_.push_back(prefix_ + "." + std::string(key) + " must be one of constrained, unconstrained, gates, total");
                }
            }

            void read_sort_key(const std::string_view key, HotspotSortKey& out) {
                std::string text;
                if (!read_string(key, text)) {
                    return;
                }
                if (auto sort_key = hotspot_sort_key_from_string(text)) {
                    out = *sort_key;
                } else {
                    errors_.push_back(prefix_ + "." + std::string(key) + " must be percentage or absolute");
                }
            }

        private:
            bool read_string(const std::string_view key, std::string& out) {
                if (!table_ || !(*table_)[key]) {
                    return false;
                }
                const std::size_t known_errors = errors_.size();
                read(key, out);
                return errors_.size() == known_errors;
            }

            const toml::table* table_;
            std::string prefix_;
            std::vector<std::string>& errors_;
        };

        const toml::table* subtable(const toml::table* parent, const std::string_view key) {
            if (!parent) {
                return nullptr;
            }
            return (*parent)[key].as_table();
        }

        std::string quoted(const std::string& value) {
            std::string escaped = string_utils::replace_all(value, "\\", "\\\\");
            escaped = string_utils::replace_all(std::move(escaped), "\"", "\\\"");
            return "\"" + escaped + "\"";
        }

        const char* boolean(const bool value) {
            return value ? "true" : "false";
        }

        bool is_known_log_level(const std::string& level) {
            static constexpr std::array<std::string_view, 9> levels = {
                "trace", "debug", "info", "warn", "warning", "err", "error", "critical", "off"
            };
            const std::string lower = string_utils::to_lower(level);
            return std::ranges::find(levels, lower) != levels.end();
        }

    }  // namespace

    std::optional<HotspotSortKey> hotspot_sort_key_from_string(const std::string& str) noexcept {
        if (str == "percentage") return HotspotSortKey::Percentage;
        if (str == "absolute") return HotspotSortKey::Absolute;
        return std::nullopt;
    }

    Config Config::default_config() {
        return Config{};
    }

    Result<Config, Error> Config::load_from_file(const std::string& path) {
        return file_utils::read_file(path).and_then([](const std::string& content) {
            return load_from_string(content);
        });
    }

    Result<Config, Error> Config::load_from_string(const std::string& content) {
        toml::table tbl;
        try {
            tbl = toml::parse(content);
        } catch (const toml::parse_error& err) {
            return Result<Config, Error>::failure(
                Error::parse_error("Failed to parse TOML configuration: " + std::string(err.description()))
            );
        }

        Config config;
        std::vector<std::string> errors;

        {
            SectionReader metrics(tbl["metrics"].as_table(), "metrics", errors);
            metrics.read("cache_ttl_ms", config.metrics.cache_ttl_ms);
            metrics.read("history_depth", config.metrics.history_depth);
            metrics.read("update_debounce_ms", config.metrics.update_debounce_ms);
            metrics.read("source_extension", config.metrics.source_extension);
            metrics.read("default_file_name", config.metrics.default_file_name);
            metrics.read("max_top_functions", config.metrics.max_top_functions);
        }

        {
            SectionReader hotspots(tbl["hotspots"].as_table(), "hotspots", errors);
            hotspots.read_metric("metric", config.hotspots.metric);
            hotspots.read("minimum_threshold", config.hotspots.minimum_threshold);
            hotspots.read_sort_key("sort_by", config.hotspots.sort_by);
            hotspots.read("max_results", config.hotspots.max_results);
        }

        {
            SectionReader analysis(tbl["analysis"].as_table(), "analysis", errors);
            auto& a = config.analysis;
            analysis.read("hotspot_threshold_percent", a.hotspot_threshold_percent);
            analysis.read("complexity_low", a.complexity_low);
            analysis.read("complexity_medium", a.complexity_medium);
            analysis.read("entry_function", a.entry_function);
            analysis.read("recursive_marker", a.recursive_marker);
            analysis.read("enable_hotspot_rule", a.enable_hotspot_rule);
            analysis.read("enable_loop_rule", a.enable_loop_rule);
            analysis.read("enable_arithmetic_rule", a.enable_arithmetic_rule);
            analysis.read("enable_array_rule", a.enable_array_rule);
            analysis.read("enable_hash_rule", a.enable_hash_rule);
            analysis.read("enable_best_practice_rule", a.enable_best_practice_rule);
        }

        if (const auto* heuristics = tbl["heuristics"].as_table()) {
            auto& h = config.heuristics;

            SectionReader hotspot(subtable(heuristics, "hotspot"), "heuristics.hotspot", errors);
            hotspot.read("high_percent", h.hotspot.high_percent);
            hotspot.read("low_percent", h.hotspot.low_percent);
            hotspot.read("savings_factor", h.hotspot.savings_factor);

            SectionReader loops(subtable(heuristics, "loops"), "heuristics.loops", errors);
            loops.read("max_iterations", h.loops.max_iterations);
            loops.read("nested_lookback", h.loops.nested_lookback);
            loops.read("large_loop_factor", h.loops.large_loop_factor);
            loops.read("dynamic_bound_factor", h.loops.dynamic_bound_factor);
            loops.read("nested_loop_factor", h.loops.nested_loop_factor);
            loops.read("large_loop_fallback_per_iteration", h.loops.large_loop_fallback_per_iteration);
            loops.read("dynamic_bound_fallback", h.loops.dynamic_bound_fallback);
            loops.read("nested_loop_fallback", h.loops.nested_loop_fallback);

            SectionReader arithmetic(subtable(heuristics, "arithmetic"), "heuristics.arithmetic", errors);
            arithmetic.read("division_factor", h.arithmetic.division_factor);
            arithmetic.read("division_fallback", h.arithmetic.division_fallback);

            SectionReader arrays(subtable(heuristics, "arrays"), "heuristics.arrays", errors);
            arrays.read("vec_savings", h.arrays.vec_savings);
            arrays.read("vec_savings_percent", h.arrays.vec_savings_percent);
            arrays.read("push_savings", h.arrays.push_savings);
            arrays.read("push_savings_percent", h.arrays.push_savings_percent);

            SectionReader hashing(subtable(heuristics, "hashing"), "heuristics.hashing", errors);
            hashing.read("loop_lookback", h.hashing.loop_lookback);
            hashing.read("savings_factor", h.hashing.savings_factor);
            hashing.read("fallback", h.hashing.fallback);

            SectionReader best(subtable(heuristics, "best_practice"), "heuristics.best_practice", errors);
            best.read("large_circuit_gates", h.best_practice.large_circuit_gates);
            best.read("large_circuit_factor", h.best_practice.large_circuit_factor);
            best.read("large_circuit_percent", h.best_practice.large_circuit_percent);
            best.read("recursion_gates", h.best_practice.recursion_gates);
            best.read("recursion_factor", h.best_practice.recursion_factor);
            best.read("recursion_percent", h.best_practice.recursion_percent);
            best.read("dominant_function_percent", h.best_practice.dominant_function_percent);
            best.read("dominant_function_factor", h.best_practice.dominant_function_factor);
            best.read("high_constrained_ops", h.best_practice.high_constrained_ops);
            best.read("high_constrained_factor", h.best_practice.high_constrained_factor);
            best.read("high_constrained_percent", h.best_practice.high_constrained_percent);
        }

        {
            SectionReader logging(tbl["logging"].as_table(), "logging", errors);
            logging.read("level", config.logging.level);
            logging.read("pattern", config.logging.pattern);
        }

        if (!errors.empty()) {
            return Result<Config, Error>::failure(
                Error::config_error("Configuration validation failed:\n  " + string_utils::join(errors, "\n  "))
            );
        }

        if (auto validation = config.validate(); validation.is_err()) {
            return Result<Config, Error>::failure(validation.error());
        }

        return Result<Config, Error>::success(std::move(config));
    }

    Result<void, Error> Config::save_to_file(const std::string& path) const {
        return file_utils::write_file(path, to_string());
    }

    std::string Config::to_string() const {
        std::ostringstream ss;

        ss << "[metrics]\n";
        ss << "cache_ttl_ms = " << metrics.cache_ttl_ms << "\n";
        ss << "history_depth = " << metrics.history_depth << "\n";
        ss << "update_debounce_ms = " << metrics.update_debounce_ms << "\n";
        ss << "source_extension = " << quoted(metrics.source_extension) << "\n";
        ss << "default_file_name = " << quoted(metrics.default_file_name) << "\n";
        ss << "max_top_functions = " << metrics.max_top_functions << "\n\n";

        ss << "[hotspots]\n";
        ss << "metric = \"" << cca::to_string(hotspots.metric) << "\"\n";
        ss << "minimum_threshold = " << hotspots.minimum_threshold << "\n";
        ss << "sort_by = \"" << cca::to_string(hotspots.sort_by) << "\"\n";
        ss << "max_results = " << hotspots.max_results << "\n\n";

        ss << "[analysis]\n";
        ss << "hotspot_threshold_percent = " << analysis.hotspot_threshold_percent << "\n";
        ss << "complexity_low = " << analysis.complexity_low << "\n";
        ss << "complexity_medium = " << analysis.complexity_medium << "\n";
        ss << "entry_function = " << quoted(analysis.entry_function) << "\n";
        ss << "recursive_marker = " << quoted(analysis.recursive_marker) << "\n";
        ss << "enable_hotspot_rule = " << boolean(analysis.enable_hotspot_rule) << "\n";
        ss << "enable_loop_rule = " << boolean(analysis.enable_loop_rule) << "\n";
        ss << "enable_arithmetic_rule = " << boolean(analysis.enable_arithmetic_rule) << "\n";
        ss << "enable_array_rule = " << boolean(analysis.enable_array_rule) << "\n";
        ss << "enable_hash_rule = " << boolean(analysis.enable_hash_rule) << "\n";
        ss << "enable_best_practice_rule = " << boolean(analysis.enable_best_practice_rule) << "\n\n";

        const auto& h = heuristics;
        ss << "[heuristics.hotspot]\n";
        ss << "high_percent = " << h.hotspot.high_percent << "\n";
        ss << "low_percent = " << h.hotspot.low_percent << "\n";
        ss << "savings_factor = " << h.hotspot.savings_factor << "\n\n";

        ss << "[heuristics.loops]\n";
        ss << "max_iterations = " << h.loops.max_iterations << "\n";
        ss << "nested_lookback = " << h.loops.nested_lookback << "\n";
        ss << "large_loop_factor = " << h.loops.large_loop_factor << "\n";
        ss << "dynamic_bound_factor = " << h.loops.dynamic_bound_factor << "\n";
        ss << "nested_loop_factor = " << h.loops.nested_loop_factor << "\n";
        ss << "large_loop_fallback_per_iteration = " << h.loops.large_loop_fallback_per_iteration << "\n";
        ss << "dynamic_bound_fallback = " << h.loops.dynamic_bound_fallback << "\n";
        ss << "nested_loop_fallback = " << h.loops.nested_loop_fallback << "\n\n";

        ss << "[heuristics.arithmetic]\n";
        ss << "division_factor = " << h.arithmetic.division_factor << "\n";
        ss << "division_fallback = " << h.arithmetic.division_fallback << "\n\n";

        ss << "[heuristics.arrays]\n";
        ss << "vec_savings = " << h.arrays.vec_savings << "\n";
        ss << "vec_savings_percent = " << h.arrays.vec_savings_percent << "\n";
        ss << "push_savings = " << h.arrays.push_savings << "\n";
        ss << "push_savings_percent = " << h.arrays.push_savings_percent << "\n\n";

        ss << "[heuristics.hashing]\n";
        ss << "loop_lookback = " << h.hashing.loop_lookback << "\n";
        ss << "savings_factor = " << h.hashing.savings_factor << "\n";
        ss << "fallback = " << h.hashing.fallback << "\n\n";

        ss << "[heuristics.best_practice]\n";
        ss << "large_circuit_gates = " << h.best_practice.large_circuit_gates << "\n";
        ss << "large_circuit_factor = " << h.best_practice.large_circuit_factor << "\n";
        ss << "large_circuit_percent = " << h.best_practice.large_circuit_percent << "\n";
        ss << "recursion_gates = " << h.best_practice.recursion_gates << "\n";
        ss << "recursion_factor = " << h.best_practice.recursion_factor << "\n";
        ss << "recursion_percent = " << h.best_practice.recursion_percent << "\n";
        ss << "dominant_function_percent = " << h.best_practice.dominant_function_percent << "\n";
        ss << "dominant_function_factor = " << h.best_practice.dominant_function_factor << "\n";
        ss << "high_constrained_ops = " << h.best_practice.high_constrained_ops << "\n";
        ss << "high_constrained_factor = " << h.best_practice.high_constrained_factor << "\n";
        ss << "high_constrained_percent = " << h.best_practice.high_constrained_percent << "\n\n";

        ss << "[logging]\n";
        ss << "level = " << quoted(logging.level) << "\n";
        ss << "pattern = " << quoted(logging.pattern) << "\n";

        return ss.str();
    }

    Result<void, Error> Config::validate() const {
        std::vector<std::string> errors;

        if (metrics.cache_ttl_ms < 0) {
            errors.emplace_back("cache_ttl_ms must be non-negative");
        }

        if (metrics.history_depth < 2) {
            errors.emplace_back("history_depth must be at least 2 to allow comparisons");
        }

        if (metrics.update_debounce_ms < 0) {
            errors.emplace_back("update_debounce_ms must be non-negative");
        }

        if (metrics.source_extension.empty()) {
            errors.emplace_back("source_extension must not be empty");
        }

        if (metrics.default_file_name.empty()) {
            errors.emplace_back("default_file_name must not be empty");
        }

        if (hotspots.minimum_threshold < 0.0) {
            errors.emplace_back("minimum_threshold must be non-negative");
        }

        if (hotspots.sort_by == HotspotSortKey::Percentage && hotspots.minimum_threshold > 1.0) {
            errors.emplace_back("minimum_threshold must be a fraction between 0.0 and 1.0 when sorting by percentage");
        }

        if (analysis.hotspot_threshold_percent < 0.0 || analysis.hotspot_threshold_percent > 100.0) {
            errors.emplace_back("hotspot_threshold_percent must be between 0 and 100");
        }

        if (analysis.complexity_low < 0 || analysis.complexity_medium < analysis.complexity_low) {
            errors.emplace_back("complexity thresholds must satisfy 0 <= complexity_low <= complexity_medium");
        }

        if (heuristics.hotspot.low_percent > heuristics.hotspot.high_percent) {
            errors.emplace_back("heuristics.hotspot.low_percent must not exceed high_percent");
        }

        if (heuristics.loops.max_iterations < 0) {
            errors.emplace_back("heuristics.loops.max_iterations must be non-negative");
        }

        if (!is_known_log_level(logging.level)) {
            errors.emplace_back("logging.level '" + logging.level + "' is not a known level");
        }

        if (!errors.empty()) {
            return Result<void, Error>::failure(
                Error::config_error("Configuration validation failed:\n  " + string_utils::join(errors, "\n  "))
            );
        }

        return Result<void, Error>::success();
    }

    ConfigPatch ConfigPatch::from(const Config& config) {
        ConfigPatch patch;
        patch.metrics = config.metrics;
        patch.hotspots = config.hotspots;
        patch.analysis = config.analysis;
        patch.heuristics = config.heuristics;
        patch.logging = config.logging;
        return patch;
    }

    Config ConfigPatch::apply_to(const Config& base) const {
        Config merged = base;
        if (metrics) merged.metrics = *metrics;
        if (hotspots) merged.hotspots = *hotspots;
        if (analysis) merged.analysis = *analysis;
        if (heuristics) merged.heuristics = *heuristics;
        if (logging) merged.logging = *logging;
        return merged;
    }

}  // namespace cca
