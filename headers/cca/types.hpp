#ifndef CCA_TYPES_HPP
#define CCA_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data structures for circuit cost analysis.
 *
 * Types are organized into categories:
 *
 * - Cost domains: CostDomain, MetricKind, CostTriple
 * - Parser output: CostRecord
 * - Aggregated metrics: ExpressionMetric, LineMetric, FunctionMetric,
 *   FileMetric, ComplexityReport
 * - Run-to-run comparison: MetricsDelta, MetricsComparison
 * - Suggestions: Severity, SuggestionCategory, Suggestion, InsightReport
 *
 * Everything here is a plain value type. Reports are immutable once
 * returned; callers receive copies.
 */

#include "cca/utils/numeric_utils.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cca {

    using Timestamp = std::chrono::system_clock::time_point;

    // ============================================================================
    // Cost Domains
    // ============================================================================

    /**
     * The three independently profiled cost streams.
     */
    enum class CostDomain {
        Constrained,    ///< Arithmetic-constraint opcodes (ACIR)
        Unconstrained,  ///< Unconstrained bytecode opcodes (Brillig)
        Gates           ///< Proving-backend gates
    };

    inline constexpr std::array<CostDomain, 3> ALL_COST_DOMAINS = {
        CostDomain::Constrained,
        CostDomain::Unconstrained,
        CostDomain::Gates
    };

    inline const char* to_string(CostDomain domain) noexcept {
        switch (domain) {
            case CostDomain::Constrained:   return "constrained";
            case CostDomain::Unconstrained: return "unconstrained";
            case CostDomain::Gates:         return "gates";
        }
        return "unknown";
    }

    /**
     * Metric a comparison, hotspot selection or heatmap is keyed on.
     * Total is the sum of the three domains.
     */
    enum class MetricKind {
        Constrained,
        Unconstrained,
        Gates,
        Total
    };

    inline const char* to_string(MetricKind metric) noexcept {
        switch (metric) {
            case MetricKind::Constrained:   return "constrained";
            case MetricKind::Unconstrained: return "unconstrained";
            case MetricKind::Gates:         return "gates";
            case MetricKind::Total:         return "total";
        }
        return "unknown";
    }

    std::optional<MetricKind> metric_kind_from_string(const std::string& str) noexcept;

    /**
     * Per-domain cost counters. Sums saturate at INT64_MAX.
     */
    struct CostTriple {
        std::int64_t constrained_ops = 0;
        std::int64_t unconstrained_ops = 0;
        std::int64_t gate_count = 0;

        [[nodiscard]] std::int64_t total() const noexcept {
            return numeric_utils::saturating_add(
                numeric_utils::saturating_add(constrained_ops, unconstrained_ops), gate_count);
        }

        [[nodiscard]] std::int64_t get(CostDomain domain) const noexcept {
            switch (domain) {
                case CostDomain::Constrained:   return constrained_ops;
                case CostDomain::Unconstrained: return unconstrained_ops;
                case CostDomain::Gates:         return gate_count;
            }
            return 0;
        }

        [[nodiscard]] std::int64_t get(MetricKind metric) const noexcept {
            switch (metric) {
                case MetricKind::Constrained:   return constrained_ops;
                case MetricKind::Unconstrained: return unconstrained_ops;
                case MetricKind::Gates:         return gate_count;
                case MetricKind::Total:         return total();
            }
            return 0;
        }

        void add(CostDomain domain, std::int64_t amount) noexcept {
            switch (domain) {
                case CostDomain::Constrained:   constrained_ops = numeric_utils::saturating_add(constrained_ops, amount); break;
                case CostDomain::Unconstrained: unconstrained_ops = numeric_utils::saturating_add(unconstrained_ops, amount); break;
                case CostDomain::Gates:         gate_count = numeric_utils::saturating_add(gate_count, amount); break;
            }
        }

        CostTriple& operator+=(const CostTriple& other) noexcept {
            add(CostDomain::Constrained, other.constrained_ops);
            add(CostDomain::Unconstrained, other.unconstrained_ops);
            add(CostDomain::Gates, other.gate_count);
            return *this;
        }

        bool operator==(const CostTriple&) const = default;
    };

    // ============================================================================
    // Parser Output
    // ============================================================================

    /**
     * One annotation tag from a profiler stream.
     *
     * Several records may share a line when the profiler reports distinct
     * expressions on it.
     */
    struct CostRecord {
        std::string file;
        std::size_t line = 0;
        std::size_t column = 0;
        std::string expression;
        std::int64_t cost = 0;
        double share_percent = 0.0;  ///< As reported by the producer; informational

        bool operator==(const CostRecord&) const = default;
    };

    // ============================================================================
    // Aggregated Metrics
    // ============================================================================

    struct ExpressionMetric {
        std::string expression;
        std::size_t column = 0;
        CostTriple costs;
        std::vector<CostDomain> domains;  ///< Streams that reported this expression

        bool operator==(const ExpressionMetric&) const = default;
    };

    struct LineMetric {
        std::size_t line_number = 0;
        std::string file;
        std::vector<ExpressionMetric> expressions;
        CostTriple costs;
        std::int64_t total_cost = 0;
        double normalized_heat = 0.0;     ///< [0, 1] relative to the costliest line
        double percent_of_circuit = 0.0;  ///< [0, 100]

        bool operator==(const LineMetric&) const = default;
    };

    /**
     * Cost rollup of a lexically detected function.
     *
     * The line range is half-open: [start_line, end_line). Heat and percent
     * are relative to the other functions, not to the line-level base.
     */
    struct FunctionMetric {
        std::string name;
        std::string package_name = "main";
        std::size_t start_line = 0;
        std::size_t end_line = 0;
        CostTriple costs;
        std::int64_t total_cost = 0;
        double normalized_heat = 0.0;
        double percent_of_circuit = 0.0;

        [[nodiscard]] std::size_t line_span() const noexcept {
            return end_line > start_line ? end_line - start_line : 0;
        }

        bool operator==(const FunctionMetric&) const = default;
    };

    struct FileMetric {
        std::string file_name;
        std::vector<LineMetric> lines;
        std::vector<FunctionMetric> functions;
        CostTriple totals;

        [[nodiscard]] const LineMetric* find_line(std::size_t line_number) const noexcept;

        bool operator==(const FileMetric&) const = default;
    };

    struct ComplexityReport {
        std::vector<FileMetric> files;
        CostTriple totals;
        std::vector<LineMetric> hotspots;
        std::vector<FunctionMetric> top_functions;
        std::string source_hash;
        Timestamp generated_at;

        [[nodiscard]] std::int64_t total_cost() const noexcept {
            return totals.total();
        }

        /**
         * Looks a line of the analysed (first) file up among the hotspots.
         */
        [[nodiscard]] const LineMetric* find_hotspot(std::size_t line_number) const noexcept;

        /**
         * Equality over the computed values; generated_at is ignored.
         */
        [[nodiscard]] bool same_values(const ComplexityReport& other) const;
    };

    // ============================================================================
    // Run-to-run Comparison
    // ============================================================================

    struct MetricsDelta {
        std::size_t line_number = 0;
        std::int64_t previous_value = 0;
        std::int64_t current_value = 0;
        std::int64_t delta = 0;
        double delta_percent = 0.0;
        bool is_improvement = false;
        bool is_regression = false;
    };

    struct MetricsComparison {
        MetricKind metric = MetricKind::Constrained;
        std::vector<MetricsDelta> deltas;
        std::int64_t overall_change = 0;
        double overall_change_percent = 0.0;
        bool is_improvement = false;
        Timestamp compared_at;
        std::string baseline_label = "Previous Run";
    };

    // ============================================================================
    // Suggestions
    // ============================================================================

    /**
     * Severity of a suggestion. Declaration order is sort order.
     */
    enum class Severity {
        High,
        Medium,
        Low
    };

    inline const char* to_string(Severity severity) noexcept {
        switch (severity) {
            case Severity::High:   return "high";
            case Severity::Medium: return "medium";
            case Severity::Low:    return "low";
        }
        return "unknown";
    }

    enum class SuggestionCategory {
        Loop,
        Arithmetic,
        Storage,
        Algorithm,
        General,
        BestPractice
    };

    inline const char* to_string(SuggestionCategory category) noexcept {
        switch (category) {
            case SuggestionCategory::Loop:         return "loop";
            case SuggestionCategory::Arithmetic:   return "arithmetic";
            case SuggestionCategory::Storage:      return "storage";
            case SuggestionCategory::Algorithm:    return "algorithm";
            case SuggestionCategory::General:      return "general";
            case SuggestionCategory::BestPractice: return "best-practice";
        }
        return "unknown";
    }

    /**
     * Estimated effect of applying a suggestion.
     */
    struct Impact {
        std::int64_t estimated_savings = 0;  ///< Opcodes or gates
        double savings_percent = 0.0;        ///< Share of the circuit
    };

    struct Suggestion {
        std::string id;
        std::size_t line_number = 0;  ///< 0 for circuit-wide suggestions
        Severity severity = Severity::Medium;
        SuggestionCategory category = SuggestionCategory::General;

        std::string title;
        std::string description;
        Impact impact;

        std::optional<std::string> code_snippet;
        std::optional<std::string> suggested_fix;
        std::optional<std::string> learn_more_url;

        [[nodiscard]] bool is_circuit_wide() const noexcept {
            return line_number == 0;
        }
    };

    enum class ComplexityClass {
        Low,
        Medium,
        High
    };

    inline const char* to_string(ComplexityClass cls) noexcept {
        switch (cls) {
            case ComplexityClass::Low:    return "low";
            case ComplexityClass::Medium: return "medium";
            case ComplexityClass::High:   return "high";
        }
        return "unknown";
    }

    struct InsightReport {
        std::vector<Suggestion> suggestions;
        std::int64_t total_potential_savings = 0;
        double total_potential_savings_percent = 0.0;  ///< Clamped to 100
        ComplexityClass complexity_class = ComplexityClass::Low;
        CostTriple totals;
        Timestamp analyzed_at;
    };

}  // namespace cca

#endif //CCA_TYPES_HPP
