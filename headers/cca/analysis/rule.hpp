#ifndef CCA_RULE_HPP
#define CCA_RULE_HPP

/**
 * @file rule.hpp
 * @brief Interface for optimization rules.
 *
 * Rules inspect an aggregated report together with the raw source text
 * and emit suggestions. Detection is lexical: loops, divisions and hash
 * calls are recognised by line patterns, not by parsing the program.
 *
 * - HotspotRule: lines dominating the circuit
 * - LoopRule: large, dynamically bounded and nested loops
 * - ArithmeticRule: field divisions
 * - ArrayRule: dynamic arrays and push calls
 * - HashInLoopRule: hash functions evaluated inside loops
 * - BestPracticeRule: circuit-wide size checks
 */

#include "cca/types.hpp"
#include "cca/result.hpp"
#include "cca/error.hpp"
#include "cca/config.hpp"
#include "cca/heuristics/config.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cca::analysis {

    enum class RuleKind {
        Hotspot,
        Loop,
        Arithmetic,
        Array,
        HashInLoop,
        BestPractice
    };

    inline const char* to_string(RuleKind kind) noexcept {
        switch (kind) {
            case RuleKind::Hotspot:      return "hotspot";
            case RuleKind::Loop:         return "loop";
            case RuleKind::Arithmetic:   return "arithmetic";
            case RuleKind::Array:        return "array";
            case RuleKind::HashInLoop:   return "hash-in-loop";
            case RuleKind::BestPractice: return "best-practice";
        }
        return "unknown";
    }

    /**
     * Inputs shared by every rule of one analysis run.
     */
    struct RuleContext {
        const ComplexityReport& report;
        std::string_view source_code;
        const std::vector<std::string_view>& source_lines;  ///< Index 0 is line 1
        const AnalysisConfig& analysis;
        const heuristics::HeuristicsConfig& heuristics;

        /**
         * Metrics used for factor-based impacts. Only hotspot lines carry
         * metrics here; other lines fall back to fixed impacts.
         */
        [[nodiscard]] const LineMetric* line_metrics(std::size_t line_number) const noexcept {
            return report.find_hotspot(line_number);
        }
    };

    struct RuleOutput {
        std::vector<Suggestion> suggestions;
        std::size_t lines_scanned = 0;
    };

    /**
     * Interface for optimization rules.
     *
     * Rules are stateless; evaluate() may be called concurrently.
     */
    class IAnalyzerRule {
    public:
        virtual ~IAnalyzerRule() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        [[nodiscard]] virtual std::string_view description() const noexcept = 0;

        [[nodiscard]] virtual RuleKind kind() const noexcept = 0;

        /**
         * Scans the context and returns the suggestions of this rule.
         *
         * @param context Report, source and thresholds
         * @return Suggestions or an error
         */
        [[nodiscard]] virtual Result<RuleOutput, Error> evaluate(const RuleContext& context) const = 0;
    };

    // ============================================================================
    // Helpers shared by the rules
    // ============================================================================

    /**
     * Impact scaled from line metrics: factor times the line's gates and
     * share of the circuit. Without metrics, @p fallback savings and 0%.
     */
    [[nodiscard]] Impact scaled_impact(const LineMetric* metrics, double factor, std::int64_t fallback);

    /**
     * True if the line opens a loop: "for <var> in <range> {".
     */
    [[nodiscard]] bool is_loop_header(std::string_view line);

    /**
     * True if one of the @p lookback lines preceding @p index opens a loop.
     */
    [[nodiscard]] bool loop_precedes(const std::vector<std::string_view>& lines,
                                     std::size_t index,
                                     std::size_t lookback);

    /**
     * Trimmed copy of a source line for Suggestion::code_snippet.
     */
    [[nodiscard]] std::string snippet(std::string_view line);

}  // namespace cca::analysis

#endif //CCA_RULE_HPP
