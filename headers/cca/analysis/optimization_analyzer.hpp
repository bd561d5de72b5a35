#ifndef CCA_OPTIMIZATION_ANALYZER_HPP
#define CCA_OPTIMIZATION_ANALYZER_HPP

/**
 * @file optimization_analyzer.hpp
 * @brief Runs the optimization rules and ranks their suggestions.
 */

#include "cca/analysis/rule.hpp"
#include "cca/config.hpp"
#include "cca/heuristics/config.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace cca::analysis {

    /**
     * Owns a rule set and turns a report into an InsightReport.
     *
     * A rule that returns an error is logged and skipped; the remaining
     * rules still contribute.
     */
    class OptimizationAnalyzer {
    public:
        /**
         * Analyzer with the default rule set.
         */
        explicit OptimizationAnalyzer(AnalysisConfig analysis = {},
                                      heuristics::HeuristicsConfig heuristics = {});

        OptimizationAnalyzer(std::vector<std::unique_ptr<IAnalyzerRule>> rules,
                             AnalysisConfig analysis,
                             heuristics::HeuristicsConfig heuristics);

        /**
         * Evaluates every enabled rule over @p report and @p source_code.
         *
         * Suggestions are ordered by severity (high first), then by
         * estimated savings descending; ties keep rule order. Totals are
         * sums over all suggestions, the percent clamped to 100.
         */
        [[nodiscard]] InsightReport analyze(const ComplexityReport& report, std::string_view source_code) const;

        [[nodiscard]] bool is_enabled(RuleKind kind) const noexcept;

        [[nodiscard]] ComplexityClass classify(std::int64_t gate_count) const noexcept;

        [[nodiscard]] const std::vector<std::unique_ptr<IAnalyzerRule>>& rules() const noexcept {
            return rules_;
        }

        [[nodiscard]] const AnalysisConfig& analysis_config() const noexcept {
            return analysis_;
        }

        void set_config(AnalysisConfig analysis, heuristics::HeuristicsConfig heuristics);

    private:
        std::vector<std::unique_ptr<IAnalyzerRule>> rules_;
        AnalysisConfig analysis_;
        heuristics::HeuristicsConfig heuristics_;
    };

    /**
     * Stable sort by severity, then estimated savings descending.
     */
    void sort_suggestions(std::vector<Suggestion>& suggestions);

}  // namespace cca::analysis

#endif //CCA_OPTIMIZATION_ANALYZER_HPP
