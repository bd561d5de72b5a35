#include "cca/analysis/optimization_analyzer.hpp"
#include "cca/analysis/all_rules.hpp"
#include "cca/utils/logging.hpp"
#include "cca/utils/numeric_utils.hpp"
#include "cca/utils/string_utils.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <utility>

namespace cca::analysis
{
    OptimizationAnalyzer::OptimizationAnalyzer(AnalysisConfig analysis, heuristics::HeuristicsConfig heuristics)
        : OptimizationAnalyzer(make_default_rules(), std::move(analysis), heuristics) {}

    OptimizationAnalyzer::OptimizationAnalyzer(std::vector<std::unique_ptr<IAnalyzerRule>> rules,
                                               AnalysisConfig analysis,
                                               heuristics::HeuristicsConfig heuristics)
        : rules_(std::move(rules))
        , analysis_(std::move(analysis))
        , heuristics_(heuristics) {}

    bool OptimizationAnalyzer::is_enabled(const RuleKind kind) const noexcept {
        switch (kind) {
            case RuleKind::Hotspot:      return analysis_.enable_hotspot_rule;
            case RuleKind::Loop:         return analysis_.enable_loop_rule;
            case RuleKind::Arithmetic:   return analysis_.enable_arithmetic_rule;
            case RuleKind::Array:        return analysis_.enable_array_rule;
            case RuleKind::HashInLoop:   return analysis_.enable_hash_rule;
            case RuleKind::BestPractice: return analysis_.enable_best_practice_rule;
        }
        return false;
    }

    ComplexityClass OptimizationAnalyzer::classify(const std::int64_t gate_count) const noexcept {
        if (gate_count < analysis_.complexity_low) {
            return ComplexityClass::Low;
        }
        if (gate_count < analysis_.complexity_medium) {
            return ComplexityClass::Medium;
        }
        return ComplexityClass::High;
    }

    void OptimizationAnalyzer::set_config(AnalysisConfig analysis, heuristics::HeuristicsConfig heuristics) {
        analysis_ = std::move(analysis);
        heuristics_ = heuristics;
    }

    InsightReport OptimizationAnalyzer::analyze(const ComplexityReport& report,
                                                const std::string_view source_code) const {
        const auto source_lines = string_utils::split_lines(source_code);
        const RuleContext context{report, source_code, source_lines, analysis_, heuristics_};

        InsightReport insights;
        for (const auto& rule : rules_) {
            if (!is_enabled(rule->kind())) {
                continue;
            }

            auto result = rule->evaluate(context);
            if (result.is_err()) {
                logging::get_logger()->warn("Rule {} failed: {}", rule->name(), result.error().to_string());
                continue;
            }

            auto& suggestions = result.value().suggestions;
            logging::get_logger()->debug("Rule {} produced {} suggestions", rule->name(), suggestions.size());
            std::ranges::move(suggestions, std::back_inserter(insights.suggestions));
        }

        sort_suggestions(insights.suggestions);

        double savings_percent = 0.0;
        for (const auto& suggestion : insights.suggestions) {
            insights.total_potential_savings = numeric_utils::saturating_add(
                insights.total_potential_savings, suggestion.impact.estimated_savings);
            savings_percent += suggestion.impact.savings_percent;
        }
        insights.total_potential_savings_percent = std::min(savings_percent, 100.0);
        insights.complexity_class = classify(report.totals.gate_count);
        insights.totals = report.totals;
        insights.analyzed_at = std::chrono::system_clock::now();

        return insights;
    }

    void sort_suggestions(std::vector<Suggestion>& suggestions) {
        std::ranges::stable_sort(suggestions, [](const Suggestion& a, const Suggestion& b) {
            if (a.severity != b.severity) {
                return a.severity < b.severity;
            }
            return a.impact.estimated_savings > b.impact.estimated_savings;
        });
    }

}  // namespace cca::analysis
