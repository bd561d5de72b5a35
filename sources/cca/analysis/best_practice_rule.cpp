#include "cca/analysis/best_practice_rule.hpp"
#include "cca/utils/numeric_utils.hpp"
#include "cca/utils/string_utils.hpp"

#include <string>
#include <utility>

namespace cca::analysis
{
    namespace {

        constexpr const char* DATA_TYPES_URL = "https://noir-lang.org/docs/noir/concepts/data_types";
        constexpr const char* RECURSION_URL = "https://noir-lang.org/docs/noir/concepts/recursion";
        constexpr const char* DOCS_URL = "https://noir-lang.org/docs/";

        std::int64_t fraction_of(const std::int64_t value, const double factor) {
            return numeric_utils::scale(value, factor);
        }

        Suggestion circuit_wide(std::string id, const Severity severity, std::string title,
                                std::string description, const Impact impact) {
            Suggestion suggestion;
            suggestion.id = std::move(id);
            suggestion.line_number = 0;
            suggestion.severity = severity;
            suggestion.category = SuggestionCategory::BestPractice;
            suggestion.title = std::move(title);
            suggestion.description = std::move(description);
            suggestion.impact = impact;
            return suggestion;
        }

    }  // namespace

    Result<RuleOutput, Error> BestPracticeRule::evaluate(const RuleContext& context) const {
        RuleOutput output;
        const auto& config = context.heuristics.best_practice;
        const auto& totals = context.report.totals;
        const std::string gates = string_utils::format_thousands(totals.gate_count);

        if (totals.gate_count > config.large_circuit_gates) {
            auto suggestion = circuit_wide(
                "best-practice-large-circuit", Severity::High, "Very large circuit",
                "Circuit has " + gates + " gates. Break it into sub-circuits or use recursion "
                "to reduce proving time",
                Impact{fraction_of(totals.gate_count, config.large_circuit_factor), config.large_circuit_percent}
            );
            suggestion.learn_more_url = DATA_TYPES_URL;
            output.suggestions.push_back(std::move(suggestion));
        }

        if (totals.gate_count > config.recursion_gates &&
            !string_utils::contains(context.source_code, context.analysis.recursive_marker)) {
            auto suggestion = circuit_wide(
                "best-practice-missing-recursive", Severity::Medium,
                "Large circuit without recursive composition",
                "Circuit has " + gates + " gates without the " + context.analysis.recursive_marker +
                " attribute. Consider recursive proof composition to split it into sub-circuits",
                Impact{fraction_of(totals.gate_count, config.recursion_factor), config.recursion_percent}
            );
            suggestion.learn_more_url = RECURSION_URL;
            output.suggestions.push_back(std::move(suggestion));
        }

        if (!context.report.top_functions.empty()) {
            const FunctionMetric& largest = context.report.top_functions.front();
            if (largest.percent_of_circuit > config.dominant_function_percent &&
                largest.name != context.analysis.entry_function) {
                const std::string percent = string_utils::format_fixed(largest.percent_of_circuit, 1);
                auto suggestion = circuit_wide(
                    "best-practice-large-function", Severity::Medium,
                    "Function dominates: " + largest.name,
                    "\"" + largest.name + "\" uses " + percent + "% of circuit. "
                    "Split it into smaller functions or optimize its logic",
                    Impact{fraction_of(largest.costs.gate_count, config.dominant_function_factor),
                           largest.percent_of_circuit * config.dominant_function_factor}
                );
                suggestion.line_number = largest.start_line;
                output.suggestions.push_back(std::move(suggestion));
            }
        }

        if (totals.constrained_ops > config.high_constrained_ops) {
            auto suggestion = circuit_wide(
                "best-practice-high-acir", Severity::Medium, "High constrained opcode count",
                "Circuit has " + string_utils::format_thousands(totals.constrained_ops) +
                " constrained opcodes. Optimize the hotspots to reduce proving time",
                Impact{fraction_of(totals.constrained_ops, config.high_constrained_factor),
                       config.high_constrained_percent}
            );
            suggestion.learn_more_url = DOCS_URL;
            output.suggestions.push_back(std::move(suggestion));
        }

        return Result<RuleOutput, Error>::success(std::move(output));
    }

}  // namespace cca::analysis
