#include "cca/analysis/arithmetic_rule.hpp"
#include "cca/utils/string_utils.hpp"

#include <string>
#include <utility>

namespace cca::analysis
{
    Result<RuleOutput, Error> ArithmeticRule::evaluate(const RuleContext& context) const {
        RuleOutput output;
        const auto& config = context.heuristics.arithmetic;
        const auto& lines = context.source_lines;

        for (std::size_t index = 0; index < lines.size(); ++index) {
            ++output.lines_scanned;
            const std::string_view line = lines[index];

            // Lines with a "//" comment are skipped entirely
            if (!string_utils::contains(line, "/") || string_utils::contains(line, "//")) {
                continue;
            }

            const std::size_t line_number = index + 1;

            Suggestion suggestion;
            suggestion.id = "arithmetic-division-" + std::to_string(line_number);
            suggestion.line_number = line_number;
            suggestion.severity = Severity::Medium;
            suggestion.category = SuggestionCategory::Arithmetic;
            suggestion.title = "Division";
            suggestion.description = "Division requires an expensive field inversion. Multiply by the modular "
                                     "inverse of constants or restructure the logic to avoid dividing";
            suggestion.impact = scaled_impact(context.line_metrics(line_number), config.division_factor,
                                              config.division_fallback);
            suggestion.code_snippet = snippet(line);
            output.suggestions.push_back(std::move(suggestion));
        }

        return Result<RuleOutput, Error>::success(std::move(output));
    }

}  // namespace cca::analysis
