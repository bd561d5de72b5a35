#include "cca/analysis/array_rule.hpp"

#include <regex>
#include <string>
#include <utility>

namespace cca::analysis
{
    Result<RuleOutput, Error> ArrayRule::evaluate(const RuleContext& context) const {
        static const std::regex vec_regex(R"(Vec\s*<)");
        static const std::regex push_regex(R"(\.push\s*\()");

        RuleOutput output;
        const auto& config = context.heuristics.arrays;
        const auto& lines = context.source_lines;

        for (std::size_t index = 0; index < lines.size(); ++index) {
            ++output.lines_scanned;
            const std::string_view line = lines[index];
            const std::size_t line_number = index + 1;

            if (std::regex_search(line.begin(), line.end(), vec_regex)) {
                Suggestion suggestion;
                suggestion.id = "array-vec-" + std::to_string(line_number);
                suggestion.line_number = line_number;
                suggestion.severity = Severity::Medium;
                suggestion.category = SuggestionCategory::Storage;
                suggestion.title = "Dynamic array (Vec)";
                suggestion.description = "Vec is less efficient than a fixed-size array. "
                                         "Use [Field; N] instead of Vec<Field>";
                suggestion.impact.estimated_savings = config.vec_savings;
                suggestion.impact.savings_percent = config.vec_savings_percent;
                suggestion.code_snippet = snippet(line);
                output.suggestions.push_back(std::move(suggestion));
            }

            if (std::regex_search(line.begin(), line.end(), push_regex)) {
                Suggestion suggestion;
                suggestion.id = "array-push-" + std::to_string(line_number);
                suggestion.line_number = line_number;
                suggestion.severity = Severity::Low;
                suggestion.category = SuggestionCategory::Storage;
                suggestion.title = "Array push";
                suggestion.description = "push() adds overhead. Use a fixed-size array with manual indexing";
                suggestion.impact.estimated_savings = config.push_savings;
                suggestion.impact.savings_percent = config.push_savings_percent;
                suggestion.code_snippet = snippet(line);
                output.suggestions.push_back(std::move(suggestion));
            }
        }

        return Result<RuleOutput, Error>::success(std::move(output));
    }

}  // namespace cca::analysis
