#include "cca/analysis/loop_rule.hpp"
#include "cca/utils/numeric_utils.hpp"

#include <charconv>
#include <optional>
#include <regex>
#include <string>
#include <utility>

namespace cca::analysis
{
    namespace {

        struct LiteralRange {
            std::int64_t start = 0;
            std::int64_t end = 0;
        };

        std::optional<std::int64_t> to_int(const std::string& text) {
            std::int64_t value = 0;
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || ptr != text.data() + text.size()) {
                return std::nullopt;
            }
            return value;
        }

        std::optional<LiteralRange> literal_range(const std::string& range_text) {
            static const std::regex range_regex(R"((\d+)\.\.(\d+))");

            std::smatch match;
            if (!std::regex_search(range_text, match, range_regex)) {
                return std::nullopt;
            }
            const auto start = to_int(match[1].str());
            const auto end = to_int(match[2].str());
            if (!start || !end) {
                return std::nullopt;
            }
            return LiteralRange{*start, *end};
        }

    }  // namespace

    Result<RuleOutput, Error> LoopRule::evaluate(const RuleContext& context) const {
        static const std::regex loop_regex(R"(for\s+\w+\s+in\s+(.+?)\s*\{)");

        RuleOutput output;
        const auto& config = context.heuristics.loops;
        const auto& lines = context.source_lines;

        for (std::size_t index = 0; index < lines.size(); ++index) {
            ++output.lines_scanned;
            const std::size_t line_number = index + 1;
            const std::string line(lines[index]);
            const LineMetric* metrics = context.line_metrics(line_number);

            std::smatch match;
            if (std::regex_search(line, match, loop_regex)) {
                if (const auto range = literal_range(match[1].str())) {
                    const std::int64_t iterations = range->end - range->start;
                    if (iterations > config.max_iterations) {
                        Suggestion suggestion;
                        suggestion.id = "loop-large-" + std::to_string(line_number);
                        suggestion.line_number = line_number;
                        suggestion.severity = Severity::High;
                        suggestion.category = SuggestionCategory::Loop;
                        suggestion.title = "Loop: " + std::to_string(iterations) + " iterations";
                        suggestion.description = "Loop unrolls " + std::to_string(iterations) +
                                                 " times. Reduce iterations or restructure to lower the constraint count";
                        suggestion.impact = scaled_impact(metrics, config.large_loop_factor,
                                                          numeric_utils::saturating_mul(iterations, config.large_loop_fallback_per_iteration));
                        suggestion.code_snippet = snippet(line);
                        output.suggestions.push_back(std::move(suggestion));
                    }
                } else {
                    Suggestion suggestion;
                    suggestion.id = "loop-dynamic-" + std::to_string(line_number);
                    suggestion.line_number = line_number;
                    suggestion.severity = Severity::Medium;
                    suggestion.category = SuggestionCategory::Loop;
                    suggestion.title = "Loop: variable bounds";
                    suggestion.description = "Loop has variable bounds. Use compile-time constants or fixed-size arrays";
                    suggestion.impact = scaled_impact(metrics, config.dynamic_bound_factor,
                                                      config.dynamic_bound_fallback);
                    suggestion.code_snippet = snippet(line);
                    output.suggestions.push_back(std::move(suggestion));
                }
            }

            if (is_loop_header(line) && loop_precedes(lines, index, config.nested_lookback)) {
                Suggestion suggestion;
                suggestion.id = "loop-nested-" + std::to_string(line_number);
                suggestion.line_number = line_number;
                suggestion.severity = Severity::High;
                suggestion.category = SuggestionCategory::Loop;
                suggestion.title = "Nested loop";
                suggestion.description = "Nested loops multiply the unrolled body. Flatten the logic, "
                                         "use lookup tables or restructure";
                suggestion.impact = scaled_impact(metrics, config.nested_loop_factor,
                                                  config.nested_loop_fallback);
                suggestion.code_snippet = snippet(line);
                output.suggestions.push_back(std::move(suggestion));
            }
        }

        return Result<RuleOutput, Error>::success(std::move(output));
    }

}  // namespace cca::analysis
