#include "cca/analysis/hotspot_rule.hpp"
#include "cca/utils/numeric_utils.hpp"
#include "cca/utils/string_utils.hpp"

#include <string>
#include <utility>

namespace cca::analysis
{
    namespace {

        Severity hotspot_severity(const double percent, const heuristics::HotspotConfig& config) {
            if (percent >= config.high_percent) {
                return Severity::High;
            }
            if (percent < config.low_percent) {
                return Severity::Low;
            }
            return Severity::Medium;
        }

    }  // namespace

    Result<RuleOutput, Error> HotspotRule::evaluate(const RuleContext& context) const {
        RuleOutput output;
        const auto& config = context.heuristics.hotspot;
        const std::string* primary_file = context.report.files.empty()
            ? nullptr
            : &context.report.files.front().file_name;

        for (const auto& hotspot : context.report.hotspots) {
            ++output.lines_scanned;

            if (primary_file != nullptr && hotspot.file != *primary_file) {
                continue;
            }
            if (hotspot.percent_of_circuit < context.analysis.hotspot_threshold_percent) {
                continue;
            }
            if (hotspot.costs.gate_count == 0) {
                continue;
            }

            const std::string percent = string_utils::format_fixed(hotspot.percent_of_circuit, 1);

            Suggestion suggestion;
            suggestion.id = "hotspot-" + std::to_string(hotspot.line_number);
            suggestion.line_number = hotspot.line_number;
            suggestion.severity = hotspot_severity(hotspot.percent_of_circuit, config);
            suggestion.category = SuggestionCategory::General;
            suggestion.title = "Hotspot: " + percent + "% of circuit";
            suggestion.description = "Uses " + percent + "% of circuit (" +
                                     std::to_string(hotspot.costs.gate_count) +
                                     " gates). Split into smaller operations or optimize the algorithm";
            suggestion.impact.estimated_savings = numeric_utils::scale(hotspot.costs.gate_count, config.savings_factor);
            suggestion.impact.savings_percent = hotspot.percent_of_circuit * config.savings_factor;

            if (hotspot.line_number >= 1 && hotspot.line_number <= context.source_lines.size()) {
                suggestion.code_snippet = snippet(context.source_lines[hotspot.line_number - 1]);
            } else {
                suggestion.code_snippet = std::string();
            }

            output.suggestions.push_back(std::move(suggestion));
        }

        return Result<RuleOutput, Error>::success(std::move(output));
    }

}  // namespace cca::analysis
