#include "cca/analysis/rule.hpp"
#include "cca/utils/numeric_utils.hpp"
#include "cca/utils/string_utils.hpp"

#include <regex>

namespace cca::analysis
{
    Impact scaled_impact(const LineMetric* metrics, const double factor, const std::int64_t fallback) {
        Impact impact;
        if (metrics == nullptr) {
            impact.estimated_savings = fallback;
            return impact;
        }
        impact.estimated_savings = numeric_utils::scale(metrics->costs.gate_count, factor);
        impact.savings_percent = metrics->percent_of_circuit * factor;
        return impact;
    }

    bool is_loop_header(const std::string_view line) {
        static const std::regex loop_regex(R"(for\s+\w+\s+in\s+.+\{)");
        return std::regex_search(line.begin(), line.end(), loop_regex);
    }

    bool loop_precedes(const std::vector<std::string_view>& lines,
                       const std::size_t index,
                       const std::size_t lookback) {
        const std::size_t first = index > lookback ? index - lookback : 0;
        for (std::size_t i = first; i < index && i < lines.size(); ++i) {
            if (is_loop_header(lines[i])) {
                return true;
            }
        }
        return false;
    }

    std::string snippet(const std::string_view line) {
        return std::string(string_utils::trim(line));
    }

}  // namespace cca::analysis
