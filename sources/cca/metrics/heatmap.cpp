#include "cca/metrics/heatmap.hpp"
#include "cca/utils/string_utils.hpp"

#include <algorithm>
#include <utility>

namespace cca::metrics
{
    namespace {

        std::string badge_text(const LineMetric& line, const MetricKind metric) {
            const char* suffix = metric == MetricKind::Gates ? "g" : "ops";
            return std::to_string(line.costs.get(metric)) + suffix;
        }

        std::string tooltip(const LineMetric& line) {
            return "Constrained: " + std::to_string(line.costs.constrained_ops) + " ops | " +
                   "Unconstrained: " + std::to_string(line.costs.unconstrained_ops) + " ops | " +
                   "Gates: " + std::to_string(line.costs.gate_count) + " | " +
                   string_utils::format_fixed(line.percent_of_circuit, 2) + "%";
        }

    }  // namespace

    std::vector<HeatmapEntry> generate_heatmap(const ComplexityReport& report, const HeatmapFilter& filter) {
        std::vector<HeatmapEntry> entries;
        if (report.files.empty()) {
            return entries;
        }

        for (const auto& line : report.files.front().lines) {
            if (line.percent_of_circuit < filter.threshold_percent) {
                continue;
            }

            HeatmapEntry entry;
            entry.line_number = line.line_number;
            entry.heat_value = line.normalized_heat;
            entry.primary_metric = line.costs.get(filter.metric);
            entry.metric = filter.metric;
            entry.badge_text = badge_text(line, filter.metric);
            entry.tooltip = tooltip(line);
            entries.push_back(std::move(entry));
        }

        std::ranges::stable_sort(entries, [](const HeatmapEntry& a, const HeatmapEntry& b) {
            return a.heat_value > b.heat_value;
        });
        return entries;
    }

}  // namespace cca::metrics
