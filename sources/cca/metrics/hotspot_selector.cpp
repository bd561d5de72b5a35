#include "cca/metrics/hotspot_selector.hpp"

#include <algorithm>

namespace cca::metrics
{
    namespace {

        double sort_key(const LineMetric& line, const HotspotCriteria& criteria) {
            if (criteria.sort_by == HotspotSortKey::Percentage) {
                return line.percent_of_circuit;
            }
            return static_cast<double>(line.costs.get(criteria.metric));
        }

    }  // namespace

    std::vector<LineMetric> HotspotSelector::select(const std::vector<LineMetric>& lines) const {
        std::vector<LineMetric> selected;

        for (const auto& line : lines) {
            const bool passes = criteria_.sort_by == HotspotSortKey::Percentage
                ? line.percent_of_circuit >= criteria_.minimum_threshold * 100.0
                : static_cast<double>(line.costs.get(criteria_.metric)) >= criteria_.minimum_threshold;
            if (passes) {
                selected.push_back(line);
            }
        }

        std::ranges::stable_sort(selected, [this](const LineMetric& a, const LineMetric& b) {
            return sort_key(a, criteria_) > sort_key(b, criteria_);
        });

        if (selected.size() > criteria_.max_results) {
            selected.resize(criteria_.max_results);
        }
        return selected;
    }

    std::vector<FunctionMetric> select_top_functions(const std::vector<FunctionMetric>& functions,
                                                     const std::size_t k) {
        std::vector<FunctionMetric> sorted = functions;
        std::ranges::stable_sort(sorted, [](const FunctionMetric& a, const FunctionMetric& b) {
            return a.total_cost > b.total_cost;
        });
        if (sorted.size() > k) {
            sorted.resize(k);
        }
        return sorted;
    }

}  // namespace cca::metrics
