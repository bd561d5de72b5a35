#ifndef CCA_HOTSPOT_SELECTOR_HPP
#define CCA_HOTSPOT_SELECTOR_HPP

/**
 * @file hotspot_selector.hpp
 * @brief Filters aggregated lines and functions into bounded top-N lists.
 */

#include "cca/config.hpp"
#include "cca/types.hpp"

#include <vector>

namespace cca::metrics {

    /**
     * Pure filter and sort over aggregated metrics.
     *
     * Sorting is stable: entries with equal keys keep their input order.
     */
    class HotspotSelector {
    public:
        explicit HotspotSelector(HotspotCriteria criteria = {})
            : criteria_(criteria) {}

        /**
         * Percentage mode keeps lines with percent_of_circuit at or above
         * minimum_threshold * 100 and sorts by percent. Absolute mode keeps
         * lines whose metric value is at or above minimum_threshold and
         * sorts by that value. Both truncate to max_results.
         */
        [[nodiscard]] std::vector<LineMetric> select(const std::vector<LineMetric>& lines) const;

        [[nodiscard]] const HotspotCriteria& criteria() const noexcept {
            return criteria_;
        }

    private:
        HotspotCriteria criteria_;
    };

    /**
     * The @p k costliest functions by total cost, in descending order.
     */
    [[nodiscard]] std::vector<FunctionMetric> select_top_functions(const std::vector<FunctionMetric>& functions,
                                                                   std::size_t k);

}  // namespace cca::metrics

#endif //CCA_HOTSPOT_SELECTOR_HPP
