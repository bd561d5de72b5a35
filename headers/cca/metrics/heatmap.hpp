#ifndef CCA_HEATMAP_HPP
#define CCA_HEATMAP_HPP

/**
 * @file heatmap.hpp
 * @brief Per-line heat data for editor overlays.
 */

#include "cca/types.hpp"

#include <string>
#include <vector>

namespace cca::metrics {

    struct HeatmapFilter {
        MetricKind metric = MetricKind::Constrained;

        /// Lines below this share of the circuit (0-100) are omitted
        double threshold_percent = 0.0;
    };

    struct HeatmapEntry {
        std::size_t line_number = 0;
        double heat_value = 0.0;
        std::int64_t primary_metric = 0;
        MetricKind metric = MetricKind::Constrained;
        std::string badge_text;  ///< "42ops", or "42g" for gates
        std::string tooltip;
    };

    /**
     * Heat entries for the lines of the report's first file that pass
     * @p filter, hottest first.
     */
    [[nodiscard]] std::vector<HeatmapEntry> generate_heatmap(const ComplexityReport& report,
                                                             const HeatmapFilter& filter);

}  // namespace cca::metrics

#endif //CCA_HEATMAP_HPP
