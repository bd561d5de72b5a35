#include "cca/types.hpp"

#include <algorithm>

namespace cca
{
    std::optional<MetricKind> metric_kind_from_string(const std::string& str) noexcept {
        if (str == "constrained" || str == "acir") return MetricKind::Constrained;
        if (str == "unconstrained" || str == "brillig") return MetricKind::Unconstrained;
        if (str == "gates") return MetricKind::Gates;
        if (str == "total") return MetricKind::Total;
        return std::nullopt;
    }

    const LineMetric* FileMetric::find_line(const std::size_t line_number) const noexcept {
        const auto it = std::ranges::lower_bound(lines, line_number, {}, &LineMetric::line_number);
        if (it == lines.end() || it->line_number != line_number) {
            return nullptr;
        }
        return &*it;
    }

    const LineMetric* ComplexityReport::find_hotspot(const std::size_t line_number) const noexcept {
        const std::string* primary_file = files.empty() ? nullptr : &files.front().file_name;
        const auto it = std::ranges::find_if(hotspots, [&](const LineMetric& hotspot) {
            return hotspot.line_number == line_number &&
                   (primary_file == nullptr || hotspot.file == *primary_file);
        });
        return it == hotspots.end() ? nullptr : &*it;
    }

    bool ComplexityReport::same_values(const ComplexityReport& other) const {
        return files == other.files &&
               totals == other.totals &&
               hotspots == other.hotspots &&
               top_functions == other.top_functions &&
               source_hash == other.source_hash;
    }

}  // namespace cca
