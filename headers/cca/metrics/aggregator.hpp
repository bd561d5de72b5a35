#ifndef CCA_AGGREGATOR_HPP
#define CCA_AGGREGATOR_HPP

/**
 * @file aggregator.hpp
 * @brief Merges per-domain cost records into a ComplexityReport.
 *
 * Aggregation steps:
 *
 * 1. Fold every present domain into per-file line maps. Records for the
 *    same (line, column, expression) in several domains merge into one
 *    ExpressionMetric.
 * 2. Normalize: heat is relative to the costliest line of the circuit,
 *    percent is relative to the circuit-wide total of all domains.
 * 3. Detect functions lexically in the source of the analysed file and
 *    roll their lines up; function heat and percent are relative to the
 *    other functions only.
 * 4. Select hotspots and top functions.
 *
 * aggregate() is a pure function. aggregate_cached() wraps it with the
 * injected ReportCache keyed by the content hash of the source.
 */

#include "cca/config.hpp"
#include "cca/types.hpp"
#include "cca/result.hpp"
#include "cca/error.hpp"
#include "cca/metrics/report_cache.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cca::metrics {

    /**
     * Parser output for each cost domain. An absent domain contributes zero.
     */
    struct DomainRecords {
        std::optional<std::vector<CostRecord>> constrained;
        std::optional<std::vector<CostRecord>> unconstrained;
        std::optional<std::vector<CostRecord>> gates;

        [[nodiscard]] const std::optional<std::vector<CostRecord>>& get(CostDomain domain) const noexcept;

        std::optional<std::vector<CostRecord>>& get(CostDomain domain) noexcept;

        [[nodiscard]] bool empty() const noexcept {
            return !constrained && !unconstrained && !gates;
        }
    };

    struct AggregatorOptions {
        HotspotCriteria hotspots;
        std::size_t max_top_functions = 5;
    };

    /**
     * A lexically detected function declaration.
     */
    struct FunctionSpan {
        std::string name;
        std::size_t start_line = 0;
        std::size_t end_line = 0;  ///< Exclusive
    };

    /**
     * Finds function declarations matching "[pub] fn name" at line start.
     *
     * Each span runs from its declaration to the line before the next
     * declaration, the last one to the end of the source.
     */
    [[nodiscard]] std::vector<FunctionSpan> detect_functions(std::string_view source_code);

    class MetricsAggregator {
    public:
        using DomainLoader = std::function<Result<DomainRecords, Error>()>;

        explicit MetricsAggregator(ReportCache& cache, AggregatorOptions options = {});

        [[nodiscard]] ComplexityReport aggregate(const DomainRecords& domains,
                                                 std::string_view source_code,
                                                 const std::string& file_name) const;

        /**
         * Returns the cached report for @p source_code or loads the domain
         * records, aggregates and caches them.
         *
         * @p load is only invoked on a cache miss. Its errors are returned
         * unchanged; a concurrent recompute yields an InFlight error.
         */
        [[nodiscard]] Result<ComplexityReport, Error> aggregate_cached(std::string_view source_code,
                                                                       const std::string& file_name,
                                                                       const DomainLoader& load);

        [[nodiscard]] const AggregatorOptions& options() const noexcept {
            return options_;
        }

        void set_options(const AggregatorOptions& options) {
            options_ = options;
        }

        [[nodiscard]] ReportCache& cache() noexcept {
            return cache_;
        }

    private:
        ReportCache& cache_;
        AggregatorOptions options_;
    };

}  // namespace cca::metrics

#endif //CCA_AGGREGATOR_HPP
