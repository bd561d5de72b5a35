#ifndef CCA_ENGINE_HPP
#define CCA_ENGINE_HPP

/**
 * @file engine.hpp
 * @brief Public entry point of the circuit cost analyzer.
 *
 * The engine wires the parser, aggregator, cache and analyzer together:
 *
 * @code
 *     cca::ComplexityEngine engine;
 *
 *     cca::ReportInput input;
 *     input.constrained_text = acir_svg;
 *     input.gates_text = gates_svg;
 *     input.source_code = source;
 *
 *     auto report = engine.generate_complexity_report(input);
 *     if (report.is_err()) {
 *         return;
 *     }
 *     auto insights = engine.analyze_circuit(report.value(), source);
 * @endcode
 *
 * Reports are cached by the content hash of the source. Profiler text for
 * a source that is already cached is not parsed again until the entry
 * expires or the cache is cleared.
 */

#include "cca/analysis/optimization_analyzer.hpp"
#include "cca/config.hpp"
#include "cca/error.hpp"
#include "cca/metrics/aggregator.hpp"
#include "cca/metrics/heatmap.hpp"
#include "cca/metrics/report_cache.hpp"
#include "cca/parsers/cost_parser.hpp"
#include "cca/profiler/backend.hpp"
#include "cca/result.hpp"
#include "cca/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cca {

    /**
     * Profiler texts and the source they annotate.
     */
    struct ReportInput {
        std::optional<std::string> constrained_text;
        std::optional<std::string> unconstrained_text;
        std::optional<std::string> gates_text;
        std::string source_code;
        std::string file_name;  ///< Empty selects MetricsConfig::default_file_name

        static ReportInput from(profiler::ProfilerOutput output, std::string source_code, std::string file_name);
    };

    class ComplexityEngine {
    public:
        /**
         * Creates an engine with @p config. The configuration is assumed
         * valid; use Config::validate() or update_configuration() for
         * untrusted input.
         */
        explicit ComplexityEngine(Config config = Config::default_config());

        ComplexityEngine(const ComplexityEngine&) = delete;
        ComplexityEngine& operator=(const ComplexityEngine&) = delete;

        /**
         * Extracts cost annotations from one raw profiler text.
         */
        [[nodiscard]] std::vector<CostRecord> parse_cost_records(std::string_view raw_text) const;

        /**
         * Builds the report for @p input, or returns the cached one.
         *
         * @return The report, InvalidArgument if neither source nor any
         *         profiler text is given, or InFlight if the same source is
         *         being recomputed
         */
        [[nodiscard]] Result<ComplexityReport, Error> generate_complexity_report(const ReportInput& input);

        /**
         * Returns the report for @p source_code, profiling it through the
         * attached backend on a cache miss.
         *
         * @return nullopt on a miss without backend; ProfilerError when the
         *         backend fails
         */
        [[nodiscard]] Result<std::optional<ComplexityReport>, Error> get_complexity_report(
            std::string_view source_code,
            const std::optional<std::string>& manifest = std::nullopt,
            const std::optional<std::string>& file_name = std::nullopt
        );

        /**
         * Line deltas of @p current against the previous computed report.
         */
        [[nodiscard]] std::optional<MetricsComparison> compare_with_previous(
            const ComplexityReport& current,
            MetricKind metric = MetricKind::Constrained
        ) const;

        [[nodiscard]] InsightReport analyze_circuit(const ComplexityReport& report,
                                                    std::string_view source_code) const;

        [[nodiscard]] std::vector<metrics::HeatmapEntry> heatmap(const ComplexityReport& report,
                                                                 const metrics::HeatmapFilter& filter = {}) const;

        void clear_cache();

        /**
         * Merges @p patch into the current configuration.
         *
         * Nothing is applied if the merged configuration fails validation.
         */
        Result<void, Error> update_configuration(const ConfigPatch& patch);

        [[nodiscard]] const Config& get_configuration() const noexcept {
            return config_;
        }

        /**
         * Sets the profiler used by get_complexity_report(); nullptr detaches.
         */
        void attach_backend(std::shared_ptr<profiler::IProfilerBackend> backend);

        [[nodiscard]] bool has_backend() const noexcept {
            return backend_ != nullptr;
        }

        [[nodiscard]] metrics::CacheStats cache_stats() const {
            return cache_.stats();
        }

    private:
        void apply(const Config& config);

        [[nodiscard]] metrics::DomainRecords parse_domains(const std::optional<std::string>& constrained,
                                                           const std::optional<std::string>& unconstrained,
                                                           const std::optional<std::string>& gates) const;

        [[nodiscard]] std::string resolve_file_name(const std::string& file_name) const;

        Config config_;
        parsers::CostRecordParser parser_;
        metrics::ReportCache cache_;
        metrics::MetricsAggregator aggregator_;
        analysis::OptimizationAnalyzer analyzer_;
        std::shared_ptr<profiler::IProfilerBackend> backend_;
    };

}  // namespace cca

#endif //CCA_ENGINE_HPP
