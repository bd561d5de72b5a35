#include "cca/engine.hpp"
#include "cca/utils/hash_utils.hpp"
#include "cca/utils/logging.hpp"

#include <chrono>
#include <utility>

namespace cca
{
    namespace {

        metrics::CacheOptions cache_options_from(const MetricsConfig& config) {
            metrics::CacheOptions options;
            options.ttl = std::chrono::milliseconds(config.cache_ttl_ms);
            options.history_depth = config.history_depth;
            return options;
        }

        metrics::AggregatorOptions aggregator_options_from(const Config& config) {
            metrics::AggregatorOptions options;
            options.hotspots = config.hotspots;
            options.max_top_functions = config.metrics.max_top_functions;
            return options;
        }

        bool has_text(const std::optional<std::string>& text) {
            return text.has_value() && !text->empty();
        }

    }  // namespace

    ReportInput ReportInput::from(profiler::ProfilerOutput output, std::string source_code, std::string file_name) {
        ReportInput input;
        input.constrained_text = std::move(output.constrained_text);
        input.unconstrained_text = std::move(output.unconstrained_text);
        input.gates_text = std::move(output.gates_text);
        input.source_code = std::move(source_code);
        input.file_name = std::move(file_name);
        return input;
    }

    ComplexityEngine::ComplexityEngine(Config config)
        : config_(std::move(config))
        , parser_(config_.metrics.source_extension)
        , cache_(cache_options_from(config_.metrics))
        , aggregator_(cache_, aggregator_options_from(config_))
        , analyzer_(config_.analysis, config_.heuristics) {
        if (auto configured = logging::configure(config_.logging); configured.is_err()) {
            logging::get_logger()->warn("Keeping current log settings: {}", configured.error().to_string());
        }
    }

    std::vector<CostRecord> ComplexityEngine::parse_cost_records(const std::string_view raw_text) const {
        return parser_.parse(raw_text);
    }

    metrics::DomainRecords ComplexityEngine::parse_domains(const std::optional<std::string>& constrained,
                                                           const std::optional<std::string>& unconstrained,
                                                           const std::optional<std::string>& gates) const {
        metrics::DomainRecords domains;
        if (constrained) {
            domains.constrained = parser_.parse(*constrained);
        }
        if (unconstrained) {
            domains.unconstrained = parser_.parse(*unconstrained);
        }
        if (gates) {
            domains.gates = parser_.parse(*gates);
        }
        return domains;
    }

    std::string ComplexityEngine::resolve_file_name(const std::string& file_name) const {
        return file_name.empty() ? config_.metrics.default_file_name : file_name;
    }

    Result<ComplexityReport, Error> ComplexityEngine::generate_complexity_report(const ReportInput& input) {
        if (input.source_code.empty() && !has_text(input.constrained_text) &&
            !has_text(input.unconstrained_text) && !has_text(input.gates_text)) {
            return Result<ComplexityReport, Error>::failure(
                Error::invalid_argument("Neither source code nor profiler output was provided")
            );
        }

        const std::string file_name = resolve_file_name(input.file_name);
        return aggregator_.aggregate_cached(input.source_code, file_name,
            [&]() -> Result<metrics::DomainRecords, Error> {
                return Result<metrics::DomainRecords, Error>::success(
                    parse_domains(input.constrained_text, input.unconstrained_text, input.gates_text)
                );
            });
    }

    Result<std::optional<ComplexityReport>, Error> ComplexityEngine::get_complexity_report(
        const std::string_view source_code,
        const std::optional<std::string>& manifest,
        const std::optional<std::string>& file_name
    ) {
        using ResultType = Result<std::optional<ComplexityReport>, Error>;

        if (!backend_) {
            return ResultType::success(cache_.lookup(hash_utils::content_hash(source_code)));
        }

        const std::string resolved = resolve_file_name(file_name.value_or(""));
        auto report = aggregator_.aggregate_cached(source_code, resolved,
            [&]() -> Result<metrics::DomainRecords, Error> {
                auto output = backend_->profile(source_code, manifest, resolved);
                if (output.is_err()) {
                    const Error& error = output.error();
                    logging::get_logger()->warn("Profiler failed for {}: {}", resolved, error.to_string());
                    if (error.code() == ErrorCode::ProfilerError) {
                        return Result<metrics::DomainRecords, Error>::failure(error);
                    }
                    return Result<metrics::DomainRecords, Error>::failure(
                        Error::profiler_error(error.message(), resolved)
                    );
                }
                const auto& texts = output.value();
                return Result<metrics::DomainRecords, Error>::success(
                    parse_domains(texts.constrained_text, texts.unconstrained_text, texts.gates_text)
                );
            });

        return report.map([](const ComplexityReport& computed) {
            return std::optional<ComplexityReport>(computed);
        });
    }

    std::optional<MetricsComparison> ComplexityEngine::compare_with_previous(const ComplexityReport& current,
                                                                             const MetricKind metric) const {
        return cache_.compare_with_previous(current, metric);
    }

    InsightReport ComplexityEngine::analyze_circuit(const ComplexityReport& report,
                                                    const std::string_view source_code) const {
        return analyzer_.analyze(report, source_code);
    }

    std::vector<metrics::HeatmapEntry> ComplexityEngine::heatmap(const ComplexityReport& report,
                                                                 const metrics::HeatmapFilter& filter) const {
        return metrics::generate_heatmap(report, filter);
    }

    void ComplexityEngine::clear_cache() {
        cache_.clear();
    }

    Result<void, Error> ComplexityEngine::update_configuration(const ConfigPatch& patch) {
        if (patch.empty()) {
            return Result<void, Error>::success();
        }

        Config merged = patch.apply_to(config_);
        if (auto valid = merged.validate(); valid.is_err()) {
            return valid;
        }

        if (patch.logging) {
            if (auto configured = logging::configure(merged.logging); configured.is_err()) {
                return configured;
            }
        }

        apply(merged);
        logging::get_logger()->debug("Configuration updated");
        return Result<void, Error>::success();
    }

    void ComplexityEngine::apply(const Config& config) {
        if (config.metrics.source_extension != config_.metrics.source_extension) {
            parser_ = parsers::CostRecordParser(config.metrics.source_extension);
        }
        cache_.set_options(cache_options_from(config.metrics));
        aggregator_.set_options(aggregator_options_from(config));
        analyzer_.set_config(config.analysis, config.heuristics);
        config_ = config;
    }

    void ComplexityEngine::attach_backend(std::shared_ptr<profiler::IProfilerBackend> backend) {
        backend_ = std::move(backend);
    }

}  // namespace cca
