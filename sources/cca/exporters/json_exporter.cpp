#include "cca/exporters/json_exporter.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

namespace cca::exporters
{
    using json = nlohmann::json;

    namespace {

        json costs_to_json(const CostTriple& costs) {
            return {
                {"constrained_ops", costs.constrained_ops},
                {"unconstrained_ops", costs.unconstrained_ops},
                {"gate_count", costs.gate_count},
                {"total", costs.total()}
            };
        }

        json line_to_json(const LineMetric& line, const bool include_expressions) {
            json entry;
            entry["line_number"] = line.line_number;
            entry["file"] = line.file;
            entry["costs"] = costs_to_json(line.costs);
            entry["total_cost"] = line.total_cost;
            entry["normalized_heat"] = line.normalized_heat;
            entry["percent_of_circuit"] = line.percent_of_circuit;

            if (include_expressions) {
                json expressions = json::array();
                for (const auto& expr : line.expressions) {
                    json domains = json::array();
                    for (const CostDomain domain : expr.domains) {
                        domains.push_back(to_string(domain));
                    }
                    expressions.push_back({
                        {"expression", expr.expression},
                        {"column", expr.column},
                        {"costs", costs_to_json(expr.costs)},
                        {"domains", domains}
                    });
                }
                entry["expressions"] = expressions;
            }
            return entry;
        }

        json function_to_json(const FunctionMetric& function) {
            return {
                {"name", function.name},
                {"package_name", function.package_name},
                {"start_line", function.start_line},
                {"end_line", function.end_line},
                {"costs", costs_to_json(function.costs)},
                {"total_cost", function.total_cost},
                {"normalized_heat", function.normalized_heat},
                {"percent_of_circuit", function.percent_of_circuit}
            };
        }

        json suggestion_to_json(const Suggestion& suggestion) {
            json entry;
            entry["id"] = suggestion.id;
            entry["line_number"] = suggestion.line_number;
            entry["severity"] = to_string(suggestion.severity);
            entry["category"] = to_string(suggestion.category);
            entry["title"] = suggestion.title;
            entry["description"] = suggestion.description;
            entry["impact"] = {
                {"estimated_savings", suggestion.impact.estimated_savings},
                {"savings_percent", suggestion.impact.savings_percent}
            };

            if (suggestion.code_snippet) {
                entry["code_snippet"] = *suggestion.code_snippet;
            }
            if (suggestion.suggested_fix) {
                entry["suggested_fix"] = *suggestion.suggested_fix;
            }
            if (suggestion.learn_more_url) {
                entry["learn_more_url"] = *suggestion.learn_more_url;
            }
            return entry;
        }

    }  // namespace

    std::string format_timestamp(const Timestamp ts) {
        const auto time_t_val = std::chrono::system_clock::to_time_t(ts);
        std::ostringstream ss;

#ifdef _WIN32
        std::tm time_info{};
        gmtime_s(&time_info, &time_t_val);
        ss << std::put_time(&time_info, "%Y-%m-%dT%H:%M:%SZ");
#else
        std::tm time_info{};
        gmtime_r(&time_t_val, &time_info);
        ss << std::put_time(&time_info, "%Y-%m-%dT%H:%M:%SZ");
#endif

        return ss.str();
    }

    JsonExporter::JsonExporter(ExportOptions options)
        : options_(std::move(options)) {}

    json JsonExporter::document(const char* kind, const Timestamp generated_at) const {
        json output = json::object();
        if (options_.include_metadata) {
            output["schema_version"] = options_.schema_version;
            output["cca_version"] = VERSION_STRING;
            output["generated_at"] = format_timestamp(generated_at);
        }
        output["kind"] = kind;
        return output;
    }

    json JsonExporter::to_json(const ComplexityReport& report) const {
        json output = document("complexity_report", report.generated_at);
        output["source_hash"] = report.source_hash;
        output["totals"] = costs_to_json(report.totals);

        json files = json::array();
        for (const auto& file : report.files) {
            json lines = json::array();
            for (const auto& line : file.lines) {
                lines.push_back(line_to_json(line, options_.include_expressions));
            }
            json functions = json::array();
            for (const auto& function : file.functions) {
                functions.push_back(function_to_json(function));
            }
            files.push_back({
                {"file_name", file.file_name},
                {"totals", costs_to_json(file.totals)},
                {"lines", lines},
                {"functions", functions}
            });
        }
        output["files"] = files;

        json hotspots = json::array();
        for (const auto& line : report.hotspots) {
            hotspots.push_back(line_to_json(line, false));
        }
        output["hotspots"] = hotspots;

        json top_functions = json::array();
        for (const auto& function : report.top_functions) {
            top_functions.push_back(function_to_json(function));
        }
        output["top_functions"] = top_functions;

        return output;
    }

    json JsonExporter::to_json(const InsightReport& insights) const {
        json output = document("insight_report", insights.analyzed_at);
        output["complexity_class"] = to_string(insights.complexity_class);
        output["totals"] = costs_to_json(insights.totals);
        output["total_potential_savings"] = insights.total_potential_savings;
        output["total_potential_savings_percent"] = insights.total_potential_savings_percent;

        json suggestions = json::array();
        for (const auto& suggestion : insights.suggestions) {
            suggestions.push_back(suggestion_to_json(suggestion));
        }
        output["suggestions"] = suggestions;

        return output;
    }

    json JsonExporter::to_json(const MetricsComparison& comparison) const {
        json output = document("metrics_comparison", comparison.compared_at);
        output["metric"] = to_string(comparison.metric);
        output["baseline_label"] = comparison.baseline_label;
        output["overall_change"] = comparison.overall_change;
        output["overall_change_percent"] = comparison.overall_change_percent;
        output["is_improvement"] = comparison.is_improvement;

        json deltas = json::array();
        for (const auto& delta : comparison.deltas) {
            deltas.push_back({
                {"line_number", delta.line_number},
                {"previous_value", delta.previous_value},
                {"current_value", delta.current_value},
                {"delta", delta.delta},
                {"delta_percent", delta.delta_percent},
                {"is_improvement", delta.is_improvement},
                {"is_regression", delta.is_regression}
            });
        }
        output["deltas"] = deltas;

        return output;
    }

    Result<void, Error> JsonExporter::write(std::ostream& stream, const json& output) const {
        std::string text;
        try {
            // Profiler expressions and source snippets are not guaranteed to be UTF-8
            text = output.dump(options_.pretty_print ? 2 : -1, ' ', false, json::error_handler_t::replace);
        } catch (const json::exception& e) {
            return Result<void, Error>::failure(
                Error(ErrorCode::InternalError, "Failed to serialize JSON output: " + std::string(e.what()))
            );
        }

        stream << text << std::endl;

        if (!stream) {
            return Result<void, Error>::failure(
                Error(ErrorCode::IoError, "Failed to write JSON output")
            );
        }
        return Result<void, Error>::success();
    }

    Result<void, Error> JsonExporter::export_to_stream(std::ostream& stream, const ComplexityReport& report) const {
        return write(stream, to_json(report));
    }

    Result<void, Error> JsonExporter::export_to_stream(std::ostream& stream, const InsightReport& insights) const {
        return write(stream, to_json(insights));
    }

    Result<void, Error> JsonExporter::export_to_stream(std::ostream& stream,
                                                       const MetricsComparison& comparison) const {
        return write(stream, to_json(comparison));
    }

    Result<std::string, Error> JsonExporter::export_to_string(const ComplexityReport& report) const {
        std::ostringstream ss;
        if (auto result = export_to_stream(ss, report); result.is_err()) {
            return Result<std::string, Error>::failure(result.error());
        }
        return Result<std::string, Error>::success(ss.str());
    }

    Result<std::string, Error> JsonExporter::export_to_string(const InsightReport& insights) const {
        std::ostringstream ss;
        if (auto result = export_to_stream(ss, insights); result.is_err()) {
            return Result<std::string, Error>::failure(result.error());
        }
        return Result<std::string, Error>::success(ss.str());
    }

    Result<std::string, Error> JsonExporter::export_to_string(const MetricsComparison& comparison) const {
        std::ostringstream ss;
        if (auto result = export_to_stream(ss, comparison); result.is_err()) {
            return Result<std::string, Error>::failure(result.error());
        }
        return Result<std::string, Error>::success(ss.str());
    }

    Result<void, Error> JsonExporter::export_to_file(const std::string& path, const ComplexityReport& report) const {
        std::ofstream file(path);
        if (!file.is_open()) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to open file for writing", path)
            );
        }
        return export_to_stream(file, report);
    }

}  // namespace cca::exporters
