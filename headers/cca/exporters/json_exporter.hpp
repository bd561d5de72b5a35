#ifndef CCA_JSON_EXPORTER_HPP
#define CCA_JSON_EXPORTER_HPP

/**
 * @file json_exporter.hpp
 * @brief Versioned JSON output for reports, insights and comparisons.
 *
 * Every document carries a metadata header unless disabled:
 *
 * @code
 *     {
 *       "schema_version": "1.0.0",
 *       "cca_version": "1.0.0",
 *       "generated_at": "2026-01-01T12:00:00Z",
 *       "kind": "complexity_report",
 *       ...
 *     }
 * @endcode
 */

#include "cca/types.hpp"
#include "cca/result.hpp"
#include "cca/error.hpp"
#include "cca/version.hpp"

#include <nlohmann/json.hpp>

#include <ostream>
#include <string>

namespace cca::exporters {

    struct ExportOptions {
        bool pretty_print = true;
        bool include_metadata = true;
        bool include_expressions = true;  ///< Per-expression detail of each line
        std::string schema_version = SCHEMA_VERSION;
    };

    class JsonExporter {
    public:
        explicit JsonExporter(ExportOptions options = {});

        [[nodiscard]] nlohmann::json to_json(const ComplexityReport& report) const;

        [[nodiscard]] nlohmann::json to_json(const InsightReport& insights) const;

        [[nodiscard]] nlohmann::json to_json(const MetricsComparison& comparison) const;

        [[nodiscard]] Result<void, Error> export_to_stream(std::ostream& stream,
                                                           const ComplexityReport& report) const;

        [[nodiscard]] Result<void, Error> export_to_stream(std::ostream& stream,
                                                           const InsightReport& insights) const;

        [[nodiscard]] Result<void, Error> export_to_stream(std::ostream& stream,
                                                           const MetricsComparison& comparison) const;

        [[nodiscard]] Result<std::string, Error> export_to_string(const ComplexityReport& report) const;

        [[nodiscard]] Result<std::string, Error> export_to_string(const InsightReport& insights) const;

        [[nodiscard]] Result<std::string, Error> export_to_string(const MetricsComparison& comparison) const;

        /**
         * Writes the report to @p path, replacing the file.
         */
        [[nodiscard]] Result<void, Error> export_to_file(const std::string& path,
                                                         const ComplexityReport& report) const;

        [[nodiscard]] const ExportOptions& options() const noexcept {
            return options_;
        }

    private:
        [[nodiscard]] nlohmann::json document(const char* kind, Timestamp generated_at) const;

        [[nodiscard]] Result<void, Error> write(std::ostream& stream, const nlohmann::json& output) const;

        ExportOptions options_;
    };

    /**
     * Formats a timestamp as ISO 8601 UTC.
     */
    [[nodiscard]] std::string format_timestamp(Timestamp ts);

}  // namespace cca::exporters

#endif //CCA_JSON_EXPORTER_HPP
