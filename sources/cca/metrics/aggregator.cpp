#include "cca/metrics/aggregator.hpp"
#include "cca/metrics/hotspot_selector.hpp"
#include "cca/utils/hash_utils.hpp"
#include "cca/utils/logging.hpp"
#include "cca/utils/numeric_utils.hpp"
#include "cca/utils/string_utils.hpp"

#include <algorithm>
#include <map>
#include <regex>
#include <utility>

namespace cca::metrics
{
    namespace {

        using LineMap = std::map<std::size_t, LineMetric>;

        /**
         * Profilers may report "src/main.nr" for a file the caller calls
         * "main.nr"; both name the analysed file.
         */
        bool same_file(const std::string& reported, const std::string& analysed) {
            if (reported == analysed) {
                return true;
            }
            const auto suffix_match = [](const std::string& longer, const std::string& shorter) {
                return longer.size() > shorter.size() &&
                       longer.ends_with(shorter) &&
                       longer[longer.size() - shorter.size() - 1] == '/';
            };
            return suffix_match(reported, analysed) || suffix_match(analysed, reported);
        }

        /**
         * Per-file line maps, the analysed file first and the others in
         * order of first appearance.
         */
        class LineFold {
        public:
            explicit LineFold(std::string primary_file) {
                order_.push_back(std::move(primary_file));
                maps_.emplace_back();
            }

            void add(const CostRecord& record, const CostDomain domain) {
                const std::string& file = record.file.empty() || same_file(record.file, order_.front())
                    ? order_.front()
                    : record.file;
                LineMap& lines = map_for(file);

                auto [it, inserted] = lines.try_emplace(record.line);
                LineMetric& line = it->second;
                if (inserted) {
                    line.line_number = record.line;
                    line.file = file;
                }
                line.costs.add(domain, record.cost);

                const auto existing = std::ranges::find_if(line.expressions, [&](const ExpressionMetric& e) {
                    return e.column == record.column && e.expression == record.expression;
                });
                if (existing != line.expressions.end()) {
                    existing->costs.add(domain, record.cost);
                    if (std::ranges::find(existing->domains, domain) == existing->domains.end()) {
                        existing->domains.push_back(domain);
                    }
                    return;
                }

                ExpressionMetric expression;
                expression.expression = record.expression;
                expression.column = record.column;
                expression.costs.add(domain, record.cost);
                expression.domains.push_back(domain);
                line.expressions.push_back(std::move(expression));
            }

            [[nodiscard]] const std::vector<std::string>& files() const noexcept {
                return order_;
            }

            [[nodiscard]] const LineMap& lines(const std::size_t index) const {
                return maps_[index];
            }

        private:
            LineMap& map_for(const std::string& file) {
                const auto it = std::ranges::find(order_, file);
                if (it != order_.end()) {
                    return maps_[static_cast<std::size_t>(it - order_.begin())];
                }
                order_.push_back(file);
                return maps_.emplace_back();
            }

            std::vector<std::string> order_;
            std::vector<LineMap> maps_;
        };

        std::vector<FunctionMetric> rollup_functions(const std::vector<FunctionSpan>& spans,
                                                     const std::vector<LineMetric>& lines) {
            std::vector<FunctionMetric> functions;
            functions.reserve(spans.size());

            for (const auto& span : spans) {
                FunctionMetric function;
                function.name = span.name;
                function.start_line = span.start_line;
                function.end_line = span.end_line;

                for (const auto& line : lines) {
                    if (line.line_number >= span.start_line && line.line_number < span.end_line) {
                        function.costs += line.costs;
                    }
                }
                function.total_cost = function.costs.total();
                functions.push_back(std::move(function));
            }

            std::int64_t max_cost = 0;
            std::int64_t sum_cost = 0;
            for (const auto& function : functions) {
                max_cost = std::max(max_cost, function.total_cost);
                sum_cost = numeric_utils::saturating_add(sum_cost, function.total_cost);
            }

            for (auto& function : functions) {
                function.normalized_heat = max_cost > 0
                    ? static_cast<double>(function.total_cost) / static_cast<double>(max_cost)
                    : 0.0;
                function.percent_of_circuit = sum_cost > 0
                    ? 100.0 * static_cast<double>(function.total_cost) / static_cast<double>(sum_cost)
                    : 0.0;
            }

            std::ranges::stable_sort(functions, [](const FunctionMetric& a, const FunctionMetric& b) {
                return a.total_cost > b.total_cost;
            });
            return functions;
        }

    }  // namespace

    const std::optional<std::vector<CostRecord>>& DomainRecords::get(const CostDomain domain) const noexcept {
        switch (domain) {
            case CostDomain::Constrained:   return constrained;
            case CostDomain::Unconstrained: return unconstrained;
            case CostDomain::Gates:         return gates;
        }
        return constrained;
    }

    std::optional<std::vector<CostRecord>>& DomainRecords::get(const CostDomain domain) noexcept {
        switch (domain) {
            case CostDomain::Constrained:   return constrained;
            case CostDomain::Unconstrained: return unconstrained;
            case CostDomain::Gates:         return gates;
        }
        return constrained;
    }

    std::vector<FunctionSpan> detect_functions(const std::string_view source_code) {
        static const std::regex function_regex(R"(^\s*(pub\s+)?fn\s+(\w+))");

        const auto lines = string_utils::split_lines(source_code);
        std::vector<FunctionSpan> spans;

        for (std::size_t i = 0; i < lines.size(); ++i) {
            std::match_results<std::string_view::const_iterator> match;
            if (!std::regex_search(lines[i].begin(), lines[i].end(), match, function_regex)) {
                continue;
            }
            if (!spans.empty()) {
                spans.back().end_line = i + 1;
            }
            FunctionSpan span;
            span.name = match[2].str();
            span.start_line = i + 1;
            spans.push_back(std::move(span));
        }

        if (!spans.empty()) {
            spans.back().end_line = lines.size() + 1;
        }
        return spans;
    }

    MetricsAggregator::MetricsAggregator(ReportCache& cache, AggregatorOptions options)
        : cache_(cache)
        , options_(std::move(options)) {}

    ComplexityReport MetricsAggregator::aggregate(const DomainRecords& domains,
                                                  const std::string_view source_code,
                                                  const std::string& file_name) const {
        LineFold fold(file_name);
        for (const CostDomain domain : ALL_COST_DOMAINS) {
            const auto& records = domains.get(domain);
            if (!records) {
                continue;
            }
            for (const auto& record : *records) {
                fold.add(record, domain);
            }
        }

        ComplexityReport report;
        report.files.reserve(fold.files().size());

        std::int64_t max_line_cost = 0;
        for (std::size_t i = 0; i < fold.files().size(); ++i) {
            FileMetric file;
            file.file_name = fold.files()[i];
            for (const auto& [number, line] : fold.lines(i)) {
                LineMetric metric = line;
                metric.total_cost = metric.costs.total();
                max_line_cost = std::max(max_line_cost, metric.total_cost);
                file.totals += metric.costs;
                file.lines.push_back(std::move(metric));
            }
            report.totals += file.totals;
            report.files.push_back(std::move(file));
        }

        const std::int64_t circuit_total = report.totals.total();
        for (auto& file : report.files) {
            for (auto& line : file.lines) {
                line.normalized_heat = max_line_cost > 0
                    ? static_cast<double>(line.total_cost) / static_cast<double>(max_line_cost)
                    : 0.0;
                line.percent_of_circuit = circuit_total > 0
                    ? 100.0 * static_cast<double>(line.total_cost) / static_cast<double>(circuit_total)
                    : 0.0;
            }
        }

        FileMetric& primary = report.files.front();
        primary.functions = rollup_functions(detect_functions(source_code), primary.lines);

        std::vector<LineMetric> all_lines;
        for (const auto& file : report.files) {
            all_lines.insert(all_lines.end(), file.lines.begin(), file.lines.end());
        }
        report.hotspots = HotspotSelector(options_.hotspots).select(all_lines);
        report.top_functions = select_top_functions(primary.functions, options_.max_top_functions);
        report.source_hash = hash_utils::content_hash(source_code);
        report.generated_at = std::chrono::system_clock::now();

        logging::get_logger()->debug(
            "Aggregated {} lines across {} files: {} hotspots, {} functions, total cost {}",
            all_lines.size(), report.files.size(), report.hotspots.size(),
            primary.functions.size(), circuit_total);

        return report;
    }

    Result<ComplexityReport, Error> MetricsAggregator::aggregate_cached(const std::string_view source_code,
                                                                        const std::string& file_name,
                                                                        const DomainLoader& load) {
        const std::string hash = hash_utils::content_hash(source_code);
        return cache_.get_or_compute(hash, [&]() -> Result<ComplexityReport, Error> {
            auto domains = load();
            if (domains.is_err()) {
                return Result<ComplexityReport, Error>::failure(domains.error());
            }
            return Result<ComplexityReport, Error>::success(
                aggregate(domains.value(), source_code, file_name)
            );
        });
    }

}  // namespace cca::metrics
