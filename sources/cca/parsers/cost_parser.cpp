#include "cca/parsers/cost_parser.hpp"
#include "cca/utils/logging.hpp"
#include "cca/utils/numeric_utils.hpp"
#include "cca/utils/string_utils.hpp"

#include <algorithm>
#include <charconv>
#include <iterator>
#include <optional>
#include <utility>

namespace cca::parsers
{
    namespace {

        std::string escape_regex(const std::string_view text) {
            static constexpr std::string_view special = R"(\^$.|?*+()[]{}/)";
            std::string escaped;
            escaped.reserve(text.size() * 2);
            for (const char c : text) {
                if (special.find(c) != std::string_view::npos) {
                    escaped += '\\';
                }
                escaped += c;
            }
            return escaped;
        }

        template<typename T>
        std::optional<T> parse_number(const std::string& text) {
            T value{};
            const char* begin = text.data();
            const char* end = begin + text.size();
            const auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc{} || ptr != end) {
                return std::nullopt;
            }
            return value;
        }

        constexpr std::string_view TITLE_OPEN = "<title>";
        constexpr std::string_view TITLE_CLOSE = "</title>";

        /// Title bodies longer than this are skipped without running the regex
        constexpr std::size_t MAX_TITLE_LENGTH = 4096;

        /**
         * Grammar of one title body, matched whole.
         */
        std::regex build_tag_regex(const std::string& extension) {
            return std::regex(
                R"(([^:<]+)" + escape_regex(extension) +
                R"():(\d+):(\d+)::(.+) \((\d+) opcodes, ([\d.]+)%\))"
            );
        }

        /**
         * Calls @p visit with the body of every closed <title> element.
         *
         * A body runs from the last <title> before a </title> to that
         * </title>, so an unclosed tag never swallows its successor.
         */
        template<typename Visitor>
        void for_each_title(const std::string_view text, Visitor&& visit) {
            std::size_t pos = 0;
            while (true) {
                const std::size_t open = text.find(TITLE_OPEN, pos);
                if (open == std::string_view::npos) {
                    return;
                }
                const std::size_t close = text.find(TITLE_CLOSE, open + TITLE_OPEN.size());
                if (close == std::string_view::npos) {
                    return;
                }
                const std::size_t start = text.rfind(TITLE_OPEN, close) + TITLE_OPEN.size();
                visit(text.substr(start, close - start));
                pos = close + TITLE_CLOSE.size();
            }
        }

    }  // namespace

    CostRecordParser::CostRecordParser(std::string source_extension)
        : source_extension_(std::move(source_extension))
        , tag_regex_(build_tag_regex(source_extension_)) {}

    std::vector<CostRecord> CostRecordParser::parse(const std::string_view raw_text) const {
        std::vector<CostRecord> records;
        std::size_t skipped = 0;

        for_each_title(raw_text, [&](const std::string_view body) {
            if (body.size() > MAX_TITLE_LENGTH) {
                ++skipped;
                return;
            }

            std::match_results<std::string_view::const_iterator> match;
            if (!std::regex_match(body.begin(), body.end(), match, tag_regex_)) {
                ++skipped;
                return;
            }

            const auto line = parse_number<std::size_t>(match[2].str());
            const auto column = parse_number<std::size_t>(match[3].str());
            const auto cost = parse_number<std::int64_t>(match[5].str());
            const auto share = parse_number<double>(match[6].str());

            if (!line || !column || !cost || !share || *line == 0) {
                ++skipped;
                return;
            }

            CostRecord record;
            record.file = std::string(string_utils::trim(match[1].str()));
            record.line = *line;
            record.column = *column;
            record.expression = unescape(string_utils::trim(match[4].str()));
            record.cost = *cost;
            record.share_percent = *share;
            records.push_back(std::move(record));
        });

        std::ranges::stable_sort(records, [](const CostRecord& a, const CostRecord& b) {
            if (a.line != b.line) {
                return a.line < b.line;
            }
            return a.column < b.column;
        });

        logging::get_logger()->debug("Parsed {} cost records ({} malformed tags skipped)",
                                     records.size(), skipped);
        return records;
    }

    std::string CostRecordParser::unescape(const std::string_view text) {
        static const std::regex markup_regex(R"(<[^>]*>)");

        std::string result = std::regex_replace(std::string(text), markup_regex, "");
        result = string_utils::replace_all(std::move(result), "&lt;", "<");
        result = string_utils::replace_all(std::move(result), "&gt;", ">");
        result = string_utils::replace_all(std::move(result), "&quot;", "\"");
        result = string_utils::replace_all(std::move(result), "&apos;", "'");
        result = string_utils::replace_all(std::move(result), "&#39;", "'");
        // Last, so "&amp;lt;" decodes to "&lt;" rather than "<"
        result = string_utils::replace_all(std::move(result), "&amp;", "&");
        return result;
    }

    CostRecordIndex::CostRecordIndex(std::vector<CostRecord> records)
        : records_(std::move(records)) {
        for (std::size_t i = 0; i < records_.size(); ++i) {
            const auto& record = records_[i];
            by_line_.emplace(record.line, i);
            if (std::ranges::find(file_names_, record.file) == file_names_.end()) {
                file_names_.push_back(record.file);
            }
        }
    }

    std::vector<CostRecord> CostRecordIndex::for_line(const std::size_t line, const std::string* file) const {
        std::vector<CostRecord> result;
        const auto [first, last] = by_line_.equal_range(line);
        for (auto it = first; it != last; ++it) {
            const auto& record = records_[it->second];
            if (file == nullptr || record.file == *file) {
                result.push_back(record);
            }
        }
        return result;
    }

    std::vector<CostRecord> CostRecordIndex::for_file(const std::string& file) const {
        std::vector<CostRecord> result;
        std::ranges::copy_if(records_, std::back_inserter(result), [&](const CostRecord& record) {
            return record.file == file;
        });
        return result;
    }

    std::int64_t CostRecordIndex::total_for_line(const std::size_t line, const std::string* file) const {
        std::int64_t total = 0;
        for (const auto& record : for_line(line, file)) {
            total = numeric_utils::saturating_add(total, record.cost);
        }
        return total;
    }

    std::vector<std::string> CostRecordIndex::expressions_for_line(const std::size_t line,
                                                                   const std::string* file) const {
        std::vector<std::string> expressions;
        for (const auto& record : for_line(line, file)) {
            expressions.push_back(record.expression);
        }
        return expressions;
    }

}  // namespace cca::parsers
