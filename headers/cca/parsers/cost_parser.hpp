#ifndef CCA_COST_PARSER_HPP
#define CCA_COST_PARSER_HPP

/**
 * @file cost_parser.hpp
 * @brief Parser for profiler cost annotations.
 *
 * The profiler emits one annotation per costed expression, embedded in
 * otherwise arbitrary text (typically a flamegraph SVG):
 *
 * @code
 *     <title>main.nr:3:12::x != 0 (2 opcodes, 4.35%)</title>
 * @endcode
 *
 * Only the tag shape is parsed; the surrounding container format is
 * ignored. The same grammar is used for all three cost domains.
 */

#include "cca/types.hpp"

#include <map>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace cca::parsers {

    /**
     * Extracts CostRecords from raw profiler text.
     *
     * Parsing never fails: fragments that do not match the tag grammar,
     * name a file with another extension, or carry out-of-range numbers are
     * skipped. The result is sorted by (line, column); records with equal
     * keys keep their order of appearance.
     */
    class CostRecordParser {
    public:
        /**
         * @param source_extension Extension the annotated file name must end in
         */
        explicit CostRecordParser(std::string source_extension = ".nr");

        [[nodiscard]] std::vector<CostRecord> parse(std::string_view raw_text) const;

        /**
         * Strips markup tags, then decodes &gt; &lt; &amp; &quot; &apos; and &#39;.
         *
         * Tags are removed before entities are decoded so that escaped
         * comparison operators survive.
         */
        [[nodiscard]] static std::string unescape(std::string_view text);

        [[nodiscard]] const std::string& source_extension() const noexcept {
            return source_extension_;
        }

    private:
        std::string source_extension_;
        std::regex tag_regex_;
    };

    /**
     * Read-only lookup structure over a parsed record list.
     *
     * Built once; queries never re-parse. When @p file is omitted in a
     * query, records from every file match.
     */
    class CostRecordIndex {
    public:
        CostRecordIndex() = default;
        explicit CostRecordIndex(std::vector<CostRecord> records);

        [[nodiscard]] const std::vector<CostRecord>& records() const noexcept {
            return records_;
        }

        [[nodiscard]] bool empty() const noexcept {
            return records_.empty();
        }

        [[nodiscard]] std::vector<CostRecord> for_line(std::size_t line,
                                                       const std::string* file = nullptr) const;

        [[nodiscard]] std::vector<CostRecord> for_file(const std::string& file) const;

        /**
         * Distinct file names in order of first appearance.
         */
        [[nodiscard]] const std::vector<std::string>& file_names() const noexcept {
            return file_names_;
        }

        /**
         * Sum of the costs of every record on the line.
         */
        [[nodiscard]] std::int64_t total_for_line(std::size_t line,
                                                  const std::string* file = nullptr) const;

        [[nodiscard]] std::vector<std::string> expressions_for_line(std::size_t line,
                                                                    const std::string* file = nullptr) const;

    private:
        std::vector<CostRecord> records_;
        std::vector<std::string> file_names_;
        std::multimap<std::size_t, std::size_t> by_line_;  ///< line -> index into records_
    };

}  // namespace cca::parsers

#endif //CCA_COST_PARSER_HPP
