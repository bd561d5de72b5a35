#ifndef CCA_TEST_PROFILER_TEXT_HPP
#define CCA_TEST_PROFILER_TEXT_HPP

/**
 * @file profiler_text.hpp
 * @brief Builders for profiler output and reports used across the unit tests.
 */

#include "cca/types.hpp"

#include <initializer_list>
#include <string>
#include <vector>

namespace cca::test {

    /**
     * One flamegraph frame with a cost annotation.
     */
    inline std::string tag(const std::string& file, std::size_t line, std::size_t column,
                           const std::string& expression, std::int64_t cost,
                           const std::string& percent = "1.00") {
        return "<g class=\"func_g\"><title>" + file + ":" + std::to_string(line) + ":" +
               std::to_string(column) + "::" + expression + " (" + std::to_string(cost) +
               " opcodes, " + percent + "%)</title><rect x=\"0\" y=\"0\"/></g>\n";
    }

    inline std::string svg(std::initializer_list<std::string> frames) {
        std::string text = "<?xml version=\"1.0\" standalone=\"no\"?>\n<svg version=\"1.1\">\n";
        for (const auto& frame : frames) {
            text += frame;
        }
        text += "</svg>\n";
        return text;
    }

    inline CostRecord record(std::size_t line, std::size_t column, const std::string& expression,
                             std::int64_t cost, const std::string& file = "main.nr") {
        CostRecord r;
        r.file = file;
        r.line = line;
        r.column = column;
        r.expression = expression;
        r.cost = cost;
        r.share_percent = 0.0;
        return r;
    }

    inline LineMetric line_metric(std::size_t line_number, const CostTriple& costs,
                                  double percent = 0.0, const std::string& file = "main.nr") {
        LineMetric line;
        line.line_number = line_number;
        line.file = file;
        line.costs = costs;
        line.total_cost = costs.total();
        line.percent_of_circuit = percent;
        return line;
    }

    inline CostTriple costs(std::int64_t constrained, std::int64_t unconstrained, std::int64_t gates) {
        CostTriple triple;
        triple.constrained_ops = constrained;
        triple.unconstrained_ops = unconstrained;
        triple.gate_count = gates;
        return triple;
    }

    /**
     * Report with one file whose lines are also its totals.
     */
    inline ComplexityReport report_with_lines(const std::vector<LineMetric>& lines,
                                              const std::string& file_name = "main.nr") {
        ComplexityReport report;
        FileMetric file;
        file.file_name = file_name;
        file.lines = lines;
        for (const auto& line : lines) {
            file.totals += line.costs;
        }
        report.totals = file.totals;
        report.files.push_back(file);
        return report;
    }

}  // namespace cca::test

#endif //CCA_TEST_PROFILER_TEXT_HPP
