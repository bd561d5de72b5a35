#ifndef CCA_BEST_PRACTICE_RULE_HPP
#define CCA_BEST_PRACTICE_RULE_HPP

/**
 * @file best_practice_rule.hpp
 * @brief Circuit-wide best-practice checks.
 *
 * - gates above large_circuit_gates: high
 * - gates above recursion_gates without the recursion marker: medium
 * - one function above dominant_function_percent, other than the entry
 *   function: medium, reported at its declaration line
 * - constrained opcodes above high_constrained_ops: medium
 */

#include "cca/analysis/rule.hpp"

namespace cca::analysis {

    class BestPracticeRule : public IAnalyzerRule {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "BestPracticeRule";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Checks circuit-wide gate and opcode totals";
        }

        [[nodiscard]] RuleKind kind() const noexcept override {
            return RuleKind::BestPractice;
        }

        [[nodiscard]] Result<RuleOutput, Error> evaluate(const RuleContext& context) const override;
    };

}  // namespace cca::analysis

#endif //CCA_BEST_PRACTICE_RULE_HPP
