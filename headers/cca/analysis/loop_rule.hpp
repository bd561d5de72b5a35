#ifndef CCA_LOOP_RULE_HPP
#define CCA_LOOP_RULE_HPP

/**
 * @file loop_rule.hpp
 * @brief Loop unrolling suggestions.
 *
 * Loops are fully unrolled in a circuit, so their cost scales with the
 * iteration count:
 * - a literal range with more than max_iterations iterations is high
 * - a bound that is not a literal range is medium
 * - a loop opened within nested_lookback lines of another is high
 */

#include "cca/analysis/rule.hpp"

namespace cca::analysis {

    class LoopRule : public IAnalyzerRule {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "LoopRule";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Detects large, dynamically bounded and nested loops";
        }

        [[nodiscard]] RuleKind kind() const noexcept override {
            return RuleKind::Loop;
        }

        [[nodiscard]] Result<RuleOutput, Error> evaluate(const RuleContext& context) const override;
    };

}  // namespace cca::analysis

#endif //CCA_LOOP_RULE_HPP
