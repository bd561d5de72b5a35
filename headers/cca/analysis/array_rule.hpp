#ifndef CCA_ARRAY_RULE_HPP
#define CCA_ARRAY_RULE_HPP

/**
 * @file array_rule.hpp
 * @brief Dynamic array suggestions.
 *
 * Vec<...> types and .push(...) calls carry fixed impacts since their
 * cost is spread over the surrounding code.
 */

#include "cca/analysis/rule.hpp"

namespace cca::analysis {

    class ArrayRule : public IAnalyzerRule {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "ArrayRule";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Flags dynamic arrays and push calls";
        }

        [[nodiscard]] RuleKind kind() const noexcept override {
            return RuleKind::Array;
        }

        [[nodiscard]] Result<RuleOutput, Error> evaluate(const RuleContext& context) const override;
    };

}  // namespace cca::analysis

#endif //CCA_ARRAY_RULE_HPP
