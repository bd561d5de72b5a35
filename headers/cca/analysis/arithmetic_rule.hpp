#ifndef CCA_ARITHMETIC_RULE_HPP
#define CCA_ARITHMETIC_RULE_HPP

/**
 * @file arithmetic_rule.hpp
 * @brief Division suggestions.
 *
 * Any line containing "/" and no "//" is treated as a division.
 */

#include "cca/analysis/rule.hpp"

namespace cca::analysis {

    class ArithmeticRule : public IAnalyzerRule {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "ArithmeticRule";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Flags field divisions, which require an inversion";
        }

        [[nodiscard]] RuleKind kind() const noexcept override {
            return RuleKind::Arithmetic;
        }

        [[nodiscard]] Result<RuleOutput, Error> evaluate(const RuleContext& context) const override;
    };

}  // namespace cca::analysis

#endif //CCA_ARITHMETIC_RULE_HPP
