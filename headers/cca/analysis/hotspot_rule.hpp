#ifndef CCA_HOTSPOT_RULE_HPP
#define CCA_HOTSPOT_RULE_HPP

/**
 * @file hotspot_rule.hpp
 * @brief Suggestions for lines dominating the circuit.
 *
 * Every hotspot at or above the analysis threshold with a non-zero gate
 * count yields one suggestion. Severity follows the share of the circuit:
 * high at 20% or more, low below 10%, medium in between.
 */

#include "cca/analysis/rule.hpp"

namespace cca::analysis {

    class HotspotRule : public IAnalyzerRule {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "HotspotRule";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Flags hotspot lines that consume a large share of the circuit";
        }

        [[nodiscard]] RuleKind kind() const noexcept override {
            return RuleKind::Hotspot;
        }

        [[nodiscard]] Result<RuleOutput, Error> evaluate(const RuleContext& context) const override;
    };

}  // namespace cca::analysis

#endif //CCA_HOTSPOT_RULE_HPP
