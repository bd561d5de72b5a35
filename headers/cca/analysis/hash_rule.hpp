#ifndef CCA_HASH_RULE_HPP
#define CCA_HASH_RULE_HPP

/**
 * @file hash_rule.hpp
 * @brief Hash-in-loop suggestions.
 *
 * A line naming poseidon, pedersen, keccak, blake2s, sha256 or mimc
 * (case-insensitive) within loop_lookback lines of a loop header is
 * reported with high severity.
 */

#include "cca/analysis/rule.hpp"

namespace cca::analysis {

    class HashInLoopRule : public IAnalyzerRule {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "HashInLoopRule";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Flags hash function calls evaluated inside loops";
        }

        [[nodiscard]] RuleKind kind() const noexcept override {
            return RuleKind::HashInLoop;
        }

        [[nodiscard]] Result<RuleOutput, Error> evaluate(const RuleContext& context) const override;
    };

}  // namespace cca::analysis

#endif //CCA_HASH_RULE_HPP
