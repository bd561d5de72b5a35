#ifndef CCA_ALL_RULES_HPP
#define CCA_ALL_RULES_HPP

/**
 * @file all_rules.hpp
 * @brief Convenience header building the default rule set.
 */

#include "cca/analysis/hotspot_rule.hpp"
#include "cca/analysis/loop_rule.hpp"
#include "cca/analysis/arithmetic_rule.hpp"
#include "cca/analysis/array_rule.hpp"
#include "cca/analysis/hash_rule.hpp"
#include "cca/analysis/best_practice_rule.hpp"

#include <memory>
#include <vector>

namespace cca::analysis {

    inline std::vector<std::unique_ptr<IAnalyzerRule>> make_default_rules() {
        std::vector<std::unique_ptr<IAnalyzerRule>> rules;
        rules.push_back(std::make_unique<HotspotRule>());
        rules.push_back(std::make_unique<LoopRule>());
        rules.push_back(std::make_unique<ArithmeticRule>());
        rules.push_back(std::make_unique<ArrayRule>());
        rules.push_back(std::make_unique<HashInLoopRule>());
        rules.push_back(std::make_unique<BestPracticeRule>());
        return rules;
    }

}  // namespace cca::analysis

#endif //CCA_ALL_RULES_HPP
