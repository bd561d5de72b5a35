#include "cca/analysis/hash_rule.hpp"

#include <regex>
#include <string>
#include <utility>

namespace cca::analysis
{
    namespace {

        constexpr const char* CRYPTOGRAPHIC_PRIMITIVES_URL =
            "https://noir-lang.org/docs/noir/standard_library/cryptographic_primitives";

    }  // namespace

    Result<RuleOutput, Error> HashInLoopRule::evaluate(const RuleContext& context) const {
        static const std::regex hash_regex(R"((poseidon|pedersen|keccak|blake2s|sha256|mimc))",
                                           std::regex::icase);

        RuleOutput output;
        const auto& config = context.heuristics.hashing;
        const auto& lines = context.source_lines;

        for (std::size_t index = 0; index < lines.size(); ++index) {
            ++output.lines_scanned;
            const std::string_view line = lines[index];

            if (!std::regex_search(line.begin(), line.end(), hash_regex)) {
                continue;
            }
            if (!loop_precedes(lines, index, config.loop_lookback)) {
                continue;
            }

            const std::size_t line_number = index + 1;

            Suggestion suggestion;
            suggestion.id = "hash-in-loop-" + std::to_string(line_number);
            suggestion.line_number = line_number;
            suggestion.severity = Severity::High;
            suggestion.category = SuggestionCategory::Algorithm;
            suggestion.title = "Hash function inside loop";
            suggestion.description = "Hash function called inside a loop. Move the call out of the loop "
                                     "or batch the inputs in a Merkle tree";
            suggestion.impact = scaled_impact(context.line_metrics(line_number), config.savings_factor,
                                              config.fallback);
            suggestion.code_snippet = snippet(line);
            suggestion.learn_more_url = CRYPTOGRAPHIC_PRIMITIVES_URL;
            output.suggestions.push_back(std::move(suggestion));
        }

        return Result<RuleOutput, Error>::success(std::move(output));
    }

}  // namespace cca::analysis
