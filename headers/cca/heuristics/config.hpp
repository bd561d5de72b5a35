#ifndef CCA_HEURISTICS_CONFIG_HPP
#define CCA_HEURISTICS_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Savings multipliers and thresholds used by the analyzer rules.
 *
 * The multipliers estimate how much of an observed cost a rewrite could
 * remove. They are product policy, not measured values, and are kept here
 * so they can be tuned without touching the rules.
 */

#include <cstddef>
#include <cstdint>

namespace cca::heuristics {

    /**
     * Hotspot rule: lines that dominate the circuit.
     */
    struct HotspotConfig {
        /// Share of the circuit at or above which a hotspot is High
        double high_percent = 20.0;

        /// Share of the circuit below which a hotspot is Low
        double low_percent = 10.0;

        /// Fraction of the line's gates assumed recoverable
        double savings_factor = 0.3;
    };

    /**
     * Loop rule: unrolled and nested loops.
     */
    struct LoopConfig {
        /// Literal ranges with more iterations than this are flagged
        std::int64_t max_iterations = 10;

        /// Preceding lines searched for an enclosing loop
        std::size_t nested_lookback = 5;

        double large_loop_factor = 0.4;
        double dynamic_bound_factor = 0.3;
        double nested_loop_factor = 0.5;

        /// Fallback savings per iteration when the line has no metrics
        std::int64_t large_loop_fallback_per_iteration = 10;
        std::int64_t dynamic_bound_fallback = 50;
        std::int64_t nested_loop_fallback = 100;
    };

    /**
     * Arithmetic rule: field division.
     */
    struct ArithmeticConfig {
        double division_factor = 0.4;
        std::int64_t division_fallback = 20;
    };

    /**
     * Array rule: dynamic arrays and append calls carry fixed impacts.
     */
    struct ArrayConfig {
        std::int64_t vec_savings = 30;
        double vec_savings_percent = 0.5;
        std::int64_t push_savings = 10;
        double push_savings_percent = 0.2;
    };

    /**
     * Hash-in-loop rule.
     */
    struct HashConfig {
        /// Preceding lines searched for an enclosing loop
        std::size_t loop_lookback = 10;

        double savings_factor = 0.5;
        std::int64_t fallback = 100;
    };

    /**
     * Circuit-wide best-practice checks.
     */
    struct BestPracticeConfig {
        std::int64_t large_circuit_gates = 100000;
        double large_circuit_factor = 0.2;
        double large_circuit_percent = 20.0;

        std::int64_t recursion_gates = 50000;
        double recursion_factor = 0.15;
        double recursion_percent = 15.0;

        /// Share of total cost above which a single function is flagged
        double dominant_function_percent = 50.0;
        double dominant_function_factor = 0.25;

        std::int64_t high_constrained_ops = 10000;
        double high_constrained_factor = 0.15;
        double high_constrained_percent = 15.0;
    };

    struct HeuristicsConfig {
        HotspotConfig hotspot;
        LoopConfig loops;
        ArithmeticConfig arithmetic;
        ArrayConfig arrays;
        HashConfig hashing;
        BestPracticeConfig best_practice;

        static HeuristicsConfig defaults() {
            return HeuristicsConfig{};
        }
    };

}  // namespace cca::heuristics

#endif //CCA_HEURISTICS_CONFIG_HPP
