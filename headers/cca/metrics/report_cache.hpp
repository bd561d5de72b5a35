#ifndef CCA_REPORT_CACHE_HPP
#define CCA_REPORT_CACHE_HPP

/**
 * @file report_cache.hpp
 * @brief Content-addressed TTL cache of complexity reports.
 *
 * The cache is the only mutable component of the engine. It holds:
 *
 * - one entry per source hash, fresh for CacheOptions::ttl
 * - a bounded history of computed reports used by compare_with_previous()
 * - the set of hashes whose recompute is in flight
 *
 * All members are guarded by one mutex, so a second caller racing on the
 * same hash observes the in-flight rejection.
 */

#include "cca/types.hpp"
#include "cca/result.hpp"
#include "cca/error.hpp"

#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace cca::metrics {

    struct CacheOptions {
        std::chrono::milliseconds ttl{std::chrono::minutes(5)};
        std::size_t history_depth = 10;
    };

    struct CacheEntry {
        std::string source_hash;
        ComplexityReport report;
        Timestamp cached_at;
    };

    struct CacheStats {
        std::size_t hits = 0;
        std::size_t misses = 0;
        std::size_t expirations = 0;
        std::size_t rejected_recomputes = 0;
    };

    class ReportCache {
    public:
        using ComputeFn = std::function<Result<ComplexityReport, Error>()>;

        explicit ReportCache(CacheOptions options = {});

        ReportCache(const ReportCache&) = delete;
        ReportCache& operator=(const ReportCache&) = delete;

        /**
         * Returns a copy of the report cached under @p source_hash if it is
         * younger than the TTL. An expired entry is evicted and reported as
         * a miss.
         */
        [[nodiscard]] std::optional<ComplexityReport> lookup(const std::string& source_hash);

        /**
         * Replaces the entry for @p source_hash and appends the report to
         * the history, evicting the oldest report beyond history_depth.
         */
        void store(const std::string& source_hash, const ComplexityReport& report);

        /**
         * Returns the cached report or runs @p compute and stores its result.
         *
         * @return The report, the error produced by @p compute, or an
         *         InFlight error when another recompute for the same hash
         *         has not finished
         */
        [[nodiscard]] Result<ComplexityReport, Error> get_or_compute(const std::string& source_hash,
                                                                     const ComputeFn& compute);

        /**
         * Drops every entry and the comparison history.
         */
        void clear();

        /**
         * Marks @p source_hash as being recomputed.
         *
         * @return false if it is already in flight
         */
        [[nodiscard]] bool try_begin(const std::string& source_hash);

        void end(const std::string& source_hash);

        [[nodiscard]] bool is_in_flight(const std::string& source_hash) const;

        /**
         * Compares @p current with the second most recent report in the
         * history, line by line within the first file of each report.
         *
         * @return nullopt while fewer than two reports are retained
         */
        [[nodiscard]] std::optional<MetricsComparison> compare_with_previous(
            const ComplexityReport& current,
            MetricKind metric
        ) const;

        /**
         * Applies new options. A shorter history is trimmed immediately.
         */
        void set_options(const CacheOptions& options);

        [[nodiscard]] CacheOptions options() const;

        [[nodiscard]] std::size_t size() const;

        [[nodiscard]] std::size_t history_size() const;

        [[nodiscard]] CacheStats stats() const;

    private:
        using Clock = std::chrono::steady_clock;

        struct Slot {
            CacheEntry entry;
            Clock::time_point stored_at;
        };

        void trim_history_locked();

        mutable std::mutex mutex_;
        CacheOptions options_;
        std::unordered_map<std::string, Slot> entries_;
        std::deque<ComplexityReport> history_;
        std::unordered_set<std::string> in_flight_;
        CacheStats stats_;
    };

    /**
     * Scoped in-flight marker for one source hash.
     *
     * @code
     *     InFlightGuard guard(cache, hash);
     *     if (!guard.acquired()) {
     *         return Error::in_flight(...);
     *     }
     *     // recompute; the hash is released when guard leaves scope
     * @endcode
     */
    class InFlightGuard {
    public:
        InFlightGuard(ReportCache& cache, std::string source_hash);
        ~InFlightGuard();

        InFlightGuard(const InFlightGuard&) = delete;
        InFlightGuard& operator=(const InFlightGuard&) = delete;

        [[nodiscard]] bool acquired() const noexcept {
            return acquired_;
        }

    private:
        ReportCache& cache_;
        std::string source_hash_;
        bool acquired_;
    };

}  // namespace cca::metrics

#endif //CCA_REPORT_CACHE_HPP
