#include "cca/metrics/report_cache.hpp"
#include "cca/utils/logging.hpp"

#include <utility>

namespace cca::metrics
{
    namespace {

        double change_percent(const std::int64_t delta, const std::int64_t previous) {
            if (previous <= 0) {
                return 0.0;
            }
            return static_cast<double>(delta) / static_cast<double>(previous) * 100.0;
        }

    }  // namespace

    ReportCache::ReportCache(CacheOptions options)
        : options_(options) {}

    std::optional<ComplexityReport> ReportCache::lookup(const std::string& source_hash) {
        std::lock_guard lock(mutex_);

        const auto it = entries_.find(source_hash);
        if (it == entries_.end()) {
            ++stats_.misses;
            logging::get_logger()->debug("Report cache miss for {}", source_hash);
            return std::nullopt;
        }

        if (Clock::now() - it->second.stored_at >= options_.ttl) {
            entries_.erase(it);
            ++stats_.expirations;
            ++stats_.misses;
            logging::get_logger()->debug("Report cache entry for {} expired", source_hash);
            return std::nullopt;
        }

        ++stats_.hits;
        logging::get_logger()->debug("Report cache hit for {}", source_hash);
        return it->second.entry.report;
    }

    void ReportCache::store(const std::string& source_hash, const ComplexityReport& report) {
        std::lock_guard lock(mutex_);

        Slot slot;
        slot.entry.source_hash = source_hash;
        slot.entry.report = report;
        slot.entry.cached_at = std::chrono::system_clock::now();
        slot.stored_at = Clock::now();
        entries_.insert_or_assign(source_hash, std::move(slot));

        history_.push_back(report);
        trim_history_locked();
    }

    Result<ComplexityReport, Error> ReportCache::get_or_compute(const std::string& source_hash,
                                                                const ComputeFn& compute) {
        if (auto cached = lookup(source_hash)) {
            return Result<ComplexityReport, Error>::success(std::move(*cached));
        }

        const InFlightGuard guard(*this, source_hash);
        if (!guard.acquired()) {
            return Result<ComplexityReport, Error>::failure(
                Error::in_flight("A recompute for this source is already running", source_hash)
            );
        }

        auto computed = compute();
        if (computed.is_ok()) {
            store(source_hash, computed.value());
        }
        return computed;
    }

    void ReportCache::clear() {
        std::lock_guard lock(mutex_);
        entries_.clear();
        history_.clear();
        logging::get_logger()->debug("Report cache cleared");
    }

    bool ReportCache::try_begin(const std::string& source_hash) {
        std::lock_guard lock(mutex_);
        if (!in_flight_.insert(source_hash).second) {
            ++stats_.rejected_recomputes;
            logging::get_logger()->warn("Rejected concurrent recompute for {}", source_hash);
            return false;
        }
        return true;
    }

    void ReportCache::end(const std::string& source_hash) {
        std::lock_guard lock(mutex_);
        in_flight_.erase(source_hash);
    }

    bool ReportCache::is_in_flight(const std::string& source_hash) const {
        std::lock_guard lock(mutex_);
        return in_flight_.contains(source_hash);
    }

    std::optional<MetricsComparison> ReportCache::compare_with_previous(
        const ComplexityReport& current,
        const MetricKind metric
    ) const {
        std::lock_guard lock(mutex_);

        if (history_.size() < 2) {
            return std::nullopt;
        }

        const ComplexityReport& previous = history_[history_.size() - 2];

        MetricsComparison comparison;
        comparison.metric = metric;
        comparison.compared_at = std::chrono::system_clock::now();

        if (!current.files.empty() && !previous.files.empty()) {
            const FileMetric& previous_file = previous.files.front();

            for (const auto& line : current.files.front().lines) {
                const LineMetric* previous_line = previous_file.find_line(line.line_number);
                if (previous_line == nullptr) {
                    continue;
                }

                const std::int64_t current_value = line.costs.get(metric);
                const std::int64_t previous_value = previous_line->costs.get(metric);
                const std::int64_t delta = current_value - previous_value;
                if (delta == 0) {
                    continue;
                }

                MetricsDelta entry;
                entry.line_number = line.line_number;
                entry.previous_value = previous_value;
                entry.current_value = current_value;
                entry.delta = delta;
                entry.delta_percent = change_percent(delta, previous_value);
                entry.is_improvement = delta < 0;
                entry.is_regression = delta > 0;
                comparison.deltas.push_back(entry);
            }
        }

        const std::int64_t current_total = current.totals.get(metric);
        const std::int64_t previous_total = previous.totals.get(metric);
        comparison.overall_change = current_total - previous_total;
        comparison.overall_change_percent = change_percent(comparison.overall_change, previous_total);
        comparison.is_improvement = comparison.overall_change < 0;

        return comparison;
    }

    void ReportCache::set_options(const CacheOptions& options) {
        std::lock_guard lock(mutex_);
        options_ = options;
        trim_history_locked();
    }

    CacheOptions ReportCache::options() const {
        std::lock_guard lock(mutex_);
        return options_;
    }

    std::size_t ReportCache::size() const {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    std::size_t ReportCache::history_size() const {
        std::lock_guard lock(mutex_);
        return history_.size();
    }

    CacheStats ReportCache::stats() const {
        std::lock_guard lock(mutex_);
        return stats_;
    }

    void ReportCache::trim_history_locked() {
        while (history_.size() > options_.history_depth) {
            history_.pop_front();
        }
    }

    InFlightGuard::InFlightGuard(ReportCache& cache, std::string source_hash)
        : cache_(cache)
        , source_hash_(std::move(source_hash))
        , acquired_(cache_.try_begin(source_hash_)) {}

    InFlightGuard::~InFlightGuard() {
        if (acquired_) {
            cache_.end(source_hash_);
        }
    }

}  // namespace cca::metrics
