#pragma once

#include <string>
#include <array>
#include <mutex>
#include <sstream>
#include <cstdint>

#include "lcr/time_unit.hpp"
#include "lcr/format.hpp"

namespace lcr {
namespace metrics {

// ---------------------------------------------------------------------------
// latency_percentiles
// ---------------------------------------------------------------------------
// Upper bucket bounds (ns) below which the given fraction of samples fall.
// Resolution is one power of two, like the ladder they come from.
// ---------------------------------------------------------------------------
struct latency_percentiles {
    uint64_t p50{0};
    uint64_t p90{0};
    uint64_t p99{0};
    uint64_t p999{0};

    std::string str(time_unit unit = time_unit::nanoseconds) const {
        std::ostringstream oss;
        oss << "p50<=" << convert_ns(p50, unit) << to_string(unit)
            << " p90<=" << convert_ns(p90, unit) << to_string(unit)
            << " p99<=" << convert_ns(p99, unit) << to_string(unit)
            << " p99.9<=" << convert_ns(p999, unit) << to_string(unit);
        return oss.str();
    }
};

// ---------------------------------------------------------------------------
// histogram_snapshot
// ---------------------------------------------------------------------------
// Plain value copy of a latency_histogram. Safe to read without any locking.
//
//   bounds[i]      upper bound (inclusive, ns) of bucket i, ascending
//   cumulative[i]  number of samples <= bounds[i]
//   count          number of samples (the implicit +Inf bucket)
//   sum            exact sum of all samples (ns)
// ---------------------------------------------------------------------------
struct histogram_snapshot {
    static constexpr int kMaxBounds = 64;

    uint64_t count{0};
    uint64_t sum{0};
    uint64_t max{0};
    int bound_count{0};
    std::array<uint64_t, kMaxBounds> bounds{};
    std::array<uint64_t, kMaxBounds> cumulative{};

    [[nodiscard]]
    inline double mean() const noexcept {
        return count == 0 ? 0.0 : static_cast<double>(sum) / static_cast<double>(count);
    }

    // Smallest bound whose cumulative count covers `permille`/1000 of the
    // samples. Falls back to the observed max when the rank lands in +Inf.
    [[nodiscard]]
    inline uint64_t quantile_bound(uint64_t permille) const noexcept {
        if (count == 0) return 0;
        uint64_t rank = (count * permille + 999) / 1000;
        if (rank == 0) rank = 1;
        for (int i = 0; i < bound_count; ++i) {
            if (cumulative[i] >= rank) return bounds[i];
        }
        return max;
    }

    [[nodiscard]]
    inline latency_percentiles percentiles() const noexcept {
        latency_percentiles p;
        p.p50  = quantile_bound(500);
        p.p90  = quantile_bound(900);
        p.p99  = quantile_bound(990);
        p.p999 = quantile_bound(999);
        return p;
    }

    inline std::string str(time_unit unit = time_unit::microseconds) const {
        std::ostringstream oss;
        oss << "count=" << format_number_exact(count)
            << " mean=" << format_duration(static_cast<uint64_t>(mean()))
            << " max=" << format_duration(max)
            << " " << percentiles().str(unit);
        return oss.str();
    }
};

// ---------------------------------------------------------------------------
// latency_histogram
// ---------------------------------------------------------------------------
// Cumulative histogram over a power-of-two ladder of nanosecond bounds.
//
// The ladder is fixed at construction: it starts at the largest power of two
// <= min_ns and ends at the smallest power of two >= max_ns (at most 64 bounds,
// 2^0 .. 2^63). Values above the last bound only land in +Inf (count).
//
// Thread-safety: one writer and any number of readers. record() and
// snapshot() each run entirely under one mutex, so a reader never sees count,
// sum and buckets out of step. Both are O(bound count); the lock is held only
// for that bounded work.
//
// Counters only ever grow. There is no reset: the histogram lives as long as
// the process that owns it.
// ---------------------------------------------------------------------------
class latency_histogram {
public:
    static constexpr uint64_t kDefaultMinNs = 1;
    static constexpr uint64_t kDefaultMaxNs = 1ULL << 34; // ~17.18s

    explicit latency_histogram(uint64_t min_ns = kDefaultMinNs, uint64_t max_ns = kDefaultMaxNs) noexcept {
        if (min_ns == 0) min_ns = 1;
        if (max_ns < min_ns) max_ns = min_ns;
        lo_exp_ = floor_log2_(min_ns);
        int hi_exp = ceil_log2_(max_ns);
        if (hi_exp > 63) hi_exp = 63;
        state_.bound_count = hi_exp - lo_exp_ + 1;
        for (int i = 0; i < state_.bound_count; ++i) {
            state_.bounds[i] = 1ULL << (lo_exp_ + i);
        }
    }

    // Disable copy/move semantics
    latency_histogram(const latency_histogram&) = delete;
    latency_histogram& operator=(const latency_histogram&) = delete;
    latency_histogram(latency_histogram&&) = delete;
    latency_histogram& operator=(latency_histogram&&) = delete;

    // Adds one observation (ns)
    inline void record(uint64_t value) noexcept {
        const int first = bucket_index_(value);
        std::lock_guard<std::mutex> lock(mutex_);
        state_.count += 1;
        state_.sum += value;
        if (value > state_.max) state_.max = value;
        for (int i = first; i < state_.bound_count; ++i) {
            state_.cumulative[i] += 1;
        }
    }

    [[nodiscard]]
    inline histogram_snapshot snapshot() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    // Ladder accessors (immutable after construction, no locking needed)
    [[nodiscard]]
    inline int bound_count() const noexcept { return state_.bound_count; }

    [[nodiscard]]
    inline uint64_t bound(int i) const noexcept { return state_.bounds[i]; }

    [[nodiscard]]
    inline uint64_t lowest_bound() const noexcept { return state_.bounds[0]; }

    [[nodiscard]]
    inline uint64_t highest_bound() const noexcept { return state_.bounds[state_.bound_count - 1]; }

    // Metrics collector
    template <typename Collector>
    void collect(const std::string& name, const std::string& help, time_unit unit, Collector& collector) const {
        collector.add_histogram(snapshot(), name, help, unit);
    }

private:
    [[nodiscard]]
    static inline int floor_log2_(uint64_t v) noexcept {
        return 63 - __builtin_clzll(v);
    }

    [[nodiscard]]
    static inline int ceil_log2_(uint64_t v) noexcept {
        return (v <= 1) ? 0 : 64 - __builtin_clzll(v - 1);
    }

    // Index of the smallest bound >= value; bound_count when only +Inf fits
    [[nodiscard]]
    inline int bucket_index_(uint64_t value) const noexcept {
        if (value <= state_.bounds[0]) return 0;
        const int idx = ceil_log2_(value) - lo_exp_;
        return (idx < state_.bound_count) ? idx : state_.bound_count;
    }

    int lo_exp_{0};
    mutable std::mutex mutex_;
    histogram_snapshot state_{};
};

} // namespace metrics
} // namespace lcr
