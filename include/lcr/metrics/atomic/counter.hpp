#pragma once

#include <string>
#include <atomic>
#include <type_traits>
#include <cstdint>


namespace lcr {
namespace metrics {
namespace atomic {

// ---------------------------------------------------------------------------
// counter - monotonically increasing value (Cumulative metric)
// ---------------------------------------------------------------------------
// Written by one thread, scraped by others. Relaxed ordering is enough: each
// counter is exported independently and no reader derives invariants across
// two counters.
// ---------------------------------------------------------------------------
template<typename T = uint64_t>
struct alignas(64) counter {
    static_assert(std::is_unsigned_v<T>, "counter requires an unsigned type");

    counter() = default;
    // Disable copy/move semantics
    counter(const counter&) = delete;
    counter& operator=(const counter&) = delete;

    [[nodiscard]]
    inline T load() const noexcept { return value_.load(std::memory_order_relaxed); }
    inline void inc(T n = 1) noexcept { value_.fetch_add(n, std::memory_order_relaxed); }

    // Metrics collector
    template <typename Collector>
    void collect(const std::string& name, const std::string& help, Collector& collector) const {
        collector.add_counter(static_cast<uint64_t>(load()), name, help);
    }

private:
    std::atomic<T> value_{0};
};
using counter64 = counter<uint64_t>;
static_assert(std::is_standard_layout_v<counter64>, "counter64 must be standard layout");


// ---------------------------------------------------------------------------
// gauge - instantaneous value that can go up and down or be overwritten
// ---------------------------------------------------------------------------
// store() publishes with release semantics so a reader that observes a state
// value also observes everything the writer did before changing it.
// ---------------------------------------------------------------------------
template<typename T = uint64_t>
struct alignas(64) gauge {
    gauge() = default;
    explicit gauge(T initial) noexcept : value_(initial) {}
    // Disable copy/move semantics
    gauge(const gauge&) = delete;
    gauge& operator=(const gauge&) = delete;

    [[nodiscard]]
    inline T load() const noexcept { return value_.load(std::memory_order_acquire); }
    inline void store(T v) noexcept { value_.store(v, std::memory_order_release); }

    // Metrics collector
    template <typename Collector>
    void collect(const std::string& name, const std::string& help, Collector& collector) const {
        collector.add_gauge(static_cast<uint64_t>(load()), name, help);
    }

private:
    std::atomic<T> value_{0};
};
using gauge32 = gauge<uint32_t>;
using gauge64 = gauge<uint64_t>;
static_assert(std::is_standard_layout_v<gauge64>, "gauge64 must be standard layout");

} // namespace atomic
} // namespace metrics
} // namespace lcr
