/**
 * SHOTGATE - Signed Screenshot Gateway
 * Metrics - Thread-safe statistics collection for monitoring
 *
 * Provides:
 * - Request counters (total, active, success, error)
 * - Rejection counters per reason (validation, signature)
 * - Cache hit/miss and cache write statistics
 * - Upstream render call statistics (calls, failures, latency)
 * - Thread-safe collection using atomics
 */

#ifndef SHOTGATE_UTIL_METRICS_HPP
#define SHOTGATE_UTIL_METRICS_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace shotgate::util {

/**
 * Request rejection categories tracked separately
 */
enum class RejectionKind {
    MissingParameter,
    InvalidUrl,
    InvalidWidth,
    InvalidHeight,
    InvalidSignature
};

/**
 * Global metrics snapshot
 */
struct MetricsSnapshot {
    // Request metrics
    std::uint64_t requests_total{0};
    std::uint64_t requests_active{0};
    std::uint64_t requests_success{0};
    std::uint64_t requests_error{0};

    // Rejections
    std::uint64_t rejected_missing_parameter{0};
    std::uint64_t rejected_invalid_url{0};
    std::uint64_t rejected_invalid_width{0};
    std::uint64_t rejected_invalid_height{0};
    std::uint64_t rejected_invalid_signature{0};

    // Cache metrics
    std::uint64_t cache_hits{0};
    std::uint64_t cache_misses{0};
    double cache_hit_rate{0.0};
    std::uint64_t cache_writes{0};
    std::uint64_t cache_write_failures{0};
    std::uint64_t coalesced_waits{0};

    // Upstream metrics
    std::uint64_t upstream_calls{0};
    std::uint64_t upstream_failures{0};
    double upstream_latency_avg_ms{0.0};

    std::uint64_t uptime_seconds{0};

    /**
     * Serialize to JSON string
     */
    std::string to_json() const;
};

/**
 * Metrics collector - centralized statistics tracking
 *
 * Lock-free counters, one process-wide instance.
 */
class Metrics {
public:
    static Metrics& instance();

    // Request tracking
    void request_started();
    void request_completed(bool success);
    void request_rejected(RejectionKind kind);

    // Cache tracking
    void cache_hit();
    void cache_miss();
    void cache_write(bool success);
    void coalesced_wait();

    // Upstream tracking
    void upstream_call(bool success, std::chrono::milliseconds latency);

    MetricsSnapshot snapshot() const;

    std::uint64_t uptime_seconds() const;

private:
    Metrics();
    ~Metrics() = default;

    Metrics(const Metrics&) = delete;
    Metrics& operator=(const Metrics&) = delete;

    std::atomic<std::uint64_t> requests_total_{0};
    std::atomic<std::uint64_t> requests_active_{0};
    std::atomic<std::uint64_t> requests_success_{0};
    std::atomic<std::uint64_t> requests_error_{0};

    std::atomic<std::uint64_t> rejected_missing_parameter_{0};
    std::atomic<std::uint64_t> rejected_invalid_url_{0};
    std::atomic<std::uint64_t> rejected_invalid_width_{0};
    std::atomic<std::uint64_t> rejected_invalid_height_{0};
    std::atomic<std::uint64_t> rejected_invalid_signature_{0};

    std::atomic<std::uint64_t> cache_hits_{0};
    std::atomic<std::uint64_t> cache_misses_{0};
    std::atomic<std::uint64_t> cache_writes_{0};
    std::atomic<std::uint64_t> cache_write_failures_{0};
    std::atomic<std::uint64_t> coalesced_waits_{0};

    std::atomic<std::uint64_t> upstream_calls_{0};
    std::atomic<std::uint64_t> upstream_failures_{0};
    std::atomic<std::uint64_t> upstream_latency_sum_ms_{0};

    std::chrono::steady_clock::time_point start_time_;
};

} // namespace shotgate::util

#endif // SHOTGATE_UTIL_METRICS_HPP
