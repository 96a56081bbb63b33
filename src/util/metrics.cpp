/**
 * SHOTGATE - Signed Screenshot Gateway
 * Metrics Implementation
 */

#include "util/metrics.hpp"

#include <iomanip>
#include <sstream>

namespace shotgate::util {

Metrics::Metrics()
    : start_time_(std::chrono::steady_clock::now())
{
}

Metrics& Metrics::instance() {
    static Metrics instance;
    return instance;
}

void Metrics::request_started() {
    requests_total_.fetch_add(1, std::memory_order_relaxed);
    requests_active_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::request_completed(bool success) {
    requests_active_.fetch_sub(1, std::memory_order_relaxed);
    if (success) {
        requests_success_.fetch_add(1, std::memory_order_relaxed);
    } else {
        requests_error_.fetch_add(1, std::memory_order_relaxed);
    }
}

void Metrics::request_rejected(RejectionKind kind) {
    switch (kind) {
        case RejectionKind::MissingParameter:
            rejected_missing_parameter_.fetch_add(1, std::memory_order_relaxed);
            break;
        case RejectionKind::InvalidUrl:
            rejected_invalid_url_.fetch_add(1, std::memory_order_relaxed);
            break;
        case RejectionKind::InvalidWidth:
            rejected_invalid_width_.fetch_add(1, std::memory_order_relaxed);
            break;
        case RejectionKind::InvalidHeight:
            rejected_invalid_height_.fetch_add(1, std::memory_order_relaxed);
            break;
        case RejectionKind::InvalidSignature:
            rejected_invalid_signature_.fetch_add(1, std::memory_order_relaxed);
            break;
    }
}

void Metrics::cache_hit() {
    cache_hits_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::cache_miss() {
    cache_misses_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::cache_write(bool success) {
    if (success) {
        cache_writes_.fetch_add(1, std::memory_order_relaxed);
    } else {
        cache_write_failures_.fetch_add(1, std::memory_order_relaxed);
    }
}

void Metrics::coalesced_wait() {
    coalesced_waits_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::upstream_call(bool success, std::chrono::milliseconds latency) {
    upstream_calls_.fetch_add(1, std::memory_order_relaxed);
    if (!success) {
        upstream_failures_.fetch_add(1, std::memory_order_relaxed);
    }
    upstream_latency_sum_ms_.fetch_add(static_cast<std::uint64_t>(latency.count()),
                                       std::memory_order_relaxed);
}

std::uint64_t Metrics::uptime_seconds() const {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(now - start_time_).count();
}

MetricsSnapshot Metrics::snapshot() const {
    MetricsSnapshot snap;

    snap.requests_total = requests_total_.load(std::memory_order_relaxed);
    snap.requests_active = requests_active_.load(std::memory_order_relaxed);
    snap.requests_success = requests_success_.load(std::memory_order_relaxed);
    snap.requests_error = requests_error_.load(std::memory_order_relaxed);

    snap.rejected_missing_parameter = rejected_missing_parameter_.load(std::memory_order_relaxed);
    snap.rejected_invalid_url = rejected_invalid_url_.load(std::memory_order_relaxed);
    snap.rejected_invalid_width = rejected_invalid_width_.load(std::memory_order_relaxed);
    snap.rejected_invalid_height = rejected_invalid_height_.load(std::memory_order_relaxed);
    snap.rejected_invalid_signature = rejected_invalid_signature_.load(std::memory_order_relaxed);

    snap.cache_hits = cache_hits_.load(std::memory_order_relaxed);
    snap.cache_misses = cache_misses_.load(std::memory_order_relaxed);
    auto cache_total = snap.cache_hits + snap.cache_misses;
    snap.cache_hit_rate = cache_total > 0
        ? static_cast<double>(snap.cache_hits) / cache_total
        : 0.0;
    snap.cache_writes = cache_writes_.load(std::memory_order_relaxed);
    snap.cache_write_failures = cache_write_failures_.load(std::memory_order_relaxed);
    snap.coalesced_waits = coalesced_waits_.load(std::memory_order_relaxed);

    snap.upstream_calls = upstream_calls_.load(std::memory_order_relaxed);
    snap.upstream_failures = upstream_failures_.load(std::memory_order_relaxed);
    snap.upstream_latency_avg_ms = snap.upstream_calls > 0
        ? static_cast<double>(upstream_latency_sum_ms_.load(std::memory_order_relaxed)) / snap.upstream_calls
        : 0.0;

    snap.uptime_seconds = uptime_seconds();

    return snap;
}

std::string MetricsSnapshot::to_json() const {
    std::ostringstream json;
    json << std::fixed << std::setprecision(4);

    json << "{\n";

    json << "  \"requests\": {\n";
    json << "    \"total\": " << requests_total << ",\n";
    json << "    \"active\": " << requests_active << ",\n";
    json << "    \"success\": " << requests_success << ",\n";
    json << "    \"error\": " << requests_error << "\n";
    json << "  },\n";

    json << "  \"rejections\": {\n";
    json << "    \"missing_parameter\": " << rejected_missing_parameter << ",\n";
    json << "    \"invalid_url\": " << rejected_invalid_url << ",\n";
    json << "    \"invalid_width\": " << rejected_invalid_width << ",\n";
    json << "    \"invalid_height\": " << rejected_invalid_height << ",\n";
    json << "    \"invalid_signature\": " << rejected_invalid_signature << "\n";
    json << "  },\n";

    json << "  \"cache\": {\n";
    json << "    \"hits\": " << cache_hits << ",\n";
    json << "    \"misses\": " << cache_misses << ",\n";
    json << "    \"hit_rate\": " << cache_hit_rate << ",\n";
    json << "    \"writes\": " << cache_writes << ",\n";
    json << "    \"write_failures\": " << cache_write_failures << ",\n";
    json << "    \"coalesced_waits\": " << coalesced_waits << "\n";
    json << "  },\n";

    json << "  \"upstream\": {\n";
    json << "    \"calls\": " << upstream_calls << ",\n";
    json << "    \"failures\": " << upstream_failures << ",\n";
    json << "    \"latency_avg_ms\": " << upstream_latency_avg_ms << "\n";
    json << "  },\n";

    json << "  \"system\": {\n";
    json << "    \"uptime_seconds\": " << uptime_seconds << "\n";
    json << "  }\n";

    json << "}";

    return json.str();
}

} // namespace shotgate::util
