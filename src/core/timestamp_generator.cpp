/************************************************************************
FlowAgg Timestamp Generator Implementation
**************************************************************************/

#include "flowagg/timestamp_generator.h"
#include "flowagg/logging.h"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <limits>

namespace flowagg {

FLOWAGG_LOG_TAG(TimestampGenerator);

TimestampGenerator::TimestampGenerator()
    : TimestampGenerator(&TimestampGenerator::SystemClockMillis) {}

TimestampGenerator::TimestampGenerator(Clock clock)
    : clock_(clock ? std::move(clock) : Clock(&TimestampGenerator::SystemClockMillis)) {}

int64_t TimestampGenerator::SystemClockMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

int64_t TimestampGenerator::ScaleMillis(int64_t millis) {
    // Leave room for a suffix below kTimestampMultiplier
    constexpr int64_t kMaxMillis =
        (std::numeric_limits<int64_t>::max() - (kTimestampMultiplier - 1)) / kTimestampMultiplier;
    constexpr int64_t kMinMillis = std::numeric_limits<int64_t>::min() / kTimestampMultiplier;
    if (millis > kMaxMillis || millis < kMinMillis) {
        FLOWAGG_LOG_WARN(TimestampGenerator)
            << "Timestamp " << millis << " ms out of range, clamping";
        millis = millis > kMaxMillis ? kMaxMillis : kMinMillis;
    }
    return millis * kTimestampMultiplier;
}

int64_t TimestampGenerator::CurrentTime() const {
    return ScaleMillis(clock_());
}

int64_t TimestampGenerator::GetUniqueTimestamp() {
    int64_t last = last_timestamp_.load(std::memory_order_acquire);
    int64_t next;
    do {
        next = std::max(last + 1, CurrentTime());
    } while (!last_timestamp_.compare_exchange_weak(
        last, next, std::memory_order_acq_rel, std::memory_order_acquire));
    return next;
}

int64_t TimestampGenerator::GetSupplementedTimestamp(int64_t incoming_ts,
                                                     const std::string& app_id) {
    return ScaleMillis(incoming_ts) + AppIdSuffix(app_id);
}

int64_t TimestampGenerator::AppIdSuffix(const std::string& app_id) {
    if (app_id.empty()) {
        return 0;
    }

    // application_<clusterTimestamp>_<sequence>
    size_t pos = app_id.rfind('_');
    std::string sequence = pos == std::string::npos ? app_id : app_id.substr(pos + 1);
    if (sequence.empty() ||
        !std::all_of(sequence.begin(), sequence.end(),
                     [](unsigned char c) { return c >= '0' && c <= '9'; })) {
        FLOWAGG_LOG_WARN(TimestampGenerator)
            << "Unparsable application id '" << app_id << "', using suffix 0";
        return 0;
    }

    // Only the low digits matter, keep them from overflowing the parse
    if (sequence.size() > 18) {
        sequence = sequence.substr(sequence.size() - 18);
    }
    int64_t id = std::strtoll(sequence.c_str(), nullptr, 10);
    return id % kTimestampMultiplier;
}

} // namespace flowagg
