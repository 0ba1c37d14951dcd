/************************************************************************
Copyright 2024 FlowAgg Contributors

Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at

    https://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.

FlowAgg Timestamp Generator

Hands out cell timestamps that are unique within a region even when many
writers land in the same millisecond. Values are wall-clock milliseconds
scaled by kTimestampMultiplier, so they never coincide with raw
millisecond timestamps written by clients.
**************************************************************************/

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace flowagg {

class TimestampGenerator {
public:
    /**
     * @brief Scale between wall-clock milliseconds and generated values.
     */
    static constexpr int64_t kTimestampMultiplier = 1000000;

    /**
     * @brief Source of wall-clock milliseconds.
     */
    using Clock = std::function<int64_t()>;

    TimestampGenerator();
    explicit TimestampGenerator(Clock clock);

    TimestampGenerator(const TimestampGenerator&) = delete;
    TimestampGenerator& operator=(const TimestampGenerator&) = delete;

    /**
     * @brief Next timestamp, strictly greater than every value this
     * instance returned before. Safe to call from any number of threads.
     */
    int64_t GetUniqueTimestamp();

    /**
     * @brief Current wall clock in generator units.
     */
    int64_t CurrentTime() const;

    /**
     * @brief Last value handed out, 0 before the first call.
     */
    int64_t LastTimestamp() const {
        return last_timestamp_.load(std::memory_order_acquire);
    }

    /**
     * @brief Scale a client-supplied millisecond timestamp into generator
     * units and fill the low digits with the application's sequence number,
     * so equal timestamps from different applications stay distinct.
     *
     * Timestamps too large or too small to scale are clamped to the
     * nearest representable value.
     *
     * @param incoming_ts Millisecond timestamp
     * @param app_id Application id "application_<clusterTs>_<seq>", may be empty
     */
    static int64_t GetSupplementedTimestamp(int64_t incoming_ts,
                                            const std::string& app_id);

    /**
     * @brief Inverse of the scaling: generator units back to milliseconds.
     */
    static int64_t GetTruncatedTimestamp(int64_t timestamp) {
        return timestamp / kTimestampMultiplier;
    }

    static int64_t SystemClockMillis();

private:
    // millis * kTimestampMultiplier, saturating instead of overflowing
    static int64_t ScaleMillis(int64_t millis);

    static int64_t AppIdSuffix(const std::string& app_id);

    Clock clock_;
    std::atomic<int64_t> last_timestamp_{0};
};

} // namespace flowagg
