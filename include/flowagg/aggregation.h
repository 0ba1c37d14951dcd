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

FlowAgg Aggregation Vocabulary

Write attributes name either the aggregation a metric cell takes part in
or the dimension its versions are compacted along. Each carries the tag
type the aggregating scanner looks for on stored cells.
**************************************************************************/

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace flowagg {

/**
 * @brief How versions of a metric cell are folded together.
 */
enum class AggregationOperation : uint8_t {
    kGlobalMin = 71,   // Minimum across all applications of the flow
    kGlobalMax = 73,   // Maximum across all applications of the flow
    kSum = 79,         // Running sum of a still-active application
    kSumFinal = 83,    // Final sum of a finished application
    kLatestMin = 89,   // Latest minimum reported by an application
    kLatestMax = 97,   // Latest maximum reported by an application
    kMin = 101,
    kMax = 103,
};

/**
 * @brief Dimension along which versions are grouped when compacting.
 */
enum class AggregationCompactionDimension : uint8_t {
    kApplicationId = 107,
};

/**
 * @brief Tag type for attributes that name neither an operation nor a
 * dimension. Such tags are carried to storage without special meaning.
 */
constexpr uint8_t kAttributeTagType = 127;

// Attribute names as written by clients
const char* AggregationOperationName(AggregationOperation op);
const char* AggregationCompactionDimensionName(AggregationCompactionDimension dim);

std::optional<AggregationOperation> AggregationOperationFromName(const std::string& name);
std::optional<AggregationCompactionDimension>
AggregationCompactionDimensionFromName(const std::string& name);

// Tag type is the enum's underlying value
inline uint8_t TagTypeOf(AggregationOperation op) {
    return static_cast<uint8_t>(op);
}
inline uint8_t TagTypeOf(AggregationCompactionDimension dim) {
    return static_cast<uint8_t>(dim);
}

std::optional<AggregationOperation> AggregationOperationFromTagType(uint8_t type);

} // namespace flowagg
