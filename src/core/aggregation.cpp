/************************************************************************
FlowAgg Aggregation Vocabulary Implementation
**************************************************************************/

#include "flowagg/aggregation.h"
#include <array>

namespace flowagg {

namespace {

constexpr std::array<AggregationOperation, 8> kAllOperations = {
    AggregationOperation::kGlobalMin, AggregationOperation::kGlobalMax,
    AggregationOperation::kSum,       AggregationOperation::kSumFinal,
    AggregationOperation::kLatestMin, AggregationOperation::kLatestMax,
    AggregationOperation::kMin,       AggregationOperation::kMax,
};

}  // namespace

const char* AggregationOperationName(AggregationOperation op) {
    switch (op) {
        case AggregationOperation::kGlobalMin: return "GLOBAL_MIN";
        case AggregationOperation::kGlobalMax: return "GLOBAL_MAX";
        case AggregationOperation::kSum: return "SUM";
        case AggregationOperation::kSumFinal: return "SUM_FINAL";
        case AggregationOperation::kLatestMin: return "LATEST_MIN";
        case AggregationOperation::kLatestMax: return "LATEST_MAX";
        case AggregationOperation::kMin: return "MIN";
        case AggregationOperation::kMax: return "MAX";
    }
    return "UNKNOWN";
}

const char* AggregationCompactionDimensionName(AggregationCompactionDimension dim) {
    switch (dim) {
        case AggregationCompactionDimension::kApplicationId: return "APPLICATION_ID";
    }
    return "UNKNOWN";
}

std::optional<AggregationOperation> AggregationOperationFromName(const std::string& name) {
    for (AggregationOperation op : kAllOperations) {
        if (name == AggregationOperationName(op)) {
            return op;
        }
    }
    return std::nullopt;
}

std::optional<AggregationCompactionDimension>
AggregationCompactionDimensionFromName(const std::string& name) {
    if (name == AggregationCompactionDimensionName(
                    AggregationCompactionDimension::kApplicationId)) {
        return AggregationCompactionDimension::kApplicationId;
    }
    return std::nullopt;
}

std::optional<AggregationOperation> AggregationOperationFromTagType(uint8_t type) {
    for (AggregationOperation op : kAllOperations) {
        if (TagTypeOf(op) == type) {
            return op;
        }
    }
    return std::nullopt;
}

} // namespace flowagg
