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
**************************************************************************/

#pragma once

#include <ostream>

namespace flowagg {

/**
 * @brief Context an aggregation pass runs in.
 *
 * Chosen per hook invocation and handed to the aggregating scanner; never
 * persisted.
 */
enum class ScannerOperation {
    kRead,              // Client get or scan
    kFlush,             // Memstore flush to a store file
    kMinorCompaction,   // Subset of store files; not all versions visible
    kMajorCompaction,   // All store files; old versions may be discarded
};

inline const char* ScannerOperationToString(ScannerOperation op) {
    switch (op) {
        case ScannerOperation::kRead: return "READ";
        case ScannerOperation::kFlush: return "FLUSH";
        case ScannerOperation::kMinorCompaction: return "MINOR_COMPACTION";
        case ScannerOperation::kMajorCompaction: return "MAJOR_COMPACTION";
    }
    return "UNKNOWN";
}

inline std::ostream& operator<<(std::ostream& os, ScannerOperation op) {
    return os << ScannerOperationToString(op);
}

} // namespace flowagg
