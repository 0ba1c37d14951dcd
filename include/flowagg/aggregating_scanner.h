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

FlowAgg Aggregating Scanner Contract

The aggregating scanner folds the versions of metric cells into summarized
values. Its algorithm lives outside this library; observers only build one
through this factory, in the operation mode of the hook they run in, and
hand it back to the engine in place of the raw scanner.
**************************************************************************/

#pragma once

#include <flowagg/region.h>
#include <flowagg/scanner_operation.h>
#include <flowagg/status.h>
#include <memory>

namespace flowagg {

class AggregatingScannerFactory {
public:
    virtual ~AggregatingScannerFactory() = default;

    /**
     * @brief Wrap a client read scanner.
     *
     * @param env Environment of the region being read
     * @param scan Scan the raw scanner was opened with
     * @param raw Scanner to aggregate. Moved out on success, so the new
     *            scanner owns and closes it; left with the caller on failure.
     * @param op Operation mode, kRead for client reads
     * @param scanner Output: aggregating scanner
     */
    virtual Status NewRegionScanner(const RegionEnvironment& env,
                                    const Scan& scan,
                                    std::unique_ptr<RegionScanner>* raw,
                                    ScannerOperation op,
                                    std::unique_ptr<RegionScanner>* scanner) = 0;

    /**
     * @brief Wrap a flush or compaction scanner. Ownership of *raw follows
     * the same rule as NewRegionScanner().
     */
    virtual Status NewInternalScanner(const RegionEnvironment& env,
                                      std::unique_ptr<InternalScanner>* raw,
                                      ScannerOperation op,
                                      std::unique_ptr<InternalScanner>* scanner) = 0;

    virtual const char* Name() const = 0;
};

} // namespace flowagg
