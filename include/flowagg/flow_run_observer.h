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

FlowAgg Flow Run Observer

Region observer for the flow run table. Many application attempts write
metric updates for the same flow run concurrently; this observer makes
those writes collision free and routes every read, flush and compaction
of the table through an aggregating scanner so callers only ever see
aggregated values.

Regions of any other table pass through untouched.
**************************************************************************/

#pragma once

#include <flowagg/aggregating_scanner.h>
#include <flowagg/region_observer.h>
#include <flowagg/scanner_operation.h>
#include <flowagg/timestamp_generator.h>
#include <memory>
#include <string>

namespace flowagg {

/**
 * @brief Operation mode for a compaction: major when the request says so,
 * minor otherwise, including when there is no request at all.
 */
ScannerOperation ClassifyCompaction(const CompactionRequest* request);

class FlowRunObserver : public RegionObserver {
public:
    explicit FlowRunObserver(std::shared_ptr<AggregatingScannerFactory> scanner_factory);

    /**
     * @param clock Wall-clock source for this region's timestamp generator
     */
    FlowRunObserver(std::shared_ptr<AggregatingScannerFactory> scanner_factory,
                    TimestampGenerator::Clock clock);

    /**
     * @brief Decide once whether this region belongs to the flow run table.
     */
    Status Start(const RegionEnvironment& env) override;

    bool IsFlowRunRegion() const { return is_flow_run_region_; }

    /**
     * @brief Tag every cell of the batch with the batch's attributes and
     * give cells without a timestamp a unique one.
     *
     * All cells of a batch are assumed to come from the same operation, so
     * they share one tag set. Cells with an explicit timestamp (metric
     * values on their own time axis) keep it.
     */
    Status PrePut(ObserverContext* ctx, WriteBatch* batch) override;

    /**
     * @brief Answer a point lookup with the aggregated row and bypass the
     * engine's own lookup.
     */
    Status PreGetOp(ObserverContext* ctx, const Get& get,
                    std::vector<Cell>* results) override;

    /**
     * @brief Make the scan return every version so metrics can be
     * aggregated and min/max determined.
     */
    Status PreScannerOpen(ObserverContext* ctx, Scan* scan) override;

    Status PostScannerOpen(ObserverContext* ctx, const Scan& scan,
                           std::unique_ptr<RegionScanner>* scanner) override;

    Status PreFlush(ObserverContext* ctx, const Store* store,
                    std::unique_ptr<InternalScanner>* scanner) override;

    Status PostFlush(ObserverContext* ctx, const Store* store,
                     const std::string& result_file) override;

    Status PreCompact(ObserverContext* ctx, const Store* store,
                      std::unique_ptr<InternalScanner>* scanner,
                      ScanType scan_type,
                      const CompactionRequest* request) override;

    std::string Name() const override { return "FlowRunObserver"; }

    TimestampGenerator& timestamp_generator() { return timestamp_generator_; }

private:
    /**
     * @brief Generated timestamp for cells the client left unset, the
     * client's own timestamp otherwise.
     */
    int64_t GetCellTimestamp(int64_t timestamp, const TagSet& tags);

    Status WrapInternalScanner(ObserverContext* ctx,
                               std::unique_ptr<InternalScanner>* scanner,
                               ScannerOperation op);

    std::shared_ptr<AggregatingScannerFactory> scanner_factory_;

    // Unique per row within this region
    TimestampGenerator timestamp_generator_;

    Region* region_ = nullptr;
    bool started_ = false;
    bool is_flow_run_region_ = false;
};

} // namespace flowagg
