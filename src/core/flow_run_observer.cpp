/************************************************************************
FlowAgg Flow Run Observer Implementation
**************************************************************************/

#include "flowagg/flow_run_observer.h"
#include "flowagg/attribute_tags.h"
#include "flowagg/flow_run_table.h"
#include "flowagg/logging.h"

namespace flowagg {

FLOWAGG_LOG_TAG(FlowRunObserver);

namespace {

// Every failure below surfaces to the engine as an I/O error
Status ToIOError(const Status& s, const std::string& what) {
    if (s.IsIOError()) {
        return s;
    }
    return Status::IOError(what + ": " + s.ToString());
}

/**
 * Closes the scanners of a point lookup on every exit path. Close()
 * reports the first failure; a close failing during unwinding is logged,
 * since the hook is already returning an error.
 */
class ScannerCloseGuard {
public:
    ScannerCloseGuard(std::unique_ptr<RegionScanner>* raw,
                      std::unique_ptr<RegionScanner>* aggregating)
        : raw_(raw), aggregating_(aggregating) {}

    ~ScannerCloseGuard() {
        if (closed_) return;
        Status s = Close();
        if (!s.ok()) {
            FLOWAGG_LOG_WARN(FlowRunObserver)
                << "Failed to close point lookup scanner: " << s.ToString();
        }
    }

    Status Close() {
        closed_ = true;
        Status result;
        // The aggregating scanner closes the raw scanner it owns
        if (*aggregating_) {
            result = (*aggregating_)->Close();
            aggregating_->reset();
        }
        if (*raw_) {
            Status s = (*raw_)->Close();
            if (result.ok()) result = s;
            raw_->reset();
        }
        return result;
    }

private:
    std::unique_ptr<RegionScanner>* raw_;
    std::unique_ptr<RegionScanner>* aggregating_;
    bool closed_ = false;
};

}  // namespace

ScannerOperation ClassifyCompaction(const CompactionRequest* request) {
    if (request == nullptr) {
        return ScannerOperation::kMinorCompaction;
    }
    return request->IsMajor() ? ScannerOperation::kMajorCompaction
                              : ScannerOperation::kMinorCompaction;
}

FlowRunObserver::FlowRunObserver(std::shared_ptr<AggregatingScannerFactory> scanner_factory)
    : scanner_factory_(std::move(scanner_factory)) {}

FlowRunObserver::FlowRunObserver(std::shared_ptr<AggregatingScannerFactory> scanner_factory,
                                 TimestampGenerator::Clock clock)
    : scanner_factory_(std::move(scanner_factory)),
      timestamp_generator_(std::move(clock)) {}

Status FlowRunObserver::Start(const RegionEnvironment& env) {
    if (started_) {
        return Status::InvalidArgument("FlowRunObserver already attached to a region");
    }
    started_ = true;

    region_ = env.region();
    if (region_ == nullptr) {
        FLOWAGG_LOG_WARN(FlowRunObserver) << "No region in environment, passing through";
        return Status::OK();
    }

    is_flow_run_region_ = IsFlowRunTable(region_->GetRegionInfo(), env.configuration());
    if (is_flow_run_region_ && !scanner_factory_) {
        is_flow_run_region_ = false;
        return Status::InvalidArgument("FlowRunObserver requires an aggregating scanner factory");
    }

    FLOWAGG_LOG_DEBUG(FlowRunObserver)
        << "Attached to " << region_->GetRegionInfo().RegionName()
        << " flowRunRegion=" << is_flow_run_region_;
    return Status::OK();
}

//==============================================================================
// Write path
//==============================================================================

Status FlowRunObserver::PrePut(ObserverContext* ctx, WriteBatch* batch) {
    if (!is_flow_run_region_) {
        return Status::OK();
    }

    const AttributeList& attributes = batch->attributes();
    if (attributes.empty()) {
        return Status::OK();
    }

    // All cells of one batch are the same operation
    TagSet tags;
    Status s = TagsFromAttributes(attributes, &tags);
    if (!s.ok()) {
        return ToIOError(s, "Tagging write to row " + batch->row());
    }

    FamilyCellMap new_family_cells;
    for (const auto& entry : batch->family_cell_map()) {
        std::vector<Cell> new_cells;
        new_cells.reserve(entry.second.size());
        for (const Cell& cell : entry.second) {
            // A unique timestamp for non-metric cells keeps concurrent
            // writers from overwriting each other's versions
            int64_t cell_timestamp = GetCellTimestamp(cell.timestamp(), tags);
            new_cells.emplace_back(cell.row(), cell.family(), cell.qualifier(),
                                   cell_timestamp, CellType::kPut, cell.value(), tags);
        }
        new_family_cells.emplace(entry.first, std::move(new_cells));
    }

    batch->SetFamilyCellMap(std::move(new_family_cells));
    batch->SetTags(std::move(tags));
    return Status::OK();
}

int64_t FlowRunObserver::GetCellTimestamp(int64_t timestamp, const TagSet& tags) {
    if (timestamp == kLatestTimestamp) {
        return timestamp_generator_.GetUniqueTimestamp();
    }
    return timestamp;
}

//==============================================================================
// Read path
//==============================================================================

Status FlowRunObserver::PreGetOp(ObserverContext* ctx, const Get& get,
                                 std::vector<Cell>* results) {
    if (!is_flow_run_region_) {
        return Status::OK();
    }

    Scan scan(get);
    scan.SetMaxVersions();

    std::unique_ptr<RegionScanner> raw;
    std::unique_ptr<RegionScanner> scanner;
    ScannerCloseGuard guard(&raw, &scanner);

    Status s = region_->GetScanner(scan, &raw);
    if (!s.ok()) {
        return ToIOError(s, "Opening scanner for get of row " + get.row());
    }

    s = scanner_factory_->NewRegionScanner(ctx->environment(), scan, &raw,
                                           ScannerOperation::kRead, &scanner);
    if (!s.ok()) {
        return ToIOError(s, "Creating aggregating scanner for get of row " + get.row());
    }

    size_t initial_size = results->size();
    bool more_rows = false;
    s = scanner->Next(results, &more_rows);
    if (s.ok()) {
        s = guard.Close();
    }
    if (!s.ok()) {
        // Never hand back a partially aggregated row
        results->erase(results->begin() + initial_size, results->end());
        return ToIOError(s, "Aggregating get of row " + get.row());
    }

    ctx->Bypass();
    return Status::OK();
}

Status FlowRunObserver::PreScannerOpen(ObserverContext* ctx, Scan* scan) {
    if (is_flow_run_region_) {
        // All versions are needed to aggregate metrics
        scan->SetMaxVersions();
    }
    return Status::OK();
}

Status FlowRunObserver::PostScannerOpen(ObserverContext* ctx, const Scan& scan,
                                        std::unique_ptr<RegionScanner>* scanner) {
    if (!is_flow_run_region_) {
        return Status::OK();
    }
    if (!*scanner) {
        return Status::InvalidArgument("No region scanner to aggregate");
    }

    std::unique_ptr<RegionScanner> aggregating;
    Status s = scanner_factory_->NewRegionScanner(ctx->environment(), scan, scanner,
                                                  ScannerOperation::kRead, &aggregating);
    if (!s.ok()) {
        return ToIOError(s, "Creating aggregating scanner for scan");
    }

    *scanner = std::move(aggregating);
    return Status::OK();
}

//==============================================================================
// Flush and compaction
//==============================================================================

Status FlowRunObserver::PreFlush(ObserverContext* ctx, const Store* store,
                                 std::unique_ptr<InternalScanner>* scanner) {
    if (!is_flow_run_region_) {
        return Status::OK();
    }
    if (store != nullptr) {
        FLOWAGG_LOG_DEBUG(FlowRunObserver) << "preFlush " << store->DescribeStats();
    }
    return WrapInternalScanner(ctx, scanner, ScannerOperation::kFlush);
}

Status FlowRunObserver::PostFlush(ObserverContext* ctx, const Store* store,
                                  const std::string& result_file) {
    if (!is_flow_run_region_) {
        return Status::OK();
    }
    if (store != nullptr) {
        FLOWAGG_LOG_DEBUG(FlowRunObserver)
            << "postFlush " << store->DescribeStats() << " resultFile=" << result_file;
    }
    return Status::OK();
}

Status FlowRunObserver::PreCompact(ObserverContext* ctx, const Store* store,
                                   std::unique_ptr<InternalScanner>* scanner,
                                   ScanType scan_type,
                                   const CompactionRequest* request) {
    if (!is_flow_run_region_) {
        return Status::OK();
    }

    ScannerOperation request_op = ClassifyCompaction(request);
    if (request != nullptr) {
        FLOWAGG_LOG_INFO(FlowRunObserver)
            << "Compactionrequest= " << request->ToString() << " " << request_op
            << " RegionName=" << region_->GetRegionInfo().RegionName();
    } else {
        FLOWAGG_LOG_DEBUG(FlowRunObserver)
            << "No compaction request, treating as " << request_op;
    }
    return WrapInternalScanner(ctx, scanner, request_op);
}

Status FlowRunObserver::WrapInternalScanner(ObserverContext* ctx,
                                            std::unique_ptr<InternalScanner>* scanner,
                                            ScannerOperation op) {
    if (!*scanner) {
        return Status::InvalidArgument(std::string("No scanner to aggregate for ") +
                                       ScannerOperationToString(op));
    }

    std::unique_ptr<InternalScanner> aggregating;
    Status s = scanner_factory_->NewInternalScanner(ctx->environment(), scanner, op,
                                                    &aggregating);
    if (!s.ok()) {
        return ToIOError(s, std::string("Creating aggregating scanner for ") +
                                ScannerOperationToString(op));
    }

    *scanner = std::move(aggregating);
    return Status::OK();
}

} // namespace flowagg
