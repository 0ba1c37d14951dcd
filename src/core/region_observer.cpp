/**
 * RegionObserverPipeline implementation
 */

#include "flowagg/region_observer.h"
#include "flowagg/logging.h"

namespace flowagg {

FLOWAGG_LOG_TAG(ObserverPipeline);

RegionObserverPipeline::~RegionObserverPipeline() {
    Stop();
}

//==============================================================================
// Observer management
//==============================================================================

void RegionObserverPipeline::AddObserver(std::unique_ptr<RegionObserver> observer) {
    if (!observer) {
        return;
    }
    if (started_) {
        FLOWAGG_LOG_WARN(ObserverPipeline)
            << "Ignoring observer " << observer->Name() << " added after start";
        return;
    }

    std::string name = observer->Name();
    if (observer_index_.find(name) != observer_index_.end()) {
        return;
    }

    observer_index_[name] = observers_.size();
    observers_.push_back(std::move(observer));
}

void RegionObserverPipeline::RemoveObserver(const std::string& name) {
    auto it = observer_index_.find(name);
    if (it == observer_index_.end()) {
        return;
    }

    size_t index = it->second;
    if (index < num_started_) {
        observers_[index]->Stop(env_);
        --num_started_;
    }

    observers_.erase(observers_.begin() + index);
    observer_index_.erase(it);

    // Indices after the removed observer have shifted
    for (size_t i = index; i < observers_.size(); ++i) {
        observer_index_[observers_[i]->Name()] = i;
    }
}

RegionObserver* RegionObserverPipeline::GetObserver(const std::string& name) {
    auto it = observer_index_.find(name);
    if (it == observer_index_.end()) {
        return nullptr;
    }
    return observers_[it->second].get();
}

//==============================================================================
// Lifecycle
//==============================================================================

Status RegionObserverPipeline::Start() {
    if (started_) {
        return Status::InvalidArgument("Observer pipeline already started");
    }

    for (auto& observer : observers_) {
        Status s = observer->Start(env_);
        if (!s.ok()) {
            FLOWAGG_LOG_ERROR(ObserverPipeline)
                << "Observer " << observer->Name() << " failed to start: " << s.ToString();
            Stop();
            return s;
        }
        ++num_started_;
    }

    started_ = true;
    // Environments without a region still run their observers as pass-throughs
    if (env_.region() != nullptr) {
        FLOWAGG_LOG_DEBUG(ObserverPipeline)
            << "Started " << observers_.size() << " observers for region "
            << env_.region()->GetRegionInfo().RegionName();
    } else {
        FLOWAGG_LOG_DEBUG(ObserverPipeline)
            << "Started " << observers_.size() << " observers without a region";
    }
    return Status::OK();
}

void RegionObserverPipeline::Stop() {
    while (num_started_ > 0) {
        --num_started_;
        observers_[num_started_]->Stop(env_);
    }
    started_ = false;
}

//==============================================================================
// Hooks
//==============================================================================

Status RegionObserverPipeline::PrePut(WriteBatch* batch) {
    if (!batch) {
        return Status::InvalidArgument("WriteBatch is null");
    }

    ObserverContext ctx(env_);
    for (auto& observer : observers_) {
        Status s = observer->PrePut(&ctx, batch);
        if (!s.ok()) {
            return s;
        }
        if (ctx.ShouldBypass()) {
            break;
        }
    }
    return Status::OK();
}

Status RegionObserverPipeline::PreGetOp(const Get& get,
                                        std::vector<Cell>* results,
                                        bool* bypassed) {
    if (!results || !bypassed) {
        return Status::InvalidArgument("PreGetOp output is null");
    }

    *bypassed = false;
    ObserverContext ctx(env_);
    for (auto& observer : observers_) {
        Status s = observer->PreGetOp(&ctx, get, results);
        if (!s.ok()) {
            return s;
        }
        if (ctx.ShouldBypass()) {
            *bypassed = true;
            break;
        }
    }
    return Status::OK();
}

Status RegionObserverPipeline::PreScannerOpen(Scan* scan) {
    if (!scan) {
        return Status::InvalidArgument("Scan is null");
    }

    ObserverContext ctx(env_);
    for (auto& observer : observers_) {
        Status s = observer->PreScannerOpen(&ctx, scan);
        if (!s.ok()) {
            return s;
        }
    }
    return Status::OK();
}

Status RegionObserverPipeline::PostScannerOpen(const Scan& scan,
                                               std::unique_ptr<RegionScanner>* scanner) {
    if (!scanner) {
        return Status::InvalidArgument("RegionScanner is null");
    }

    ObserverContext ctx(env_);
    for (auto& observer : observers_) {
        Status s = observer->PostScannerOpen(&ctx, scan, scanner);
        if (!s.ok()) {
            return s;
        }
    }
    return Status::OK();
}

Status RegionObserverPipeline::PreFlush(const Store* store,
                                        std::unique_ptr<InternalScanner>* scanner) {
    if (!scanner) {
        return Status::InvalidArgument("Flush scanner is null");
    }

    ObserverContext ctx(env_);
    for (auto& observer : observers_) {
        Status s = observer->PreFlush(&ctx, store, scanner);
        if (!s.ok()) {
            return s;
        }
    }
    return Status::OK();
}

void RegionObserverPipeline::PostFlush(const Store* store, const std::string& result_file) {
    ObserverContext ctx(env_);
    for (auto& observer : observers_) {
        Status s = observer->PostFlush(&ctx, store, result_file);
        if (!s.ok()) {
            // The flush already happened, nothing left to fail
            FLOWAGG_LOG_WARN(ObserverPipeline)
                << "PostFlush of " << observer->Name() << " failed: " << s.ToString();
        }
    }
}

Status RegionObserverPipeline::PreCompact(const Store* store,
                                          std::unique_ptr<InternalScanner>* scanner,
                                          ScanType scan_type,
                                          const CompactionRequest* request) {
    if (!scanner) {
        return Status::InvalidArgument("Compaction scanner is null");
    }

    ObserverContext ctx(env_);
    for (auto& observer : observers_) {
        Status s = observer->PreCompact(&ctx, store, scanner, scan_type, request);
        if (!s.ok()) {
            return s;
        }
    }
    return Status::OK();
}

}  // namespace flowagg
