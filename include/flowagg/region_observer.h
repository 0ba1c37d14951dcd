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

/**
 * Region Observer Hooks for FlowAgg
 *
 * The storage engine's extension points as an explicit interface. An engine
 * owns one RegionObserverPipeline per region and routes every write, point
 * lookup, scan open, flush and compaction of that region through it.
 */

#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "flowagg/cell.h"
#include "flowagg/region.h"
#include "flowagg/status.h"
#include "flowagg/write_batch.h"

namespace flowagg {

/**
 * ObserverContext - Per-invocation state shared by the observers of a hook
 *
 * An observer that fully answers a request calls Bypass(); the engine then
 * skips its own default handling and the observers after it.
 */
class ObserverContext {
public:
    explicit ObserverContext(const RegionEnvironment& env) : env_(env) {}

    const RegionEnvironment& environment() const { return env_; }

    void Bypass() { bypass_ = true; }
    bool ShouldBypass() const { return bypass_; }

private:
    const RegionEnvironment& env_;
    bool bypass_ = false;
};

//==============================================================================
// RegionObserver - Abstract base class
//==============================================================================

/**
 * Base class for region observers. Every hook defaults to a pass-through.
 *
 * Lifecycle:
 * 1. Start() - Once, when attached to a region
 * 2. PrePut() - Before a write batch is persisted (may rewrite its cells)
 * 3. PreGetOp() - Before a point lookup (may answer it and bypass)
 * 4. PreScannerOpen() / PostScannerOpen() - Around opening a client scanner
 * 5. PreFlush() / PostFlush() - Around a memstore flush
 * 6. PreCompact() - Before a compaction (may replace its scanner)
 * 7. Stop() - When detached
 */
class RegionObserver {
public:
    virtual ~RegionObserver() = default;

    virtual Status Start(const RegionEnvironment& env) { return Status::OK(); }

    virtual void Stop(const RegionEnvironment& env) {}

    /**
     * Called before a write batch is persisted.
     * The observer may rewrite the batch's cells in place.
     */
    virtual Status PrePut(ObserverContext* ctx, WriteBatch* batch) {
        return Status::OK();
    }

    /**
     * Called before a point lookup. An observer that fills *results itself
     * must call ctx->Bypass().
     */
    virtual Status PreGetOp(ObserverContext* ctx, const Get& get,
                            std::vector<Cell>* results) {
        return Status::OK();
    }

    /**
     * Called before the engine opens a client scanner; the scan may be
     * adjusted.
     */
    virtual Status PreScannerOpen(ObserverContext* ctx, Scan* scan) {
        return Status::OK();
    }

    /**
     * Called after the engine opened a client scanner; *scanner may be
     * replaced by one that wraps it.
     */
    virtual Status PostScannerOpen(ObserverContext* ctx, const Scan& scan,
                                   std::unique_ptr<RegionScanner>* scanner) {
        return Status::OK();
    }

    /**
     * Called before a memstore flush; *scanner produces the cells written
     * to the new store file and may be replaced.
     */
    virtual Status PreFlush(ObserverContext* ctx, const Store* store,
                            std::unique_ptr<InternalScanner>* scanner) {
        return Status::OK();
    }

    virtual Status PostFlush(ObserverContext* ctx, const Store* store,
                             const std::string& result_file) {
        return Status::OK();
    }

    /**
     * Called before a compaction; *scanner produces the cells of the
     * compacted file and may be replaced. request may be null.
     */
    virtual Status PreCompact(ObserverContext* ctx, const Store* store,
                              std::unique_ptr<InternalScanner>* scanner,
                              ScanType scan_type,
                              const CompactionRequest* request) {
        return Status::OK();
    }

    virtual std::string Name() const = 0;
};

//==============================================================================
// RegionObserverPipeline - Composes the observers of one region
//==============================================================================

/**
 * Runs the observers of one region in registration order.
 *
 * - PrePut and the scanner hooks chain: each observer sees the batch or
 *   scanner left by the one before it. The first error aborts the hook.
 * - PreGetOp stops at the first observer that bypasses.
 * - PostFlush calls every observer; errors are logged, never returned.
 *
 * Example:
 *   RegionObserverPipeline pipeline(env);
 *   pipeline.AddObserver(std::make_unique<FlowRunObserver>(factory));
 *   pipeline.Start();
 *   pipeline.PrePut(&batch);
 */
class RegionObserverPipeline {
public:
    explicit RegionObserverPipeline(const RegionEnvironment& env) : env_(env) {}
    ~RegionObserverPipeline();

    RegionObserverPipeline(const RegionObserverPipeline&) = delete;
    RegionObserverPipeline& operator=(const RegionObserverPipeline&) = delete;

    //==========================================================================
    // Observer management
    //==========================================================================

    /**
     * Append an observer. Must happen before Start(); null observers and
     * duplicate names are ignored.
     */
    void AddObserver(std::unique_ptr<RegionObserver> observer);

    void RemoveObserver(const std::string& name);

    RegionObserver* GetObserver(const std::string& name);

    size_t NumObservers() const { return observers_.size(); }

    const RegionEnvironment& environment() const { return env_; }

    //==========================================================================
    // Lifecycle
    //==========================================================================

    /**
     * Start every observer; fails fast on the first error.
     */
    Status Start();

    /**
     * Stop started observers in reverse order. Also run by the destructor.
     */
    void Stop();

    bool started() const { return started_; }

    //==========================================================================
    // Hooks
    //==========================================================================

    Status PrePut(WriteBatch* batch);

    /**
     * @param bypassed Output: true when an observer answered the lookup and
     *                 the engine must not resolve it itself
     */
    Status PreGetOp(const Get& get, std::vector<Cell>* results, bool* bypassed);

    Status PreScannerOpen(Scan* scan);

    Status PostScannerOpen(const Scan& scan, std::unique_ptr<RegionScanner>* scanner);

    Status PreFlush(const Store* store, std::unique_ptr<InternalScanner>* scanner);

    void PostFlush(const Store* store, const std::string& result_file);

    Status PreCompact(const Store* store,
                      std::unique_ptr<InternalScanner>* scanner,
                      ScanType scan_type,
                      const CompactionRequest* request);

private:
    const RegionEnvironment& env_;
    std::vector<std::unique_ptr<RegionObserver>> observers_;
    std::unordered_map<std::string, size_t> observer_index_;  // name -> index
    size_t num_started_ = 0;
    bool started_ = false;
};

}  // namespace flowagg
