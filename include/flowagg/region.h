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

FlowAgg Storage Engine Interfaces

The slice of a versioned key-value engine that region observers work
against: region identity, read requests, scanners, stores and compaction
requests. Engines implement these; FlowAgg never depends on an engine's
own plugin ABI.
**************************************************************************/

#pragma once

#include <flowagg/cell.h>
#include <flowagg/configuration.h>
#include <flowagg/status.h>
#include <cstdint>
#include <limits>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace flowagg {

/**
 * @brief Identity of one region: a contiguous row range of one table.
 */
struct RegionInfo {
    std::string table_name;
    std::string start_key;
    std::string end_key;
    int64_t region_id = 0;

    RegionInfo() = default;
    RegionInfo(std::string table, std::string start, std::string end, int64_t id)
        : table_name(std::move(table)), start_key(std::move(start)),
          end_key(std::move(end)), region_id(id) {}

    /**
     * @brief "<table>,<start key>,<region id>"
     */
    std::string RegionName() const;
};

/**
 * @brief Point lookup of one row.
 */
class Get {
public:
    explicit Get(std::string row) : row_(std::move(row)) {}

    const std::string& row() const { return row_; }

    Get& AddFamily(const std::string& family) {
        families_.insert(family);
        return *this;
    }
    const std::set<std::string>& families() const { return families_; }

    Get& SetMaxVersions(int max_versions) {
        max_versions_ = max_versions;
        return *this;
    }
    int max_versions() const { return max_versions_; }

private:
    std::string row_;
    std::set<std::string> families_;
    int max_versions_ = 1;
};

/**
 * @brief Row range scan. An empty stop row means "to the end".
 */
class Scan {
public:
    static constexpr int kAllVersions = std::numeric_limits<int>::max();

    Scan() = default;
    Scan(std::string start_row, std::string stop_row)
        : start_row_(std::move(start_row)), stop_row_(std::move(stop_row)) {}

    /**
     * @brief Single-row scan equivalent to the lookup.
     */
    explicit Scan(const Get& get);

    const std::string& start_row() const { return start_row_; }
    const std::string& stop_row() const { return stop_row_; }

    Scan& AddFamily(const std::string& family) {
        families_.insert(family);
        return *this;
    }
    const std::set<std::string>& families() const { return families_; }

    /**
     * @brief Return every stored version of each cell.
     */
    Scan& SetMaxVersions() {
        max_versions_ = kAllVersions;
        return *this;
    }
    Scan& SetMaxVersions(int max_versions) {
        max_versions_ = max_versions;
        return *this;
    }
    int max_versions() const { return max_versions_; }
    bool all_versions() const { return max_versions_ == kAllVersions; }

    bool is_get_scan() const { return get_scan_; }

    /**
     * @brief Whether the row falls in [start_row, stop_row); a get scan
     * matches exactly its one row.
     */
    bool ContainsRow(const std::string& row) const;

    /**
     * @brief Whether the family is selected; no families selects all.
     */
    bool IncludesFamily(const std::string& family) const {
        return families_.empty() || families_.count(family) > 0;
    }

private:
    std::string start_row_;
    std::string stop_row_;
    std::set<std::string> families_;
    int max_versions_ = 1;
    bool get_scan_ = false;
};

/**
 * @brief Row-at-a-time cell iterator used by flushes, compactions and
 * client scans.
 */
class InternalScanner {
public:
    virtual ~InternalScanner() = default;

    /**
     * @brief Append the cells of the next row to *results.
     *
     * @param more_rows Output: false once no row follows this one
     */
    virtual Status Next(std::vector<Cell>* results, bool* more_rows) = 0;

    /**
     * @brief Release resources. Calling Close() twice is harmless.
     */
    virtual Status Close() = 0;
};

/**
 * @brief Scanner over cells already in store order; each Next() yields
 * the cells of one row. Next() after Close() returns InvalidArgument.
 */
class CellListScanner : public InternalScanner {
public:
    explicit CellListScanner(std::vector<Cell> cells) : cells_(std::move(cells)) {}

    Status Next(std::vector<Cell>* results, bool* more_rows) override;
    Status Close() override;

    size_t num_cells() const { return cells_.size(); }
    bool closed() const { return closed_; }

private:
    std::vector<Cell> cells_;
    size_t position_ = 0;
    bool closed_ = false;
};

/**
 * @brief Scanner the region opens for client reads.
 */
class RegionScanner : public InternalScanner {
public:
    virtual const RegionInfo& GetRegionInfo() const = 0;
};

/**
 * @brief One column family's storage within a region.
 *
 * Only the statistics observers log are exposed.
 */
class Store {
public:
    virtual ~Store() = default;

    virtual std::string GetColumnFamilyName() const = 0;
    virtual uint64_t GetFlushableSize() const = 0;
    virtual uint64_t GetFlushedCellsCount() const = 0;
    virtual uint64_t GetCompactedCellsCount() const = 0;
    virtual uint64_t GetMajorCompactedCellsCount() const = 0;
    virtual uint64_t GetMemstoreFlushSize() const = 0;
    virtual uint64_t GetMemStoreSize() const = 0;
    virtual uint64_t GetSize() const = 0;
    virtual size_t GetStorefilesCount() const = 0;

    /**
     * @brief One-line summary of the statistics above.
     */
    std::string DescribeStats() const;
};

/**
 * @brief Which store files a compaction rewrites.
 */
class CompactionRequest {
public:
    CompactionRequest(bool is_major, std::vector<std::string> files)
        : is_major_(is_major), files_(std::move(files)) {}

    bool IsMajor() const { return is_major_; }
    const std::vector<std::string>& files() const { return files_; }

    std::string ToString() const;

private:
    bool is_major_;
    std::vector<std::string> files_;
};

/**
 * @brief How a compaction treats delete markers.
 */
enum class ScanType {
    kCompactRetainDeletes,
    kCompactDropDeletes,
};

/**
 * @brief A region as seen by its observers.
 */
class Region {
public:
    virtual ~Region() = default;

    virtual const RegionInfo& GetRegionInfo() const = 0;

    /**
     * @brief Open a raw scanner over the region's memstore and store files.
     */
    virtual Status GetScanner(const Scan& scan,
                              std::unique_ptr<RegionScanner>* scanner) = 0;
};

/**
 * @brief Runtime handed to an observer attached to one region.
 *
 * The region and configuration outlive every observer of the region.
 */
class RegionEnvironment {
public:
    RegionEnvironment(Region* region, const Configuration& configuration)
        : region_(region), configuration_(configuration) {}

    Region* region() const { return region_; }
    const Configuration& configuration() const { return configuration_; }

private:
    Region* region_;
    const Configuration& configuration_;
};

} // namespace flowagg
