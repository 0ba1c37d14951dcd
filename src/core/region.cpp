/************************************************************************
FlowAgg Storage Engine Interface Helpers
**************************************************************************/

#include "flowagg/region.h"
#include <sstream>

namespace flowagg {

std::string RegionInfo::RegionName() const {
    std::ostringstream oss;
    oss << table_name << "," << start_key << "," << region_id;
    return oss.str();
}

Scan::Scan(const Get& get)
    : start_row_(get.row()),
      // Smallest row sorting after get.row(), stop row is exclusive
      stop_row_(get.row() + std::string(1, '\0')),
      families_(get.families()),
      max_versions_(get.max_versions()),
      get_scan_(true) {}

bool Scan::ContainsRow(const std::string& row) const {
    if (get_scan_) {
        return row == start_row_;
    }
    if (row < start_row_) {
        return false;
    }
    return stop_row_.empty() || row < stop_row_;
}

Status CellListScanner::Next(std::vector<Cell>* results, bool* more_rows) {
    if (closed_) {
        return Status::InvalidArgument("Scanner is closed");
    }

    if (position_ < cells_.size()) {
        const std::string row = cells_[position_].row();
        while (position_ < cells_.size() && cells_[position_].row() == row) {
            results->push_back(cells_[position_]);
            ++position_;
        }
    }

    *more_rows = position_ < cells_.size();
    return Status::OK();
}

Status CellListScanner::Close() {
    closed_ = true;
    return Status::OK();
}

std::string Store::DescribeStats() const {
    std::ostringstream oss;
    oss << "store = " << GetColumnFamilyName()
        << " flushableSize=" << GetFlushableSize()
        << " flushedCellsCount=" << GetFlushedCellsCount()
        << " compactedCellsCount=" << GetCompactedCellsCount()
        << " majorCompactedCellsCount=" << GetMajorCompactedCellsCount()
        << " memstoreFlushSize=" << GetMemstoreFlushSize()
        << " memstoreSize=" << GetMemStoreSize()
        << " size=" << GetSize()
        << " storeFilesCount=" << GetStorefilesCount();
    return oss.str();
}

std::string CompactionRequest::ToString() const {
    std::ostringstream oss;
    oss << "CompactionRequest(" << (is_major_ ? "major" : "minor")
        << ", files=" << files_.size();
    if (!files_.empty()) {
        oss << " [";
        for (size_t i = 0; i < files_.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << files_[i];
        }
        oss << "]";
    }
    oss << ")";
    return oss.str();
}

} // namespace flowagg
