/************************************************************************
FlowAgg Write Batch Implementation
**************************************************************************/

#include "flowagg/write_batch.h"

namespace flowagg {

WriteBatch& WriteBatch::AddColumn(const std::string& family,
                                  const std::string& qualifier,
                                  const std::string& value) {
    return AddColumn(family, qualifier, kLatestTimestamp, value);
}

WriteBatch& WriteBatch::AddColumn(const std::string& family,
                                  const std::string& qualifier,
                                  int64_t timestamp,
                                  const std::string& value) {
    family_cells_[family].emplace_back(row_, family, qualifier, timestamp,
                                       CellType::kPut, value, tags_);
    return *this;
}

WriteBatch& WriteBatch::SetAttribute(const std::string& name, const std::string& value) {
    for (auto& attribute : attributes_) {
        if (attribute.first == name) {
            attribute.second = value;
            return *this;
        }
    }
    attributes_.emplace_back(name, value);
    return *this;
}

const std::string* WriteBatch::GetAttribute(const std::string& name) const {
    for (const auto& attribute : attributes_) {
        if (attribute.first == name) {
            return &attribute.second;
        }
    }
    return nullptr;
}

size_t WriteBatch::NumCells() const {
    size_t total = 0;
    for (const auto& entry : family_cells_) {
        total += entry.second.size();
    }
    return total;
}

} // namespace flowagg
