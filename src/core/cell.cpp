/************************************************************************
FlowAgg Cell Implementation
**************************************************************************/

#include "flowagg/cell.h"
#include <sstream>
#include <tuple>

namespace flowagg {

const char* CellTypeToString(CellType type) {
    switch (type) {
        case CellType::kPut: return "Put";
        case CellType::kDelete: return "Delete";
        case CellType::kDeleteColumn: return "DeleteColumn";
        case CellType::kDeleteFamily: return "DeleteFamily";
    }
    return "Unknown";
}

std::string Tag::ToString() const {
    std::ostringstream oss;
    oss << name << "(" << static_cast<int>(type) << ")=" << value;
    return oss.str();
}

TagSet MakeTagSet(std::vector<Tag> tags) {
    return std::make_shared<const std::vector<Tag>>(std::move(tags));
}

const std::vector<Tag>& TagsOf(const TagSet& tags) {
    static const std::vector<Tag> kEmpty;
    return tags ? *tags : kEmpty;
}

bool Cell::operator<(const Cell& other) const {
    int cmp = row_.compare(other.row_);
    if (cmp != 0) return cmp < 0;
    cmp = family_.compare(other.family_);
    if (cmp != 0) return cmp < 0;
    cmp = qualifier_.compare(other.qualifier_);
    if (cmp != 0) return cmp < 0;
    // Newest version first
    if (timestamp_ != other.timestamp_) return timestamp_ > other.timestamp_;
    return static_cast<uint8_t>(type_) > static_cast<uint8_t>(other.type_);
}

bool Cell::operator==(const Cell& other) const {
    return std::tie(row_, family_, qualifier_, timestamp_, type_, value_) ==
               std::tie(other.row_, other.family_, other.qualifier_,
                        other.timestamp_, other.type_, other.value_) &&
           TagsOf(tags_) == TagsOf(other.tags_);
}

std::string Cell::ToString() const {
    std::ostringstream oss;
    oss << row_ << "/" << family_ << ":" << qualifier_ << "/";
    if (timestamp_ == kLatestTimestamp) {
        oss << "LATEST_TIMESTAMP";
    } else {
        oss << timestamp_;
    }
    oss << "/" << CellTypeToString(type_) << "/vlen=" << value_.size();

    const auto& tags = TagsOf(tags_);
    if (!tags.empty()) {
        oss << "/tags=[";
        for (size_t i = 0; i < tags.size(); ++i) {
            if (i > 0) oss << ",";
            oss << tags[i].ToString();
        }
        oss << "]";
    }
    return oss.str();
}

} // namespace flowagg
