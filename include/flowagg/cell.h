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

FlowAgg Cells and Tags

A cell is the atomic versioned unit of the store:
(row, family, qualifier, timestamp) -> value, plus the tag set describing
the write operation that produced it.
**************************************************************************/

#pragma once

#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace flowagg {

/**
 * @brief Timestamp a caller leaves on a cell when it does not set one.
 *
 * The engine would otherwise resolve it to "now" at persistence time.
 */
constexpr int64_t kLatestTimestamp = std::numeric_limits<int64_t>::max();

/**
 * @brief Largest tag value the engine can persist.
 */
constexpr size_t kMaxTagValueLength = 65535;

enum class CellType : uint8_t {
    kPut = 4,
    kDelete = 8,
    kDeleteColumn = 12,
    kDeleteFamily = 14,
};

const char* CellTypeToString(CellType type);

/**
 * @brief Metadata unit attached to a stored cell.
 *
 * Derived 1:1 from a write attribute. The byte layout on disk belongs to
 * the engine; here a tag is just its type, the originating attribute name
 * and the raw value.
 */
struct Tag {
    uint8_t type = 0;
    std::string name;
    std::string value;

    Tag() = default;
    Tag(uint8_t t, std::string n, std::string v)
        : type(t), name(std::move(n)), value(std::move(v)) {}

    bool operator==(const Tag& other) const {
        return type == other.type && name == other.name && value == other.value;
    }
    bool operator!=(const Tag& other) const { return !(*this == other); }

    std::string ToString() const;
};

/**
 * @brief Immutable tag list shared by every cell of one write.
 */
using TagSet = std::shared_ptr<const std::vector<Tag>>;

TagSet MakeTagSet(std::vector<Tag> tags);

/**
 * @brief Tag list behind a tag set, or an empty list for a null set.
 */
const std::vector<Tag>& TagsOf(const TagSet& tags);

class Cell {
public:
    Cell() = default;
    Cell(std::string row, std::string family, std::string qualifier,
         int64_t timestamp, CellType type, std::string value,
         TagSet tags = nullptr)
        : row_(std::move(row)),
          family_(std::move(family)),
          qualifier_(std::move(qualifier)),
          timestamp_(timestamp),
          type_(type),
          value_(std::move(value)),
          tags_(std::move(tags)) {}

    const std::string& row() const { return row_; }
    const std::string& family() const { return family_; }
    const std::string& qualifier() const { return qualifier_; }
    int64_t timestamp() const { return timestamp_; }
    CellType type() const { return type_; }
    const std::string& value() const { return value_; }
    const TagSet& tags() const { return tags_; }

    bool HasLatestTimestamp() const { return timestamp_ == kLatestTimestamp; }

    /**
     * @brief Same row, family and qualifier (the version-independent key).
     */
    bool SameColumn(const Cell& other) const {
        return row_ == other.row_ && family_ == other.family_ &&
               qualifier_ == other.qualifier_;
    }

    /**
     * @brief Store ordering: row, family, qualifier ascending, then
     * timestamp descending so the newest version comes first.
     */
    bool operator<(const Cell& other) const;

    /**
     * @brief Field-wise equality; tag sets compare by content.
     */
    bool operator==(const Cell& other) const;
    bool operator!=(const Cell& other) const { return !(*this == other); }

    std::string ToString() const;

private:
    std::string row_;
    std::string family_;
    std::string qualifier_;
    int64_t timestamp_ = kLatestTimestamp;
    CellType type_ = CellType::kPut;
    std::string value_;
    TagSet tags_;
};

} // namespace flowagg
