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

FlowAgg Write Batch

One client write against a single row: the cells to store, grouped by
column family, plus the attributes describing the operation that produced
them. Every cell of a batch belongs to the same logical operation, so a
batch carries exactly one tag set.
**************************************************************************/

#pragma once

#include <flowagg/cell.h>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace flowagg {

/**
 * @brief Write attributes in the order the client set them.
 */
using AttributeList = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Family -> cells, families in byte order.
 */
using FamilyCellMap = std::map<std::string, std::vector<Cell>>;

class WriteBatch {
public:
    explicit WriteBatch(std::string row) : row_(std::move(row)) {}

    const std::string& row() const { return row_; }

    /**
     * @brief Add a cell with no timestamp; the store decides it.
     */
    WriteBatch& AddColumn(const std::string& family,
                          const std::string& qualifier,
                          const std::string& value);

    /**
     * @brief Add a cell with an explicit timestamp.
     */
    WriteBatch& AddColumn(const std::string& family,
                          const std::string& qualifier,
                          int64_t timestamp,
                          const std::string& value);

    /**
     * @brief Set an attribute; an existing name keeps its position.
     */
    WriteBatch& SetAttribute(const std::string& name, const std::string& value);

    /**
     * @brief Attribute value, or nullptr when unset.
     */
    const std::string* GetAttribute(const std::string& name) const;

    const AttributeList& attributes() const { return attributes_; }

    const FamilyCellMap& family_cell_map() const { return family_cells_; }

    /**
     * @brief Replace all cells at once.
     */
    void SetFamilyCellMap(FamilyCellMap family_cells) {
        family_cells_ = std::move(family_cells);
    }

    /**
     * @brief Tag set shared by all cells, null until the batch is tagged.
     */
    const TagSet& tags() const { return tags_; }
    void SetTags(TagSet tags) { tags_ = std::move(tags); }

    size_t NumCells() const;
    bool empty() const { return NumCells() == 0; }

private:
    std::string row_;
    AttributeList attributes_;
    FamilyCellMap family_cells_;
    TagSet tags_;
};

} // namespace flowagg
