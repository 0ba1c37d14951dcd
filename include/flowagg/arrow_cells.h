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

FlowAgg Arrow Cell Batches

Columnar form of a cell list for engines whose memtables and flush
batches are Arrow RecordBatches. One batch row is one cell version.
**************************************************************************/

#pragma once

#include <flowagg/cell.h>
#include <flowagg/region.h>
#include <flowagg/status.h>
#include <arrow/api.h>
#include <memory>
#include <vector>

namespace flowagg {

/**
 * @brief Schema of a cell batch:
 *   row: binary, family: binary, qualifier: binary, timestamp: int64,
 *   type: uint8, value: binary,
 *   tags: list<struct<type: uint8, name: utf8, value: binary>>
 */
std::shared_ptr<arrow::Schema> CellSchema();

/**
 * @brief Build a cell batch, one row per cell in input order.
 */
Status CellsToRecordBatch(const std::vector<Cell>& cells,
                          std::shared_ptr<arrow::RecordBatch>* batch);

/**
 * @brief Read cells back from a cell batch.
 *
 * Consecutive cells carrying the same tags share one TagSet, as the cells
 * of one write do.
 *
 * @return InvalidArgument if the batch does not have CellSchema()
 */
Status CellsFromRecordBatch(const arrow::RecordBatch& batch,
                            std::vector<Cell>* cells);

/**
 * @brief Scanner over a cell batch in store order, one row per Next().
 *
 * Lets an Arrow flush batch stand in for the engine's flush scanner.
 */
class RecordBatchScanner : public CellListScanner {
public:
    static Status Open(const std::shared_ptr<arrow::RecordBatch>& batch,
                       std::unique_ptr<RecordBatchScanner>* scanner);

private:
    explicit RecordBatchScanner(std::vector<Cell> cells)
        : CellListScanner(std::move(cells)) {}
};

} // namespace flowagg
