/************************************************************************
Unit Tests for Arrow cell batches
**************************************************************************/

#include "flowagg/aggregation.h"
#include "flowagg/arrow_cells.h"
#include <arrow/api.h>
#include <gtest/gtest.h>

namespace flowagg {

class ArrowCellsTest : public ::testing::Test {
protected:
    void SetUp() override {
        write_tags_ = MakeTagSet({Tag(TagTypeOf(AggregationOperation::kSum), "SUM",
                                      "application_1425016501000_0001"),
                                  Tag(kAttributeTagType, "op", "APP_ATTEMPT")});
        cells_ = {
            Cell("flow!b", "m", "MAP_SLOT_MILLIS", 200, CellType::kPut, "12", write_tags_),
            Cell("flow!b", "m", "MAP_SLOT_MILLIS", 100, CellType::kPut, "7", write_tags_),
            Cell("flow!a", "i", "flow_name", 50, CellType::kPut, "sleep job"),
            Cell("flow!a", "i", "flow_version", 60, CellType::kDeleteColumn, ""),
        };
    }

    TagSet write_tags_;
    std::vector<Cell> cells_;
};

TEST_F(ArrowCellsTest, BatchHasCellSchema) {
    std::shared_ptr<arrow::RecordBatch> batch;
    ASSERT_TRUE(CellsToRecordBatch(cells_, &batch).ok());

    EXPECT_TRUE(batch->schema()->Equals(*CellSchema()));
    EXPECT_EQ(batch->num_rows(), 4);

    auto timestamps = std::static_pointer_cast<arrow::Int64Array>(batch->column(3));
    EXPECT_EQ(timestamps->Value(0), 200);
    EXPECT_EQ(timestamps->Value(2), 50);

    auto tags = std::static_pointer_cast<arrow::ListArray>(batch->column(6));
    EXPECT_EQ(tags->value_length(0), 2);
    EXPECT_EQ(tags->value_length(2), 0);
}

TEST_F(ArrowCellsTest, CellsSurviveConversion) {
    std::shared_ptr<arrow::RecordBatch> batch;
    ASSERT_TRUE(CellsToRecordBatch(cells_, &batch).ok());

    std::vector<Cell> decoded;
    ASSERT_TRUE(CellsFromRecordBatch(*batch, &decoded).ok());
    EXPECT_EQ(decoded, cells_);
    EXPECT_EQ(decoded[3].type(), CellType::kDeleteColumn);
}

TEST_F(ArrowCellsTest, ConsecutiveCellsOfOneWriteShareTags) {
    std::shared_ptr<arrow::RecordBatch> batch;
    ASSERT_TRUE(CellsToRecordBatch(cells_, &batch).ok());

    std::vector<Cell> decoded;
    ASSERT_TRUE(CellsFromRecordBatch(*batch, &decoded).ok());
    ASSERT_NE(decoded[0].tags(), nullptr);
    EXPECT_EQ(decoded[0].tags(), decoded[1].tags());
    EXPECT_EQ(decoded[2].tags(), nullptr);
}

TEST_F(ArrowCellsTest, EmptyCellList) {
    std::shared_ptr<arrow::RecordBatch> batch;
    ASSERT_TRUE(CellsToRecordBatch({}, &batch).ok());
    EXPECT_EQ(batch->num_rows(), 0);

    std::vector<Cell> decoded = cells_;
    ASSERT_TRUE(CellsFromRecordBatch(*batch, &decoded).ok());
    EXPECT_TRUE(decoded.empty());
}

TEST_F(ArrowCellsTest, ForeignSchemaIsRejected) {
    auto schema = arrow::schema({arrow::field("row", arrow::utf8())});
    arrow::StringBuilder builder;
    ASSERT_TRUE(builder.Append("r").ok());
    std::shared_ptr<arrow::Array> rows;
    ASSERT_TRUE(builder.Finish(&rows).ok());
    auto batch = arrow::RecordBatch::Make(schema, 1,
                                          std::vector<std::shared_ptr<arrow::Array>>{rows});

    std::vector<Cell> decoded;
    EXPECT_TRUE(CellsFromRecordBatch(*batch, &decoded).IsInvalidArgument());
}

TEST_F(ArrowCellsTest, ScannerYieldsRowsInStoreOrder) {
    std::shared_ptr<arrow::RecordBatch> batch;
    ASSERT_TRUE(CellsToRecordBatch(cells_, &batch).ok());

    std::unique_ptr<RecordBatchScanner> scanner;
    ASSERT_TRUE(RecordBatchScanner::Open(batch, &scanner).ok());
    EXPECT_EQ(scanner->num_cells(), 4u);

    std::vector<Cell> first;
    bool more_rows = false;
    ASSERT_TRUE(scanner->Next(&first, &more_rows).ok());
    EXPECT_TRUE(more_rows);
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[0].qualifier(), "flow_name");
    EXPECT_EQ(first[1].qualifier(), "flow_version");

    std::vector<Cell> second;
    ASSERT_TRUE(scanner->Next(&second, &more_rows).ok());
    EXPECT_FALSE(more_rows);
    ASSERT_EQ(second.size(), 2u);
    EXPECT_EQ(second[0].timestamp(), 200);
    EXPECT_EQ(second[1].timestamp(), 100);

    ASSERT_TRUE(scanner->Close().ok());
    EXPECT_TRUE(scanner->Next(&second, &more_rows).IsInvalidArgument());
}

TEST_F(ArrowCellsTest, ScannerRejectsNullBatch) {
    std::unique_ptr<RecordBatchScanner> scanner;
    EXPECT_TRUE(RecordBatchScanner::Open(nullptr, &scanner).IsInvalidArgument());
}

} // namespace flowagg

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
