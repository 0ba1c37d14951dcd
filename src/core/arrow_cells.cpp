/************************************************************************
FlowAgg Arrow Cell Batch Implementation
**************************************************************************/

#include "flowagg/arrow_cells.h"
#include <algorithm>

namespace flowagg {

namespace {

std::shared_ptr<arrow::DataType> TagStructType() {
    return arrow::struct_({
        arrow::field("type", arrow::uint8(), false),
        arrow::field("name", arrow::utf8(), false),
        arrow::field("value", arrow::binary(), false),
    });
}

}  // namespace

std::shared_ptr<arrow::Schema> CellSchema() {
    static const std::shared_ptr<arrow::Schema> schema = arrow::schema({
        arrow::field("row", arrow::binary(), false),
        arrow::field("family", arrow::binary(), false),
        arrow::field("qualifier", arrow::binary(), false),
        arrow::field("timestamp", arrow::int64(), false),
        arrow::field("type", arrow::uint8(), false),
        arrow::field("value", arrow::binary(), false),
        arrow::field("tags", arrow::list(TagStructType()), false),
    });
    return schema;
}

Status CellsToRecordBatch(const std::vector<Cell>& cells,
                          std::shared_ptr<arrow::RecordBatch>* batch) {
    arrow::MemoryPool* pool = arrow::default_memory_pool();

    arrow::BinaryBuilder row_builder(pool);
    arrow::BinaryBuilder family_builder(pool);
    arrow::BinaryBuilder qualifier_builder(pool);
    arrow::Int64Builder timestamp_builder(pool);
    arrow::UInt8Builder type_builder(pool);
    arrow::BinaryBuilder value_builder(pool);

    auto tag_type_builder = std::make_shared<arrow::UInt8Builder>(pool);
    auto tag_name_builder = std::make_shared<arrow::StringBuilder>(pool);
    auto tag_value_builder = std::make_shared<arrow::BinaryBuilder>(pool);
    auto tag_builder = std::make_shared<arrow::StructBuilder>(
        TagStructType(), pool,
        std::vector<std::shared_ptr<arrow::ArrayBuilder>>{
            tag_type_builder, tag_name_builder, tag_value_builder});
    arrow::ListBuilder tags_builder(pool, tag_builder, arrow::list(TagStructType()));

    arrow::Status st;
    for (const Cell& cell : cells) {
        st = row_builder.Append(cell.row());
        if (st.ok()) st = family_builder.Append(cell.family());
        if (st.ok()) st = qualifier_builder.Append(cell.qualifier());
        if (st.ok()) st = timestamp_builder.Append(cell.timestamp());
        if (st.ok()) st = type_builder.Append(static_cast<uint8_t>(cell.type()));
        if (st.ok()) st = value_builder.Append(cell.value());
        if (st.ok()) st = tags_builder.Append();
        for (const Tag& tag : TagsOf(cell.tags())) {
            if (!st.ok()) break;
            st = tag_builder->Append();
            if (st.ok()) st = tag_type_builder->Append(tag.type);
            if (st.ok()) st = tag_name_builder->Append(tag.name);
            if (st.ok()) st = tag_value_builder->Append(tag.value);
        }
        if (!st.ok()) {
            return Status::InternalError("Failed to append cell " + cell.ToString() +
                                         ": " + st.ToString());
        }
    }

    std::vector<std::shared_ptr<arrow::Array>> columns(7);
    st = row_builder.Finish(&columns[0]);
    if (st.ok()) st = family_builder.Finish(&columns[1]);
    if (st.ok()) st = qualifier_builder.Finish(&columns[2]);
    if (st.ok()) st = timestamp_builder.Finish(&columns[3]);
    if (st.ok()) st = type_builder.Finish(&columns[4]);
    if (st.ok()) st = value_builder.Finish(&columns[5]);
    if (st.ok()) st = tags_builder.Finish(&columns[6]);
    if (!st.ok()) {
        return Status::InternalError("Failed to finish cell batch: " + st.ToString());
    }

    *batch = arrow::RecordBatch::Make(CellSchema(), static_cast<int64_t>(cells.size()),
                                      std::move(columns));
    return Status::OK();
}

Status CellsFromRecordBatch(const arrow::RecordBatch& batch,
                            std::vector<Cell>* cells) {
    if (!batch.schema()->Equals(*CellSchema())) {
        return Status::InvalidArgument("Not a cell batch: " + batch.schema()->ToString());
    }

    auto rows = std::static_pointer_cast<arrow::BinaryArray>(batch.column(0));
    auto families = std::static_pointer_cast<arrow::BinaryArray>(batch.column(1));
    auto qualifiers = std::static_pointer_cast<arrow::BinaryArray>(batch.column(2));
    auto timestamps = std::static_pointer_cast<arrow::Int64Array>(batch.column(3));
    auto types = std::static_pointer_cast<arrow::UInt8Array>(batch.column(4));
    auto values = std::static_pointer_cast<arrow::BinaryArray>(batch.column(5));
    auto tag_lists = std::static_pointer_cast<arrow::ListArray>(batch.column(6));

    auto tag_structs = std::static_pointer_cast<arrow::StructArray>(tag_lists->values());
    auto tag_types = std::static_pointer_cast<arrow::UInt8Array>(tag_structs->field(0));
    auto tag_names = std::static_pointer_cast<arrow::StringArray>(tag_structs->field(1));
    auto tag_values = std::static_pointer_cast<arrow::BinaryArray>(tag_structs->field(2));

    std::vector<Cell> decoded;
    decoded.reserve(static_cast<size_t>(batch.num_rows()));
    TagSet previous_tags;

    for (int64_t i = 0; i < batch.num_rows(); ++i) {
        std::vector<Tag> tags;
        int64_t offset = tag_lists->value_offset(i);
        int64_t length = tag_lists->value_length(i);
        tags.reserve(static_cast<size_t>(length));
        for (int64_t j = offset; j < offset + length; ++j) {
            tags.emplace_back(tag_types->Value(j), tag_names->GetString(j),
                              tag_values->GetString(j));
        }

        TagSet cell_tags;
        if (!tags.empty()) {
            if (previous_tags && *previous_tags == tags) {
                cell_tags = previous_tags;
            } else {
                cell_tags = MakeTagSet(std::move(tags));
                previous_tags = cell_tags;
            }
        }

        decoded.emplace_back(rows->GetString(i), families->GetString(i),
                             qualifiers->GetString(i), timestamps->Value(i),
                             static_cast<CellType>(types->Value(i)),
                             values->GetString(i), std::move(cell_tags));
    }

    *cells = std::move(decoded);
    return Status::OK();
}

//==============================================================================
// RecordBatchScanner
//==============================================================================

Status RecordBatchScanner::Open(const std::shared_ptr<arrow::RecordBatch>& batch,
                                std::unique_ptr<RecordBatchScanner>* scanner) {
    if (!batch) {
        return Status::InvalidArgument("RecordBatch is null");
    }

    std::vector<Cell> cells;
    Status s = CellsFromRecordBatch(*batch, &cells);
    if (!s.ok()) {
        return s;
    }

    std::stable_sort(cells.begin(), cells.end());
    scanner->reset(new RecordBatchScanner(std::move(cells)));
    return Status::OK();
}

} // namespace flowagg
