/************************************************************************
Unit Tests for FlowRunObserver

Drives the observer through an in-memory region the way a storage engine
would and checks the cells the engine ends up storing and returning.
**************************************************************************/

#include "flowagg/aggregation.h"
#include "flowagg/flow_run_observer.h"
#include "flowagg/flow_run_table.h"
#include "test_util/memory_region.h"
#include "test_util/summing_aggregator.h"
#include <gtest/gtest.h>
#include <set>

using namespace flowagg;
using flowagg::test::MemoryRegion;
using flowagg::test::SummingAggregatorFactory;

namespace {

constexpr int64_t kFrozenMillis = 1000;
const int64_t kFirstGenerated = kFrozenMillis * TimestampGenerator::kTimestampMultiplier;

const char* kFlowRunRow = "yarn-cluster!user!flow!1425016501000";

WriteBatch MetricWrite(const std::string& app_id, const std::string& value) {
    WriteBatch batch(kFlowRunRow);
    batch.AddColumn("m", "MAP_SLOT_MILLIS", value)
        .SetAttribute("SUM", app_id);
    return batch;
}

}  // namespace

class FlowRunObserverTest : public ::testing::Test {
protected:
    FlowRunObserverTest() : FlowRunObserverTest("prod.timelineservice.flowrun") {}

    explicit FlowRunObserverTest(const std::string& table)
        : factory_(std::make_shared<SummingAggregatorFactory>()),
          region_(RegionInfo(table, "", "", 1425016501000), Configuration()) {
        auto observer = std::make_unique<FlowRunObserver>(
            factory_, [] { return kFrozenMillis; });
        observer_ = observer.get();
        region_.AddObserver(std::move(observer));
    }

    void SetUp() override {
        ASSERT_TRUE(region_.Start().ok());
    }

    std::shared_ptr<SummingAggregatorFactory> factory_;
    MemoryRegion region_;
    FlowRunObserver* observer_ = nullptr;
};

//==============================================================================
// Region gate
//==============================================================================

TEST_F(FlowRunObserverTest, FlowRunTableRegionIsRecognized) {
    EXPECT_TRUE(observer_->IsFlowRunRegion());
}

TEST_F(FlowRunObserverTest, SecondStartIsRejected) {
    EXPECT_TRUE(observer_->Start(region_.environment()).IsInvalidArgument());
    EXPECT_TRUE(observer_->IsFlowRunRegion());
}

TEST(FlowRunObserverStartTest, MissingFactoryFailsOnFlowRunTable) {
    MemoryRegion region(RegionInfo("prod.timelineservice.flowrun", "", "", 1), Configuration());
    region.AddObserver(std::make_unique<FlowRunObserver>(nullptr));
    EXPECT_TRUE(region.Start().IsInvalidArgument());
}

TEST(FlowRunObserverStartTest, MissingFactoryIsFineElsewhere) {
    MemoryRegion region(RegionInfo("prod.timelineservice.entity", "", "", 1), Configuration());
    region.AddObserver(std::make_unique<FlowRunObserver>(nullptr));
    EXPECT_TRUE(region.Start().ok());
}

TEST(FlowRunObserverStartTest, NoRegionPassesThrough) {
    Configuration config;
    RegionEnvironment env(nullptr, config);
    FlowRunObserver observer(std::make_shared<SummingAggregatorFactory>());

    EXPECT_TRUE(observer.Start(env).ok());
    EXPECT_FALSE(observer.IsFlowRunRegion());
}

TEST(FlowRunObserverStartTest, ConfiguredTableName) {
    Configuration config;
    config.Set(kFlowRunTableNameKey, "runs");
    config.Set(kSchemaPrefixKey, "test.");
    MemoryRegion region(RegionInfo("TEST.RUNS", "", "", 1), config);
    auto observer = std::make_unique<FlowRunObserver>(std::make_shared<SummingAggregatorFactory>());
    FlowRunObserver* raw = observer.get();
    region.AddObserver(std::move(observer));

    ASSERT_TRUE(region.Start().ok());
    EXPECT_TRUE(raw->IsFlowRunRegion());
}

//==============================================================================
// Write path
//==============================================================================

TEST_F(FlowRunObserverTest, ConcurrentAttemptsDoNotOverwriteEachOther) {
    // The engine stamps both writes with the same wall-clock time
    region_.SetClock([] { return int64_t{5}; });

    WriteBatch first(kFlowRunRow);
    first.AddColumn("i", "flow_name", "sleep job").SetAttribute("op", "APP_ATTEMPT");
    WriteBatch second(kFlowRunRow);
    second.AddColumn("i", "flow_name", "sleep job").SetAttribute("op", "APP_ATTEMPT");

    ASSERT_TRUE(region_.Put(first).ok());
    ASSERT_TRUE(region_.Put(second).ok());

    std::vector<Cell> stored = region_.StoredCells("i");
    ASSERT_EQ(stored.size(), 2u);
    EXPECT_EQ(stored[0].timestamp(), kFirstGenerated);
    EXPECT_EQ(stored[1].timestamp(), kFirstGenerated + 1);
    EXPECT_EQ(TagsOf(stored[0].tags()), TagsOf(stored[1].tags()));
    ASSERT_EQ(TagsOf(stored[0].tags()).size(), 1u);
    EXPECT_EQ(TagsOf(stored[0].tags())[0], Tag(kAttributeTagType, "op", "APP_ATTEMPT"));
}

TEST_F(FlowRunObserverTest, SameColumnTwiceInOneBatchKeepsBothVersions) {
    WriteBatch batch(kFlowRunRow);
    batch.AddColumn("i", "flow_name", "a")
        .AddColumn("i", "flow_name", "b")
        .SetAttribute("op", "APP_ATTEMPT");
    ASSERT_TRUE(region_.Put(batch).ok());

    std::vector<Cell> stored = region_.StoredCells("i");
    ASSERT_EQ(stored.size(), 2u);
    EXPECT_EQ(stored[0].timestamp(), kFirstGenerated);
    EXPECT_EQ(stored[0].value(), "a");
    EXPECT_EQ(stored[1].timestamp(), kFirstGenerated + 1);
    EXPECT_EQ(stored[1].value(), "b");

    EXPECT_EQ(stored[0].tags(), stored[1].tags());
    const std::vector<Tag> expected = {Tag(kAttributeTagType, "op", "APP_ATTEMPT")};
    EXPECT_EQ(TagsOf(stored[0].tags()), expected);
}

TEST(FlowRunObserverWithoutObserverTest, SameTimestampWritesCollide) {
    MemoryRegion region(RegionInfo("prod.timelineservice.flowrun", "", "", 1), Configuration());
    region.SetClock([] { return int64_t{5}; });
    ASSERT_TRUE(region.Start().ok());

    WriteBatch first(kFlowRunRow);
    first.AddColumn("i", "flow_name", "a");
    WriteBatch second(kFlowRunRow);
    second.AddColumn("i", "flow_name", "b");
    ASSERT_TRUE(region.Put(first).ok());
    ASSERT_TRUE(region.Put(second).ok());

    std::vector<Cell> stored = region.StoredCells("i");
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_EQ(stored[0].value(), "b");
}

TEST_F(FlowRunObserverTest, AllCellsOfBatchShareOneTagSet) {
    WriteBatch batch(kFlowRunRow);
    batch.AddColumn("i", "flow_name", "sleep job")
        .AddColumn("i", "flow_version", "1")
        .AddColumn("m", "HDFS_BYTES_READ", 1425016502000, "57")
        .SetAttribute("a1", "v1")
        .SetAttribute("a2", "v2");

    WriteBatch rewritten = batch;
    ASSERT_TRUE(region_.pipeline().PrePut(&rewritten).ok());

    const std::vector<Tag> expected = {Tag(kAttributeTagType, "a1", "v1"),
                                       Tag(kAttributeTagType, "a2", "v2")};
    ASSERT_NE(rewritten.tags(), nullptr);
    EXPECT_EQ(*rewritten.tags(), expected);
    EXPECT_EQ(rewritten.NumCells(), 3u);

    std::set<int64_t> timestamps;
    for (const auto& entry : rewritten.family_cell_map()) {
        for (const Cell& cell : entry.second) {
            EXPECT_EQ(cell.tags(), rewritten.tags());
            EXPECT_EQ(cell.type(), CellType::kPut);
            timestamps.insert(cell.timestamp());
        }
    }
    EXPECT_EQ(timestamps.size(), 3u);
}

TEST_F(FlowRunObserverTest, ExplicitTimestampsAreKept) {
    WriteBatch batch(kFlowRunRow);
    batch.AddColumn("m", "MAP_SLOT_MILLIS", 1425016502000, "12")
        .SetAttribute("SUM", "application_1425016501000_0001");
    ASSERT_TRUE(region_.Put(batch).ok());

    std::vector<Cell> stored = region_.StoredCells("m");
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_EQ(stored[0].timestamp(), 1425016502000);
    ASSERT_EQ(TagsOf(stored[0].tags()).size(), 1u);
    EXPECT_EQ(TagsOf(stored[0].tags())[0].type, TagTypeOf(AggregationOperation::kSum));
    EXPECT_EQ(observer_->timestamp_generator().LastTimestamp(), 0);
}

TEST_F(FlowRunObserverTest, BatchWithoutAttributesIsUntouched) {
    WriteBatch batch(kFlowRunRow);
    batch.AddColumn("i", "flow_name", "sleep job");

    WriteBatch rewritten = batch;
    ASSERT_TRUE(region_.pipeline().PrePut(&rewritten).ok());
    EXPECT_EQ(rewritten.family_cell_map(), batch.family_cell_map());
    EXPECT_EQ(rewritten.tags(), nullptr);

    ASSERT_TRUE(region_.Put(batch).ok());
    std::vector<Cell> stored = region_.StoredCells("i");
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_EQ(stored[0].timestamp(), 1000);
    EXPECT_TRUE(TagsOf(stored[0].tags()).empty());
}

TEST_F(FlowRunObserverTest, InvalidAttributeFailsWriteWithIOError) {
    WriteBatch batch(kFlowRunRow);
    batch.AddColumn("i", "flow_name", "sleep job")
        .SetAttribute("op", std::string(kMaxTagValueLength + 1, 'x'));

    EXPECT_TRUE(region_.Put(batch).IsIOError());
    EXPECT_TRUE(region_.StoredCells("i").empty());
}

//==============================================================================
// Read path
//==============================================================================

TEST_F(FlowRunObserverTest, GetReturnsAggregatedRow) {
    ASSERT_TRUE(region_.Put(MetricWrite("application_1425016501000_0001", "10")).ok());
    ASSERT_TRUE(region_.Put(MetricWrite("application_1425016501000_0002", "20")).ok());
    ASSERT_TRUE(region_.Put(MetricWrite("application_1425016501000_0003", "30")).ok());
    ASSERT_EQ(region_.StoredCells("m").size(), 3u);

    std::vector<Cell> results;
    ASSERT_TRUE(region_.Get(Get(kFlowRunRow), &results).ok());

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].qualifier(), "MAP_SLOT_MILLIS");
    EXPECT_EQ(results[0].value(), "60");

    EXPECT_EQ(factory_->operations(),
              (std::vector<ScannerOperation>{ScannerOperation::kRead}));
    ASSERT_EQ(factory_->scans().size(), 1u);
    EXPECT_TRUE(factory_->scans()[0].all_versions());
    EXPECT_TRUE(factory_->scans()[0].is_get_scan());
    EXPECT_TRUE(region_.last_raw_scan().all_versions());
    EXPECT_EQ(region_.open_scanners(), 0);
}

TEST_F(FlowRunObserverTest, GetKeepsRequestedFamilies) {
    ASSERT_TRUE(region_.Put(MetricWrite("application_1_0001", "10")).ok());
    WriteBatch info(kFlowRunRow);
    info.AddColumn("i", "flow_name", "sleep job").SetAttribute("op", "APP");
    ASSERT_TRUE(region_.Put(info).ok());

    Get get(kFlowRunRow);
    get.AddFamily("i");
    std::vector<Cell> results;
    ASSERT_TRUE(region_.Get(get, &results).ok());

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].family(), "i");
    EXPECT_EQ(region_.last_raw_scan().families(), std::set<std::string>{"i"});
}

TEST_F(FlowRunObserverTest, AggregationFailureFailsGetWithoutPartialResults) {
    ASSERT_TRUE(region_.Put(MetricWrite("application_1_0001", "10")).ok());
    ASSERT_TRUE(region_.Put(MetricWrite("application_1_0002", "not-a-number")).ok());

    std::vector<Cell> results = {Cell("earlier", "f", "q", 1, CellType::kPut, "kept")};
    Status s = region_.Get(Get(kFlowRunRow), &results);

    EXPECT_TRUE(s.IsIOError());
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].value(), "kept");
    EXPECT_EQ(region_.open_scanners(), 0);
}

TEST_F(FlowRunObserverTest, ScannerConstructionFailureClosesRawScanner) {
    ASSERT_TRUE(region_.Put(MetricWrite("application_1_0001", "10")).ok());
    factory_->FailConstruction(Status::Corruption("broken"));

    std::vector<Cell> results;
    EXPECT_TRUE(region_.Get(Get(kFlowRunRow), &results).IsIOError());
    EXPECT_TRUE(results.empty());
    EXPECT_EQ(region_.open_scanners(), 0);
}

TEST_F(FlowRunObserverTest, ScannerNextFailureSurfacesAsIOError) {
    ASSERT_TRUE(region_.Put(MetricWrite("application_1_0001", "10")).ok());
    factory_->FailNext(Status::IOError("disk"));

    std::vector<Cell> results;
    Status s = region_.Get(Get(kFlowRunRow), &results);
    EXPECT_TRUE(s.IsIOError());
    EXPECT_EQ(s.message(), "disk");
    EXPECT_TRUE(results.empty());
    EXPECT_EQ(region_.open_scanners(), 0);
}

TEST_F(FlowRunObserverTest, ScanIsWrappedForReadWithAllVersions) {
    ASSERT_TRUE(region_.Put(MetricWrite("application_1_0001", "10")).ok());
    ASSERT_TRUE(region_.Put(MetricWrite("application_1_0002", "32")).ok());

    std::unique_ptr<RegionScanner> scanner;
    ASSERT_TRUE(region_.OpenScanner(Scan("", ""), &scanner).ok());
    EXPECT_EQ(scanner->GetRegionInfo().table_name, "prod.timelineservice.flowrun");

    std::vector<std::vector<Cell>> rows;
    ASSERT_TRUE(MemoryRegion::ReadAll(scanner.get(), &rows).ok());
    ASSERT_EQ(rows.size(), 1u);
    ASSERT_EQ(rows[0].size(), 1u);
    EXPECT_EQ(rows[0][0].value(), "42");

    EXPECT_EQ(factory_->operations(),
              (std::vector<ScannerOperation>{ScannerOperation::kRead}));
    EXPECT_TRUE(factory_->scans()[0].all_versions());
    EXPECT_FALSE(factory_->scans()[0].is_get_scan());
    EXPECT_EQ(region_.open_scanners(), 0);
}

TEST_F(FlowRunObserverTest, PostScannerOpenRejectsMissingScanner) {
    ObserverContext ctx(region_.environment());
    std::unique_ptr<RegionScanner> scanner;
    EXPECT_TRUE(observer_->PostScannerOpen(&ctx, Scan(), &scanner).IsInvalidArgument());
}

//==============================================================================
// Flush and compaction
//==============================================================================

TEST_F(FlowRunObserverTest, FlushWritesAggregatedCells) {
    ASSERT_TRUE(region_.Put(MetricWrite("application_1_0001", "10")).ok());
    ASSERT_TRUE(region_.Put(MetricWrite("application_1_0002", "20")).ok());
    ASSERT_TRUE(region_.Flush("m").ok());

    EXPECT_EQ(factory_->operations(),
              (std::vector<ScannerOperation>{ScannerOperation::kFlush}));
    const auto* store = region_.GetStore("m");
    ASSERT_EQ(store->files().size(), 1u);
    ASSERT_EQ(store->files()[0].size(), 1u);
    EXPECT_EQ(store->files()[0][0].value(), "30");
    EXPECT_TRUE(store->memstore().empty());
}

TEST_F(FlowRunObserverTest, CompactionModeFollowsRequest) {
    ASSERT_TRUE(region_.Put(MetricWrite("application_1_0001", "10")).ok());
    ASSERT_TRUE(region_.Flush("m").ok());
    ASSERT_TRUE(region_.Put(MetricWrite("application_1_0002", "5")).ok());
    ASSERT_TRUE(region_.Flush("m").ok());

    ASSERT_TRUE(region_.Compact("m", /*major=*/false).ok());
    ASSERT_TRUE(region_.Compact("m", /*major=*/true).ok());
    ASSERT_TRUE(region_.Compact("m", /*major=*/true, /*with_request=*/false).ok());

    EXPECT_EQ(factory_->operations(),
              (std::vector<ScannerOperation>{ScannerOperation::kFlush,
                                             ScannerOperation::kFlush,
                                             ScannerOperation::kMinorCompaction,
                                             ScannerOperation::kMajorCompaction,
                                             ScannerOperation::kMinorCompaction}));

    // The minor compaction kept both versions, the major one summed them
    const auto* store = region_.GetStore("m");
    ASSERT_EQ(store->files().size(), 1u);
    ASSERT_EQ(store->files()[0].size(), 1u);
    EXPECT_EQ(store->files()[0][0].value(), "15");
}

TEST(ClassifyCompactionTest, OnlyMajorRequestsAreMajor) {
    CompactionRequest major(true, {"f1"});
    CompactionRequest minor(false, {"f1"});

    EXPECT_EQ(ClassifyCompaction(&major), ScannerOperation::kMajorCompaction);
    EXPECT_EQ(ClassifyCompaction(&minor), ScannerOperation::kMinorCompaction);
    EXPECT_EQ(ClassifyCompaction(nullptr), ScannerOperation::kMinorCompaction);
}

//==============================================================================
// Other tables
//==============================================================================

class OtherTableTest : public FlowRunObserverTest {
protected:
    OtherTableTest() : FlowRunObserverTest("prod.timelineservice.entity"),
                       plain_(RegionInfo("prod.timelineservice.entity", "", "", 1425016501000),
                              Configuration()) {}

    void SetUp() override {
        FlowRunObserverTest::SetUp();
        ASSERT_TRUE(plain_.Start().ok());
    }

    // Same operation against the observed region and a region with no observer
    template <typename Op>
    void Both(Op op) {
        op(region_);
        op(plain_);
    }

    MemoryRegion plain_;
};

TEST_F(OtherTableTest, ObserverIsInvisible) {
    EXPECT_FALSE(observer_->IsFlowRunRegion());

    Both([](MemoryRegion& region) {
        ASSERT_TRUE(region.Put(MetricWrite("application_1_0001", "10")).ok());
        ASSERT_TRUE(region.Put(MetricWrite("application_1_0002", "20")).ok());
    });
    EXPECT_EQ(region_.StoredCells("m"), plain_.StoredCells("m"));

    std::vector<Cell> observed_get;
    std::vector<Cell> plain_get;
    ASSERT_TRUE(region_.Get(Get(kFlowRunRow), &observed_get).ok());
    ASSERT_TRUE(plain_.Get(Get(kFlowRunRow), &plain_get).ok());
    EXPECT_EQ(observed_get, plain_get);
    ASSERT_EQ(observed_get.size(), 1u);
    EXPECT_EQ(observed_get[0].value(), "20");

    std::vector<std::vector<Cell>> observed_rows;
    std::vector<std::vector<Cell>> plain_rows;
    std::unique_ptr<RegionScanner> scanner;
    ASSERT_TRUE(region_.OpenScanner(Scan("", ""), &scanner).ok());
    ASSERT_TRUE(MemoryRegion::ReadAll(scanner.get(), &observed_rows).ok());
    ASSERT_TRUE(plain_.OpenScanner(Scan("", ""), &scanner).ok());
    ASSERT_TRUE(MemoryRegion::ReadAll(scanner.get(), &plain_rows).ok());
    EXPECT_EQ(observed_rows, plain_rows);
    EXPECT_FALSE(region_.last_raw_scan().all_versions());

    Both([](MemoryRegion& region) {
        ASSERT_TRUE(region.Flush("m").ok());
        ASSERT_TRUE(region.Compact("m", true).ok());
    });
    EXPECT_EQ(region_.StoredCells("m"), plain_.StoredCells("m"));

    EXPECT_EQ(factory_->num_constructed(), 0u);
    EXPECT_EQ(observer_->timestamp_generator().LastTimestamp(), 0);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
