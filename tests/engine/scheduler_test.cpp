// =============================================================================
// logq - Scheduler Tests
// =============================================================================
// End-to-end runs over small directory trees: enumeration, compressed and
// corrupt inputs, worker-count independence, byte-range splitting and
// cancellation.
// =============================================================================

#include "logq/engine/scheduler.h"

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <vector>

#include "logq/engine/engine_config.h"
#include "logq/parse/schema.h"
#include "logq/query/condition_parser.h"
#include "../test_util.h"

namespace logq::engine {
namespace {

using logq::test::TempDir;

// =============================================================================
// Test Fixture
// =============================================================================

class SchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string app;
        for (int i = 0; i < 200; ++i) {
            const char* level = i % 10 == 0 ? "ERROR" : (i % 3 == 0 ? "WARN" : "INFO");
            app += std::string(level) + "|" + std::to_string(200 + i % 5) + "|" +
                   std::to_string(i) + "\n";
        }
        app_ = app;

        dir_.write("app.log", app);
        dir_.write("archive/app.log.gz", logq::test::gzipCompress("ERROR|500|1000\nINFO|200|1\n"));
        dir_.write("archive/old.log.zst", logq::test::zstdCompress("ERROR|503|7\n"));
        dir_.write("bz/x.log.bz2", logq::test::bzip2Compress("WARN|404|3\nERROR|500|2\n"));
        dir_.write("xz/y.log.xz", logq::test::xzCompress("ERROR|501|5\n"));
        dir_.write(".hidden/secret.log", "ERROR|500|99\n");
    }

    EngineConfig config(std::vector<std::string> conditions = {},
                        AggregationMode mode = AggregationMode::kEnumerate) const {
        EngineConfig cfg;
        cfg.scan.logRoot = dir_.path();
        cfg.scan.numWorkers = 4;
        cfg.fields = {field("level"), field("status", parse::FieldType::kInteger),
                      field("bytes", parse::FieldType::kInteger)};
        auto parsed = query::parseConditions(conditions);
        EXPECT_TRUE(parsed.has_value());
        if (parsed) {
            cfg.query.conditions = *parsed;
        }
        cfg.query.mode = mode;
        return cfg;
    }

    static parse::FieldSpec field(std::string name,
                                  parse::FieldType type = parse::FieldType::kString) {
        parse::FieldSpec spec;
        spec.name = std::move(name);
        spec.type = type;
        return spec;
    }

    static FinalResult mustRun(const EngineConfig& cfg) {
        auto result = runQuery(cfg);
        EXPECT_TRUE(result.has_value()) << (result ? "" : result.error().message());
        return result.value_or(FinalResult{});
    }

    // "ERROR" rows in app.log: i % 10 == 0 for i in [0, 200)
    static constexpr std::uint64_t kAppErrors = 20;
    // app.log.gz, old.log.zst, x.log.bz2, y.log.xz
    static constexpr std::uint64_t kArchiveErrors = 4;

    TempDir dir_;
    std::string app_;
};

// =============================================================================
// Enumeration
// =============================================================================

TEST_F(SchedulerTest, EnumerationIsSortedAndSkipsHidden) {
    ScanOptions options;
    options.logRoot = dir_.path();

    auto files = enumerateFiles(options);
    ASSERT_TRUE(files.has_value());
    ASSERT_EQ(files->size(), 5u);
    for (std::size_t i = 0; i < files->size(); ++i) {
        EXPECT_EQ((*files)[i].index, i);
        if (i > 0) {
            EXPECT_LT((*files)[i - 1].path, (*files)[i].path);
        }
    }

    options.includeHidden = true;
    EXPECT_EQ(enumerateFiles(options)->size(), 6u);

    options.includeHidden = false;
    options.recursive = false;
    auto top = enumerateFiles(options);
    ASSERT_EQ(top->size(), 1u);
    EXPECT_EQ(top->front().path.filename(), "app.log");
}

TEST_F(SchedulerTest, ExtensionAndNameFilters) {
    ScanOptions options;
    options.logRoot = dir_.path();
    options.extensions = {"GZ", ".zst"};
    EXPECT_EQ(enumerateFiles(options)->size(), 2u);

    options.extensions.clear();
    options.nameContains = {"old", "x."};
    EXPECT_EQ(enumerateFiles(options)->size(), 2u);
}

TEST_F(SchedulerTest, MissingRootIsEnumerationError) {
    auto cfg = config();
    cfg.scan.logRoot = dir_.path() / "nope";
    auto result = runQuery(cfg);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kEnumerationError);

    cfg.scan.logRoot = dir_.path() / "app.log";
    EXPECT_EQ(runQuery(cfg).error().code(), ErrorCode::kEnumerationError);
}

TEST_F(SchedulerTest, EmptyDirectoryYieldsEmptyResult) {
    TempDir empty;
    auto cfg = config({}, AggregationMode::kCount);
    cfg.scan.logRoot = empty.path();
    FinalResult result = mustRun(cfg);
    EXPECT_EQ(result.count, 0u);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(result.stats.filesScanned, 0u);
}

// =============================================================================
// Queries
// =============================================================================

TEST_F(SchedulerTest, FiltersAcrossCompressionFormats) {
    FinalResult result = mustRun(config({"level == ERROR"}));

    EXPECT_EQ(result.matches.size(), kAppErrors + kArchiveErrors);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(result.stats.filesScanned, 5u);
    EXPECT_EQ(result.stats.recordsMatched, kAppErrors + kArchiveErrors);
    for (std::size_t i = 1; i < result.matches.size(); ++i) {
        EXPECT_TRUE(discoveryLess(result.matches[i - 1], result.matches[i]));
    }
    for (const auto& match : result.matches) {
        EXPECT_TRUE(match.raw.starts_with("ERROR|"));
    }
}

TEST_F(SchedulerTest, MatchOffsetsPointAtRecords) {
    FinalResult result = mustRun(config({"bytes == 30"}));
    ASSERT_EQ(result.matches.size(), 1u);
    const Match& match = result.matches[0];
    EXPECT_EQ(result.sourceOf(match).filename(), "app.log");
    EXPECT_EQ(app_.substr(match.offset, match.raw.size()), match.raw);
}

TEST_F(SchedulerTest, CorruptFileIsSkippedAndReported) {
    const std::string gz = logq::test::gzipCompress("ERROR|500|1\nERROR|500|2\n");
    dir_.write("broken.log.gz", gz.substr(0, gz.size() / 2));
    dir_.write("fake.log.gz", "not gzip at all\n");

    FinalResult result = mustRun(config({"level == ERROR"}, AggregationMode::kCount));
    EXPECT_EQ(result.count, kAppErrors + kArchiveErrors);
    EXPECT_EQ(result.stats.filesScanned, 5u);
    EXPECT_EQ(result.stats.filesFailed, 2u);
    ASSERT_EQ(result.errors.size(), 2u);
    EXPECT_EQ(result.errors[0].kind, ErrorCode::kDecompressionError);
    EXPECT_EQ(std::filesystem::path(result.errors[0].path).filename(), "broken.log.gz");
    EXPECT_EQ(std::filesystem::path(result.errors[1].path).filename(), "fake.log.gz");
}

TEST_F(SchedulerTest, ResultIndependentOfWorkerCount) {
    auto cfg = config({"status >= 202"});
    cfg.scan.numWorkers = 1;
    FinalResult baseline = mustRun(cfg);
    EXPECT_GT(baseline.matches.size(), 0u);

    for (std::size_t workers : {2u, 8u}) {
        SCOPED_TRACE(workers);
        cfg.scan.numWorkers = workers;
        FinalResult result = mustRun(cfg);
        EXPECT_EQ(result.matches, baseline.matches);
        EXPECT_EQ(result.stats.recordsScanned, baseline.stats.recordsScanned);
    }
}

TEST_F(SchedulerTest, RepeatedRunsAreIdentical) {
    auto cfg = config({"level in ERROR,WARN"});
    auto spec = cfg.buildQuerySpec();
    ASSERT_TRUE(spec.has_value());

    Scheduler scheduler(cfg.scan);
    auto first = scheduler.run(*spec);
    auto second = scheduler.run(*spec);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->matches, second->matches);
    EXPECT_FALSE(scheduler.isRunning());
}

TEST_F(SchedulerTest, ByteRangeSplittingMatchesWholeFile) {
    auto cfg = config({"level == WARN"});
    FinalResult whole = mustRun(cfg);

    cfg.scan.splitThreshold = 64;
    cfg.scan.chunkSize = kMinChunkSize;
    FinalResult split = mustRun(cfg);

    EXPECT_EQ(split.matches, whole.matches);
    EXPECT_EQ(split.stats.recordsScanned, whole.stats.recordsScanned);
    EXPECT_EQ(split.stats.filesScanned, whole.stats.filesScanned);
}

TEST_F(SchedulerTest, GroupByWithMetric) {
    auto cfg = config({}, AggregationMode::kGroup);
    cfg.scan.recursive = false;
    cfg.query.groupBy = "level";
    cfg.query.metric = "bytes";
    FinalResult result = mustRun(cfg);

    ASSERT_EQ(result.groups.size(), 3u);
    EXPECT_EQ(result.groups[0].first, "ERROR");
    EXPECT_EQ(result.groups[0].second.count, kAppErrors);
    EXPECT_DOUBLE_EQ(result.groups[0].second.min, 0.0);
    EXPECT_DOUBLE_EQ(result.groups[0].second.max, 190.0);

    std::uint64_t total = 0;
    for (const auto& [key, group] : result.groups) {
        total += group.count;
    }
    EXPECT_EQ(total, 200u);
}

TEST(SchedulerScenarioTest, BasicFilterReturnsSingleMatch) {
    TempDir dir;
    dir.write("a.log", "2024-01-01|ERROR|disk full\n2024-01-01|INFO|ok\n");
    dir.write("b.log", "2024-01-02|INFO|started\n2024-01-02|WARN|slow disk\n");

    EngineConfig cfg;
    cfg.scan.logRoot = dir.path();
    cfg.scan.numWorkers = 2;
    cfg.fields = {parse::parseFieldSpec("ts:timestamp").value(),
                  parse::parseFieldSpec("level").value(),
                  parse::parseFieldSpec("msg").value()};
    cfg.query.conditions = query::parseConditions({"level == \"ERROR\""}).value();

    auto result = runQuery(cfg);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->matches.size(), 1u);
    EXPECT_EQ(result->matches[0].raw, "2024-01-01|ERROR|disk full");
    EXPECT_EQ(result->sourceOf(result->matches[0]).filename(), "a.log");
    EXPECT_EQ(result->matches[0].offset, 0u);
    EXPECT_TRUE(result->errors.empty());
    EXPECT_EQ(result->stats.recordsScanned, 4u);
}

TEST(SchedulerScenarioTest, CountOverThreeFilesForAnyPoolSize) {
    TempDir dir;
    for (int file = 0; file < 3; ++file) {
        std::string content;
        for (int i = 0; i < 15; ++i) {
            content += i < 10 ? "hit|" : "miss|";
            content += std::to_string(i) + "\n";
        }
        dir.write("f" + std::to_string(file) + ".log", content);
    }

    EngineConfig cfg;
    cfg.scan.logRoot = dir.path();
    cfg.fields = {parse::parseFieldSpec("kind").value(), parse::parseFieldSpec("n:int").value()};
    cfg.query.conditions = query::parseConditions({"kind == hit"}).value();
    cfg.query.mode = AggregationMode::kCount;

    for (std::size_t workers : {1u, 2u, 8u}) {
        SCOPED_TRACE(workers);
        cfg.scan.numWorkers = workers;
        auto result = runQuery(cfg);
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(result->count, 30u);
        EXPECT_EQ(result->stats.recordsScanned, 45u);
    }
}

// =============================================================================
// Planning
// =============================================================================

TEST_F(SchedulerTest, OnlyPlainFilesAreSplit) {
    ScanOptions options;
    options.logRoot = dir_.path();
    options.splitThreshold = 64;
    auto files = enumerateFiles(options);
    ASSERT_TRUE(files.has_value());

    auto tasks = planTasks(*files, options);
    std::size_t appTasks = 0;
    for (const auto& task : tasks) {
        if (task.file().path.filename() == "app.log") {
            ++appTasks;
        } else {
            EXPECT_TRUE(task.range().isWholeStream());
        }
    }
    EXPECT_EQ(appTasks, (app_.size() + 63) / 64);
    EXPECT_EQ(tasks.back().range().end, kEndOfStream);

    options.recordDelimiter = "||";
    EXPECT_EQ(planTasks(*files, options).size(), files->size());

    options.recordDelimiter = "\n";
    options.splitThreshold = kNoSplit;
    EXPECT_EQ(planTasks(*files, options).size(), files->size());
}

// =============================================================================
// Cancellation
// =============================================================================

TEST_F(SchedulerTest, CancelBeforeRun) {
    auto cfg = config();
    auto spec = cfg.buildQuerySpec();
    ASSERT_TRUE(spec.has_value());

    Scheduler scheduler(cfg.scan);
    scheduler.cancel();
    auto result = scheduler.run(*spec);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kCancelled);
    EXPECT_TRUE(scheduler.isCancelled());

    // The request is consumed by the cancelled run
    EXPECT_TRUE(scheduler.run(*spec).has_value());
    EXPECT_FALSE(scheduler.isCancelled());
}

TEST_F(SchedulerTest, ExternalFlagCancels) {
    std::atomic<bool> flag{true};
    auto cfg = config();
    cfg.scan.cancelFlag = &flag;
    auto result = runQuery(cfg);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kCancelled);
}

TEST_F(SchedulerTest, ProgressCallbackCanCancel) {
    auto cfg = config();
    cfg.scan.numWorkers = 1;
    cfg.scan.progressIntervalMs = 0;
    int reports = 0;
    cfg.scan.progressCallback = [&reports](const ProgressInfo& info) {
        EXPECT_LE(info.tasksCompleted, info.totalTasks);
        ++reports;
        return false;
    };

    auto result = runQuery(cfg);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kCancelled);
    EXPECT_GE(reports, 1);
}

TEST_F(SchedulerTest, FinalProgressReportCanCancel) {
    auto cfg = config();
    cfg.scan.progressIntervalMs = 60'000;
    bool sawCompletion = false;
    cfg.scan.progressCallback = [&sawCompletion](const ProgressInfo& info) {
        if (info.tasksCompleted < info.totalTasks) {
            return true;
        }
        sawCompletion = true;
        return false;
    };

    Scheduler scheduler(cfg.scan);
    auto result = scheduler.run(cfg.buildQuerySpec().value());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kCancelled);
    EXPECT_TRUE(sawCompletion);
    EXPECT_TRUE(scheduler.isCancelled());
}

TEST_F(SchedulerTest, ProgressReachesCompletion) {
    auto cfg = config();
    ProgressInfo last;
    cfg.scan.progressCallback = [&last](const ProgressInfo& info) {
        last = info;
        return true;
    };
    mustRun(cfg);
    EXPECT_EQ(last.filesCompleted, 5u);
    EXPECT_EQ(last.tasksCompleted, last.totalTasks);
    EXPECT_DOUBLE_EQ(last.ratio(), 1.0);
}

// =============================================================================
// Configuration
// =============================================================================

TEST_F(SchedulerTest, ConfigValidation) {
    auto cfg = config();
    EXPECT_TRUE(cfg.validate().has_value());

    auto sameDelimiters = cfg;
    sameDelimiters.fieldDelimiter = "\n";
    EXPECT_EQ(sameDelimiters.validate().error().code(), ErrorCode::kConfigError);

    auto noFields = cfg;
    noFields.fields.clear();
    EXPECT_FALSE(noFields.validate().has_value());

    auto unknownField = config({"missing == 1"});
    EXPECT_EQ(unknownField.validate().error().code(), ErrorCode::kConfigError);
    EXPECT_EQ(runQuery(unknownField).error().code(), ErrorCode::kConfigError);

    auto tinyChunk = cfg;
    tinyChunk.scan.chunkSize = 1;
    EXPECT_FALSE(tinyChunk.validate().has_value());
}

}  // namespace
}  // namespace logq::engine
