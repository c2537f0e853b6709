// =============================================================================
// logq - File Task Tests
// =============================================================================
// A source that fails partway through a file: the task ends skipped, and the
// matches it saw before the failure never reach the final result.
// =============================================================================

#include "logq/engine/file_task.h"

#include <gtest/gtest.h>

#include <istream>
#include <memory>
#include <sstream>
#include <streambuf>
#include <string>
#include <vector>

#include "logq/engine/aggregator.h"
#include "logq/engine/engine_config.h"
#include "logq/io/record_splitter.h"
#include "logq/query/condition_parser.h"

namespace logq::engine {
namespace {

/// Serves a fixed prefix, then fails the device on the next refill.
class FailingBuffer : public std::streambuf {
public:
    explicit FailingBuffer(std::string data) : data_(std::move(data)) {
        setg(data_.data(), data_.data(), data_.data() + data_.size());
    }

protected:
    int_type underflow() override { throw std::ios_base::failure("device error"); }

private:
    std::string data_;
};

class FailingStream : public std::istream {
public:
    explicit FailingStream(std::string data) : std::istream(nullptr), buffer_(std::move(data)) {
        rdbuf(&buffer_);
    }

private:
    FailingBuffer buffer_;
};

std::string errorRecords(int count) {
    std::string data;
    for (int i = 0; i < count; ++i) {
        data += "ERROR|500|" + std::to_string(i) + "\n";
    }
    return data;
}

FileHandle handle(FileIndex index, std::string path) {
    FileHandle file;
    file.path = std::move(path);
    file.index = index;
    return file;
}

class FileTaskTest : public ::testing::Test {
protected:
    void SetUp() override {
        EngineConfig cfg;
        cfg.scan.logRoot = "/logs";
        cfg.fields.resize(3);
        cfg.fields[0].name = "level";
        cfg.fields[1].name = "status";
        cfg.fields[1].type = parse::FieldType::kInteger;
        cfg.fields[2].name = "seq";
        cfg.fields[2].type = parse::FieldType::kInteger;
        auto conditions = query::parseConditions({"level == ERROR"});
        ASSERT_TRUE(conditions.has_value());
        cfg.query.conditions = *conditions;
        auto spec = cfg.buildQuerySpec();
        ASSERT_TRUE(spec.has_value()) << spec.error().message();
        spec_ = *spec;

        options_.chunkSize = kMinChunkSize;
    }

    /// Options whose sources fail once `data` is used up.
    TaskOptions failingAfter(std::string data) const {
        TaskOptions options = options_;
        options.openSource = [data](const FileHandle& file, ByteOffset offset, std::size_t) {
            return std::make_unique<io::PlainByteSource>(
                std::make_unique<FailingStream>(data.substr(offset)), file.path.string());
        };
        return options;
    }

    TaskOptions healthy(std::string data) const {
        TaskOptions options = options_;
        options.openSource = [data](const FileHandle& file, ByteOffset offset, std::size_t) {
            return std::make_unique<io::PlainByteSource>(
                std::make_unique<std::istringstream>(data.substr(offset)), file.path.string());
        };
        return options;
    }

    std::shared_ptr<const query::QuerySpec> spec_;
    TaskOptions options_;
};

TEST_F(FileTaskTest, SourceDeliversRecordsBeforeFailing) {
    const std::string data = errorRecords(20);
    io::PlainByteSource source(std::make_unique<FailingStream>(data), "bad.log");
    io::SplitterOptions splitterOptions;
    splitterOptions.chunkSize = kMinChunkSize;
    io::RecordSplitter splitter(source, std::move(splitterOptions));

    std::size_t records = 0;
    EXPECT_THROW(
        {
            while (splitter.next()) {
                ++records;
            }
        },
        ReadError);
    EXPECT_GT(records, 0u);
}

TEST_F(FileTaskTest, ReadErrorPartwayFailsTheTask) {
    FileTask task(0, handle(0, "/logs/bad.log"));
    EXPECT_EQ(task.run(*spec_, failingAfter(errorRecords(20))), TaskState::kFailedSkipped);
    ASSERT_TRUE(task.error().has_value());
    EXPECT_EQ(task.error()->kind, ErrorCode::kReadError);
    EXPECT_EQ(task.error()->fileIndex, 0u);
    EXPECT_EQ(taskStateToString(task.state()), "failed");
    EXPECT_TRUE(task.takeResult().matches().empty());
}

TEST_F(FileTaskTest, FailedFileContributesNothingToFinalResult) {
    const std::string good = errorRecords(3);
    const std::string bad = errorRecords(20);

    FileTask failing(0, handle(0, "/logs/a.log"));
    FileTask passing(1, handle(1, "/logs/b.log"));
    ASSERT_EQ(failing.run(*spec_, failingAfter(bad)), TaskState::kFailedSkipped);
    ASSERT_EQ(passing.run(*spec_, healthy(good)), TaskState::kCompleted);

    Aggregator aggregator(spec_, 2);
    aggregator.reportFailure(failing.id(), *failing.error());
    aggregator.contribute(passing.id(), passing.file().index, passing.takeResult());
    FinalResult result = aggregator.finalize({"/logs/a.log", "/logs/b.log"});

    ASSERT_EQ(result.matches.size(), 3u);
    for (const Match& match : result.matches) {
        EXPECT_EQ(match.fileIndex, 1u);
    }
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].fileIndex, 0u);
    EXPECT_EQ(result.errors[0].kind, ErrorCode::kReadError);
}

TEST_F(FileTaskTest, FailedRangeDiscardsCompletedRangesOfSameFile) {
    const std::string data = errorRecords(20);
    const ByteOffset split = data.size() / 2;

    FileTask head(0, handle(0, "/logs/big.log"), ByteRange{0, split});
    FileTask tail(1, handle(0, "/logs/big.log"), ByteRange{split, kEndOfStream});
    ASSERT_EQ(head.run(*spec_, healthy(data)), TaskState::kCompleted);
    ASSERT_EQ(tail.run(*spec_, failingAfter(data)), TaskState::kFailedSkipped);

    Aggregator aggregator(spec_, 2);
    aggregator.contribute(head.id(), head.file().index, head.takeResult());
    aggregator.reportFailure(tail.id(), *tail.error());
    FinalResult result = aggregator.finalize({"/logs/big.log"});

    EXPECT_TRUE(result.matches.empty());
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].path, "/logs/big.log");
}

}  // namespace
}  // namespace logq::engine
