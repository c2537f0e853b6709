// =============================================================================
// logq - File Task
// =============================================================================
// One unit of scheduled work: a whole file, or a byte range of a large plain
// file, run through ByteSource -> RecordSplitter -> FieldExtractor ->
// Predicate -> PartialResult.
//
// State machine:
//   kPending -> kRunning -> kCompleted
//                        -> kFailedSkipped  (error recorded, partial dropped)
//                        -> kAbandoned      (cancelled mid-run)
//   kPending -> kAbandoned                  (cancelled before start)
// =============================================================================

#ifndef LOGQ_ENGINE_FILE_TASK_H
#define LOGQ_ENGINE_FILE_TASK_H

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "logq/common/types.h"
#include "logq/engine/partial_result.h"
#include "logq/io/byte_source.h"
#include "logq/io/record_splitter.h"
#include "logq/query/query_spec.h"

namespace logq::engine {

/// @brief FileTask lifecycle state.
enum class TaskState : std::uint8_t {
    kPending = 0,
    kRunning = 1,
    kCompleted = 2,
    kFailedSkipped = 3,
    kAbandoned = 4
};

[[nodiscard]] std::string_view taskStateToString(TaskState state) noexcept;

/// @brief Opens the byte source of a task at a decoded offset.
using SourceOpener = std::function<std::unique_ptr<io::ByteSource>(
    const FileHandle& file, ByteOffset offset, std::size_t bufferSize)>;

/// @brief Reading parameters shared by every task of a run.
struct TaskOptions {
    std::string recordDelimiter = std::string(kDefaultRecordDelimiter);
    std::size_t chunkSize = kDefaultChunkSize;
    std::size_t inputBufferSize = kDefaultInputBufferSize;
    bool trimCarriageReturn = true;

    /// @brief Cancellation poll, checked between chunks.
    io::CancelCheck shouldStop;

    /// @brief Source factory; io::openByteSource when empty.
    SourceOpener openSource;
};

/// @brief Scan of one file or file range.
class FileTask {
public:
    FileTask(TaskId id, FileHandle file, ByteRange range = {});

    /// @brief Run the task to a terminal state.
    /// @note Per-file failures are recorded in error(), never thrown.
    TaskState run(const query::QuerySpec& spec, const TaskOptions& options);

    /// @brief Mark a pending task abandoned without running it.
    void abandon() noexcept;

    [[nodiscard]] TaskId id() const noexcept { return id_; }
    [[nodiscard]] const FileHandle& file() const noexcept { return file_; }
    [[nodiscard]] const ByteRange& range() const noexcept { return range_; }
    [[nodiscard]] TaskState state() const noexcept { return state_; }

    /// @brief Error of a kFailedSkipped task.
    [[nodiscard]] const std::optional<FileError>& error() const noexcept { return error_; }

    /// @brief Move the partial of a kCompleted task out.
    [[nodiscard]] PartialResult takeResult() { return std::move(result_); }

    /// @brief Decoded bytes processed by the last run.
    [[nodiscard]] std::uint64_t bytesDecoded() const noexcept { return bytesDecoded_; }

private:
    /// @brief Scan records and fill result_. Throws on I/O or decode failure.
    void scan(const query::QuerySpec& spec, const TaskOptions& options);

    void fail(ErrorCode kind, std::string message);

    TaskId id_;
    FileHandle file_;
    ByteRange range_;
    TaskState state_ = TaskState::kPending;
    std::optional<FileError> error_;
    PartialResult result_;
    std::uint64_t bytesDecoded_ = 0;
};

}  // namespace logq::engine

#endif  // LOGQ_ENGINE_FILE_TASK_H
