// =============================================================================
// logq - Scheduler
// =============================================================================
// Enumerates the log root, plans FileTasks and runs them on a fixed-size
// worker pool (TBB task arena), feeding results to the Aggregator.
//
// This module provides:
// - ScanOptions: Enumeration, pool and reading configuration
// - enumerateFiles(): Sorted snapshot of the files under the log root
// - planTasks(): One task per file, byte ranges for large plain files
// - Scheduler: Runs a query over the planned tasks
//
// Cancellation: cancel(), a caller-supplied flag, or a progress callback
// returning false stop the run. Tasks poll between chunks; in-flight tasks
// are abandoned and the run returns kCancelled instead of a result.
// =============================================================================

#ifndef LOGQ_ENGINE_SCHEDULER_H
#define LOGQ_ENGINE_SCHEDULER_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "logq/common/error.h"
#include "logq/common/types.h"
#include "logq/engine/aggregator.h"
#include "logq/engine/file_task.h"
#include "logq/query/query_spec.h"

namespace logq::engine {

// =============================================================================
// Constants
// =============================================================================

/// @brief Default minimum interval between progress reports.
inline constexpr std::uint32_t kDefaultProgressIntervalMs = 500;

/// @brief Upper bound on the default worker count.
inline constexpr std::size_t kMaxDefaultWorkers = 64;

// =============================================================================
// Progress Reporting
// =============================================================================

/// @brief Progress snapshot passed to the progress callback.
struct ProgressInfo {
    /// @brief Files whose every task has settled
    std::uint64_t filesCompleted = 0;

    /// @brief Files in the run
    std::uint64_t totalFiles = 0;

    /// @brief Tasks settled so far
    std::uint64_t tasksCompleted = 0;

    /// @brief Tasks in the run
    std::uint64_t totalTasks = 0;

    /// @brief Decoded bytes processed
    std::uint64_t bytesProcessed = 0;

    /// @brief Elapsed time (milliseconds)
    std::uint64_t elapsedMs = 0;

    /// @brief Get progress ratio (0.0-1.0)
    [[nodiscard]] double ratio() const noexcept {
        if (totalTasks > 0) {
            return static_cast<double>(tasksCompleted) / static_cast<double>(totalTasks);
        }
        return 0.0;
    }

    /// @brief Files completed per second
    [[nodiscard]] double filesPerSecond() const noexcept {
        if (elapsedMs == 0) {
            return 0.0;
        }
        return static_cast<double>(filesCompleted) * 1000.0 / static_cast<double>(elapsedMs);
    }
};

/// @brief Progress callback.
/// @return true to continue, false to cancel
using ProgressCallback = std::function<bool(const ProgressInfo& info)>;

// =============================================================================
// Scan Options
// =============================================================================

/// @brief Configuration of enumeration, the worker pool and reading.
struct ScanOptions {
    /// @brief Directory to scan
    std::filesystem::path logRoot;

    /// @brief Descend into subdirectories
    bool recursive = true;

    /// @brief Include dot-files and dot-directories
    bool includeHidden = false;

    /// @brief Allowed file-name suffixes (e.g. ".gz", ".log.gz"); empty = all
    std::vector<std::string> extensions;

    /// @brief Keep files whose name contains any of these; empty = all
    std::vector<std::string> nameContains;

    /// @brief Worker count (0 = hardware concurrency)
    std::size_t numWorkers = 0;

    /// @brief Decoded bytes per splitter read
    std::size_t chunkSize = kDefaultChunkSize;

    /// @brief Raw input buffer per decoder
    std::size_t inputBufferSize = kDefaultInputBufferSize;

    /// @brief Plain files above this size become byte-range tasks (kNoSplit = never)
    std::uint64_t splitThreshold = kDefaultSplitThreshold;

    /// @brief Record delimiter
    std::string recordDelimiter = std::string(kDefaultRecordDelimiter);

    /// @brief Strip '\r' before '\n'
    bool trimCarriageReturn = true;

    /// @brief Progress callback (optional)
    ProgressCallback progressCallback;

    /// @brief Minimum interval between progress reports
    std::uint32_t progressIntervalMs = kDefaultProgressIntervalMs;

    /// @brief External cancellation flag, e.g. set by a signal handler (optional)
    const std::atomic<bool>* cancelFlag = nullptr;

    /// @brief Validate options
    [[nodiscard]] VoidResult validate() const;

    /// @brief Get effective worker count
    [[nodiscard]] std::size_t effectiveWorkers() const noexcept;
};

/// @brief Get recommended worker count for the current system.
[[nodiscard]] std::size_t recommendedWorkerCount() noexcept;

// =============================================================================
// Enumeration and Planning
// =============================================================================

/// @brief List the files under the log root.
/// @return Files sorted by path with their discovery index set, or
///         EnumerationError if the root is missing, not a directory or
///         cannot be listed.
[[nodiscard]] Result<std::vector<FileHandle>> enumerateFiles(const ScanOptions& options);

/// @brief Turn enumerated files into tasks.
/// @note Only files whose content is uncompressed are split, and only when
///       the record delimiter cannot overlap itself.
[[nodiscard]] std::vector<FileTask> planTasks(const std::vector<FileHandle>& files,
                                              const ScanOptions& options);

// =============================================================================
// Scheduler
// =============================================================================

class SchedulerImpl;

/// @brief Runs queries over a log root.
///
/// Thread Safety:
/// - run() must not be called concurrently on one instance
/// - cancel() may be called from any thread
class Scheduler {
public:
    explicit Scheduler(ScanOptions options);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;
    Scheduler(Scheduler&&) noexcept;
    Scheduler& operator=(Scheduler&&) noexcept;

    /// @brief Enumerate, scan and aggregate.
    /// @return FinalResult, or kConfigError / kEnumerationError / kCancelled.
    [[nodiscard]] Result<FinalResult> run(std::shared_ptr<const query::QuerySpec> spec);

    /// @brief Request cancellation of a running or upcoming run.
    void cancel() noexcept;

    /// @brief Check if the last run was cancelled.
    [[nodiscard]] bool isCancelled() const noexcept;

    /// @brief Check if a run is in progress.
    [[nodiscard]] bool isRunning() const noexcept;

    [[nodiscard]] const ScanOptions& options() const noexcept;

private:
    std::unique_ptr<SchedulerImpl> impl_;
};

}  // namespace logq::engine

#endif  // LOGQ_ENGINE_SCHEDULER_H
