// =============================================================================
// logq - Aggregator
// =============================================================================
// Collects per-task partial results and reduces them into the FinalResult.
//
// Workers hand their partials over through contribute() / reportFailure(),
// which store into per-task slots under a mutex. No lock is held while a task
// processes records. finalize() runs once, on a single consumer, after every
// task has finished; it reduces slots in task order, so the result is the
// same whatever order tasks completed in.
// =============================================================================

#ifndef LOGQ_ENGINE_AGGREGATOR_H
#define LOGQ_ENGINE_AGGREGATOR_H

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "logq/common/types.h"
#include "logq/engine/partial_result.h"
#include "logq/query/query_spec.h"

namespace logq::engine {

// =============================================================================
// FinalResult
// =============================================================================

/// @brief Result of a completed run.
struct FinalResult {
    AggregationMode mode = AggregationMode::kEnumerate;

    /// @brief Enumerate mode: matches in output order.
    std::vector<Match> matches;

    /// @brief Count mode: number of matching records.
    std::uint64_t count = 0;

    /// @brief Group mode: groups ordered by key.
    std::vector<std::pair<std::string, GroupAccumulator>> groups;

    /// @brief Skipped files, ordered by file index.
    std::vector<FileError> errors;

    ScanStats stats;

    /// @brief Enumerated files, indexed by FileIndex.
    std::vector<std::filesystem::path> files;

    /// @brief Path of the file a match came from.
    [[nodiscard]] const std::filesystem::path& sourceOf(const Match& match) const {
        return files.at(match.fileIndex);
    }
};

// =============================================================================
// Aggregator
// =============================================================================

/// @brief Thread-safe collector and single-consumer reducer.
class Aggregator {
public:
    /// @brief Construct for a run of taskCount tasks.
    Aggregator(std::shared_ptr<const query::QuerySpec> spec, std::size_t taskCount);

    Aggregator(const Aggregator&) = delete;
    Aggregator& operator=(const Aggregator&) = delete;

    /// @brief Store the partial of a completed task. Thread-safe.
    void contribute(TaskId task, FileIndex file, PartialResult&& partial);

    /// @brief Record a failed task. Thread-safe.
    /// @note Every partial of the same file is discarded at finalize().
    void reportFailure(TaskId task, FileError error);

    /// @brief Number of tasks that contributed or failed so far. Thread-safe.
    [[nodiscard]] std::size_t settledTasks() const;

    /// @brief Reduce all slots into the final result.
    /// @param files Enumerated file table, indexed by FileIndex.
    [[nodiscard]] FinalResult finalize(std::vector<std::filesystem::path> files);

private:
    struct Slot {
        FileIndex file = 0;
        std::optional<PartialResult> partial;
    };

    std::shared_ptr<const query::QuerySpec> spec_;

    mutable std::mutex mutex_;
    std::vector<Slot> slots_;
    std::vector<FileError> errors_;
    std::size_t settled_ = 0;
};

/// @brief Apply the query's output ordering and limit to merged matches.
void orderMatches(std::vector<Match>& matches, const query::QuerySpec& spec);

}  // namespace logq::engine

#endif  // LOGQ_ENGINE_AGGREGATOR_H
