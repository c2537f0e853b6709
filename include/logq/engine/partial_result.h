// =============================================================================
// logq - Partial Results
// =============================================================================
// Per-task accumulation of matches, counts and group statistics, and the
// associative, commutative merge that combines them.
//
// Matches are kept ordered by (file index, record offset), so merging two
// partials is an ordered merge and the outcome does not depend on which task
// finished first.
// =============================================================================

#ifndef LOGQ_ENGINE_PARTIAL_RESULT_H
#define LOGQ_ENGINE_PARTIAL_RESULT_H

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "logq/common/error.h"
#include "logq/common/hash.h"
#include "logq/common/types.h"
#include "logq/parse/field_value.h"
#include "logq/query/query_spec.h"

namespace logq::engine {

using query::AggregationMode;

// =============================================================================
// Match
// =============================================================================

/// @brief One matching record, detached from the file buffers.
struct Match {
    FileIndex fileIndex = 0;
    ByteOffset offset = 0;

    /// @brief Record bytes as read (delimiter excluded).
    std::string raw;

    /// @brief Projected fields, in QuerySpec::outputFields() order.
    std::vector<parse::OwnedValue> fields;

    /// @brief Sort key value when the query sorts.
    parse::OwnedValue sortKey;

    friend bool operator==(const Match&, const Match&) = default;
};

/// @brief Discovery order: file index, then offset within the file.
[[nodiscard]] inline bool discoveryLess(const Match& a, const Match& b) noexcept {
    if (a.fileIndex != b.fileIndex) {
        return a.fileIndex < b.fileIndex;
    }
    return a.offset < b.offset;
}

// =============================================================================
// Group Accumulator
// =============================================================================

/// @brief Running statistics for one group.
/// @note Metric sums of integer fields are exact (and so order-independent)
///       while they stay below 2^53.
struct GroupAccumulator {
    std::uint64_t count = 0;
    std::uint64_t metricCount = 0;
    double sum = 0.0;
    double min = std::numeric_limits<double>::infinity();
    double max = -std::numeric_limits<double>::infinity();

    /// @brief Add one record; metric is absent when the field was absent.
    void add(std::optional<double> metric) noexcept;

    /// @brief Fold another accumulator in.
    void merge(const GroupAccumulator& other) noexcept;

    [[nodiscard]] bool hasMetric() const noexcept { return metricCount > 0; }

    friend bool operator==(const GroupAccumulator&, const GroupAccumulator&) = default;
};

using GroupMap = StringMap<GroupAccumulator>;

/// @brief Group key used when the grouping field is absent.
inline constexpr std::string_view kAbsentGroupKey = "(absent)";

// =============================================================================
// Statistics and Errors
// =============================================================================

/// @brief Counters describing a scan.
struct ScanStats {
    std::uint64_t filesScanned = 0;
    std::uint64_t filesFailed = 0;
    std::uint64_t recordsScanned = 0;
    std::uint64_t recordsMatched = 0;
    std::uint64_t schemaMismatches = 0;
    std::uint64_t coercionFailures = 0;
    std::uint64_t bytesDecoded = 0;
    std::uint64_t elapsedMs = 0;

    /// @brief Add counters (elapsed time is not summed).
    void merge(const ScanStats& other) noexcept;

    friend bool operator==(const ScanStats&, const ScanStats&) = default;
};

/// @brief A file skipped because of an error.
struct FileError {
    FileIndex fileIndex = 0;
    std::string path;
    ErrorCode kind = ErrorCode::kReadError;
    std::string message;

    friend bool operator==(const FileError&, const FileError&) = default;
};

// =============================================================================
// PartialResult
// =============================================================================

/// @brief Output of one FileTask in the shape of the query's mode.
class PartialResult {
public:
    PartialResult() = default;
    explicit PartialResult(AggregationMode mode) : mode_(mode) {}

    [[nodiscard]] AggregationMode mode() const noexcept { return mode_; }

    /// @brief Append a match. Matches must arrive in discovery order.
    void addMatch(Match match);

    /// @brief Count matching records.
    void addCount(std::uint64_t n = 1) noexcept { count_ += n; }

    /// @brief Fold a record into its group.
    void addToGroup(std::string_view key, std::optional<double> metric);

    /// @brief Merge another partial of the same mode into this one.
    /// @note Associative and commutative.
    void merge(PartialResult&& other);

    [[nodiscard]] const std::vector<Match>& matches() const noexcept { return matches_; }
    [[nodiscard]] std::vector<Match>& matches() noexcept { return matches_; }
    [[nodiscard]] std::uint64_t count() const noexcept { return count_; }
    [[nodiscard]] const GroupMap& groups() const noexcept { return groups_; }
    [[nodiscard]] const ScanStats& stats() const noexcept { return stats_; }
    [[nodiscard]] ScanStats& stats() noexcept { return stats_; }

private:
    AggregationMode mode_ = AggregationMode::kEnumerate;
    std::vector<Match> matches_;
    std::uint64_t count_ = 0;
    GroupMap groups_;
    ScanStats stats_;
};

}  // namespace logq::engine

#endif  // LOGQ_ENGINE_PARTIAL_RESULT_H
