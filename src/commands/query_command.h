// =============================================================================
// logq - Query Command
// =============================================================================
// Command handler for the query run.
//
// This module provides:
// - QueryOptions: Raw command-line options, as typed by the user
// - buildEngineConfig(): Parse and unescape options into an EngineConfig
// - QueryCommand: Run the query and write the result
// - writeTextResult() / writeJsonResult(): Result formatters
// =============================================================================

#ifndef LOGQ_COMMANDS_QUERY_COMMAND_H
#define LOGQ_COMMANDS_QUERY_COMMAND_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "logq/common/error.h"
#include "logq/engine/aggregator.h"
#include "logq/engine/engine_config.h"

namespace logq::commands {

// =============================================================================
// Query Options
// =============================================================================

/// @brief Output format of the result.
enum class OutputFormat : std::uint8_t {
    kText = 0,
    kJson = 1
};

/// @brief Parse "text" / "json".
[[nodiscard]] Result<OutputFormat> parseOutputFormat(std::string_view str);

/// @brief Command-line options of a query run.
struct QueryOptions {
    std::filesystem::path logDir;
    bool recursive = true;
    bool includeHidden = false;
    std::vector<std::string> extensions;
    std::vector<std::string> nameContains;

    /// @brief Worker threads (0 = auto).
    std::size_t threads = 0;

    std::size_t chunkSize = kDefaultChunkSize;

    /// @brief Byte-range split threshold (0 = never split).
    std::uint64_t splitThreshold = kDefaultSplitThreshold;

    /// @brief Delimiters, still escaped ("\n", "\t", "\|").
    std::string recordDelimiter = "\\n";
    std::string fieldDelimiter = "|";

    bool keepCarriageReturn = false;
    bool allowEmptyRecords = false;

    /// @brief Field declarations, "name:type[:required][:remainder]".
    std::vector<std::string> fields;

    /// @brief Conditions, "<field> <op> <value>".
    std::vector<std::string> where;

    std::string mode = "enumerate";
    std::vector<std::string> select;
    std::string groupBy;
    std::string metric;
    std::string sortBy;
    bool descending = false;

    /// @brief Row limit (0 = unlimited).
    std::uint64_t limit = 0;

    std::string format = "text";

    /// @brief Output file (empty or "-" = stdout).
    std::string outputPath;

    bool showProgress = false;
    std::uint32_t progressIntervalMs = engine::kDefaultProgressIntervalMs;

    /// @brief Cancellation flag set by the signal handler (optional).
    const std::atomic<bool>* cancelFlag = nullptr;
};

/// @brief Translate command-line options into an engine configuration.
/// @return kConfigError for malformed field declarations, conditions,
///         delimiters or mode names.
[[nodiscard]] Result<engine::EngineConfig> buildEngineConfig(const QueryOptions& options);

// =============================================================================
// Result Writers
// =============================================================================

/// @brief Write a result as text.
///
/// - enumerate: raw records, or the selected fields joined by the field
///   delimiter when projectFields is set
/// - count: the count
/// - group: key<TAB>count[<TAB>sum<TAB>min<TAB>max]
void writeTextResult(std::ostream& out, const engine::FinalResult& result,
                     const query::QuerySpec& spec, bool projectFields);

/// @brief Write a result as a JSON document.
void writeJsonResult(std::ostream& out, const engine::FinalResult& result,
                     const query::QuerySpec& spec);

/// @brief Escape a string for inclusion in a JSON string literal.
[[nodiscard]] std::string jsonEscape(std::string_view text);

// =============================================================================
// QueryCommand Class
// =============================================================================

/// @brief Command handler for a query run.
class QueryCommand {
public:
    explicit QueryCommand(QueryOptions options);
    ~QueryCommand();

    QueryCommand(const QueryCommand&) = delete;
    QueryCommand& operator=(const QueryCommand&) = delete;
    QueryCommand(QueryCommand&&) noexcept;
    QueryCommand& operator=(QueryCommand&&) noexcept;

    /// @brief Run the query and write its result.
    /// @return Exit code (0 = success, per-file errors included).
    [[nodiscard]] int execute();

    [[nodiscard]] const QueryOptions& options() const noexcept { return options_; }

private:
    /// @brief Write the result to the configured destination.
    void writeResult(const engine::FinalResult& result, const query::QuerySpec& spec,
                     OutputFormat format);

    QueryOptions options_;
};

}  // namespace logq::commands

#endif  // LOGQ_COMMANDS_QUERY_COMMAND_H
