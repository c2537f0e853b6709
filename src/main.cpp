// =============================================================================
// logq - Parallel Log Query Engine
// =============================================================================
// Main entry point for the logq command-line tool.
//
// This file implements the CLI using CLI11, providing:
// - Scan options: log directory, file filters, threads, chunking
// - Schema options: delimiters and field declarations
// - Query options: conditions, aggregation mode, output shape
// - Config file support (--config, TOML/INI with the same keys)
// - SIGINT/SIGTERM handling that cancels the run cleanly
// =============================================================================

#include <CLI/CLI.hpp>
#include <fmt/format.h>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

#include "logq/common/error.h"
#include "logq/common/logger.h"
#include "logq/common/types.h"
#include "logq/io/byte_source.h"

#include "commands/query_command.h"

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "logq: parallel query engine for delimited log files\n"
    "Scans a directory of plain or compressed (gzip, bzip2, xz, zstd) log files,\n"
    "filters records with typed conditions and enumerates, counts or groups them.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int verbosity = 0;  // 0 = normal, 1 = debug, 2 = trace
    bool quiet = false;
    std::string logLevel;  // overrides -v / -q when set
    std::string logFile;
};

GlobalOptions gOptions;
logq::commands::QueryOptions gQueryOpts;

// =============================================================================
// Signal Handling
// =============================================================================

std::atomic<bool> gInterrupted{false};

extern "C" void handleSignal(int /*signal*/) {
    gInterrupted.store(true);
}

void installSignalHandlers() {
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);
}

// =============================================================================
// Help Text
// =============================================================================

std::string compressionFooter() {
    std::string footer = "Compressed inputs are detected by magic bytes. Supported:";
    for (auto format : logq::io::supportedCompressionFormats()) {
        if (format == logq::CompressionFormat::kNone) {
            continue;
        }
        footer += fmt::format(" {} ({})", logq::io::compressionFormatName(format),
                              logq::io::compressionFormatExtension(format));
    }
    return footer;
}

logq::log::Level resolveLogLevel() {
    if (!gOptions.logLevel.empty()) {
        return logq::log::levelFromString(gOptions.logLevel);
    }
    if (gOptions.quiet) {
        return logq::log::Level::kError;
    }
    if (gOptions.verbosity >= 2) {
        return logq::log::Level::kTrace;
    }
    if (gOptions.verbosity >= 1) {
        return logq::log::Level::kDebug;
    }
    return logq::log::Level::kInfo;
}

// =============================================================================
// Option Setup
// =============================================================================

void setupScanOptions(CLI::App& app) {
    app.add_option("-d,--log-dir", gQueryOpts.logDir, "Directory containing the log files")
        ->required()
        ->group("Scan");

    app.add_flag("--recursive,!--no-recursive", gQueryOpts.recursive,
                 "Descend into subdirectories")
        ->default_val(true)
        ->group("Scan");

    app.add_flag("--hidden", gQueryOpts.includeHidden, "Include dot-files and dot-directories")
        ->group("Scan");

    app.add_option("--ext", gQueryOpts.extensions,
                   "Only scan files with these suffixes (e.g. .log,.gz)")
        ->delimiter(',')
        ->group("Scan");

    app.add_option("--name-contains", gQueryOpts.nameContains,
                   "Only scan files whose name contains any of these strings")
        ->delimiter(',')
        ->group("Scan");

    app.add_option("-t,--threads", gQueryOpts.threads, "Number of worker threads (0 = auto-detect)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber)
        ->group("Scan");

    app.add_option("--chunk-size", gQueryOpts.chunkSize, "Decoded bytes per read")
        ->default_val(logq::kDefaultChunkSize)
        ->check(CLI::Range(static_cast<std::size_t>(logq::kMinChunkSize),
                           static_cast<std::size_t>(1) << 30))
        ->group("Scan");

    app.add_option("--split-threshold", gQueryOpts.splitThreshold,
                   "Split plain files larger than this many bytes (0 = never)")
        ->default_val(logq::kDefaultSplitThreshold)
        ->group("Scan");
}

void setupSchemaOptions(CLI::App& app) {
    app.add_option("--record-delimiter", gQueryOpts.recordDelimiter,
                   "Record delimiter (escapes: \\n \\t \\r \\\\ \\| \\xHH)")
        ->default_val("\\n")
        ->group("Schema");

    app.add_option("--field-delimiter", gQueryOpts.fieldDelimiter, "Field delimiter")
        ->default_val("|")
        ->group("Schema");

    app.add_option("--field", gQueryOpts.fields,
                   "Field declaration name:type[:required][:remainder], in record order")
        ->required()
        ->group("Schema");

    app.add_flag("--allow-empty-records", gQueryOpts.allowEmptyRecords,
                 "Process empty records instead of skipping them")
        ->group("Schema");

    app.add_flag("--keep-cr", gQueryOpts.keepCarriageReturn,
                 "Keep a trailing carriage return on each record")
        ->group("Schema");
}

void setupQueryOptions(CLI::App& app) {
    app.add_option("-w,--where", gQueryOpts.where,
                   "Condition '<field> <op> <value>' (repeatable, all must hold)")
        ->group("Query");

    app.add_option("-m,--mode", gQueryOpts.mode, "Aggregation mode: enumerate, count, group")
        ->default_val("enumerate")
        ->check(CLI::IsMember({"enumerate", "count", "group"}))
        ->group("Query");

    app.add_option("--select", gQueryOpts.select, "Fields to output (enumerate mode)")
        ->delimiter(',')
        ->group("Query");

    app.add_option("--group-by", gQueryOpts.groupBy, "Grouping field (group mode)")
        ->group("Query");

    app.add_option("--metric", gQueryOpts.metric, "Numeric field summed per group (group mode)")
        ->group("Query");

    app.add_option("--sort-by", gQueryOpts.sortBy, "Sort matches by this field (enumerate mode)")
        ->group("Query");

    app.add_flag("--descending", gQueryOpts.descending, "Sort in descending order")
        ->group("Query");

    app.add_option("--limit", gQueryOpts.limit, "Maximum number of matches (0 = unlimited)")
        ->default_val(0)
        ->group("Query");
}

void setupOutputOptions(CLI::App& app) {
    app.add_option("--format", gQueryOpts.format, "Output format: text, json")
        ->default_val("text")
        ->check(CLI::IsMember({"text", "json"}))
        ->group("Output");

    app.add_option("-o,--output", gQueryOpts.outputPath, "Output file (default: stdout)")
        ->group("Output");

    app.add_flag("--progress", gQueryOpts.showProgress, "Log progress periodically")
        ->group("Output");

    app.add_option("--progress-interval", gQueryOpts.progressIntervalMs,
                   "Milliseconds between progress reports")
        ->default_val(logq::engine::kDefaultProgressIntervalMs)
        ->group("Output");
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);
    app.set_config("--config", "", "Read options from a TOML/INI file");

    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v debug, -vv trace)");
    app.add_flag("-q,--quiet", gOptions.quiet, "Only log errors");
    app.add_option("--log-level", gOptions.logLevel,
                   "Log level: trace, debug, info, warning, error, critical")
        ->check(CLI::IsMember({"trace", "debug", "info", "warning", "warn", "error", "critical"},
                              CLI::ignore_case));
    app.add_option("--log-file", gOptions.logFile, "Also write the log to this file");
    app.footer(compressionFooter());

    setupScanOptions(app);
    setupSchemaOptions(app);
    setupQueryOptions(app);
    setupOutputOptions(app);

    CLI11_PARSE(app, argc, argv);

    // Initialize logger
    try {
        logq::log::Config logConfig;
        logConfig.logFile = gOptions.logFile;
        logConfig.level = resolveLogLevel();
        logq::log::init(logConfig);
        LOGQ_LOG_DEBUG("Logging at level {}", logq::log::levelToString(logConfig.level));
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return logq::toExitCode(logq::ErrorCode::kConfigError);
    }

    installSignalHandlers();
    gQueryOpts.cancelFlag = &gInterrupted;

    int exitCode = EXIT_SUCCESS;
    try {
        logq::commands::QueryCommand command(std::move(gQueryOpts));
        exitCode = command.execute();
    } catch (const logq::LogqException& ex) {
        LOGQ_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        LOGQ_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = logq::toExitCode(logq::ErrorCode::kIOError);
    }

    logq::log::shutdown();
    return exitCode;
}
