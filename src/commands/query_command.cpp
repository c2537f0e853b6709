// =============================================================================
// logq - Query Command Implementation
// =============================================================================

#include "query_command.h"

#include <fstream>
#include <iostream>
#include <ostream>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "logq/common/logger.h"
#include "logq/parse/schema.h"
#include "logq/query/condition_parser.h"

namespace logq::commands {

namespace {

/// @brief Render a field value as a JSON value.
std::string jsonValue(const parse::OwnedValue& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        return "null";
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        return fmt::format("\"{}\"", jsonEscape(*text));
    }
    if (const auto* ts = std::get_if<parse::Timestamp>(&value)) {
        return fmt::format("\"{}\"", parse::formatTimestamp(*ts));
    }
    return parse::formatValue(value);
}

void writeGroupStats(std::ostream& out, const engine::GroupAccumulator& acc) {
    if (acc.hasMetric()) {
        fmt::print(out, "\t{}\t{}\t{}", acc.sum, acc.min, acc.max);
    } else {
        out << "\t0\t-\t-";
    }
}

}  // namespace

// =============================================================================
// Option Parsing
// =============================================================================

Result<OutputFormat> parseOutputFormat(std::string_view str) {
    if (str == "text") {
        return OutputFormat::kText;
    }
    if (str == "json") {
        return OutputFormat::kJson;
    }
    return makeError<OutputFormat>(ErrorCode::kConfigError,
                                   fmt::format("unknown output format '{}'", str));
}

Result<engine::EngineConfig> buildEngineConfig(const QueryOptions& options) {
    using ConfigResult = Result<engine::EngineConfig>;
    engine::EngineConfig config;

    auto recordDelimiter = parse::unescapeDelimiter(options.recordDelimiter);
    if (!recordDelimiter) {
        return std::unexpected(recordDelimiter.error());
    }
    auto fieldDelimiter = parse::unescapeDelimiter(options.fieldDelimiter);
    if (!fieldDelimiter) {
        return std::unexpected(fieldDelimiter.error());
    }

    auto& scan = config.scan;
    scan.logRoot = options.logDir;
    scan.recursive = options.recursive;
    scan.includeHidden = options.includeHidden;
    scan.extensions = options.extensions;
    scan.nameContains = options.nameContains;
    scan.numWorkers = options.threads;
    scan.chunkSize = options.chunkSize;
    scan.splitThreshold = options.splitThreshold;
    scan.recordDelimiter = std::move(*recordDelimiter);
    scan.trimCarriageReturn = !options.keepCarriageReturn;
    scan.progressIntervalMs = options.progressIntervalMs;
    scan.cancelFlag = options.cancelFlag;
    if (options.showProgress) {
        scan.progressCallback = [](const engine::ProgressInfo& info) {
            LOGQ_LOG_INFO("Progress: {}/{} files ({:.1f}%), {} bytes, {:.1f} files/s",
                          info.filesCompleted, info.totalFiles, info.ratio() * 100.0,
                          info.bytesProcessed, info.filesPerSecond());
            return true;
        };
    }

    config.fieldDelimiter = std::move(*fieldDelimiter);
    config.allowEmptyRecords = options.allowEmptyRecords;

    for (const auto& text : options.fields) {
        auto field = parse::parseFieldSpec(text);
        if (!field) {
            return std::unexpected(field.error());
        }
        config.fields.push_back(std::move(*field));
    }

    auto conditions = query::parseConditions(options.where);
    if (!conditions) {
        return std::unexpected(conditions.error());
    }

    auto mode = query::aggregationModeFromString(options.mode);
    if (!mode) {
        return makeError<engine::EngineConfig>(
            ErrorCode::kConfigError,
            fmt::format("unknown mode '{}' (expected enumerate, count or group)", options.mode));
    }

    auto& definition = config.query;
    definition.conditions = std::move(*conditions);
    definition.mode = *mode;
    definition.selectFields = options.select;
    definition.groupBy = options.groupBy;
    definition.metric = options.metric;
    definition.sortBy = options.sortBy;
    definition.descending = options.descending;
    if (options.limit > 0) {
        definition.limit = options.limit;
    }

    return ConfigResult{std::move(config)};
}

// =============================================================================
// Result Writers
// =============================================================================

std::string jsonEscape(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 2);
    for (char c : text) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\b':
                out += "\\b";
                break;
            case '\f':
                out += "\\f";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

void writeTextResult(std::ostream& out, const engine::FinalResult& result,
                     const query::QuerySpec& spec, bool projectFields) {
    switch (result.mode) {
        case query::AggregationMode::kEnumerate: {
            const std::string& delimiter = spec.schema().fieldDelimiter();
            for (const auto& match : result.matches) {
                if (!projectFields) {
                    out << match.raw << '\n';
                    continue;
                }
                for (std::size_t i = 0; i < match.fields.size(); ++i) {
                    if (i > 0) {
                        out << delimiter;
                    }
                    out << parse::formatValue(match.fields[i]);
                }
                out << '\n';
            }
            break;
        }
        case query::AggregationMode::kCount:
            out << result.count << '\n';
            break;
        case query::AggregationMode::kGroup:
            for (const auto& [key, acc] : result.groups) {
                out << key << '\t' << acc.count;
                if (spec.metricField()) {
                    writeGroupStats(out, acc);
                }
                out << '\n';
            }
            break;
    }
}

void writeJsonResult(std::ostream& out, const engine::FinalResult& result,
                     const query::QuerySpec& spec) {
    fmt::print(out, "{{\n  \"mode\": \"{}\",\n", query::aggregationModeToString(result.mode));

    switch (result.mode) {
        case query::AggregationMode::kEnumerate: {
            const auto& outputFields = spec.outputFields();
            out << "  \"matches\": [";
            for (std::size_t m = 0; m < result.matches.size(); ++m) {
                const auto& match = result.matches[m];
                fmt::print(out, "{}\n    {{\"file\": \"{}\", \"offset\": {}, \"record\": \"{}\", \"fields\": {{",
                           m > 0 ? "," : "", jsonEscape(result.sourceOf(match).string()),
                           match.offset, jsonEscape(match.raw));
                for (std::size_t i = 0; i < match.fields.size() && i < outputFields.size(); ++i) {
                    fmt::print(out, "{}\"{}\": {}", i > 0 ? ", " : "",
                               jsonEscape(spec.schema().field(outputFields[i]).name),
                               jsonValue(match.fields[i]));
                }
                out << "}}";
            }
            out << (result.matches.empty() ? "],\n" : "\n  ],\n");
            break;
        }
        case query::AggregationMode::kCount:
            fmt::print(out, "  \"count\": {},\n", result.count);
            break;
        case query::AggregationMode::kGroup: {
            out << "  \"groups\": [";
            for (std::size_t g = 0; g < result.groups.size(); ++g) {
                const auto& [key, acc] = result.groups[g];
                fmt::print(out, "{}\n    {{\"key\": \"{}\", \"count\": {}", g > 0 ? "," : "",
                           jsonEscape(key), acc.count);
                if (spec.metricField()) {
                    if (acc.hasMetric()) {
                        fmt::print(out, ", \"sum\": {}, \"min\": {}, \"max\": {}", acc.sum,
                                   acc.min, acc.max);
                    } else {
                        out << ", \"sum\": 0, \"min\": null, \"max\": null";
                    }
                }
                out << "}";
            }
            out << (result.groups.empty() ? "],\n" : "\n  ],\n");
            break;
        }
    }

    out << "  \"errors\": [";
    for (std::size_t e = 0; e < result.errors.size(); ++e) {
        const auto& error = result.errors[e];
        fmt::print(out, "{}\n    {{\"file\": \"{}\", \"kind\": \"{}\", \"message\": \"{}\"}}",
                   e > 0 ? "," : "", jsonEscape(error.path), errorKindName(error.kind),
                   jsonEscape(error.message));
    }
    out << (result.errors.empty() ? "],\n" : "\n  ],\n");

    const auto& stats = result.stats;
    fmt::print(out,
               "  \"stats\": {{\"files_scanned\": {}, \"files_failed\": {}, "
               "\"records_scanned\": {}, \"records_matched\": {}, \"schema_mismatches\": {}, "
               "\"coercion_failures\": {}, \"bytes_decoded\": {}, \"elapsed_ms\": {}}}\n}}\n",
               stats.filesScanned, stats.filesFailed, stats.recordsScanned,
               stats.recordsMatched, stats.schemaMismatches, stats.coercionFailures,
               stats.bytesDecoded, stats.elapsedMs);
}

// =============================================================================
// QueryCommand Implementation
// =============================================================================

QueryCommand::QueryCommand(QueryOptions options) : options_(std::move(options)) {}

QueryCommand::~QueryCommand() = default;

QueryCommand::QueryCommand(QueryCommand&&) noexcept = default;
QueryCommand& QueryCommand::operator=(QueryCommand&&) noexcept = default;

int QueryCommand::execute() {
    try {
        const OutputFormat format = unwrapOrThrow(parseOutputFormat(options_.format));
        const engine::EngineConfig config = unwrapOrThrow(buildEngineConfig(options_));
        unwrapOrThrow(config.validate());
        const auto spec = unwrapOrThrow(config.buildQuerySpec());

        engine::Scheduler scheduler(config.scan);
        auto result = scheduler.run(spec);
        if (!result) {
            if (result.error().code() == ErrorCode::kCancelled) {
                LOGQ_LOG_WARNING("Query interrupted: {}", result.error().message());
            } else {
                LOGQ_LOG_ERROR("Query failed: {}", result.error().message());
            }
            return result.error().exitCode();
        }

        if (!result->errors.empty()) {
            LOGQ_LOG_WARNING("{} of {} files were skipped because of errors",
                             result->errors.size(), result->files.size());
        }

        writeResult(*result, *spec, format);
    } catch (const ConfigError& e) {
        LOGQ_LOG_ERROR("Invalid configuration: {}", e.message());
        return e.exitCode();
    } catch (const IOError& e) {
        LOGQ_LOG_ERROR("Cannot write result: {}", e.message());
        return e.exitCode();
    } catch (const LogqException& e) {
        LOGQ_LOG_ERROR("Query failed: {}", e.message());
        return e.exitCode();
    }
    return 0;
}

void QueryCommand::writeResult(const engine::FinalResult& result, const query::QuerySpec& spec,
                               OutputFormat format) {
    const bool projectFields = !options_.select.empty();
    auto write = [&](std::ostream& out) {
        if (format == OutputFormat::kJson) {
            writeJsonResult(out, result, spec);
        } else {
            writeTextResult(out, result, spec, projectFields);
        }
        out.flush();
    };

    if (options_.outputPath.empty() || options_.outputPath == "-") {
        write(std::cout);
        if (!std::cout) {
            throw IOError("Failed to write to stdout");
        }
        return;
    }

    std::ofstream file(options_.outputPath, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw IOError("Failed to open output file: " + options_.outputPath);
    }
    write(file);
    if (!file) {
        throw IOError("Failed to write output file: " + options_.outputPath);
    }
    LOGQ_LOG_DEBUG("Wrote result to {}", options_.outputPath);
}

}  // namespace logq::commands
