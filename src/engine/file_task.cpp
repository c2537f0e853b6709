// =============================================================================
// logq - File Task Implementation
// =============================================================================

#include "logq/engine/file_task.h"

#include <fmt/format.h>

#include "logq/common/logger.h"
#include "logq/io/byte_source.h"
#include "logq/parse/field_extractor.h"

namespace logq::engine {

std::string_view taskStateToString(TaskState state) noexcept {
    switch (state) {
        case TaskState::kPending:
            return "pending";
        case TaskState::kRunning:
            return "running";
        case TaskState::kCompleted:
            return "completed";
        case TaskState::kFailedSkipped:
            return "failed";
        case TaskState::kAbandoned:
            return "abandoned";
        default:
            return "unknown";
    }
}

FileTask::FileTask(TaskId id, FileHandle file, ByteRange range)
    : id_(id), file_(std::move(file)), range_(range) {}

void FileTask::abandon() noexcept {
    if (state_ == TaskState::kPending) {
        state_ = TaskState::kAbandoned;
    }
}

void FileTask::fail(ErrorCode kind, std::string message) {
    LOGQ_LOG_WARNING("Skipping {}: {} ({})", file_.path.string(), message, errorKindName(kind));
    error_ = FileError{file_.index, file_.path.string(), kind, std::move(message)};
    result_ = PartialResult{};
    state_ = TaskState::kFailedSkipped;
}

TaskState FileTask::run(const query::QuerySpec& spec, const TaskOptions& options) {
    state_ = TaskState::kRunning;
    error_.reset();

    try {
        scan(spec, options);
    } catch (const IOError& e) {
        if (const auto& ec = e.systemError()) {
            LOGQ_LOG_DEBUG("Task {}: system error {} ({})", id_, ec->value(), ec->message());
        }
        fail(e.code(), e.message());
    } catch (const LogqException& e) {
        fail(e.code(), e.message());
    } catch (const std::exception& e) {
        fail(ErrorCode::kReadError, e.what());
    }

    LOGQ_LOG_TRACE("Task {} on {} is {}", id_, file_.path.string(), taskStateToString(state_));
    return state_;
}

void FileTask::scan(const query::QuerySpec& spec, const TaskOptions& options) {
    const std::size_t delimLen = options.recordDelimiter.size();

    // A range task opens one delimiter early so it can see whether its first
    // byte starts a record
    ByteOffset openOffset = 0;
    if (range_.begin > 0) {
        openOffset = range_.begin >= delimLen ? range_.begin - delimLen : 0;
    }

    auto source = options.openSource
                      ? options.openSource(file_, openOffset, options.inputBufferSize)
                      : io::openByteSource(file_, openOffset, options.inputBufferSize);

    io::SplitterOptions splitterOptions;
    splitterOptions.delimiter = options.recordDelimiter;
    splitterOptions.chunkSize = options.chunkSize;
    splitterOptions.keepEmptyRecords = spec.schema().allowEmptyRecords();
    splitterOptions.trimCarriageReturn = options.trimCarriageReturn;
    splitterOptions.range = range_;
    splitterOptions.shouldStop = options.shouldStop;
    io::RecordSplitter splitter(*source, std::move(splitterOptions), openOffset);

    parse::FieldExtractor extractor(spec.schema(), spec.neededFields());
    parse::FieldSet fields(spec.schema().fieldCount());
    PartialResult partial(spec.mode());
    ScanStats& stats = partial.stats();
    std::string groupKey;

    while (auto record = splitter.next()) {
        if (extractor.extract(record->bytes, fields) != parse::ExtractStatus::kOk) {
            continue;
        }
        if (!spec.predicate().evaluate(fields)) {
            continue;
        }
        ++stats.recordsMatched;

        switch (spec.mode()) {
            case AggregationMode::kEnumerate: {
                Match match;
                match.fileIndex = file_.index;
                match.offset = record->offset;
                match.raw = std::string(record->bytes);
                match.fields.reserve(spec.outputFields().size());
                for (std::size_t index : spec.outputFields()) {
                    match.fields.push_back(parse::toOwned(fields[index]));
                }
                if (auto sortField = spec.sortField()) {
                    match.sortKey = parse::toOwned(fields[*sortField]);
                }
                partial.addMatch(std::move(match));
                break;
            }
            case AggregationMode::kCount:
                partial.addCount();
                break;
            case AggregationMode::kGroup: {
                const auto& keyValue = fields[*spec.groupField()];
                if (const auto* text = std::get_if<std::string_view>(&keyValue)) {
                    groupKey.assign(*text);
                } else if (parse::isPresent(keyValue)) {
                    groupKey = parse::formatValue(keyValue);
                } else {
                    groupKey.assign(kAbsentGroupKey);
                }

                std::optional<double> metric;
                if (auto metricField = spec.metricField()) {
                    const auto& value = fields[*metricField];
                    if (const auto* i = std::get_if<std::int64_t>(&value)) {
                        metric = static_cast<double>(*i);
                    } else if (const auto* d = std::get_if<double>(&value)) {
                        metric = *d;
                    }
                }
                partial.addToGroup(groupKey, metric);
                break;
            }
        }
    }

    bytesDecoded_ = splitter.bytesConsumed();
    stats.recordsScanned = splitter.recordsEmitted();

    if (splitter.cancelled()) {
        LOGQ_LOG_DEBUG("Task {} abandoned on {}", id_, file_.path.string());
        result_ = PartialResult{};
        state_ = TaskState::kAbandoned;
        return;
    }

    stats.schemaMismatches = extractor.stats().schemaMismatches;
    stats.coercionFailures = extractor.stats().coercionFailures;
    stats.bytesDecoded = bytesDecoded_;

    LOGQ_LOG_DEBUG("Task {} finished {} [{}, {}): {} records, {} matched", id_,
                   file_.path.string(), range_.begin,
                   range_.end == kEndOfStream ? std::string("eof") : fmt::format("{}", range_.end),
                   stats.recordsScanned, stats.recordsMatched);

    result_ = std::move(partial);
    state_ = TaskState::kCompleted;
}

}  // namespace logq::engine
