// =============================================================================
// logq - Aggregator Implementation
// =============================================================================

#include "logq/engine/aggregator.h"

#include <algorithm>
#include <map>
#include <set>
#include <tuple>

#include <tbb/parallel_sort.h>

#include "logq/common/logger.h"

namespace logq::engine {

Aggregator::Aggregator(std::shared_ptr<const query::QuerySpec> spec, std::size_t taskCount)
    : spec_(std::move(spec)), slots_(taskCount) {}

void Aggregator::contribute(TaskId task, FileIndex file, PartialResult&& partial) {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot& slot = slots_.at(task);
    slot.file = file;
    slot.partial = std::move(partial);
    ++settled_;
}

void Aggregator::reportFailure(TaskId task, FileError error) {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot& slot = slots_.at(task);
    slot.file = error.fileIndex;
    slot.partial.reset();
    errors_.push_back(std::move(error));
    ++settled_;
}

std::size_t Aggregator::settledTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settled_;
}

void orderMatches(std::vector<Match>& matches, const query::QuerySpec& spec) {
    if (spec.sortField()) {
        const bool descending = spec.descending();
        tbb::parallel_sort(matches.begin(), matches.end(),
                           [descending](const Match& a, const Match& b) {
                               const bool aAbsent =
                                   std::holds_alternative<std::monostate>(a.sortKey);
                               const bool bAbsent =
                                   std::holds_alternative<std::monostate>(b.sortKey);
                               // Records without a key go last in either direction
                               if (aAbsent != bAbsent) {
                                   return bAbsent;
                               }
                               auto order = parse::compareOwned(a.sortKey, b.sortKey);
                               if (order != 0) {
                                   return descending ? order > 0 : order < 0;
                               }
                               return discoveryLess(a, b);
                           });
    }

    if (auto limit = spec.limit(); limit && matches.size() > *limit) {
        matches.resize(static_cast<std::size_t>(*limit));
    }
}

FinalResult Aggregator::finalize(std::vector<std::filesystem::path> files) {
    std::lock_guard<std::mutex> lock(mutex_);

    FinalResult result;
    result.mode = spec_->mode();
    result.files = std::move(files);

    // One failed range invalidates its whole file
    std::set<FileIndex> failedFiles;
    for (const auto& error : errors_) {
        failedFiles.insert(error.fileIndex);
    }

    PartialResult total(spec_->mode());
    std::set<FileIndex> scannedFiles;
    for (auto& slot : slots_) {
        if (!slot.partial || failedFiles.contains(slot.file)) {
            continue;
        }
        scannedFiles.insert(slot.file);
        total.merge(std::move(*slot.partial));
        slot.partial.reset();
    }

    result.stats = total.stats();
    result.stats.filesScanned = scannedFiles.size();
    result.stats.filesFailed = failedFiles.size();

    switch (spec_->mode()) {
        case AggregationMode::kEnumerate:
            result.matches = std::move(total.matches());
            orderMatches(result.matches, *spec_);
            break;
        case AggregationMode::kCount:
            result.count = total.count();
            break;
        case AggregationMode::kGroup: {
            std::map<std::string, GroupAccumulator> ordered(total.groups().begin(),
                                                            total.groups().end());
            result.groups.assign(ordered.begin(), ordered.end());
            break;
        }
    }

    // A file with several failed ranges is reported once
    std::vector<FileError> errors = errors_;
    std::sort(errors.begin(), errors.end(), [](const FileError& a, const FileError& b) {
        return std::tie(a.fileIndex, a.message) < std::tie(b.fileIndex, b.message);
    });
    errors.erase(std::unique(errors.begin(), errors.end(),
                             [](const FileError& a, const FileError& b) {
                                 return a.fileIndex == b.fileIndex;
                             }),
                 errors.end());
    result.errors = std::move(errors);

    LOGQ_LOG_DEBUG("Aggregated {} tasks: {} files scanned, {} failed", slots_.size(),
                   result.stats.filesScanned, result.stats.filesFailed);
    return result;
}

}  // namespace logq::engine
