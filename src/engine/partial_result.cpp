// =============================================================================
// logq - Partial Results Implementation
// =============================================================================

#include "logq/engine/partial_result.h"

#include <algorithm>
#include <iterator>

namespace logq::engine {

// =============================================================================
// GroupAccumulator
// =============================================================================

void GroupAccumulator::add(std::optional<double> metric) noexcept {
    ++count;
    if (metric) {
        ++metricCount;
        sum += *metric;
        min = std::min(min, *metric);
        max = std::max(max, *metric);
    }
}

void GroupAccumulator::merge(const GroupAccumulator& other) noexcept {
    count += other.count;
    metricCount += other.metricCount;
    sum += other.sum;
    min = std::min(min, other.min);
    max = std::max(max, other.max);
}

// =============================================================================
// ScanStats
// =============================================================================

void ScanStats::merge(const ScanStats& other) noexcept {
    filesScanned += other.filesScanned;
    filesFailed += other.filesFailed;
    recordsScanned += other.recordsScanned;
    recordsMatched += other.recordsMatched;
    schemaMismatches += other.schemaMismatches;
    coercionFailures += other.coercionFailures;
    bytesDecoded += other.bytesDecoded;
}

// =============================================================================
// PartialResult
// =============================================================================

void PartialResult::addMatch(Match match) {
    matches_.push_back(std::move(match));
}

void PartialResult::addToGroup(std::string_view key, std::optional<double> metric) {
    auto it = groups_.find(key);
    if (it == groups_.end()) {
        it = groups_.emplace(std::string(key), GroupAccumulator{}).first;
    }
    it->second.add(metric);
}

void PartialResult::merge(PartialResult&& other) {
    if (!other.matches_.empty()) {
        if (matches_.empty()) {
            matches_ = std::move(other.matches_);
        } else {
            std::vector<Match> merged;
            merged.reserve(matches_.size() + other.matches_.size());
            std::merge(std::make_move_iterator(matches_.begin()),
                       std::make_move_iterator(matches_.end()),
                       std::make_move_iterator(other.matches_.begin()),
                       std::make_move_iterator(other.matches_.end()),
                       std::back_inserter(merged), discoveryLess);
            matches_ = std::move(merged);
        }
    }

    count_ += other.count_;

    for (auto& [key, accumulator] : other.groups_) {
        auto it = groups_.find(key);
        if (it == groups_.end()) {
            groups_.emplace(key, accumulator);
        } else {
            it->second.merge(accumulator);
        }
    }

    stats_.merge(other.stats_);

    other.matches_.clear();
    other.groups_.clear();
    other.count_ = 0;
    other.stats_ = ScanStats{};
}

}  // namespace logq::engine
