// =============================================================================
// logq - Record Splitter Implementation
// =============================================================================

#include "logq/io/record_splitter.h"

#include <algorithm>
#include <cstring>

#include "logq/common/error.h"

namespace logq::io {

RecordSplitter::RecordSplitter(ByteSource& source, SplitterOptions options,
                               ByteOffset sourceStartOffset)
    : source_(source), options_(std::move(options)), headOffset_(sourceStartOffset) {
    if (options_.delimiter.empty()) {
        throw ConfigError("record delimiter must not be empty");
    }
    options_.chunkSize = std::max(options_.chunkSize, kMinChunkSize);
    buffer_.resize(options_.chunkSize);

    // A range starting past 0 begins mid-record: its first record belongs to
    // the previous range
    skippingFirst_ = options_.range.begin > 0;
}

bool RecordSplitter::isSelfOverlapping(std::string_view delimiter) noexcept {
    for (std::size_t shift = 1; shift < delimiter.size(); ++shift) {
        if (delimiter.substr(shift) == delimiter.substr(0, delimiter.size() - shift)) {
            return true;
        }
    }
    return false;
}

std::optional<std::size_t> RecordSplitter::findDelimiter(std::size_t from) const noexcept {
    const std::size_t delimLen = options_.delimiter.size();
    const char first = options_.delimiter.front();
    const char* base = buffer_.data();

    std::size_t pos = from;
    while (pos < tail_) {
        const void* hit = std::memchr(base + pos, first, tail_ - pos);
        if (hit == nullptr) {
            return std::nullopt;
        }
        pos = static_cast<std::size_t>(static_cast<const char*>(hit) - base);
        if (pos + delimLen > tail_) {
            // Possible delimiter split across chunks
            return std::nullopt;
        }
        if (delimLen == 1 ||
            std::memcmp(base + pos + 1, options_.delimiter.data() + 1, delimLen - 1) == 0) {
            return pos;
        }
        ++pos;
    }
    return std::nullopt;
}

bool RecordSplitter::fill() {
    if (options_.shouldStop && options_.shouldStop()) {
        cancelled_ = true;
        return false;
    }

    // Move the partial record to the front of the buffer
    if (head_ > 0) {
        const std::size_t carry = tail_ - head_;
        if (carry > 0) {
            std::memmove(buffer_.data(), buffer_.data() + head_, carry);
        }
        scanFrom_ -= head_;
        tail_ = carry;
        head_ = 0;
    }

    if (buffer_.size() < tail_ + options_.chunkSize) {
        buffer_.resize(tail_ + options_.chunkSize);
    }

    const std::size_t n =
        source_.read(std::span<char>(buffer_.data() + tail_, options_.chunkSize));
    if (n == 0) {
        eof_ = true;
        return false;
    }
    tail_ += n;
    bytesConsumed_ += n;
    return true;
}

std::optional<RawRecord> RecordSplitter::finish(std::size_t start, std::size_t length,
                                                ByteOffset offset) {
    if (offset >= options_.range.end) {
        done_ = true;
        return std::nullopt;
    }

    if (options_.trimCarriageReturn && options_.delimiter == "\n" && length > 0 &&
        buffer_[start + length - 1] == '\r') {
        --length;
    }

    if (length == 0 && !options_.keepEmptyRecords) {
        return std::nullopt;
    }

    ++recordsEmitted_;
    return RawRecord{std::string_view(buffer_.data() + start, length), offset};
}

std::optional<RawRecord> RecordSplitter::next() {
    const std::size_t delimLen = options_.delimiter.size();

    while (!done_) {
        if (auto pos = findDelimiter(scanFrom_)) {
            const std::size_t start = head_;
            const std::size_t length = *pos - head_;
            const ByteOffset offset = headOffset_;

            head_ = *pos + delimLen;
            scanFrom_ = head_;
            headOffset_ += length + delimLen;

            if (skippingFirst_) {
                skippingFirst_ = false;
                continue;
            }
            if (auto record = finish(start, length, offset)) {
                return record;
            }
            continue;
        }

        if (eof_) {
            done_ = true;
            if (head_ < tail_ && !skippingFirst_) {
                // Final record without a trailing delimiter
                const std::size_t start = head_;
                const std::size_t length = tail_ - head_;
                const ByteOffset offset = headOffset_;
                headOffset_ += length;
                head_ = tail_;
                return finish(start, length, offset);
            }
            return std::nullopt;
        }

        // Resume the search where a delimiter could still begin
        scanFrom_ = std::max(head_, tail_ >= delimLen - 1 ? tail_ - (delimLen - 1) : 0);

        if (!fill() && cancelled_) {
            done_ = true;
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::uint64_t RecordSplitter::forEach(const RecordCallback& callback) {
    std::uint64_t delivered = 0;
    while (auto record = next()) {
        ++delivered;
        if (!callback(*record)) {
            break;
        }
    }
    return delivered;
}

}  // namespace logq::io
