// =============================================================================
// logq - Record Splitter
// =============================================================================
// Splits a decoded byte stream into records on a configurable delimiter.
//
// The splitter pulls fixed-size chunks from a ByteSource and carries the
// incomplete tail of each chunk over to the next, so records spanning chunk
// boundaries are reassembled exactly. The emitted record sequence does not
// depend on chunk size.
//
// Byte-range mode: a splitter restricted to [begin, end) emits exactly the
// records whose first byte lies in the range. The caller positions the source
// at max(0, begin - delimiterLength); the splitter discards bytes up to and
// including the first delimiter it sees, then stops at the first record
// starting at or after end.
// =============================================================================

#ifndef LOGQ_IO_RECORD_SPLITTER_H
#define LOGQ_IO_RECORD_SPLITTER_H

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "logq/common/types.h"
#include "logq/io/byte_source.h"

namespace logq::io {

// =============================================================================
// Raw Record
// =============================================================================

/// @brief One delimited record.
/// @note bytes views the splitter's buffer and is valid until the next call
///       to next().
struct RawRecord {
    /// @brief Record bytes, delimiter excluded.
    std::string_view bytes;

    /// @brief Decoded offset of the record's first byte.
    ByteOffset offset = 0;
};

// =============================================================================
// Splitter Options
// =============================================================================

/// @brief Cancellation poll, checked before each chunk read.
using CancelCheck = std::function<bool()>;

/// @brief Splitter configuration.
struct SplitterOptions {
    /// @brief Record delimiter (non-empty).
    std::string delimiter = std::string(kDefaultRecordDelimiter);

    /// @brief Bytes requested from the source per read.
    std::size_t chunkSize = kDefaultChunkSize;

    /// @brief Emit zero-length records instead of dropping them.
    bool keepEmptyRecords = false;

    /// @brief Strip one trailing '\r' when the delimiter is "\n".
    bool trimCarriageReturn = true;

    /// @brief Decoded range whose records are emitted.
    ByteRange range{};

    /// @brief Optional cancellation poll.
    CancelCheck shouldStop;
};

// =============================================================================
// RecordSplitter
// =============================================================================

/// @brief Incremental record splitter over a ByteSource.
///
/// Thread Safety:
/// - Not thread-safe; owned by a single FileTask
class RecordSplitter {
public:
    using RecordCallback = std::function<bool(const RawRecord&)>;

    /// @brief Construct a splitter.
    /// @param source Decoded byte stream (must outlive the splitter).
    /// @param options Splitter configuration.
    /// @param sourceStartOffset Decoded offset of the source's first byte.
    RecordSplitter(ByteSource& source, SplitterOptions options, ByteOffset sourceStartOffset = 0);

    RecordSplitter(const RecordSplitter&) = delete;
    RecordSplitter& operator=(const RecordSplitter&) = delete;

    /// @brief Produce the next record.
    /// @return The record, or std::nullopt at end of stream, end of range, or
    ///         after cancellation.
    /// @throws DecompressionError, ReadError propagated from the source.
    [[nodiscard]] std::optional<RawRecord> next();

    /// @brief Invoke callback for each remaining record.
    /// @return Number of records delivered. Stops early when the callback
    ///         returns false.
    std::uint64_t forEach(const RecordCallback& callback);

    /// @brief Check whether splitting stopped on the cancellation poll.
    [[nodiscard]] bool cancelled() const noexcept { return cancelled_; }

    /// @brief Records emitted so far.
    [[nodiscard]] std::uint64_t recordsEmitted() const noexcept { return recordsEmitted_; }

    /// @brief Decoded bytes pulled from the source so far.
    [[nodiscard]] std::uint64_t bytesConsumed() const noexcept { return bytesConsumed_; }

    /// @brief Check whether a delimiter can overlap a shifted copy of itself.
    /// @note Byte-range splitting is exact only for non-overlapping delimiters.
    [[nodiscard]] static bool isSelfOverlapping(std::string_view delimiter) noexcept;

private:
    /// @brief Locate the delimiter in [from, tail_).
    [[nodiscard]] std::optional<std::size_t> findDelimiter(std::size_t from) const noexcept;

    /// @brief Compact the carry-over and read another chunk.
    /// @return false at end of stream.
    bool fill();

    /// @brief Apply range end, CR trimming and empty-record rules.
    /// @return The record to emit, or std::nullopt to drop it.
    [[nodiscard]] std::optional<RawRecord> finish(std::size_t start, std::size_t length,
                                                  ByteOffset offset);

    ByteSource& source_;
    SplitterOptions options_;

    std::vector<char> buffer_;
    std::size_t head_ = 0;      ///< First unconsumed byte
    std::size_t tail_ = 0;      ///< One past the last valid byte
    std::size_t scanFrom_ = 0;  ///< Resume point for delimiter search
    ByteOffset headOffset_ = 0;

    bool skippingFirst_ = false;
    bool eof_ = false;
    bool done_ = false;
    bool cancelled_ = false;

    std::uint64_t recordsEmitted_ = 0;
    std::uint64_t bytesConsumed_ = 0;
};

}  // namespace logq::io

#endif  // LOGQ_IO_RECORD_SPLITTER_H
