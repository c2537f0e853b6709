// =============================================================================
// logq - Common Type Definitions
// =============================================================================
// Core type definitions shared by every stage of the scan pipeline.
//
// This module defines:
// - FileIndex, TaskId, ByteOffset: Type aliases for identifiers and offsets
// - CompressionFormat: Enum for detected/hinted input compression
// - FileHandle: One enumerated input file
// - ByteRange: Contiguous decoded-byte range owned by one task
// - Pipeline sizing constants
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef LOGQ_COMMON_TYPES_H
#define LOGQ_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <string_view>

namespace logq {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Position of a file in the enumeration snapshot (discovery order).
using FileIndex = std::uint32_t;

/// @brief Identifier of a FileTask (dense, 0-based, in dispatch order).
using TaskId = std::uint32_t;

/// @brief Byte offset in a file's decoded content.
using ByteOffset = std::uint64_t;

// =============================================================================
// Constants
// =============================================================================

/// @brief Sentinel for "until end of stream".
inline constexpr ByteOffset kEndOfStream = std::numeric_limits<ByteOffset>::max();

/// @brief Default size of a decoded chunk handed to the record splitter.
inline constexpr std::size_t kDefaultChunkSize = 1024 * 1024;  // 1MB

/// @brief Smallest accepted chunk size.
inline constexpr std::size_t kMinChunkSize = 16;

/// @brief Default compressed-input read buffer size.
inline constexpr std::size_t kDefaultInputBufferSize = 256 * 1024;  // 256KB

/// @brief Bytes inspected for compression magic.
inline constexpr std::size_t kMagicSniffSize = 8;

/// @brief Plain files above this size are split into byte-range tasks.
inline constexpr std::uint64_t kDefaultSplitThreshold = 256ULL * 1024 * 1024;  // 256MB

/// @brief Split threshold value that disables splitting.
inline constexpr std::uint64_t kNoSplit = 0;

/// @brief Default record delimiter.
inline constexpr std::string_view kDefaultRecordDelimiter = "\n";

/// @brief Default field delimiter.
inline constexpr std::string_view kDefaultFieldDelimiter = "|";

// =============================================================================
// Compression Format Enumeration
// =============================================================================

/// @brief Supported compression formats.
enum class CompressionFormat : std::uint8_t {
    kNone = 0,   ///< Uncompressed (plain text)
    kGzip = 1,   ///< gzip (.gz)
    kBzip2 = 2,  ///< bzip2 (.bz2)
    kXz = 3,     ///< xz/lzma (.xz)
    kZstd = 4,   ///< zstd (.zst)
    kUnknown = 255
};

// =============================================================================
// File Handle
// =============================================================================

/// @brief One file discovered under the log root.
/// @note Created during enumeration and never mutated afterwards.
struct FileHandle {
    /// @brief Absolute or root-relative path as enumerated.
    std::filesystem::path path;

    /// @brief On-disk size in bytes.
    std::uint64_t size = 0;

    /// @brief Last modification time at enumeration.
    std::filesystem::file_time_type modified{};

    /// @brief Compression implied by the extension (a hint, not authoritative).
    CompressionFormat extensionHint = CompressionFormat::kNone;

    /// @brief Position in the sorted enumeration snapshot.
    FileIndex index = 0;
};

// =============================================================================
// Byte Range
// =============================================================================

/// @brief Half-open range [begin, end) of decoded byte offsets.
/// @note A task owns the records whose first byte lies in its range.
struct ByteRange {
    ByteOffset begin = 0;
    ByteOffset end = kEndOfStream;

    [[nodiscard]] constexpr bool isWholeStream() const noexcept {
        return begin == 0 && end == kEndOfStream;
    }

    [[nodiscard]] constexpr bool contains(ByteOffset offset) const noexcept {
        return offset >= begin && offset < end;
    }

    friend constexpr bool operator==(const ByteRange&, const ByteRange&) = default;
};

}  // namespace logq

#endif  // LOGQ_COMMON_TYPES_H
