// =============================================================================
// logq - Byte Sources
// =============================================================================
// Sequential access to a file's decoded bytes, with transparent decompression.
//
// This module provides:
// - ByteSource: Interface yielding decoded bytes in bounded-size reads
// - Plain, gzip, bzip2, xz and zstd implementations
// - Format detection from magic bytes (authoritative) and extension (hint)
//
// Every decoder is streaming: memory use is bounded by its input and output
// buffers, independent of file size.
//
// Usage:
//   auto source = openByteSource(fileHandle);
//   std::vector<char> chunk(64 * 1024);
//   while (auto n = source->read(chunk)) { ... }
// =============================================================================

#ifndef LOGQ_IO_BYTE_SOURCE_H
#define LOGQ_IO_BYTE_SOURCE_H

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "logq/common/error.h"
#include "logq/common/types.h"

namespace logq::io {

// =============================================================================
// Compression Format Detection
// =============================================================================

/// @brief Detect compression format from file magic bytes.
/// @param data First few bytes of the file.
/// @return Detected compression format (kNone if no magic matched).
[[nodiscard]] CompressionFormat detectCompressionFormat(std::span<const std::uint8_t> data);

/// @brief Detect compression format from file extension.
/// @param path File path.
/// @return Format implied by the extension.
[[nodiscard]] CompressionFormat detectCompressionFormatFromExtension(
    const std::filesystem::path& path);

/// @brief Read the magic prefix of a file and detect its format.
/// @return Detected format, or ReadError if the file cannot be opened.
[[nodiscard]] Result<CompressionFormat> sniffCompressionFormat(const std::filesystem::path& path);

/// @brief Get file extension for compression format (e.g. ".gz").
[[nodiscard]] std::string_view compressionFormatExtension(CompressionFormat format);

/// @brief Get human-readable name for compression format (e.g. "gzip").
[[nodiscard]] std::string_view compressionFormatName(CompressionFormat format);

/// @brief Formats the byte sources can decode, plain included.
[[nodiscard]] std::vector<CompressionFormat> supportedCompressionFormats();

// =============================================================================
// ByteSource Interface
// =============================================================================

/// @brief Sequential, finite stream of decoded bytes.
///
/// Thread Safety:
/// - Not thread-safe; each FileTask owns its source exclusively
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// @brief Decode up to out.size() bytes into out.
    /// @return Number of bytes written; 0 only at end of stream.
    /// @throws DecompressionError on malformed or truncated compressed data.
    /// @throws ReadError on I/O failure.
    [[nodiscard]] virtual std::size_t read(std::span<char> out) = 0;

    /// @brief Format this source decodes.
    [[nodiscard]] virtual CompressionFormat format() const noexcept = 0;

    /// @brief Raw (on-disk) bytes consumed so far.
    [[nodiscard]] std::uint64_t rawBytesRead() const noexcept { return rawBytesRead_; }

    /// @brief Name used in error messages (usually the file path).
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

protected:
    ByteSource(std::unique_ptr<std::istream> input, std::string name, std::size_t bufferSize);

    /// @brief Read more raw input into inputBuffer_.
    /// @return Number of bytes read; 0 at end of input.
    /// @throws ReadError if the underlying stream fails.
    std::size_t fillInput();

    /// @brief Error context naming this source.
    [[nodiscard]] ErrorContext context() const { return ErrorContext{name_}; }

    std::unique_ptr<std::istream> input_;
    std::string name_;
    std::vector<std::uint8_t> inputBuffer_;
    std::uint64_t rawBytesRead_ = 0;
    bool inputEof_ = false;
};

// =============================================================================
// PlainByteSource
// =============================================================================

/// @brief Pass-through source for uncompressed input.
class PlainByteSource final : public ByteSource {
public:
    PlainByteSource(std::unique_ptr<std::istream> input, std::string name);

    [[nodiscard]] std::size_t read(std::span<char> out) override;

    [[nodiscard]] CompressionFormat format() const noexcept override {
        return CompressionFormat::kNone;
    }
};

// =============================================================================
// GzipByteSource
// =============================================================================

/// @brief Streaming gzip decoder (zlib). Concatenated members are decoded as
///        one stream.
class GzipByteSource final : public ByteSource {
public:
    GzipByteSource(std::unique_ptr<std::istream> input, std::string name,
                   std::size_t bufferSize = kDefaultInputBufferSize);
    ~GzipByteSource() override;

    GzipByteSource(const GzipByteSource&) = delete;
    GzipByteSource& operator=(const GzipByteSource&) = delete;

    [[nodiscard]] std::size_t read(std::span<char> out) override;

    [[nodiscard]] CompressionFormat format() const noexcept override {
        return CompressionFormat::kGzip;
    }

private:
    /// @brief Prepare for another gzip member if one follows.
    /// @return true if a new member starts, false at clean end of stream.
    bool startNextMember();

    /// @brief zlib stream state (opaque pointer).
    void* zlibStream_ = nullptr;

    bool finished_ = false;
};

// =============================================================================
// Bzip2ByteSource
// =============================================================================

/// @brief Streaming bzip2 decoder (libbz2). Multi-stream files are supported.
class Bzip2ByteSource final : public ByteSource {
public:
    Bzip2ByteSource(std::unique_ptr<std::istream> input, std::string name,
                    std::size_t bufferSize = kDefaultInputBufferSize);
    ~Bzip2ByteSource() override;

    Bzip2ByteSource(const Bzip2ByteSource&) = delete;
    Bzip2ByteSource& operator=(const Bzip2ByteSource&) = delete;

    [[nodiscard]] std::size_t read(std::span<char> out) override;

    [[nodiscard]] CompressionFormat format() const noexcept override {
        return CompressionFormat::kBzip2;
    }

private:
    void initBzip2();
    void cleanupBzip2();

    /// @brief bzip2 stream state (opaque pointer).
    void* bzStream_ = nullptr;

    bool finished_ = false;
};

// =============================================================================
// XzByteSource
// =============================================================================

/// @brief Streaming xz/lzma decoder (liblzma), concatenated streams allowed.
class XzByteSource final : public ByteSource {
public:
    XzByteSource(std::unique_ptr<std::istream> input, std::string name,
                 std::size_t bufferSize = kDefaultInputBufferSize);
    ~XzByteSource() override;

    XzByteSource(const XzByteSource&) = delete;
    XzByteSource& operator=(const XzByteSource&) = delete;

    [[nodiscard]] std::size_t read(std::span<char> out) override;

    [[nodiscard]] CompressionFormat format() const noexcept override {
        return CompressionFormat::kXz;
    }

private:
    /// @brief lzma stream state (opaque pointer).
    void* lzmaStream_ = nullptr;

    bool finished_ = false;
};

// =============================================================================
// ZstdByteSource
// =============================================================================

/// @brief Streaming zstd decoder (libzstd), multiple frames allowed.
class ZstdByteSource final : public ByteSource {
public:
    ZstdByteSource(std::unique_ptr<std::istream> input, std::string name,
                   std::size_t bufferSize = kDefaultInputBufferSize);
    ~ZstdByteSource() override;

    ZstdByteSource(const ZstdByteSource&) = delete;
    ZstdByteSource& operator=(const ZstdByteSource&) = delete;

    [[nodiscard]] std::size_t read(std::span<char> out) override;

    [[nodiscard]] CompressionFormat format() const noexcept override {
        return CompressionFormat::kZstd;
    }

private:
    /// @brief ZSTD_DStream (opaque pointer).
    void* dstream_ = nullptr;

    std::size_t inputPos_ = 0;
    std::size_t inputSize_ = 0;
    bool frameComplete_ = false;
    bool finished_ = false;
};

// =============================================================================
// Factory Functions
// =============================================================================

/// @brief Open a file's decoded byte stream.
/// @param file Enumerated file.
/// @param startOffset Decoded offset to start at (uncompressed files only).
/// @param bufferSize Raw input buffer size.
/// @return Source decoding the detected format.
/// @throws ReadError if the file cannot be opened or positioned.
/// @throws DecompressionError if the extension claims compression the content
///         does not carry.
[[nodiscard]] std::unique_ptr<ByteSource> openByteSource(
    const FileHandle& file, ByteOffset startOffset = 0,
    std::size_t bufferSize = kDefaultInputBufferSize);

/// @brief Wrap an existing stream.
/// @param input Source stream (must support putback of the magic prefix when
///        format is kUnknown).
/// @param format Compression format (auto-detect if kUnknown).
/// @param name Name used in error messages.
[[nodiscard]] std::unique_ptr<ByteSource> makeByteSource(
    std::unique_ptr<std::istream> input, CompressionFormat format = CompressionFormat::kUnknown,
    std::string name = "<stream>", std::size_t bufferSize = kDefaultInputBufferSize);

}  // namespace logq::io

#endif  // LOGQ_IO_BYTE_SOURCE_H
