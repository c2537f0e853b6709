// =============================================================================
// logq - Byte Source Implementation
// =============================================================================
// Streaming decoders for plain, gzip, bzip2, xz and zstd input.
// =============================================================================

#include "logq/io/byte_source.h"

#include <zlib.h>
#include <bzlib.h>
#include <lzma.h>
#include <zstd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

#include <fmt/format.h>

#include "logq/common/logger.h"

namespace logq::io {

// =============================================================================
// Magic Bytes for Format Detection
// =============================================================================

namespace {

// Gzip magic: 0x1f 0x8b
constexpr std::uint8_t kGzipMagic[] = {0x1f, 0x8b};

// Bzip2 magic: 'B' 'Z' 'h'
constexpr std::uint8_t kBzip2Magic[] = {0x42, 0x5a, 0x68};

// XZ magic: 0xfd '7' 'z' 'X' 'Z' 0x00
constexpr std::uint8_t kXzMagic[] = {0xfd, 0x37, 0x7a, 0x58, 0x5a, 0x00};

// Zstd magic: 0x28 0xb5 0x2f 0xfd
constexpr std::uint8_t kZstdMagic[] = {0x28, 0xb5, 0x2f, 0xfd};

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string truncatedMessage(std::string_view formatName) {
    return fmt::format("unexpected end of {} stream (truncated input)", formatName);
}

}  // namespace

// =============================================================================
// Format Detection
// =============================================================================

CompressionFormat detectCompressionFormat(std::span<const std::uint8_t> data) {
    if (data.size() < 2) {
        return CompressionFormat::kNone;
    }

    if (data.size() >= sizeof(kGzipMagic) &&
        std::memcmp(data.data(), kGzipMagic, sizeof(kGzipMagic)) == 0) {
        return CompressionFormat::kGzip;
    }

    if (data.size() >= sizeof(kBzip2Magic) &&
        std::memcmp(data.data(), kBzip2Magic, sizeof(kBzip2Magic)) == 0) {
        return CompressionFormat::kBzip2;
    }

    if (data.size() >= sizeof(kXzMagic) &&
        std::memcmp(data.data(), kXzMagic, sizeof(kXzMagic)) == 0) {
        return CompressionFormat::kXz;
    }

    if (data.size() >= sizeof(kZstdMagic) &&
        std::memcmp(data.data(), kZstdMagic, sizeof(kZstdMagic)) == 0) {
        return CompressionFormat::kZstd;
    }

    return CompressionFormat::kNone;
}

CompressionFormat detectCompressionFormatFromExtension(const std::filesystem::path& path) {
    const std::string ext = toLower(path.extension().string());

    if (ext == ".gz" || ext == ".gzip") {
        return CompressionFormat::kGzip;
    }
    if (ext == ".bz2" || ext == ".bzip2") {
        return CompressionFormat::kBzip2;
    }
    if (ext == ".xz" || ext == ".lzma") {
        return CompressionFormat::kXz;
    }
    if (ext == ".zst" || ext == ".zstd") {
        return CompressionFormat::kZstd;
    }

    return CompressionFormat::kNone;
}

Result<CompressionFormat> sniffCompressionFormat(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return makeError<CompressionFormat>(
            ErrorCode::kReadError, fmt::format("cannot open file: {}", path.string()));
    }

    std::uint8_t magic[kMagicSniffSize] = {};
    file.read(reinterpret_cast<char*>(magic), sizeof(magic));
    if (file.bad()) {
        return makeError<CompressionFormat>(
            ErrorCode::kReadError, fmt::format("cannot read file: {}", path.string()));
    }

    return detectCompressionFormat(
        std::span<const std::uint8_t>(magic, static_cast<std::size_t>(file.gcount())));
}

std::string_view compressionFormatExtension(CompressionFormat format) {
    switch (format) {
        case CompressionFormat::kGzip:
            return ".gz";
        case CompressionFormat::kBzip2:
            return ".bz2";
        case CompressionFormat::kXz:
            return ".xz";
        case CompressionFormat::kZstd:
            return ".zst";
        case CompressionFormat::kNone:
        default:
            return "";
    }
}

std::string_view compressionFormatName(CompressionFormat format) {
    switch (format) {
        case CompressionFormat::kNone:
            return "plain";
        case CompressionFormat::kGzip:
            return "gzip";
        case CompressionFormat::kBzip2:
            return "bzip2";
        case CompressionFormat::kXz:
            return "xz";
        case CompressionFormat::kZstd:
            return "zstd";
        default:
            return "unknown";
    }
}

std::vector<CompressionFormat> supportedCompressionFormats() {
    return {CompressionFormat::kNone, CompressionFormat::kGzip, CompressionFormat::kBzip2,
            CompressionFormat::kXz, CompressionFormat::kZstd};
}

// =============================================================================
// ByteSource Base
// =============================================================================

ByteSource::ByteSource(std::unique_ptr<std::istream> input, std::string name,
                       std::size_t bufferSize)
    : input_(std::move(input)), name_(std::move(name)), inputBuffer_(bufferSize) {}

std::size_t ByteSource::fillInput() {
    if (inputEof_) {
        return 0;
    }

    input_->read(reinterpret_cast<char*>(inputBuffer_.data()),
                 static_cast<std::streamsize>(inputBuffer_.size()));
    if (input_->bad()) {
        throw ReadError("read failed", context());
    }

    auto bytesRead = static_cast<std::size_t>(input_->gcount());
    rawBytesRead_ += bytesRead;
    if (bytesRead == 0) {
        inputEof_ = true;
    }
    return bytesRead;
}

// =============================================================================
// PlainByteSource Implementation
// =============================================================================

PlainByteSource::PlainByteSource(std::unique_ptr<std::istream> input, std::string name)
    : ByteSource(std::move(input), std::move(name), 0) {}

std::size_t PlainByteSource::read(std::span<char> out) {
    if (inputEof_ || out.empty()) {
        return 0;
    }

    input_->read(out.data(), static_cast<std::streamsize>(out.size()));
    if (input_->bad()) {
        throw ReadError("read failed", context());
    }

    auto bytesRead = static_cast<std::size_t>(input_->gcount());
    rawBytesRead_ += bytesRead;
    if (bytesRead == 0) {
        inputEof_ = true;
    }
    return bytesRead;
}

// =============================================================================
// GzipByteSource Implementation
// =============================================================================

GzipByteSource::GzipByteSource(std::unique_ptr<std::istream> input, std::string name,
                               std::size_t bufferSize)
    : ByteSource(std::move(input), std::move(name), bufferSize) {
    auto* stream = new z_stream{};

    // 16 + MAX_WBITS selects the gzip wrapper
    int ret = inflateInit2(stream, 16 + MAX_WBITS);
    if (ret != Z_OK) {
        delete stream;
        throw DecompressionError(
            fmt::format("failed to initialize zlib: {}", zError(ret)), context());
    }
    zlibStream_ = stream;
}

GzipByteSource::~GzipByteSource() {
    if (zlibStream_ != nullptr) {
        auto* stream = static_cast<z_stream*>(zlibStream_);
        inflateEnd(stream);
        delete stream;
        zlibStream_ = nullptr;
    }
}

bool GzipByteSource::startNextMember() {
    auto* stream = static_cast<z_stream*>(zlibStream_);

    if (stream->avail_in == 0) {
        std::size_t n = fillInput();
        stream->next_in = inputBuffer_.data();
        stream->avail_in = static_cast<uInt>(n);
    }
    if (stream->avail_in == 0) {
        return false;
    }

    if (stream->next_in[0] != kGzipMagic[0]) {
        LOGQ_LOG_DEBUG("Ignoring {} trailing bytes after gzip stream in {}", stream->avail_in,
                       name_);
        return false;
    }

    inflateReset(stream);
    return true;
}

std::size_t GzipByteSource::read(std::span<char> out) {
    if (finished_ || out.empty()) {
        return 0;
    }

    auto* stream = static_cast<z_stream*>(zlibStream_);
    stream->next_out = reinterpret_cast<Bytef*>(out.data());
    stream->avail_out = static_cast<uInt>(out.size());

    while (stream->avail_out > 0) {
        if (stream->avail_in == 0 && !inputEof_) {
            std::size_t n = fillInput();
            stream->next_in = inputBuffer_.data();
            stream->avail_in = static_cast<uInt>(n);
        }

        int ret = inflate(stream, Z_NO_FLUSH);

        if (ret == Z_STREAM_END) {
            if (!startNextMember()) {
                finished_ = true;
                break;
            }
            continue;
        }

        if (ret == Z_BUF_ERROR) {
            // No progress possible: only legitimate while more input can arrive
            if (stream->avail_in == 0 && inputEof_) {
                throw DecompressionError(truncatedMessage("gzip"), context());
            }
            continue;
        }

        if (ret != Z_OK) {
            throw DecompressionError(
                fmt::format("gzip stream corrupt: {}",
                            stream->msg != nullptr ? stream->msg : zError(ret)),
                context());
        }
    }

    return out.size() - stream->avail_out;
}

// =============================================================================
// Bzip2ByteSource Implementation
// =============================================================================

Bzip2ByteSource::Bzip2ByteSource(std::unique_ptr<std::istream> input, std::string name,
                                 std::size_t bufferSize)
    : ByteSource(std::move(input), std::move(name), bufferSize) {
    initBzip2();
}

Bzip2ByteSource::~Bzip2ByteSource() {
    cleanupBzip2();
}

void Bzip2ByteSource::initBzip2() {
    auto* stream = new bz_stream{};

    int ret = BZ2_bzDecompressInit(stream, 0, 0);
    if (ret != BZ_OK) {
        delete stream;
        throw DecompressionError(fmt::format("failed to initialize bzip2: error {}", ret),
                                 context());
    }
    bzStream_ = stream;
}

void Bzip2ByteSource::cleanupBzip2() {
    if (bzStream_ != nullptr) {
        auto* stream = static_cast<bz_stream*>(bzStream_);
        BZ2_bzDecompressEnd(stream);
        delete stream;
        bzStream_ = nullptr;
    }
}

std::size_t Bzip2ByteSource::read(std::span<char> out) {
    if (finished_ || out.empty()) {
        return 0;
    }

    auto* stream = static_cast<bz_stream*>(bzStream_);
    stream->next_out = out.data();
    stream->avail_out = static_cast<unsigned int>(out.size());

    while (stream->avail_out > 0) {
        if (stream->avail_in == 0 && !inputEof_) {
            std::size_t n = fillInput();
            stream->next_in = reinterpret_cast<char*>(inputBuffer_.data());
            stream->avail_in = static_cast<unsigned int>(n);
        }

        const unsigned int availOutBefore = stream->avail_out;
        const unsigned int availInBefore = stream->avail_in;
        int ret = BZ2_bzDecompress(stream);

        if (ret == BZ_STREAM_END) {
            // Multi-stream files (pbzip2) carry further "BZh" headers
            char* pending = stream->next_in;
            unsigned int pendingSize = stream->avail_in;
            if (pendingSize == 0 && !inputEof_) {
                pendingSize = static_cast<unsigned int>(fillInput());
                pending = reinterpret_cast<char*>(inputBuffer_.data());
            }
            if (pendingSize == 0 || static_cast<std::uint8_t>(pending[0]) != kBzip2Magic[0]) {
                finished_ = true;
                break;
            }

            char* nextOut = stream->next_out;
            unsigned int availOut = stream->avail_out;
            cleanupBzip2();
            initBzip2();
            stream = static_cast<bz_stream*>(bzStream_);
            stream->next_in = pending;
            stream->avail_in = pendingSize;
            stream->next_out = nextOut;
            stream->avail_out = availOut;
            continue;
        }

        if (ret != BZ_OK) {
            throw DecompressionError(fmt::format("bzip2 stream corrupt: error {}", ret),
                                     context());
        }

        if (inputEof_ && stream->avail_in == 0 && availInBefore == 0 &&
            stream->avail_out == availOutBefore) {
            throw DecompressionError(truncatedMessage("bzip2"), context());
        }
    }

    return out.size() - stream->avail_out;
}

// =============================================================================
// XzByteSource Implementation
// =============================================================================

XzByteSource::XzByteSource(std::unique_ptr<std::istream> input, std::string name,
                           std::size_t bufferSize)
    : ByteSource(std::move(input), std::move(name), bufferSize) {
    lzma_stream init = LZMA_STREAM_INIT;
    auto* stream = new lzma_stream(init);

    lzma_ret ret = lzma_stream_decoder(stream, UINT64_MAX, LZMA_CONCATENATED);
    if (ret != LZMA_OK) {
        delete stream;
        throw DecompressionError(
            fmt::format("failed to initialize xz decoder: error {}", static_cast<int>(ret)),
            context());
    }
    lzmaStream_ = stream;
}

XzByteSource::~XzByteSource() {
    if (lzmaStream_ != nullptr) {
        auto* stream = static_cast<lzma_stream*>(lzmaStream_);
        lzma_end(stream);
        delete stream;
        lzmaStream_ = nullptr;
    }
}

std::size_t XzByteSource::read(std::span<char> out) {
    if (finished_ || out.empty()) {
        return 0;
    }

    auto* stream = static_cast<lzma_stream*>(lzmaStream_);
    stream->next_out = reinterpret_cast<std::uint8_t*>(out.data());
    stream->avail_out = out.size();

    while (stream->avail_out > 0) {
        if (stream->avail_in == 0 && !inputEof_) {
            std::size_t n = fillInput();
            stream->next_in = inputBuffer_.data();
            stream->avail_in = n;
        }

        // LZMA_CONCATENATED only reports stream end once told the input is over
        lzma_action action = (stream->avail_in == 0 && inputEof_) ? LZMA_FINISH : LZMA_RUN;
        lzma_ret ret = lzma_code(stream, action);

        if (ret == LZMA_STREAM_END) {
            finished_ = true;
            break;
        }
        if (ret == LZMA_OK) {
            continue;
        }
        if (ret == LZMA_BUF_ERROR) {
            if (inputEof_) {
                throw DecompressionError(truncatedMessage("xz"), context());
            }
            continue;
        }

        throw DecompressionError(
            fmt::format("xz stream corrupt: error {}", static_cast<int>(ret)), context());
    }

    return out.size() - stream->avail_out;
}

// =============================================================================
// ZstdByteSource Implementation
// =============================================================================

ZstdByteSource::ZstdByteSource(std::unique_ptr<std::istream> input, std::string name,
                               std::size_t bufferSize)
    : ByteSource(std::move(input), std::move(name), bufferSize) {
    ZSTD_DStream* dstream = ZSTD_createDStream();
    if (dstream == nullptr) {
        throw DecompressionError("failed to create zstd decoder", context());
    }

    std::size_t ret = ZSTD_initDStream(dstream);
    if (ZSTD_isError(ret) != 0U) {
        ZSTD_freeDStream(dstream);
        throw DecompressionError(
            fmt::format("failed to initialize zstd decoder: {}", ZSTD_getErrorName(ret)),
            context());
    }
    dstream_ = dstream;
}

ZstdByteSource::~ZstdByteSource() {
    if (dstream_ != nullptr) {
        ZSTD_freeDStream(static_cast<ZSTD_DStream*>(dstream_));
        dstream_ = nullptr;
    }
}

std::size_t ZstdByteSource::read(std::span<char> out) {
    if (finished_ || out.empty()) {
        return 0;
    }

    auto* dstream = static_cast<ZSTD_DStream*>(dstream_);
    ZSTD_outBuffer output{out.data(), out.size(), 0};

    while (output.pos < output.size) {
        if (inputPos_ == inputSize_ && !inputEof_) {
            inputSize_ = fillInput();
            inputPos_ = 0;
        }

        const bool inputDrained = inputPos_ == inputSize_ && inputEof_;
        if (inputDrained && frameComplete_) {
            finished_ = true;
            break;
        }

        ZSTD_inBuffer input{inputBuffer_.data(), inputSize_, inputPos_};
        const std::size_t outBefore = output.pos;
        std::size_t ret = ZSTD_decompressStream(dstream, &output, &input);
        inputPos_ = input.pos;

        if (ZSTD_isError(ret) != 0U) {
            throw DecompressionError(
                fmt::format("zstd stream corrupt: {}", ZSTD_getErrorName(ret)), context());
        }

        // 0 means a frame was fully decoded and flushed
        frameComplete_ = (ret == 0);

        if (inputDrained && output.pos == outBefore) {
            if (frameComplete_) {
                finished_ = true;
                break;
            }
            throw DecompressionError(truncatedMessage("zstd"), context());
        }
    }

    return output.pos;
}

// =============================================================================
// Factory Functions
// =============================================================================

namespace {

std::unique_ptr<ByteSource> createSource(std::unique_ptr<std::istream> input,
                                         CompressionFormat format, std::string name,
                                         std::size_t bufferSize) {
    switch (format) {
        case CompressionFormat::kNone:
            return std::make_unique<PlainByteSource>(std::move(input), std::move(name));
        case CompressionFormat::kGzip:
            return std::make_unique<GzipByteSource>(std::move(input), std::move(name),
                                                    bufferSize);
        case CompressionFormat::kBzip2:
            return std::make_unique<Bzip2ByteSource>(std::move(input), std::move(name),
                                                     bufferSize);
        case CompressionFormat::kXz:
            return std::make_unique<XzByteSource>(std::move(input), std::move(name), bufferSize);
        case CompressionFormat::kZstd:
            return std::make_unique<ZstdByteSource>(std::move(input), std::move(name),
                                                    bufferSize);
        default:
            throw DecompressionError(
                fmt::format("unsupported compression format: {}", compressionFormatName(format)),
                ErrorContext{std::move(name)});
    }
}

}  // namespace

std::unique_ptr<ByteSource> openByteSource(const FileHandle& file, ByteOffset startOffset,
                                           std::size_t bufferSize) {
    const std::string name = file.path.string();

    auto stream = std::make_unique<std::ifstream>(file.path, std::ios::binary);
    if (!stream->is_open()) {
        throw ReadError("cannot open file", std::error_code(errno, std::generic_category()),
                        ErrorContext{name});
    }

    std::uint8_t magic[kMagicSniffSize] = {};
    stream->read(reinterpret_cast<char*>(magic), sizeof(magic));
    if (stream->bad()) {
        throw ReadError("cannot read file header", ErrorContext{name});
    }
    const auto sniffed = static_cast<std::size_t>(stream->gcount());

    CompressionFormat format =
        detectCompressionFormat(std::span<const std::uint8_t>(magic, sniffed));

    // An empty file decodes to an empty stream whatever its extension says
    if (format == CompressionFormat::kNone && file.extensionHint != CompressionFormat::kNone &&
        sniffed > 0) {
        throw DecompressionError(
            fmt::format("extension implies {} but content has no {} header",
                        compressionFormatName(file.extensionHint),
                        compressionFormatName(file.extensionHint)),
            ErrorContext{name});
    }

    if (format != file.extensionHint && format != CompressionFormat::kNone) {
        LOGQ_LOG_DEBUG("Content of {} is {} despite its extension", name,
                       compressionFormatName(format));
    }

    if (startOffset != 0 && format != CompressionFormat::kNone) {
        throw ReadError(fmt::format("cannot start {} stream at offset {}",
                                    compressionFormatName(format), startOffset),
                        ErrorContext{name});
    }

    stream->clear();
    stream->seekg(static_cast<std::streamoff>(startOffset), std::ios::beg);
    if (!*stream) {
        throw ReadError(fmt::format("cannot seek to offset {}", startOffset),
                        ErrorContext{name});
    }

    return createSource(std::move(stream), format, name, bufferSize);
}

std::unique_ptr<ByteSource> makeByteSource(std::unique_ptr<std::istream> input,
                                           CompressionFormat format, std::string name,
                                           std::size_t bufferSize) {
    if (!input) {
        throw ReadError("no source stream available", ErrorContext{name});
    }

    if (format == CompressionFormat::kUnknown) {
        std::uint8_t magic[kMagicSniffSize] = {};
        input->read(reinterpret_cast<char*>(magic), sizeof(magic));
        if (input->bad()) {
            throw ReadError("cannot read stream header", ErrorContext{name});
        }
        const auto sniffed = static_cast<std::size_t>(input->gcount());
        format = detectCompressionFormat(std::span<const std::uint8_t>(magic, sniffed));

        input->clear();
        input->seekg(0, std::ios::beg);
        if (!*input) {
            throw ReadError("cannot rewind stream after format detection", ErrorContext{name});
        }
    }

    return createSource(std::move(input), format, std::move(name), bufferSize);
}

}  // namespace logq::io
