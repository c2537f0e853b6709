// =============================================================================
// logq - Byte Source Tests
// =============================================================================
// Decoding of plain and compressed files, format detection and the failure
// modes a log directory produces in practice: truncated archives, files whose
// extension lies about their content, concatenated gzip members.
// =============================================================================

#include "logq/io/byte_source.h"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "../test_util.h"

namespace logq::io {
namespace {

using test::TempDir;

FileHandle handleFor(const std::filesystem::path& path) {
    FileHandle handle;
    handle.path = path;
    handle.size = std::filesystem::file_size(path);
    handle.extensionHint = detectCompressionFormatFromExtension(path);
    return handle;
}

/// @brief Drain a source using reads of at most chunk bytes.
std::string readAll(ByteSource& source, std::size_t chunk = 7) {
    std::string out;
    std::vector<char> buffer(chunk);
    while (true) {
        const std::size_t n = source.read(std::span<char>(buffer));
        if (n == 0) {
            break;
        }
        out.append(buffer.data(), n);
    }
    return out;
}

std::string sampleLog(int lines = 200) {
    std::string text;
    for (int i = 0; i < lines; ++i) {
        text += "2024-01-01T00:00:" + std::to_string(i % 60) + "Z|INFO|request " +
                std::to_string(i) + "\n";
    }
    return text;
}

// =============================================================================
// Format Detection
// =============================================================================

TEST(CompressionDetectionTest, DetectsMagicBytes) {
    auto detect = [](const std::string& data) {
        return detectCompressionFormat(std::span<const std::uint8_t>(
            reinterpret_cast<const std::uint8_t*>(data.data()), data.size()));
    };

    EXPECT_EQ(detect(test::gzipCompress("x")), CompressionFormat::kGzip);
    EXPECT_EQ(detect(test::bzip2Compress("x")), CompressionFormat::kBzip2);
    EXPECT_EQ(detect(test::xzCompress("x")), CompressionFormat::kXz);
    EXPECT_EQ(detect(test::zstdCompress("x")), CompressionFormat::kZstd);
    EXPECT_EQ(detect("plain text"), CompressionFormat::kNone);
    EXPECT_EQ(detect(""), CompressionFormat::kNone);
}

TEST(CompressionDetectionTest, DetectsExtensions) {
    EXPECT_EQ(detectCompressionFormatFromExtension("a/app.log.gz"), CompressionFormat::kGzip);
    EXPECT_EQ(detectCompressionFormatFromExtension("app.LOG.GZ"), CompressionFormat::kGzip);
    EXPECT_EQ(detectCompressionFormatFromExtension("app.bz2"), CompressionFormat::kBzip2);
    EXPECT_EQ(detectCompressionFormatFromExtension("app.xz"), CompressionFormat::kXz);
    EXPECT_EQ(detectCompressionFormatFromExtension("app.zst"), CompressionFormat::kZstd);
    EXPECT_EQ(detectCompressionFormatFromExtension("app.log"), CompressionFormat::kNone);
}

// =============================================================================
// Decoding
// =============================================================================

TEST(ByteSourceTest, DecodesPlainFile) {
    TempDir dir;
    const std::string text = sampleLog();
    auto source = openByteSource(handleFor(dir.write("app.log", text)));

    EXPECT_EQ(source->format(), CompressionFormat::kNone);
    EXPECT_EQ(readAll(*source), text);
    EXPECT_EQ(source->rawBytesRead(), text.size());
}

TEST(ByteSourceTest, DecodesEveryCodec) {
    TempDir dir;
    const std::string text = sampleLog(1000);

    struct Case {
        const char* name;
        std::string bytes;
        CompressionFormat format;
    };
    const std::vector<Case> cases = {
        {"app.log.gz", test::gzipCompress(text), CompressionFormat::kGzip},
        {"app.log.bz2", test::bzip2Compress(text), CompressionFormat::kBzip2},
        {"app.log.xz", test::xzCompress(text), CompressionFormat::kXz},
        {"app.log.zst", test::zstdCompress(text), CompressionFormat::kZstd},
    };

    for (const auto& c : cases) {
        SCOPED_TRACE(c.name);
        auto source = openByteSource(handleFor(dir.write(c.name, c.bytes)), 0, 64);
        EXPECT_EQ(source->format(), c.format);
        EXPECT_EQ(readAll(*source, 100), text);
        EXPECT_EQ(source->rawBytesRead(), c.bytes.size());
    }
}

TEST(ByteSourceTest, DecodesConcatenatedGzipMembers) {
    TempDir dir;
    const std::string first = "a|1\nb|2\n";
    const std::string second = "c|3\n";
    const auto path =
        dir.write("rotated.gz", test::gzipCompress(first) + test::gzipCompress(second));

    auto source = openByteSource(handleFor(path));
    EXPECT_EQ(readAll(*source), first + second);
}

TEST(ByteSourceTest, DecodesCompressedContentUnderPlainName) {
    TempDir dir;
    const std::string text = sampleLog(10);
    auto source = openByteSource(handleFor(dir.write("app.log", test::gzipCompress(text))));

    EXPECT_EQ(source->format(), CompressionFormat::kGzip);
    EXPECT_EQ(readAll(*source), text);
}

TEST(ByteSourceTest, PlainSourceStartsAtOffset) {
    TempDir dir;
    auto source = openByteSource(handleFor(dir.write("app.log", "0123456789")), 4);
    EXPECT_EQ(readAll(*source), "456789");
}

TEST(ByteSourceTest, MakeByteSourceDetectsStreamFormat) {
    const std::string text = sampleLog(20);
    auto source = makeByteSource(std::make_unique<std::istringstream>(test::zstdCompress(text)));

    EXPECT_EQ(source->format(), CompressionFormat::kZstd);
    EXPECT_EQ(readAll(*source), text);
}

// =============================================================================
// Failures
// =============================================================================

TEST(ByteSourceTest, TruncatedGzipThrowsDecompressionError) {
    TempDir dir;
    const std::string full = test::gzipCompress(sampleLog(500));
    const auto path = dir.write("cut.gz", full.substr(0, full.size() / 2));

    auto source = openByteSource(handleFor(path));
    EXPECT_THROW((void)readAll(*source, 4096), DecompressionError);
}

TEST(ByteSourceTest, TruncatedXzThrowsDecompressionError) {
    TempDir dir;
    const std::string full = test::xzCompress(sampleLog(500));
    const auto path = dir.write("cut.xz", full.substr(0, full.size() / 2));

    auto source = openByteSource(handleFor(path));
    EXPECT_THROW((void)readAll(*source, 4096), DecompressionError);
}

TEST(CompressionDetectionTest, SupportedFormatsRoundTripThroughExtensions) {
    const auto formats = supportedCompressionFormats();
    ASSERT_EQ(formats.size(), 5u);
    EXPECT_EQ(formats.front(), CompressionFormat::kNone);
    EXPECT_EQ(compressionFormatExtension(CompressionFormat::kNone), "");

    for (auto format : formats) {
        if (format == CompressionFormat::kNone) {
            continue;
        }
        SCOPED_TRACE(std::string(compressionFormatName(format)));
        const std::string name = "app.log" + std::string(compressionFormatExtension(format));
        EXPECT_EQ(detectCompressionFormatFromExtension(name), format);
    }
}

TEST(ByteSourceTest, ExtensionWithoutMagicThrowsDecompressionError) {
    TempDir dir;
    const auto path = dir.write("liar.gz", "this is not gzip\n");
    EXPECT_THROW((void)openByteSource(handleFor(path)), DecompressionError);
}

TEST(ByteSourceTest, EmptyCompressedNameIsEmptyStream) {
    TempDir dir;
    auto source = openByteSource(handleFor(dir.write("empty.gz", "")));
    EXPECT_EQ(readAll(*source), "");
}

TEST(ByteSourceTest, OffsetIntoCompressedStreamIsReadError) {
    TempDir dir;
    const auto path = dir.write("app.gz", test::gzipCompress(sampleLog(10)));
    EXPECT_THROW((void)openByteSource(handleFor(path), 10), ReadError);
}

TEST(ByteSourceTest, MissingFileIsReadError) {
    FileHandle handle;
    handle.path = "/nonexistent/logq/app.log";
    EXPECT_THROW((void)openByteSource(handle), ReadError);
}

}  // namespace
}  // namespace logq::io
