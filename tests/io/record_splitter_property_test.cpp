// =============================================================================
// logq - Record Splitter Property Tests
// =============================================================================
// Records come out whole and in order whatever the chunk size, including when
// a multi-byte delimiter straddles two chunks, and a file split into byte
// ranges yields exactly the records of the whole file.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "logq/io/byte_source.h"
#include "logq/io/record_splitter.h"

namespace logq::io::test {

// =============================================================================
// Test Utilities
// =============================================================================

using Records = std::vector<std::pair<std::string, ByteOffset>>;

std::unique_ptr<ByteSource> sourceOf(const std::string& text) {
    return std::make_unique<PlainByteSource>(std::make_unique<std::istringstream>(text), "test");
}

/// @brief Split text and collect (record, offset) pairs.
Records split(const std::string& text, SplitterOptions options, ByteOffset startOffset = 0) {
    auto source = sourceOf(text);
    RecordSplitter splitter(*source, std::move(options), startOffset);
    Records records;
    while (auto record = splitter.next()) {
        records.emplace_back(std::string(record->bytes), record->offset);
    }
    return records;
}

/// @brief Join records with a delimiter and compute the expected non-empty output.
std::pair<std::string, Records> layout(const std::vector<std::string>& records,
                                       const std::string& delimiter, bool trailing) {
    std::string text;
    Records expected;
    for (std::size_t i = 0; i < records.size(); ++i) {
        if (!records[i].empty()) {
            expected.emplace_back(records[i], text.size());
        }
        text += records[i];
        if (i + 1 < records.size() || trailing) {
            text += delimiter;
        }
    }
    return {text, expected};
}

/// @brief Split text as consecutive byte ranges the way range tasks do.
Records splitInRanges(const std::string& text, const std::vector<std::size_t>& cuts,
                      const std::string& delimiter, std::size_t chunkSize) {
    Records all;
    std::vector<std::uint64_t> bounds = {0};
    bounds.insert(bounds.end(), cuts.begin(), cuts.end());

    for (std::size_t i = 0; i < bounds.size(); ++i) {
        const std::uint64_t begin = bounds[i];
        const std::uint64_t end = i + 1 < bounds.size() ? bounds[i + 1] : kEndOfStream;
        const std::uint64_t open =
            begin == 0 ? 0 : (begin >= delimiter.size() ? begin - delimiter.size() : 0);

        SplitterOptions options;
        options.delimiter = delimiter;
        options.chunkSize = chunkSize;
        options.range = ByteRange{begin, end};
        auto part = split(text.substr(open), std::move(options), open);
        all.insert(all.end(), part.begin(), part.end());
    }
    return all;
}

// =============================================================================
// RapidCheck Generators
// =============================================================================

namespace gen {

/// @brief Record text that never contains the delimiter characters.
rc::Gen<std::string> recordText() {
    return rc::gen::mapcat(rc::gen::inRange<std::size_t>(0, 40), [](std::size_t length) {
        return rc::gen::container<std::string>(
            length, rc::gen::element('a', 'b', 'c', 'E', 'O', ' ', '|'));
    });
}

rc::Gen<std::vector<std::string>> recordList() {
    return rc::gen::mapcat(rc::gen::inRange<std::size_t>(0, 60), [](std::size_t count) {
        return rc::gen::container<std::vector<std::string>>(count, recordText());
    });
}

}  // namespace gen

// =============================================================================
// Properties
// =============================================================================

RC_GTEST_PROP(RecordSplitterProperty, NewlineRecordsSurviveAnyChunkSize, ()) {
    const auto records = *gen::recordList();
    const bool trailing = *rc::gen::arbitrary<bool>();
    const auto chunkSize = *rc::gen::inRange<std::size_t>(kMinChunkSize, 80);

    auto [text, expected] = layout(records, "\n", trailing);

    SplitterOptions options;
    options.chunkSize = chunkSize;
    RC_ASSERT(split(text, std::move(options)) == expected);
}

RC_GTEST_PROP(RecordSplitterProperty, MultiByteDelimiterAcrossChunks, ()) {
    const std::string delimiter = "<EOR>";
    const auto records = *gen::recordList();
    const bool trailing = *rc::gen::arbitrary<bool>();
    const auto chunkSize = *rc::gen::inRange<std::size_t>(kMinChunkSize, 40);

    auto [text, expected] = layout(records, delimiter, trailing);

    SplitterOptions options;
    options.delimiter = delimiter;
    options.chunkSize = chunkSize;
    RC_ASSERT(split(text, std::move(options)) == expected);
}

RC_GTEST_PROP(RecordSplitterProperty, ByteRangesPartitionTheRecords, ()) {
    const std::string delimiter = *rc::gen::element(std::string("\n"), std::string("<EOR>"));
    const auto records = *gen::recordList();
    const bool trailing = *rc::gen::arbitrary<bool>();
    const auto chunkSize = *rc::gen::inRange<std::size_t>(kMinChunkSize, 64);

    auto [text, expected] = layout(records, delimiter, trailing);
    RC_PRE(text.size() >= 2);

    const auto cutCount = *rc::gen::inRange<std::size_t>(0, 6);
    auto cuts = *rc::gen::container<std::vector<std::size_t>>(
        cutCount, rc::gen::inRange<std::size_t>(1, text.size()));
    std::sort(cuts.begin(), cuts.end());
    cuts.erase(std::unique(cuts.begin(), cuts.end()), cuts.end());

    RC_ASSERT(splitInRanges(text, cuts, delimiter, chunkSize) == expected);
}

// =============================================================================
// Edge Cases
// =============================================================================

TEST(RecordSplitterTest, TrimsCarriageReturnBeforeNewline) {
    SplitterOptions options;
    auto records = split("a\r\nb\r\n", options);

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].first, "a");
    EXPECT_EQ(records[1].first, "b");
    EXPECT_EQ(records[1].second, 3u);

    options.trimCarriageReturn = false;
    EXPECT_EQ(split("a\r\n", options)[0].first, "a\r");
}

TEST(RecordSplitterTest, KeepsEmptyRecordsWhenAsked) {
    SplitterOptions options;
    options.keepEmptyRecords = true;
    auto records = split("a\n\nb\n", options);

    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[1].first, "");
    EXPECT_EQ(records[1].second, 2u);
}

TEST(RecordSplitterTest, SkipsEmptyRecordsByDefault) {
    auto records = split("\n\na\n\n", SplitterOptions{});
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0], (std::pair<std::string, ByteOffset>{"a", 2}));
}

TEST(RecordSplitterTest, FinalRecordWithoutDelimiter) {
    auto records = split("first\nlast", SplitterOptions{});
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1].first, "last");
}

TEST(RecordSplitterTest, RecordLongerThanChunk) {
    const std::string longRecord(1000, 'x');
    SplitterOptions options;
    options.chunkSize = kMinChunkSize;
    auto records = split(longRecord + "\nshort\n", options);

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].first, longRecord);
    EXPECT_EQ(records[1].second, 1001u);
}

TEST(RecordSplitterTest, StopsWhenCancelled) {
    std::string text;
    for (int i = 0; i < 1000; ++i) {
        text += "record\n";
    }

    SplitterOptions options;
    options.chunkSize = kMinChunkSize;
    int polls = 0;
    options.shouldStop = [&polls] { return ++polls > 3; };

    auto source = sourceOf(text);
    RecordSplitter splitter(*source, std::move(options));
    std::uint64_t seen = splitter.forEach([](const RawRecord&) { return true; });

    EXPECT_TRUE(splitter.cancelled());
    EXPECT_LT(seen, 1000u);
}

TEST(RecordSplitterTest, EmptyDelimiterIsConfigError) {
    auto source = sourceOf("abc");
    SplitterOptions options;
    options.delimiter.clear();
    EXPECT_THROW({ RecordSplitter splitter(*source, std::move(options)); }, ConfigError);
}

TEST(RecordSplitterTest, SelfOverlappingDelimiters) {
    EXPECT_FALSE(RecordSplitter::isSelfOverlapping("\n"));
    EXPECT_FALSE(RecordSplitter::isSelfOverlapping("\r\n"));
    EXPECT_FALSE(RecordSplitter::isSelfOverlapping("<EOR>"));
    EXPECT_TRUE(RecordSplitter::isSelfOverlapping("||"));
    EXPECT_TRUE(RecordSplitter::isSelfOverlapping("abab"));
}

}  // namespace logq::io::test
