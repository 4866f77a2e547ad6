/**
 * @file scanner_test.cpp
 * @brief Tests for the streaming record scanner.
 */

#include <gtest/gtest.h>
#include "csvlint/scanner.h"
#include "test_helpers.h"

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace csvlint;

class ScannerTest : public ::testing::Test {
protected:
    static Dialect lazy() {
        Dialect d = Dialect::csv();
        d.lazy_quotes = true;
        return d;
    }
};

// ============================================================================
// Basic tokenization
// ============================================================================

TEST_F(ScannerTest, SimpleRecords) {
    auto records = scanAll("a,b,c\r\n1,2,3\r\n");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].values, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(records[1].values, (std::vector<std::string>{"1", "2", "3"}));
    EXPECT_EQ(records[0].number, 1u);
    EXPECT_EQ(records[1].number, 2u);
    EXPECT_EQ(records[0].line_ending, LineEnding::CRLF);
    EXPECT_EQ(records[1].line_ending, LineEnding::CRLF);
}

TEST_F(ScannerTest, EmptyInputHasNoRecords) {
    auto records = scanAll("");
    EXPECT_TRUE(records.empty());
}

TEST_F(ScannerTest, LastRecordWithoutTerminator) {
    auto records = scanAll("a,b\r\n1,2");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1].values, (std::vector<std::string>{"1", "2"}));
    EXPECT_EQ(records[1].line_ending, LineEnding::NONE);
}

TEST_F(ScannerTest, EmptyFields) {
    auto records = scanAll("a,,c\r\n,\r\n");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].values, (std::vector<std::string>{"a", "", "c"}));
    EXPECT_EQ(records[1].values, (std::vector<std::string>{"", ""}));
    EXPECT_FALSE(records[1].blank);
}

TEST_F(ScannerTest, TrailingDelimiterAtEndOfInput) {
    auto records = scanAll("a,b,");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].values, (std::vector<std::string>{"a", "b", ""}));
}

TEST_F(ScannerTest, AlternateDelimiters) {
    auto tab = scanAll("a\tb\r\n", Dialect::tsv());
    ASSERT_EQ(tab.size(), 1u);
    EXPECT_EQ(tab[0].values, (std::vector<std::string>{"a", "b"}));

    auto semi = scanAll("a;b,c\r\n", Dialect::semicolon());
    ASSERT_EQ(semi.size(), 1u);
    EXPECT_EQ(semi[0].values, (std::vector<std::string>{"a", "b,c"}));
}

// ============================================================================
// Quoting
// ============================================================================

TEST_F(ScannerTest, QuotedFieldHoldsDelimiterAndLineBreak) {
    auto records = scanAll("\"a,b\",\"x\r\ny\"\r\n");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].values, (std::vector<std::string>{"a,b", "x\r\ny"}));
    EXPECT_TRUE(records[0].fields[0].is_quoted);
    EXPECT_TRUE(records[0].fields[1].is_quoted);
    EXPECT_FALSE(records[0].fields[1].bare_line_break);
    EXPECT_TRUE(records[0].issues.empty());
}

TEST_F(ScannerTest, DoubledQuoteIsCollapsed) {
    auto records = scanAll("\"He said \"\"hi\"\"\"\r\n");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].values[0], "He said \"hi\"");
    EXPECT_FALSE(records[0].malformed);
}

TEST_F(ScannerTest, BareLineBreakInsideQuotesIsFlagged) {
    auto lf = scanAll("\"a\nb\"\r\n");
    ASSERT_EQ(lf.size(), 1u);
    EXPECT_EQ(lf[0].values[0], "a\nb");
    EXPECT_TRUE(lf[0].fields[0].bare_line_break);

    auto cr = scanAll("\"a\rb\"\r\n");
    ASSERT_EQ(cr.size(), 1u);
    EXPECT_EQ(cr[0].values[0], "a\rb");
    EXPECT_TRUE(cr[0].fields[0].bare_line_break);
}

TEST_F(ScannerTest, QuoteAtEndOfInputClosesField) {
    auto records = scanAll("a\r\n\"x\"");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1].values, (std::vector<std::string>{"x"}));
    EXPECT_TRUE(records[1].issues.empty());
    EXPECT_EQ(records[1].line_ending, LineEnding::NONE);
}

TEST_F(ScannerTest, BareQuoteStrict) {
    auto records = scanAll("a,b\r\n1,x\"y\r\n2,3\r\n");
    ASSERT_EQ(records.size(), 3u);

    EXPECT_TRUE(records[1].malformed);
    ASSERT_EQ(records[1].issues.size(), 1u);
    EXPECT_EQ(records[1].issues[0].category, ErrorCategory::QUOTE_ERROR);
    EXPECT_EQ(records[1].issues[0].quote_kind, QuoteErrorKind::BARE_QUOTE);
    EXPECT_EQ(records[1].issues[0].field, 2u);
    EXPECT_EQ(records[1].values, (std::vector<std::string>{"1", "x\"y"}));

    // Scanner resynchronises at the line ending
    EXPECT_FALSE(records[2].malformed);
    EXPECT_EQ(records[2].values, (std::vector<std::string>{"2", "3"}));
}

TEST_F(ScannerTest, BareQuoteMakesLaterQuotesLiteral) {
    auto records = scanAll("x\"y,\"z\"\r\nnext\r\n");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].values, (std::vector<std::string>{"x\"y", "\"z\""}));
    EXPECT_EQ(records[0].issues.size(), 1u);
    EXPECT_EQ(records[1].values, (std::vector<std::string>{"next"}));
}

TEST_F(ScannerTest, BareQuoteLazyIsRecovered) {
    auto records = scanAll("1,x\"y\r\n", lazy());
    ASSERT_EQ(records.size(), 1u);
    EXPECT_TRUE(records[0].issues.empty());
    EXPECT_FALSE(records[0].malformed);
    EXPECT_EQ(records[0].values[1], "x\"y");
    EXPECT_FALSE(records[0].fields[0].recovered);
    EXPECT_TRUE(records[0].fields[1].recovered);
}

TEST_F(ScannerTest, MalformedEscapeStrict) {
    auto records = scanAll("\"abc\"x,d\r\n");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_TRUE(records[0].malformed);
    ASSERT_EQ(records[0].issues.size(), 1u);
    EXPECT_EQ(records[0].issues[0].quote_kind, QuoteErrorKind::MALFORMED_ESCAPE);
    EXPECT_EQ(records[0].issues[0].field, 1u);
    // Bytes after the stray character are dropped up to the delimiter
    EXPECT_EQ(records[0].values, (std::vector<std::string>{"abc", "d"}));
}

TEST_F(ScannerTest, MalformedEscapeLazy) {
    auto records = scanAll("\"abc\"x,d\r\n", lazy());
    ASSERT_EQ(records.size(), 1u);
    EXPECT_TRUE(records[0].issues.empty());
    EXPECT_EQ(records[0].values, (std::vector<std::string>{"abc\"x", "d"}));
    EXPECT_TRUE(records[0].fields[0].recovered);
}

TEST_F(ScannerTest, UnterminatedQuoteConsumesRestOfInput) {
    auto records = scanAll("a,b\r\n1,\"open\r\n2,3\r\n");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1].values, (std::vector<std::string>{"1", "open\r\n2,3\r\n"}));
    ASSERT_EQ(records[1].issues.size(), 1u);
    EXPECT_EQ(records[1].issues[0].quote_kind, QuoteErrorKind::UNTERMINATED_QUOTE);
    EXPECT_FALSE(records[1].issues[0].fatal);
    EXPECT_TRUE(records[1].malformed);
    EXPECT_FALSE(records[1].truncated);
    EXPECT_EQ(records[1].line_ending, LineEnding::NONE);
}

// ============================================================================
// Line endings
// ============================================================================

TEST_F(ScannerTest, MixedLineEndingsRecordedVerbatim) {
    auto records = scanAll("a\nb\rc\r\nd");
    ASSERT_EQ(records.size(), 4u);
    EXPECT_EQ(records[0].line_ending, LineEnding::LF);
    EXPECT_EQ(records[1].line_ending, LineEnding::CR);
    EXPECT_EQ(records[2].line_ending, LineEnding::CRLF);
    EXPECT_EQ(records[3].line_ending, LineEnding::NONE);
    EXPECT_EQ(records[3].values, (std::vector<std::string>{"d"}));
}

TEST_F(ScannerTest, CrLfSplitAcrossReads) {
    const std::string input = "a,b\r\nc,d\r\n\"q\"\r\n";
    for (size_t max_read : {1u, 2u, 3u, 4u}) {
        auto records = scanAll(input, Dialect::csv(), max_read, 4);
        ASSERT_EQ(records.size(), 3u) << "max_read=" << max_read;
        for (const auto& r : records) {
            EXPECT_EQ(r.line_ending, LineEnding::CRLF) << "max_read=" << max_read;
        }
        EXPECT_EQ(records[2].values[0], "q");
    }
}

TEST_F(ScannerTest, BlankLineIsSingleEmptyField) {
    auto records = scanAll("a\r\n\r\nb\r\n");
    ASSERT_EQ(records.size(), 3u);
    EXPECT_TRUE(records[1].blank);
    EXPECT_EQ(records[1].values, (std::vector<std::string>{""}));
    EXPECT_EQ(records[1].number, 2u);
    EXPECT_FALSE(records[0].blank);
    EXPECT_FALSE(records[2].blank);
}

TEST_F(ScannerTest, SkippedBlankLinesAreDropped) {
    auto records = scanAll("a\r\n\r\n\n\rb\r\n\r\n", Dialect::csv(), 0, 64, true);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].values, (std::vector<std::string>{"a"}));
    EXPECT_EQ(records[1].values, (std::vector<std::string>{"b"}));
    EXPECT_EQ(records[1].number, 2u);
    EXPECT_FALSE(records[1].blank);
}

TEST_F(ScannerTest, OnlyBlankLinesWhenSkippedHasNoRecords) {
    auto records = scanAll("\r\n\n\r\n", Dialect::csv(), 1, 4, true);
    EXPECT_TRUE(records.empty());
}

// ============================================================================
// Encoding
// ============================================================================

TEST_F(ScannerTest, Utf8BomIsSkipped) {
    MemorySource source("\xEF\xBB\xBF" "a,b\r\n");
    Scanner scanner(source, Dialect::csv());
    ASSERT_TRUE(scanner.next_record());
    EXPECT_EQ(scanner.record()[0].data, "a");
    EXPECT_EQ(scanner.encoding(), Encoding::UTF8_BOM);
    EXPECT_FALSE(scanner.next_record());
    EXPECT_FALSE(scanner.halted());
}

TEST_F(ScannerTest, Utf16BomIsFatal) {
    const uint8_t data[] = {0xFF, 0xFE, 'a', 0x00, '\r', 0x00, '\n', 0x00};
    MemorySource source(data, sizeof(data));
    Scanner scanner(source, Dialect::csv());
    ASSERT_TRUE(scanner.next_record());
    const Record& rec = scanner.record();
    EXPECT_TRUE(rec.truncated());
    ASSERT_EQ(rec.issues().size(), 1u);
    EXPECT_EQ(rec.issues()[0].category, ErrorCategory::ENCODING_ERROR);
    EXPECT_TRUE(rec.issues()[0].fatal);
    EXPECT_NE(rec.issues()[0].message.find("UTF-16LE"), std::string::npos);
    EXPECT_TRUE(scanner.halted());
    EXPECT_FALSE(scanner.next_record());
}

TEST_F(ScannerTest, InvalidUtf8HaltsScanning) {
    auto records = scanAll("a,b\r\n1,\xFF\r\n5,6\r\n");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_FALSE(records[0].truncated);
    EXPECT_TRUE(records[1].truncated);
    ASSERT_EQ(records[1].issues.size(), 1u);
    EXPECT_EQ(records[1].issues[0].category, ErrorCategory::ENCODING_ERROR);
    EXPECT_EQ(records[1].issues[0].byte_offset, 7u);
    EXPECT_NE(records[1].issues[0].message.find("0xFF"), std::string::npos);
    EXPECT_EQ(records[1].values[0], "1");
}

TEST_F(ScannerTest, TruncatedUtf8AtEndOfInput) {
    auto records = scanAll("a,b\r\n1,\xE6\x9D");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_TRUE(records[1].truncated);
    ASSERT_EQ(records[1].issues.size(), 1u);
    EXPECT_EQ(records[1].issues[0].message, "truncated UTF-8 sequence at end of input");
}

TEST_F(ScannerTest, MultibyteSequenceAcrossReads) {
    auto records = scanAll("city\r\nZ\xC3\xBCrich\r\n\xE6\x9D\xB1\r\n", Dialect::csv(), 1, 4);
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[1].values[0], "Z\xC3\xBCrich");
    EXPECT_EQ(records[2].values[0], "\xE6\x9D\xB1");
    for (const auto& r : records) {
        EXPECT_TRUE(r.issues.empty());
    }
}

// ============================================================================
// Scanner state and iteration
// ============================================================================

TEST_F(ScannerTest, CountersTrackProgress) {
    const std::string input = "a,b\r\n1,2\r\n";
    MemorySource source(input);
    Scanner scanner(source, Dialect::csv());
    EXPECT_EQ(scanner.records_scanned(), 0u);
    EXPECT_FALSE(scanner.finished());

    size_t n = 0;
    for (const auto& record : scanner) {
        ++n;
        EXPECT_EQ(record.record_number(), n);
    }
    EXPECT_EQ(n, 2u);
    EXPECT_EQ(scanner.records_scanned(), 2u);
    EXPECT_EQ(scanner.bytes_consumed(), input.size());
    EXPECT_TRUE(scanner.finished());
    EXPECT_FALSE(scanner.halted());
}

TEST_F(ScannerTest, RecordByteOffsets) {
    MemorySource source("ab,c\r\nd\r\n");
    Scanner scanner(source, Dialect::csv());
    ASSERT_TRUE(scanner.next_record());
    EXPECT_EQ(scanner.record().byte_offset(), 0u);
    ASSERT_TRUE(scanner.next_record());
    EXPECT_EQ(scanner.record().byte_offset(), 6u);
}

TEST_F(ScannerTest, RecordAtThrowsOutOfRange) {
    MemorySource source("a,b\r\n");
    Scanner scanner(source, Dialect::csv());
    ASSERT_TRUE(scanner.next_record());
    EXPECT_EQ(scanner.record().at(1).data, "b");
    EXPECT_THROW(scanner.record().at(2), std::out_of_range);
    EXPECT_EQ(scanner.record().terminator(), std::string_view("\r\n"));
}

TEST_F(ScannerTest, IteratorPostIncrementAndEquality) {
    MemorySource source("a\r\nb\r\nc\r\n");
    Scanner scanner(source, Dialect::csv());
    auto it = scanner.begin();
    EXPECT_EQ(it->record_number(), 1u);
    it++;
    EXPECT_EQ((*it)[0].data, "b");
    ++it;
    ++it;
    EXPECT_TRUE(it == scanner.end());
}

TEST_F(ScannerTest, LongFieldSpansManyChunks) {
    std::string big(10000, 'x');
    auto records = scanAll("h\r\n" + big + "\r\n\"" + big + "\"\r\n", Dialect::csv(), 7, 16);
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[1].values[0], big);
    EXPECT_EQ(records[2].values[0], big);
}
