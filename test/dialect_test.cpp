#include <gtest/gtest.h>
#include "csvlint/dialect.h"

#include <string>

using namespace csvlint;

class DialectTest : public ::testing::Test {};

TEST_F(DialectTest, Factories) {
    EXPECT_EQ(Dialect::csv().delimiter, ',');
    EXPECT_EQ(Dialect::tsv().delimiter, '\t');
    EXPECT_EQ(Dialect::pipe().delimiter, '|');
    EXPECT_EQ(Dialect::colon().delimiter, ':');
    EXPECT_EQ(Dialect::semicolon().delimiter, ';');

    Dialect strict = Dialect::rfc4180();
    EXPECT_EQ(strict.delimiter, ',');
    EXPECT_TRUE(strict.strict_rfc4180);
    EXPECT_FALSE(strict.lazy_quotes);
}

TEST_F(DialectTest, DefaultIsCsv) {
    Dialect d;
    EXPECT_EQ(d, Dialect::csv());
    EXPECT_NE(d, Dialect::rfc4180());
}

TEST_F(DialectTest, ToString) {
    EXPECT_EQ(Dialect::csv().to_string(),
              "Dialect{delimiter=comma, lazy_quotes=false, rfc4180=false}");
    Dialect d = Dialect::tsv();
    d.lazy_quotes = true;
    EXPECT_EQ(d.to_string(), "Dialect{delimiter=tab, lazy_quotes=true, rfc4180=false}");
}

TEST_F(DialectTest, ParseDelimiterByCharacter) {
    EXPECT_EQ(parse_delimiter(","), ',');
    EXPECT_EQ(parse_delimiter("\t"), '\t');
    EXPECT_EQ(parse_delimiter("\\t"), '\t');
    EXPECT_EQ(parse_delimiter("|"), '|');
    EXPECT_EQ(parse_delimiter(":"), ':');
    EXPECT_EQ(parse_delimiter(";"), ';');
}

TEST_F(DialectTest, ParseDelimiterByName) {
    EXPECT_EQ(parse_delimiter("comma"), ',');
    EXPECT_EQ(parse_delimiter("tab"), '\t');
    EXPECT_EQ(parse_delimiter("pipe"), '|');
    EXPECT_EQ(parse_delimiter("colon"), ':');
    EXPECT_EQ(parse_delimiter("semicolon"), ';');
}

TEST_F(DialectTest, ParseDelimiterRejectsOthers) {
    EXPECT_FALSE(parse_delimiter("").has_value());
    EXPECT_FALSE(parse_delimiter("x").has_value());
    EXPECT_FALSE(parse_delimiter(",,").has_value());
    EXPECT_FALSE(parse_delimiter("\"").has_value());
    EXPECT_FALSE(parse_delimiter("space").has_value());
    EXPECT_FALSE(parse_delimiter("Comma").has_value());
}

TEST_F(DialectTest, DelimiterNames) {
    EXPECT_EQ(delimiter_name(','), "comma");
    EXPECT_EQ(delimiter_name('\t'), "tab");
    EXPECT_EQ(delimiter_name(';'), "semicolon");
    EXPECT_EQ(delimiter_name('#'), "#");
}

TEST_F(DialectTest, LineEndings) {
    EXPECT_EQ(line_ending_bytes(LineEnding::CRLF), std::string_view("\r\n"));
    EXPECT_EQ(line_ending_bytes(LineEnding::LF), std::string_view("\n"));
    EXPECT_EQ(line_ending_bytes(LineEnding::CR), std::string_view("\r"));
    EXPECT_TRUE(line_ending_bytes(LineEnding::NONE).empty());
    EXPECT_STREQ(line_ending_to_string(LineEnding::CRLF), "CRLF");
    EXPECT_STREQ(line_ending_to_string(LineEnding::NONE), "none");
}
