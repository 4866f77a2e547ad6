#include <gtest/gtest.h>
#include "csvlint/report.h"
#include "test_helpers.h"

#include <sstream>
#include <string>

using namespace csvlint;

class ReportTest : public ::testing::Test {
protected:
    static std::string render(const ValidationResult& result,
                              const ReportOptions& options = ReportOptions()) {
        std::ostringstream out;
        write_report(out, result, options);
        return out.str();
    }
};

TEST_F(ReportTest, ValidFile) {
    auto result = validateString("a,b\r\n1,2\r\n");
    EXPECT_EQ(render(result), "file is valid\n");
    EXPECT_EQ(exit_code(result), 0);
}

TEST_F(ReportTest, ValidFileStrict) {
    auto result = validateString("a,b\r\n1,2\r\n", Dialect::rfc4180());
    ReportOptions opts;
    opts.rfc4180 = true;
    EXPECT_EQ(render(result, opts), "file is valid and complies with RFC 4180\n");
}

TEST_F(ReportTest, ErrorsWithCategoryCounts) {
    auto result = validateString("a,b,c\r\n1,2\r\n4,5,6\n7,x\"y,9\r\n", Dialect::rfc4180());
    EXPECT_EQ(exit_code(result), 2);

    std::string expected =
        "Found 3 validation error(s):\n"
        "  - 1 field count error(s)\n"
        "  - 1 line ending error(s) (RFC 4180 requires CRLF)\n"
        "  - 1 quote/escaping error(s)\n"
        "\n"
        "Record #2 has error: wrong number of fields: expected 3, found 2\n"
        "  Context: 1,2\n"
        "Record #3 has error: invalid line ending LF (RFC 4180 requires CRLF)\n"
        "Record #4 has error: bare \" in non-quoted field\n";
    EXPECT_EQ(render(result), expected);
}

TEST_F(ReportTest, ContextCanBeHidden) {
    auto result = validateString("a,b,c\r\n1,2\r\n");
    ReportOptions opts;
    opts.show_context = false;
    std::string out = render(result, opts);
    EXPECT_EQ(out.find("Context:"), std::string::npos);
    EXPECT_NE(out.find("Record #2 has error"), std::string::npos);
}

TEST_F(ReportTest, FatalAbort) {
    auto result = validateString("a,b\r\n1,\xFF\r\n");
    EXPECT_EQ(exit_code(result), 1);
    std::string out = render(result);
    EXPECT_NE(out.find("Found 1 validation error(s):"), std::string::npos);
    EXPECT_NE(out.find("  - 1 other error(s)"), std::string::npos);
    EXPECT_NE(out.find("Record #2 has error: invalid UTF-8 byte 0xFF"), std::string::npos);
    EXPECT_NE(out.find("\nunable to parse any further\n"), std::string::npos);
}

TEST_F(ReportTest, ErrorLimitNote) {
    ValidationOptions opts;
    opts.max_errors = 1;
    auto result = validateString("a,b\r\n1\r\n2\r\n", Dialect::csv(), opts);
    EXPECT_EQ(exit_code(result), 2);
    std::string out = render(result);
    EXPECT_NE(out.find("stopped after 1 error(s)"), std::string::npos);
    EXPECT_EQ(out.find("unable to parse any further"), std::string::npos);
}
