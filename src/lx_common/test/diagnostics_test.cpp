#include "lx/common/diagnostics.h"

#include <string>

#include <gtest/gtest.h>

TEST(diagnostics, quote) {
    EXPECT_EQ(
        lx_diag_formatQuote("a = 1\nb @ c\n", 2, 3, 1, false),
        "    2 |b @ c\n"
        "      |  ^\n");
}

TEST(diagnostics, quote_len) {
    EXPECT_EQ(
        lx_diag_formatQuote("let abc = 1;", 1, 5, 3, false),
        "    1 |let abc = 1;\n"
        "      |    ^~~\n");
}

TEST(diagnostics, quote_no_col) {
    EXPECT_EQ(lx_diag_formatQuote("first\nsecond", 2, 0, 0, false), "    2 |second\n");
}

TEST(diagnostics, quote_escapes) {
    EXPECT_EQ(
        lx_diag_formatQuote("\tx\x01y", 1, 3, 1, false),
        "    1 |\\tx\\x01y\n"
        "      |   ^~~~\n");
}

TEST(diagnostics, quote_crlf) {
    EXPECT_EQ(
        lx_diag_formatQuote("a\r\n@\r\n", 2, 1, 1, false),
        "    2 |@\n"
        "      |^\n");
}

TEST(diagnostics, quote_empty_line) {
    EXPECT_EQ(lx_diag_formatQuote("a\n\nb", 2, 1, 1, false), "");
    EXPECT_EQ(lx_diag_formatQuote("a", 5, 1, 1, false), "");
}

TEST(diagnostics, quote_long_line) {
    std::string const src = std::string(200, 'a') + "@";
    std::string const quote = lx_diag_formatQuote(src, 1, 201, 1, false);

    std::string const expected_line = "    1 |" + std::string(59, 'a') + "@\n";
    std::string const expected_pointer = "      |" + std::string(59, ' ') + "^\n";
    EXPECT_EQ(quote, expected_line + expected_pointer);
}

TEST(diagnostics, quote_color) {
    EXPECT_EQ(
        lx_diag_formatQuote("@", 1, 1, 1, true),
        "    1 |\x1b[1;31m@\x1b[0m\n"
        "      |\x1b[1;31m^\x1b[0m\n");
}
