#include "lx/common/string.hpp"

#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "lx/common/utils.hpp"

using namespace lx;

TEST(string, trim) {
    EXPECT_EQ(trim("  abc \t"), "abc");
    EXPECT_EQ(trim("abc\r"), "abc");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim(""), "");
    EXPECT_EQ(trimLeft(" a "), "a ");
    EXPECT_EQ(trimRight(" a "), " a");
}

TEST(string, chop_by_delim) {
    std::string_view str = "a=b=c";
    EXPECT_EQ(chopByDelim(str, '='), "a");
    EXPECT_EQ(str, "b=c");
    EXPECT_EQ(chopByDelim(str, '='), "b");
    EXPECT_EQ(chopByDelim(str, '='), "c");
    EXPECT_TRUE(str.empty());
    EXPECT_EQ(chopByDelim(str, '='), "");
}

TEST(string, escape) {
    EXPECT_EQ(escaped("plain"), "plain");
    EXPECT_EQ(escaped("a\nb\t\"\\"), "a\\nb\\t\\\"\\\\");
    EXPECT_EQ(escaped(std::string_view("\0", 1)), "\\0");
    EXPECT_EQ(escaped("\xe2\x82\xac"), "\\xe2\\x82\\xac");

    std::string out = "x";
    EXPECT_EQ(escape(out, "\r"), 2u);
    EXPECT_EQ(out, "x\\r");
}

TEST(string, format) {
    EXPECT_EQ(string_format("%s=%i", "a", 42), "a=42");
    EXPECT_EQ(string_format("%s", ""), "");
    EXPECT_EQ(string_format("%zu:%zu", (size_t)1, (size_t)12), "1:12");
}
