#include "lx/common/config.hpp"

#include <cstdio>
#include <fstream>
#include <string>

#include <unistd.h>

#include <gtest/gtest.h>

#include "lx/common/diagnostics.h"
#include "lx/common/utils.hpp"

using namespace lx;

class config : public testing::Test {
    void SetUp() override {
        lx_diag_init(LxColor_Never);
    }
};

TEST_F(config, basic) {
    Config conf;
    ASSERT_TRUE(parseConfig(conf, "a = 1\nb=two\n", "test.conf"));

    EXPECT_EQ(conf.size(), 2u);
    EXPECT_EQ(conf["a"], "1");
    EXPECT_EQ(conf["b"], "two");
}

TEST_F(config, comments_and_blank_lines) {
    Config conf;
    ASSERT_TRUE(parseConfig(conf, "# comment\n\n   \nkeywords = true\r\n# other = x\n", "test.conf"));

    EXPECT_EQ(conf.size(), 1u);
    EXPECT_EQ(conf["keywords"], "true");
}

TEST_F(config, last_value_wins) {
    Config conf;
    ASSERT_TRUE(parseConfig(conf, "a = 1\na = 2", "test.conf"));

    EXPECT_EQ(conf["a"], "2");
}

TEST_F(config, empty) {
    Config conf;
    EXPECT_TRUE(parseConfig(conf, "", "test.conf"));
    EXPECT_TRUE(conf.empty());
}

TEST_F(config, syntax_error) {
    Config conf;
    EXPECT_FALSE(parseConfig(conf, "a = 1\nbroken\n", "test.conf"));
    EXPECT_FALSE(parseConfig(conf, "= 1\n", "test.conf"));
    EXPECT_FALSE(parseConfig(conf, "a =\n", "test.conf"));
}

TEST_F(config, line_too_long) {
    Config conf;
    std::string const src = "a = " + std::string(5000, 'x');
    EXPECT_FALSE(parseConfig(conf, src, "test.conf"));
}

TEST_F(config, read_file) {
    char path[] = "/tmp/lx_config_testXXXXXX";
    int const fd = mkstemp(path);
    ASSERT_NE(fd, -1);
    close(fd);
    defer {
        std::remove(path);
    };

    {
        std::ofstream out{path};
        out << "comments = true\nfloat_literals = false\n";
    }

    Config conf;
    ASSERT_TRUE(readConfig(conf, path));
    EXPECT_EQ(conf["comments"], "true");
    EXPECT_EQ(conf["float_literals"], "false");
}

TEST_F(config, read_missing_file) {
    Config conf;
    EXPECT_FALSE(readConfig(conf, "/nonexistent/lx.conf"));
}
