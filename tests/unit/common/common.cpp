/**
 * @file
 * @brief Tests of the common utility functions
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

#include <common/common.hpp>
#include <common/error.hpp>

using namespace resprint;

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

class FileRead : public ::testing::Test {
protected:
    std::string path = ::testing::TempDir() + "resprint_common_file.txt";

    void TearDown() override
    {
        std::remove(path.c_str());
    }

    void write(const std::string &content)
    {
        std::ofstream file {path, std::ios::out | std::ios::binary};
        file << content;
    }
};

TEST_F(FileRead, Content)
{
    write("{{.kind}}\nline two\n");
    EXPECT_EQ(read_file(path), "{{.kind}}\nline two\n");
}

TEST_F(FileRead, EmptyFile)
{
    write("");
    EXPECT_EQ(read_file(path), "");
}

TEST_F(FileRead, MissingFile)
{
    try {
        read_file(path);
        FAIL() << "Exception expected";
    } catch (const FileReadError &ex) {
        EXPECT_NE(std::string(ex.what()).find(path), std::string::npos);
    }
}

TEST_F(FileRead, Directory)
{
    const std::string dir = ::testing::TempDir();

    EXPECT_THROW(read_file(dir), FileReadError);
    EXPECT_THROW(open_file(dir), FileReadError);
}

TEST_F(FileRead, OpenRegularFile)
{
    write("[]");

    std::ifstream file = open_file(path);
    std::string content;
    file >> content;
    EXPECT_EQ(content, "[]");
}

TEST(String, Split)
{
    EXPECT_EQ(string_split("a\tb\t", "\t"), (std::vector<std::string> {"a", "b", ""}));
    EXPECT_EQ(string_split("a=b=c", "=", 2), (std::vector<std::string> {"a", "b=c"}));
    EXPECT_EQ(string_split("abc", ","), (std::vector<std::string> {"abc"}));
}

TEST(String, Join)
{
    EXPECT_EQ(string_join({}, ","), "");
    EXPECT_EQ(string_join({"nginx", "redis"}, ","), "nginx,redis");
}

TEST(String, Trim)
{
    std::string left = "  \tvalue ";
    std::string right = " value \n";

    string_ltrim(left);
    string_rtrim(right);
    EXPECT_EQ(left, "value ");
    EXPECT_EQ(right, " value");
}

TEST(String, Utf8Length)
{
    EXPECT_EQ(utf8_length(""), 0U);
    EXPECT_EQ(utf8_length("name"), 4U);
    EXPECT_EQ(utf8_length("\xc5\xbeluv"), 4U);
}
