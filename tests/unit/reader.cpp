/**
 * @file
 * @brief Tests of the reader of resource documents
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <gtest/gtest.h>

#include <sstream>

#include <common/error.hpp>
#include <reader.hpp>

using namespace resprint;

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

TEST(Reader, SingleDocument)
{
    std::istringstream input {R"({"kind": "Minion", "apiVersion": "v1beta1", "id": "node-a"})"};

    const auto objects = read_objects(input, "input");
    ASSERT_EQ(objects.size(), 1U);
    EXPECT_STREQ(objects[0]->kind(), "Minion");
}

TEST(Reader, ArrayOfDocuments)
{
    std::istringstream input {R"([
        {"kind": "Service", "apiVersion": "v1beta1", "id": "frontend", "port": 80},
        {"kind": "Pod", "apiVersion": "v1beta3", "metadata": {"name": "web-1"}}
    ])"};

    const auto objects = read_objects(input, "input");
    ASSERT_EQ(objects.size(), 2U);
    EXPECT_STREQ(objects[0]->kind(), "Service");
    EXPECT_STREQ(objects[1]->kind(), "Pod");
}

TEST(Reader, InvalidJson)
{
    std::istringstream input {"{\"kind\": "};

    EXPECT_THROW(read_objects(input, "input"), DecodingError);
}

TEST(Reader, InvalidDocumentNamesPosition)
{
    std::istringstream input {R"([{"kind": "Minion", "apiVersion": "v1beta1"}, {"kind": "Minion"}])"};

    try {
        read_objects(input, "data.json");
        FAIL() << "Exception expected";
    } catch (const DecodingError &ex) {
        EXPECT_NE(std::string(ex.what()).find("data.json: document #2"), std::string::npos);
    }
}
