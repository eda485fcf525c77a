// PGLite: PostgreSQL in WebAssembly, hosted on Fizzy
// Copyright 2024 The PGLite Authors.
// SPDX-License-Identifier: Apache-2.0

#include "pglite.hpp"
#include "statements.hpp"
#include <gmock/gmock.h>
#include <sstream>

using namespace pglite;
using namespace pglite::cli;
using testing::ElementsAre;

namespace
{
std::vector<std::string> read_all(std::string_view input)
{
    std::istringstream in{std::string{input}};
    std::vector<std::string> statements;
    while (const auto statement = read_statement(in))
        statements.push_back(*statement);
    return statements;
}
}  // namespace

TEST(statements, terminated)
{
    EXPECT_THAT(read_all("SELECT 1;SELECT 2;"), ElementsAre("SELECT 1;", "SELECT 2;"));
    EXPECT_THAT(read_all("SELECT 1;\nSELECT\n  2;\n"), ElementsAre("SELECT 1;", "\nSELECT\n  2;"));
}

TEST(statements, remainder_at_end_of_input)
{
    EXPECT_THAT(read_all("SELECT 1;\nSELECT 2"), ElementsAre("SELECT 1;", "\nSELECT 2"));
    EXPECT_THAT(read_all("SELECT 1;\n  \n"), ElementsAre("SELECT 1;"));
}

TEST(statements, empty_input)
{
    EXPECT_THAT(read_all(""), ElementsAre());
    EXPECT_THAT(read_all(" \n\t"), ElementsAre());
    EXPECT_THAT(read_all(";"), ElementsAre(";"));
}

TEST(statements, default_queries)
{
    const auto queries = split_queries(default_queries);
    ASSERT_EQ(queries.size(), 6);
    EXPECT_EQ(queries[0], "SHOW client_encoding;");
    EXPECT_EQ(queries[3], "SELECT test_func();");
    EXPECT_EQ(queries[5], "SELECT addition(40,2);");
}
