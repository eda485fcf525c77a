// PGLite: PostgreSQL in WebAssembly, hosted on Fizzy
// Copyright 2024 The PGLite Authors.
// SPDX-License-Identifier: Apache-2.0

#include "statements.hpp"
#include <algorithm>
#include <cctype>
#include <istream>

namespace pglite::cli
{
const char* const default_queries = R"(

SHOW client_encoding;

CREATE OR REPLACE FUNCTION test_func() RETURNS TEXT AS $$ BEGIN RETURN 'test'; END; $$ LANGUAGE plpgsql;

CREATE OR REPLACE FUNCTION addition (entier1 integer, entier2 integer)
RETURNS integer
LANGUAGE plpgsql
IMMUTABLE
AS '
DECLARE
  resultat integer;
BEGIN
  resultat := entier1 + entier2;
  RETURN resultat;
END ' ;

SELECT test_func();

SELECT now(), current_database(), session_user, current_user;

SELECT addition(40,2);

)";

std::optional<std::string> read_statement(std::istream& in)
{
    std::string statement;
    if (std::getline(in, statement, ';'))
    {
        if (!in.eof())
        {
            statement.push_back(';');
            return statement;
        }
    }

    // End of input without a terminator.
    const bool blank = std::all_of(statement.begin(), statement.end(),
        [](char c) noexcept { return std::isspace(static_cast<unsigned char>(c)) != 0; });
    if (blank)
        return std::nullopt;
    return statement;
}
}  // namespace pglite::cli
