// PGLite: PostgreSQL in WebAssembly, hosted on Fizzy
// Copyright 2024 The PGLite Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iosfwd>
#include <optional>
#include <string>

namespace pglite::cli
{
/// Statements run right after the session is created.
extern const char* const default_queries;

/// Reads the next statement, up to and including the terminating ';'.
///
/// At the end of input a non-blank remainder is returned as is.
/// @return  The statement, or std::nullopt when the input is exhausted.
std::optional<std::string> read_statement(std::istream& in);
}  // namespace pglite::cli
