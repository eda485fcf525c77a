// PGLite: PostgreSQL in WebAssembly, hosted on Fizzy
// Copyright 2024 The PGLite Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "bytes.hpp"

namespace pglite
{
/// Decompresses a gzip stream. Concatenated gzip members are decoded one after another.
///
/// @param  input    Compressed data.
/// @return          Decompressed data.
/// @throws archive_error when the stream is corrupt or truncated.
bytes gunzip(bytes_view input);
}  // namespace pglite
