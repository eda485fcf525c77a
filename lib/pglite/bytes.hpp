// PGLite: PostgreSQL in WebAssembly, hosted on Fizzy
// Copyright 2024 The PGLite Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace pglite
{
using bytes = std::basic_string<uint8_t>;
using bytes_view = std::basic_string_view<uint8_t>;

/// Views the characters of a string as bytes.
inline bytes_view as_bytes(std::string_view s) noexcept
{
    return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}
}  // namespace pglite
