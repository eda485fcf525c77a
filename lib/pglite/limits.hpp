// PGLite: PostgreSQL in WebAssembly, hosted on Fizzy
// Copyright 2024 The PGLite Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>

namespace pglite
{
/// The page size as defined by the WebAssembly 1.0 specification.
constexpr uint32_t PageSize = 65536;

/// Only 4 GB (32-bit) of guest memory is addressable.
constexpr uint32_t MaxMemoryPagesLimit = 65536;

/// The default hard limit of the guest memory size (2 GB) as number of pages.
constexpr uint32_t DefaultMemoryPagesLimit = (2 * 1024 * 1024 * 1024ULL) / PageSize;
static_assert(DefaultMemoryPagesLimit == 32768);

/// Guest address the SQL text is written to before interactive_one is called.
/// Address 0 is left untouched so the buffer is never mistaken for a null pointer.
constexpr uint32_t SqlBufferOffset = 1;

/// Number of random bytes stored in the /dev/urandom shim.
constexpr size_t RandomDeviceSize = 128;

/// Paths inside the extraction root.
constexpr auto VersionMarkerPath = "tmp/pglite/base/PG_VERSION";
constexpr auto PostgresBinaryPath = "tmp/pglite/bin/postgres.wasi";
constexpr auto RandomDevicePath = "dev/urandom";
}  // namespace pglite
