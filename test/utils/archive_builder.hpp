// PGLite: PostgreSQL in WebAssembly, hosted on Fizzy
// Copyright 2024 The PGLite Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "bytes.hpp"
#include "tar.hpp"
#include <cstdint>
#include <string>

namespace pglite::test
{
struct TarHeaderFields
{
    std::string name;
    std::string prefix;  ///< Written to the ustar prefix field.
    char type = tar_type::Regular;
    uint32_t mode = 0644;
    std::string link_name;
    uint64_t size = 0;
    bool base256_size = false;  ///< Encode the size with the GNU base-256 extension.
};

/// Encodes a single ustar header block with a valid checksum.
bytes tar_header(const TarHeaderFields& fields);

/// Builds tar archives in memory.
class TarBuilder
{
    bytes m_archive;

public:
    /// Appends a header and the data padded to the block size. The size field is taken from data.
    TarBuilder& add(TarHeaderFields fields, bytes_view data = {});

    TarBuilder& file(const std::string& name, std::string_view content, uint32_t mode = 0644);
    TarBuilder& directory(const std::string& name, uint32_t mode = 0755);
    TarBuilder& symlink(const std::string& name, const std::string& target);
    TarBuilder& hard_link(const std::string& name, const std::string& target);

    /// Appends a GNU long name entry applying to the next member.
    TarBuilder& gnu_long_name(const std::string& name);

    /// Appends a PAX extended header applying to the next member.
    TarBuilder& pax(const std::string& key, const std::string& value);

    /// The archive terminated with two zero blocks.
    bytes finish() const;

    /// The archive without the terminating blocks.
    const bytes& data() const noexcept { return m_archive; }
};

/// Compresses data into a single gzip member.
bytes gzip(bytes_view data);

/// Builds a gzip-compressed filesystem image with the given WebAssembly binary at
/// tmp/pglite/bin/postgres.wasi and the cluster marker tmp/pglite/base/PG_VERSION.
bytes make_bundle(bytes_view wasm_binary);
}  // namespace pglite::test
