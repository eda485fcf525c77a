// PGLite: PostgreSQL in WebAssembly, hosted on Fizzy
// Copyright 2024 The PGLite Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "bytes.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace pglite
{
/// Tar entry type flags.
namespace tar_type
{
constexpr char Regular = '0';
constexpr char RegularOld = '\0';
constexpr char HardLink = '1';
constexpr char Symlink = '2';
constexpr char Directory = '5';
constexpr char PaxHeader = 'x';
constexpr char PaxGlobalHeader = 'g';
constexpr char GnuLongName = 'L';
constexpr char GnuLongLink = 'K';
}  // namespace tar_type

/// The size of a tar header and of the data padding unit.
constexpr size_t TarBlockSize = 512;

struct TarEntry
{
    std::string name;
    char type = tar_type::Regular;
    uint32_t mode = 0;
    std::string link_name;

    /// File content. Points into the archive.
    bytes_view data;
};

/// Sequential reader of a tar archive held in memory.
///
/// Extended headers (PAX, GNU long names) are consumed and applied to the entry that follows them,
/// so next() only returns regular files, directories, links and other entry kinds.
class TarReader
{
    bytes_view m_archive;
    size_t m_offset = 0;
    bool m_done = false;

public:
    explicit TarReader(bytes_view archive) noexcept : m_archive{archive} {}

    /// Returns the next entry or std::nullopt at the end of the archive.
    /// @throws archive_error on malformed input.
    std::optional<TarEntry> next();
};

/// Extracts all entries of the tar archive into the root directory.
///
/// @throws archive_error    on malformed input, unsupported entry kind or a path escaping root.
void extract(bytes_view archive, const std::filesystem::path& root);
}  // namespace pglite
