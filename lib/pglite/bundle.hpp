// PGLite: PostgreSQL in WebAssembly, hosted on Fizzy
// Copyright 2024 The PGLite Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "bytes.hpp"
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string_view>

namespace pglite
{
/// The gzip-compressed filesystem image compiled into the library.
/// Empty if the library was built without one.
bytes_view embedded_bundle() noexcept;

/// Loads a binary file at the given path.
///
/// @param  file    Path to the file.
/// @param  err     Error output stream.
/// @return         Content of the loaded file.
std::optional<bytes> load_file(const std::filesystem::path& file, std::ostream& err) noexcept;

/// Checks whether the filesystem image has already been extracted into the root directory.
bool is_extracted(const std::filesystem::path& root);

/// Decompresses the filesystem image and extracts it into the root directory.
void extract_bundle(bytes_view bundle, const std::filesystem::path& root, std::ostream& out);

/// Creates the dev directory and fills dev/urandom with fresh random bytes.
void write_random_device(const std::filesystem::path& root);

/// Prepares the root directory for a PostgreSQL instance.
///
/// The image is extracted only if it has not been extracted before. The random device is
/// rewritten on every call.
///
/// @param  root      Extraction root.
/// @param  bundle    Gzip-compressed tar image. May be empty if the root is already populated.
/// @param  out       Receives progress messages.
/// @return           The PostgreSQL WebAssembly binary.
bytes setup_environment(const std::filesystem::path& root, bytes_view bundle, std::ostream& out);
}  // namespace pglite
