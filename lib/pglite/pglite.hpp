// PGLite: PostgreSQL in WebAssembly, hosted on Fizzy
// Copyright 2024 The PGLite Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "bundle.hpp"
#include "bytes.hpp"
#include "instance.hpp"
#include "limits.hpp"
#include "uvwasi.hpp"
#include "wasi.hpp"
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pglite
{
struct Config
{
    /// Host directory receiving tmp/ and dev/.
    std::filesystem::path root_dir = ".";

    /// Gzip-compressed tar image. Must stay valid until PGLite::create() returns.
    bytes_view bundle = embedded_bundle();

    /// Guest argv.
    std::vector<std::string> args = {"--single", "postgres"};

    /// Guest environment entries in KEY=VALUE form.
    std::vector<std::string> env = {
        "ENVIRONMENT=wasi-embed", "REPL=N", "PGUSER=postgres", "PGDATABASE=postgres"};

    /// Hard limit for guest memory growth in pages.
    uint32_t memory_pages_limit = DefaultMemoryPagesLimit;
};

/// A PostgreSQL instance running in a single-user session.
class PGLite
{
    std::unique_ptr<wasi::UVWASI> m_uvwasi;
    wasi::Context m_context;
    std::unique_ptr<Instance> m_instance;
    Instance::FuncIdx m_interactive_one = 0;

    PGLite(std::unique_ptr<wasi::UVWASI> uvwasi, std::ostream& out, std::ostream& err) noexcept;

public:
    /// Prepares the filesystem, instantiates PostgreSQL and initializes the cluster.
    ///
    /// @param  out    Receives guest standard output and progress messages.
    /// @param  err    Receives guest standard error, including query results.
    static std::unique_ptr<PGLite> create(
        const Config& config, std::ostream& out, std::ostream& err);

    /// Same as above, with a given system call backend.
    static std::unique_ptr<PGLite> create(const Config& config,
        std::unique_ptr<wasi::UVWASI> uvwasi, std::ostream& out, std::ostream& err);

    PGLite(const PGLite&) = delete;
    PGLite& operator=(const PGLite&) = delete;

    /// Executes a single SQL statement.
    ///
    /// The statement is written NUL-terminated to guest memory at SqlBufferOffset, then
    /// interactive_one is called.
    ///
    /// @throws exit_error, trap_error    on guest failure.
    /// @throws std::out_of_range         if the statement does not fit in guest memory.
    void query(std::string_view sql);

    /// Executes the statements of a script separated by blank lines, stopping at the first
    /// failure. Blank statements are skipped.
    void run_queries(std::string_view input);
};

/// Splits a script into the statements run by PGLite::run_queries().
std::vector<std::string_view> split_queries(std::string_view input);

/// Formats a number in base 2 without leading zeros.
std::string to_binary(uint64_t value);
}  // namespace pglite
