// PGLite: PostgreSQL in WebAssembly, hosted on Fizzy
// Copyright 2024 The PGLite Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "bytes.hpp"
#include "instance.hpp"
#include "limits.hpp"
#include "uvwasi.hpp"
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string_view>

namespace pglite::wasi
{
/// Name of the module the WASI functions are imported from.
constexpr auto ModuleName = "wasi_snapshot_preview1";

/// Host state shared by the WASI functions of an instance.
/// Must outlive the instance created with it.
class Context
{
    UVWASI& m_uvwasi;
    std::ostream& m_out;
    std::ostream& m_err;

    /// Exit code passed to proc_exit during the current call.
    std::optional<uint32_t> m_exit_code;

public:
    /// @param  uvwasi    System call backend.
    /// @param  out       Receives guest writes to file descriptor 1.
    /// @param  err       Receives guest writes to file descriptor 2.
    Context(UVWASI& uvwasi, std::ostream& out, std::ostream& err) noexcept
      : m_uvwasi{uvwasi}, m_out{out}, m_err{err}
    {}

    UVWASI& uvwasi() noexcept { return m_uvwasi; }
    std::ostream& out() noexcept { return m_out; }
    std::ostream& err() noexcept { return m_err; }

    std::optional<uint32_t> exit_code() const noexcept { return m_exit_code; }
    void set_exit_code(uint32_t code) noexcept { m_exit_code = code; }
    void clear_exit_code() noexcept { m_exit_code.reset(); }
};

/// Instantiates a module that imports WASI functions.
///
/// Known WASI functions are bound to the context. Other functions from the WASI module returning
/// i32 are bound to a stub returning ENOSYS.
///
/// @throws instantiate_error    on parse error, unresolved or mistyped import, or failed
///                              instantiation.
std::unique_ptr<Instance> instantiate(Context& context, bytes_view wasm_binary,
    uint32_t memory_pages_limit = DefaultMemoryPagesLimit);

/// Calls an exported function with no arguments.
///
/// A proc_exit with code 0 ends the call normally.
///
/// @param  name    Function name, used in error messages.
/// @return         The function result, if any.
/// @throws exit_error    if the guest called proc_exit with a non-zero code.
/// @throws trap_error    if the guest trapped.
std::optional<uint64_t> call(
    Context& context, Instance& instance, Instance::FuncIdx func_idx, std::string_view name);
}  // namespace pglite::wasi
