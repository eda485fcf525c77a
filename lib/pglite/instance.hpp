// PGLite: PostgreSQL in WebAssembly, hosted on Fizzy
// Copyright 2024 The PGLite Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "bytes.hpp"
#include <fizzy/fizzy.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace pglite
{
/// Result of a guest function call.
struct ExecutionResult
{
    bool trapped = false;
    std::optional<uint64_t> value;
};

/// An instantiated WebAssembly module owned by the host.
class Instance
{
    std::unique_ptr<FizzyInstance, void (*)(FizzyInstance*)> m_instance;

public:
    using FuncIdx = uint32_t;

    /// Takes ownership of the instance.
    explicit Instance(FizzyInstance* instance) noexcept;

    /// Finds an exported function by name.
    std::optional<FuncIdx> find_function(std::string_view name) const;

    /// Checks whether the module exports a memory under the given name.
    bool has_exported_memory(std::string_view name) const;

    /// Returns the entire linear memory. Empty if the instance has no memory.
    /// The view is invalidated when the guest grows its memory.
    bytes_view memory() const noexcept;

    /// Copies data into linear memory at the given address.
    /// @throws std::out_of_range if the data does not fit.
    void write_memory(uint32_t offset, bytes_view data);

    /// Executes the function of the given index.
    ExecutionResult execute(FuncIdx func_idx, const std::vector<uint64_t>& args = {});
};
}  // namespace pglite
