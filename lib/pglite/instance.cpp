// PGLite: PostgreSQL in WebAssembly, hosted on Fizzy
// Copyright 2024 The PGLite Authors.
// SPDX-License-Identifier: Apache-2.0

#include "instance.hpp"
#include <cassert>
#include <cstring>
#include <stdexcept>
#include <string>

namespace pglite
{
Instance::Instance(FizzyInstance* instance) noexcept : m_instance{instance, fizzy_free_instance} {}

std::optional<Instance::FuncIdx> Instance::find_function(std::string_view name) const
{
    uint32_t func_idx;
    if (!fizzy_find_exported_function_index(
            fizzy_get_instance_module(m_instance.get()), std::string{name}.c_str(), &func_idx))
        return std::nullopt;

    return func_idx;
}

bool Instance::has_exported_memory(std::string_view name) const
{
    FizzyExternalMemory memory;
    return fizzy_find_exported_memory(m_instance.get(), std::string{name}.c_str(), &memory);
}

bytes_view Instance::memory() const noexcept
{
    auto* data = fizzy_get_instance_memory_data(m_instance.get());
    if (data == nullptr)
        return {};

    const auto size = fizzy_get_instance_memory_size(m_instance.get());
    return {data, size};
}

void Instance::write_memory(uint32_t offset, bytes_view data)
{
    auto* memory = fizzy_get_instance_memory_data(m_instance.get());
    const auto size = (memory != nullptr) ? fizzy_get_instance_memory_size(m_instance.get()) : 0;
    if (offset > size || data.size() > size - offset)
        throw std::out_of_range{"write of " + std::to_string(data.size()) + " bytes at address " +
                                std::to_string(offset) + " exceeds memory size " +
                                std::to_string(size)};

    std::memcpy(memory + offset, data.data(), data.size());
}

ExecutionResult Instance::execute(FuncIdx func_idx, const std::vector<uint64_t>& args)
{
    static_assert(sizeof(uint64_t) == sizeof(FizzyValue));
    const auto* module = fizzy_get_instance_module(m_instance.get());
    const auto func_type = fizzy_get_function_type(module, func_idx);
    if (args.size() != func_type.inputs_size)
        throw std::invalid_argument{"argument count mismatch"};
    assert(func_type.output != FizzyValueTypeF32 && func_type.output != FizzyValueTypeF64 &&
           "floating point result types are not supported");

    const auto first_arg = args.empty() ? nullptr : reinterpret_cast<const FizzyValue*>(args.data());
    const auto status = fizzy_execute(m_instance.get(), func_idx, first_arg, nullptr);
    if (status.trapped)
        return {true, std::nullopt};
    else if (status.has_value)
        return {false, func_type.output == FizzyValueTypeI32 ? status.value.i32 : status.value.i64};
    else
        return {false, std::nullopt};
}
}  // namespace pglite
