// PGLite: PostgreSQL in WebAssembly, hosted on Fizzy
// Copyright 2024 The PGLite Authors.
// SPDX-License-Identifier: Apache-2.0

#include "pglite.hpp"
#include "exceptions.hpp"
#include <uvwasi.h>
#include <algorithm>
#include <cctype>
#include <ostream>

namespace pglite
{
namespace
{
constexpr auto MemoryExportName = "memory";

bool is_blank(std::string_view text) noexcept
{
    return std::all_of(text.begin(), text.end(),
        [](char c) noexcept { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

Instance::FuncIdx require_function(const Instance& instance, const char* name)
{
    const auto func_idx = instance.find_function(name);
    if (!func_idx.has_value())
        throw instantiate_error{std::string{"missing export: "} + name};
    return *func_idx;
}
}  // namespace

std::vector<std::string_view> split_queries(std::string_view input)
{
    constexpr std::string_view separator = "\n\n";

    std::vector<std::string_view> queries;
    while (true)
    {
        const auto pos = input.find(separator);
        const auto chunk = input.substr(0, pos);
        if (!is_blank(chunk))
            queries.push_back(chunk);
        if (pos == std::string_view::npos)
            break;
        input.remove_prefix(pos + separator.size());
    }
    return queries;
}

std::string to_binary(uint64_t value)
{
    std::string digits;
    do
    {
        digits.push_back(static_cast<char>('0' + (value & 1)));
        value >>= 1;
    } while (value != 0);
    std::reverse(digits.begin(), digits.end());
    return digits;
}

PGLite::PGLite(std::unique_ptr<wasi::UVWASI> uvwasi, std::ostream& out, std::ostream& err) noexcept
  : m_uvwasi{std::move(uvwasi)}, m_context{*m_uvwasi, out, err}
{}

std::unique_ptr<PGLite> PGLite::create(const Config& config, std::ostream& out, std::ostream& err)
{
    return create(config, wasi::create_uvwasi(), out, err);
}

std::unique_ptr<PGLite> PGLite::create(const Config& config,
    std::unique_ptr<wasi::UVWASI> uvwasi, std::ostream& out, std::ostream& err)
{
    const auto wasm_binary = setup_environment(config.root_dir, config.bundle, out);

    const auto root = std::filesystem::absolute(config.root_dir);
    wasi::InitOptions options;
    options.args = config.args;
    options.env = config.env;
    options.preopens = {
        {"/tmp", (root / "tmp").string()},
        {"/dev", (root / "dev").string()},
    };
    if (const auto uvwasi_err = uvwasi->init(options); uvwasi_err != UVWASI_ESUCCESS)
        throw instantiate_error{std::string{"Failed to initialise UVWASI: "} +
                                uvwasi_embedder_err_code_to_string(uvwasi_err)};

    std::unique_ptr<PGLite> pglite{new PGLite{std::move(uvwasi), out, err}};
    pglite->m_instance =
        wasi::instantiate(pglite->m_context, wasm_binary, config.memory_pages_limit);
    auto& instance = *pglite->m_instance;
    auto& context = pglite->m_context;

    if (const auto start = instance.find_function("_start"); start.has_value())
        wasi::call(context, instance, *start, "_start");

    const auto pg_initdb = require_function(instance, "pg_initdb");
    const auto use_socketfile = require_function(instance, "use_socketfile");
    pglite->m_interactive_one = require_function(instance, "interactive_one");
    if (!instance.has_exported_memory(MemoryExportName))
        throw instantiate_error{std::string{"missing export: "} + MemoryExportName};

    const auto initdb_result = wasi::call(context, instance, pg_initdb, "pg_initdb");
    err << "initdb returned: " << to_binary(initdb_result.value_or(0)) << "\n";

    wasi::call(context, instance, use_socketfile, "use_socketfile");
    return pglite;
}

void PGLite::query(std::string_view sql)
{
    bytes buffer{as_bytes(sql)};
    buffer.push_back('\0');
    m_instance->write_memory(SqlBufferOffset, buffer);
    wasi::call(m_context, *m_instance, m_interactive_one, "interactive_one");
}

void PGLite::run_queries(std::string_view input)
{
    for (const auto query_text : split_queries(input))
    {
        m_context.err() << "REPL: " << query_text << "\n";
        query(query_text);
    }
}
}  // namespace pglite
