// PGLite: PostgreSQL in WebAssembly, hosted on Fizzy
// Copyright 2024 The PGLite Authors.
// SPDX-License-Identifier: Apache-2.0

#include "bundle.hpp"
#include "pglite.hpp"
#include "statements.hpp"
#include <iostream>
#include <optional>
#include <string_view>

namespace
{
constexpr auto usage =
    "Usage: pglite [--root DIR] [--bundle FILE] [--memory-pages N] [--no-defaults] [--help]\n";

bool parse_pages(std::string_view text, uint32_t& pages)
{
    if (text.empty() || text.size() > 5)
        return false;

    uint32_t value = 0;
    for (const auto c : text)
    {
        if (c < '0' || c > '9')
            return false;
        value = value * 10 + static_cast<uint32_t>(c - '0');
    }
    if (value > pglite::MaxMemoryPagesLimit)
        return false;

    pages = value;
    return true;
}
}  // namespace

int main(int argc, const char** argv)
{
    try
    {
        pglite::Config config;
        std::optional<pglite::bytes> bundle;
        bool run_defaults = true;

        for (int i = 1; i < argc; ++i)
        {
            const std::string_view arg{argv[i]};
            const bool has_value = i + 1 < argc;
            if (arg == "--help")
            {
                std::cout << usage;
                return 0;
            }
            else if (arg == "--no-defaults")
                run_defaults = false;
            else if (arg == "--root" && has_value)
                config.root_dir = argv[++i];
            else if (arg == "--bundle" && has_value)
            {
                bundle = pglite::load_file(argv[++i], std::cerr);
                if (!bundle)
                    return 2;
                config.bundle = *bundle;
            }
            else if (arg == "--memory-pages" && has_value)
            {
                if (!parse_pages(argv[++i], config.memory_pages_limit))
                {
                    std::cerr << "Invalid memory pages limit: " << argv[i] << "\n";
                    return 2;
                }
            }
            else
            {
                std::cerr << "Unknown argument: " << arg << "\n" << usage;
                return 2;
            }
        }

        auto pg = pglite::PGLite::create(config, std::cout, std::cerr);

        if (run_defaults)
            pg->run_queries(pglite::cli::default_queries);

        while (const auto statement = pglite::cli::read_statement(std::cin))
            pg->query(*statement);

        return 0;
    }
    catch (const std::exception& ex)
    {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
