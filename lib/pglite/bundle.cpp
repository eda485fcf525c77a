// PGLite: PostgreSQL in WebAssembly, hosted on Fizzy
// Copyright 2024 The PGLite Authors.
// SPDX-License-Identifier: Apache-2.0

#include "bundle.hpp"
#include "exceptions.hpp"
#include "gzip.hpp"
#include "limits.hpp"
#include "tar.hpp"
#include <uv.h>
#include <fstream>
#include <iterator>
#include <ostream>
#include <sstream>

namespace fs = std::filesystem;

namespace pglite
{
std::optional<bytes> load_file(const fs::path& file, std::ostream& err) noexcept
{
    try
    {
        if (!fs::exists(file))
        {
            err << "File does not exist: " << file << "\n";
            return std::nullopt;
        }
        if (!fs::is_regular_file(file))
        {
            err << "Not a file: " << file << "\n";
            return std::nullopt;
        }

        std::ifstream binary_file{file, std::ios::binary};
        if (!binary_file)
        {
            err << "Failed to open file: " << file << "\n";
            return std::nullopt;
        }
        return bytes(
            std::istreambuf_iterator<char>{binary_file}, std::istreambuf_iterator<char>{});
    }
    catch (...)
    {
        // Generic error message due to other exceptions.
        err << "Failed to load: " << file << "\n";
        return std::nullopt;
    }
}

bool is_extracted(const fs::path& root)
{
    return fs::exists(root / VersionMarkerPath);
}

void extract_bundle(bytes_view bundle, const fs::path& root, std::ostream& out)
{
    out << "Extracting env....\n";
    const auto archive = gunzip(bundle);
    fs::create_directories(root);
    extract(archive, root);
}

void write_random_device(const fs::path& root)
{
    const auto dev = root / "dev";
    fs::create_directories(dev);
    fs::permissions(dev, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                             fs::perms::others_read | fs::perms::others_exec);

    uint8_t random[RandomDeviceSize];
    if (const auto rc = uv_random(nullptr, nullptr, random, sizeof(random), 0, nullptr); rc != 0)
        throw environment_error{std::string{"uv_random: "} + uv_strerror(rc)};

    const auto path = root / RandomDevicePath;
    std::ofstream file{path, std::ios::binary | std::ios::trunc};
    if (!file)
        throw environment_error{"Failed to create file: " + path.string()};
    file.write(reinterpret_cast<const char*>(random), sizeof(random));
    if (!file)
        throw environment_error{"Failed to write file: " + path.string()};
}

bytes setup_environment(const fs::path& root, bytes_view bundle, std::ostream& out)
{
    if (!is_extracted(root))
    {
        if (bundle.empty())
            throw environment_error{
                "no filesystem image available and " + (root / VersionMarkerPath).string() +
                " does not exist"};
        extract_bundle(bundle, root, out);
    }

    write_random_device(root);

    std::ostringstream err;
    auto wasm_binary = load_file(root / PostgresBinaryPath, err);
    if (!wasm_binary)
    {
        auto message = err.str();
        if (!message.empty() && message.back() == '\n')
            message.pop_back();
        throw environment_error{message};
    }
    return std::move(*wasm_binary);
}
}  // namespace pglite
