// PGLite: PostgreSQL in WebAssembly, hosted on Fizzy
// Copyright 2024 The PGLite Authors.
// SPDX-License-Identifier: Apache-2.0

#include "bundle.hpp"
#include "exceptions.hpp"
#include "limits.hpp"
#include <gtest/gtest.h>
#include <test/utils/archive_builder.hpp>
#include <test/utils/asserts.hpp>
#include <test/utils/temp_dir.hpp>
#include <fstream>
#include <sstream>

using namespace pglite;
using namespace pglite::test;
namespace fs = std::filesystem;

namespace
{
bytes read_device(const fs::path& root)
{
    std::ostringstream err;
    return load_file(root / RandomDevicePath, err).value();
}
}  // namespace

TEST(bundle, load_file_missing)
{
    std::ostringstream err;
    EXPECT_FALSE(load_file("ABC", err).has_value());
    EXPECT_EQ(err.str(), "File does not exist: \"ABC\"\n");
}

TEST(bundle, load_file_not_a_file)
{
    TempDir dir;
    std::ostringstream expected;
    expected << "Not a file: " << dir.path() << "\n";

    std::ostringstream err;
    EXPECT_FALSE(load_file(dir.path(), err).has_value());
    EXPECT_EQ(err.str(), expected.str());
}

TEST(bundle, extracts_when_absent)
{
    TempDir dir;
    EXPECT_FALSE(is_extracted(dir.path()));

    std::ostringstream out;
    const auto wasm = setup_environment(dir.path(), make_bundle(as_bytes("postgres")), out);

    EXPECT_EQ(wasm, as_bytes("postgres"));
    EXPECT_EQ(out.str(), "Extracting env....\n");
    EXPECT_TRUE(is_extracted(dir.path()));
    EXPECT_TRUE(fs::is_regular_file(dir.path() / VersionMarkerPath));
    EXPECT_EQ(fs::file_size(dir.path() / RandomDevicePath), RandomDeviceSize);
    EXPECT_EQ(fs::status(dir.path() / "dev").permissions() & fs::perms::mask,
        static_cast<fs::perms>(0755));
}

TEST(bundle, no_extraction_when_marker_exists)
{
    TempDir dir;
    std::ostringstream out;
    setup_environment(dir.path(), make_bundle(as_bytes("first")), out);

    std::ostringstream out2;
    EXPECT_EQ(setup_environment(dir.path(), make_bundle(as_bytes("second")), out2),
        as_bytes("first"));
    EXPECT_EQ(out2.str(), "");

    // The image is not needed any more.
    EXPECT_EQ(setup_environment(dir.path(), {}, out2), as_bytes("first"));
}

TEST(bundle, random_device_refreshed)
{
    TempDir dir;
    std::ostringstream out;
    setup_environment(dir.path(), make_bundle(as_bytes("wasm")), out);
    const auto first = read_device(dir.path());

    setup_environment(dir.path(), {}, out);
    const auto second = read_device(dir.path());

    EXPECT_EQ(first.size(), RandomDeviceSize);
    EXPECT_EQ(second.size(), RandomDeviceSize);
    EXPECT_NE(first, second);
}

TEST(bundle, write_random_device_replaces_content)
{
    TempDir dir;
    fs::create_directories(dir.path() / "dev");
    {
        std::ofstream file{dir.path() / RandomDevicePath};
        file << std::string(1000, 'x');
    }

    write_random_device(dir.path());
    EXPECT_EQ(fs::file_size(dir.path() / RandomDevicePath), RandomDeviceSize);
}

TEST(bundle, missing_bundle)
{
    TempDir dir;
    std::ostringstream out;
    const auto expected = "no filesystem image available and " +
                          (dir.path() / VersionMarkerPath).string() + " does not exist";
    EXPECT_THROW_MESSAGE(setup_environment(dir.path(), {}, out), environment_error, expected.c_str());
    EXPECT_FALSE(fs::exists(dir.path() / "dev"));
}

TEST(bundle, missing_binary)
{
    TempDir dir;
    const auto bundle = gzip(TarBuilder{}.file(VersionMarkerPath, "16\n").finish());

    std::ostringstream expected;
    expected << "File does not exist: " << dir.path() / PostgresBinaryPath;

    std::ostringstream out;
    EXPECT_THROW_MESSAGE(
        setup_environment(dir.path(), bundle, out), environment_error, expected.str().c_str());
}

TEST(bundle, corrupt_bundle)
{
    TempDir dir;
    std::ostringstream out;
    auto bundle = make_bundle(as_bytes("wasm"));
    bundle.resize(bundle.size() / 2);
    EXPECT_THROW(setup_environment(dir.path(), bundle, out), archive_error);
    EXPECT_FALSE(is_extracted(dir.path()));
}
