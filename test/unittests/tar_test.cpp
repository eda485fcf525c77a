// PGLite: PostgreSQL in WebAssembly, hosted on Fizzy
// Copyright 2024 The PGLite Authors.
// SPDX-License-Identifier: Apache-2.0

#include "exceptions.hpp"
#include "tar.hpp"
#include <gtest/gtest.h>
#include <test/utils/archive_builder.hpp>
#include <test/utils/asserts.hpp>
#include <test/utils/temp_dir.hpp>
#include <fstream>
#include <iterator>

using namespace pglite;
using namespace pglite::test;
namespace fs = std::filesystem;

namespace
{
std::string read_text(const fs::path& path)
{
    std::ifstream file{path, std::ios::binary};
    return {std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
}

fs::perms permissions_of(const fs::path& path)
{
    return fs::symlink_status(path).permissions() & fs::perms::mask;
}
}  // namespace

TEST(tar_reader, entries)
{
    const auto archive = TarBuilder{}
                             .directory("a/", 0750)
                             .file("a/b.txt", "content", 0640)
                             .symlink("a/link", "b.txt")
                             .hard_link("a/hard", "a/b.txt")
                             .finish();

    TarReader reader{archive};

    auto entry = reader.next();
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->name, "a/");
    EXPECT_EQ(entry->type, tar_type::Directory);
    EXPECT_EQ(entry->mode, 0750);
    EXPECT_TRUE(entry->data.empty());

    entry = reader.next();
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->name, "a/b.txt");
    EXPECT_EQ(entry->type, tar_type::Regular);
    EXPECT_EQ(entry->mode, 0640);
    EXPECT_EQ(entry->data, as_bytes("content"));

    entry = reader.next();
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->name, "a/link");
    EXPECT_EQ(entry->type, tar_type::Symlink);
    EXPECT_EQ(entry->link_name, "b.txt");

    entry = reader.next();
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->type, tar_type::HardLink);
    EXPECT_EQ(entry->link_name, "a/b.txt");

    EXPECT_FALSE(reader.next().has_value());
    EXPECT_FALSE(reader.next().has_value());
}

TEST(tar_reader, empty_archive)
{
    EXPECT_FALSE(TarReader{{}}.next().has_value());
    EXPECT_FALSE(TarReader{TarBuilder{}.finish()}.next().has_value());
}

TEST(tar_reader, end_of_input_without_zero_blocks)
{
    TarBuilder tar;
    tar.file("x", "1234");

    TarReader reader{tar.data()};
    ASSERT_TRUE(reader.next().has_value());
    EXPECT_FALSE(reader.next().has_value());
}

TEST(tar_reader, data_spanning_blocks)
{
    const std::string content(TarBlockSize + 1, 'z');
    const auto archive = TarBuilder{}.file("big", content).file("next", "n").finish();

    TarReader reader{archive};
    EXPECT_EQ(reader.next()->data.size(), TarBlockSize + 1);
    EXPECT_EQ(reader.next()->name, "next");
}

TEST(tar_reader, ustar_prefix)
{
    const auto archive =
        TarBuilder{}.add({"file.txt", "some/deep/prefix", tar_type::Regular, 0644, {}, 0, false})
            .finish();
    EXPECT_EQ(TarReader{archive}.next()->name, "some/deep/prefix/file.txt");
}

TEST(tar_reader, old_style_regular_file)
{
    const auto archive =
        TarBuilder{}
            .add({"old", {}, tar_type::RegularOld, 0600, {}, 0, false}, as_bytes("data"))
            .finish();
    const auto entry = TarReader{archive}.next();
    EXPECT_EQ(entry->type, tar_type::Regular);
    EXPECT_EQ(entry->data, as_bytes("data"));
}

TEST(tar_reader, gnu_long_name)
{
    const std::string name = std::string(120, 'd') + "/" + std::string(80, 'f');
    const auto archive =
        TarBuilder{}.gnu_long_name(name).file("truncated", "x").file("after", "y").finish();

    TarReader reader{archive};
    EXPECT_EQ(reader.next()->name, name);
    EXPECT_EQ(reader.next()->name, "after");
}

TEST(tar_reader, pax_path)
{
    const std::string name = "pax/" + std::string(200, 'p');
    const auto archive = TarBuilder{}.pax("path", name).file("short", "x").finish();
    EXPECT_EQ(TarReader{archive}.next()->name, name);
}

TEST(tar_reader, pax_global_header_ignored)
{
    const auto archive =
        TarBuilder{}
            .add({"global", {}, tar_type::PaxGlobalHeader, 0644, {}, 0, false},
                as_bytes("17 comment=hello\n"))
            .file("file", "x")
            .finish();
    EXPECT_EQ(TarReader{archive}.next()->name, "file");
}

TEST(tar_reader, base256_size)
{
    const auto archive =
        TarBuilder{}
            .add({"binary", {}, tar_type::Regular, 0644, {}, 0, true}, as_bytes("base-256"))
            .finish();
    EXPECT_EQ(TarReader{archive}.next()->data, as_bytes("base-256"));
}

TEST(tar_reader, invalid_checksum)
{
    auto archive = TarBuilder{}.file("file", "x").finish();
    archive[0] = 'F';
    EXPECT_THROW_MESSAGE(TarReader{archive}.next(), archive_error, "tar: invalid header checksum");
}

TEST(tar_reader, truncated_header)
{
    const auto archive = TarBuilder{}.file("file", "x").finish();
    EXPECT_THROW_MESSAGE(
        TarReader{archive.substr(0, 100)}.next(), archive_error, "tar: truncated header");
}

TEST(tar_reader, truncated_data)
{
    const std::string content(1000, 'c');
    const auto archive = TarBuilder{}.file("file", content).finish();
    EXPECT_THROW_MESSAGE(TarReader{archive.substr(0, TarBlockSize + 100)}.next(), archive_error,
        "tar: truncated data of file");
}

TEST(tar_reader, malformed_pax_record)
{
    const auto archive = TarBuilder{}
                             .add({"PaxHeader", {}, tar_type::PaxHeader, 0644, {}, 0, false},
                                 as_bytes("99 path=x\n"))
                             .file("file", "x")
                             .finish();
    EXPECT_THROW_MESSAGE(TarReader{archive}.next(), archive_error, "tar: malformed pax record length");
}

TEST(tar_extract, files_directories_and_links)
{
    TempDir dir;
    const auto archive = TarBuilder{}
                             .directory("a/", 0750)
                             .file("a/b.txt", "content", 0640)
                             .file("a/nested/c.txt", "parents created")
                             .symlink("a/link", "b.txt")
                             .hard_link("a/hard", "a/b.txt")
                             .finish();

    extract(archive, dir.path());

    const auto a = dir.path() / "a";
    EXPECT_TRUE(fs::is_directory(a));
    EXPECT_EQ(permissions_of(a), static_cast<fs::perms>(0750));
    EXPECT_EQ(read_text(a / "b.txt"), "content");
    EXPECT_EQ(permissions_of(a / "b.txt"), static_cast<fs::perms>(0640));
    EXPECT_EQ(read_text(a / "nested" / "c.txt"), "parents created");
    ASSERT_TRUE(fs::is_symlink(a / "link"));
    EXPECT_EQ(fs::read_symlink(a / "link").string(), "b.txt");
    EXPECT_EQ(read_text(a / "link"), "content");
    EXPECT_EQ(fs::hard_link_count(a / "b.txt"), 2);
    EXPECT_EQ(read_text(a / "hard"), "content");
}

TEST(tar_extract, owner_access_is_kept)
{
    TempDir dir;
    extract(TarBuilder{}.directory("ro/", 0555).file("ro/file", "x", 0444).finish(), dir.path());

    EXPECT_EQ(permissions_of(dir.path() / "ro"), static_cast<fs::perms>(0755));
    EXPECT_EQ(permissions_of(dir.path() / "ro" / "file"), static_cast<fs::perms>(0644));
}

TEST(tar_extract, overwrite_existing)
{
    TempDir dir;
    extract(TarBuilder{}.file("file", "old").file("link", "plain file").finish(), dir.path());
    extract(TarBuilder{}.file("file", "new").symlink("link", "file").finish(), dir.path());

    EXPECT_EQ(read_text(dir.path() / "file"), "new");
    ASSERT_TRUE(fs::is_symlink(dir.path() / "link"));
    EXPECT_EQ(read_text(dir.path() / "link"), "new");
}

TEST(tar_extract, unknown_file_type)
{
    TempDir dir;
    const auto archive =
        TarBuilder{}.add({"dev/tty", {}, '3', 0666, {}, 0, false}).finish();
    EXPECT_THROW_MESSAGE(
        extract(archive, dir.path()), archive_error, "unknown file type in tar: 3 (dev/tty)");
}

TEST(tar_extract, path_escaping_root)
{
    TempDir dir;
    const auto root = dir.path() / "root";
    EXPECT_THROW_MESSAGE(extract(TarBuilder{}.file("../evil", "x").finish(), root), archive_error,
        "tar: path escapes extraction root: ../evil");
    EXPECT_THROW_MESSAGE(extract(TarBuilder{}.file("a/../../evil", "x").finish(), root),
        archive_error, "tar: path escapes extraction root: a/../../evil");
    EXPECT_THROW_MESSAGE(extract(TarBuilder{}.file("/etc/evil", "x").finish(), root),
        archive_error, "tar: absolute path in archive: /etc/evil");
    EXPECT_FALSE(fs::exists(dir.path() / "evil"));
}

TEST(tar_extract, symlink_escape)
{
    TempDir dir;
    const auto root = dir.path() / "root";
    const auto outside = dir.path() / "outside";
    fs::create_directories(outside);
    const auto outside_perms = permissions_of(outside);

    EXPECT_THROW_MESSAGE(
        extract(TarBuilder{}.symlink("evil", outside.string()).file("evil/a.txt", "x").finish(),
            root),
        archive_error, "tar: path escapes extraction root: evil/a.txt");
    EXPECT_THROW_MESSAGE(
        extract(TarBuilder{}.symlink("up", "../outside").file("up/b.txt", "x").finish(), root),
        archive_error, "tar: path escapes extraction root: up/b.txt");
    EXPECT_THROW_MESSAGE(
        extract(TarBuilder{}.symlink("d", "../outside").directory("d/", 0777).finish(), root),
        archive_error, "tar: path escapes extraction root: d/");
    EXPECT_THROW_MESSAGE(
        extract(TarBuilder{}.symlink("s", "../outside").symlink("s/link", "/etc").finish(), root),
        archive_error, "tar: path escapes extraction root: s/link");
    EXPECT_THROW_MESSAGE(
        extract(TarBuilder{}.symlink("h", "../outside").hard_link("h/c.txt", "a.txt").finish(),
            root),
        archive_error, "tar: path escapes extraction root: h/c.txt");

    EXPECT_TRUE(fs::is_empty(outside));
    EXPECT_EQ(permissions_of(outside), outside_perms);
}
