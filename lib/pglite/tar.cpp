// PGLite: PostgreSQL in WebAssembly, hosted on Fizzy
// Copyright 2024 The PGLite Authors.
// SPDX-License-Identifier: Apache-2.0

#include "tar.hpp"
#include "exceptions.hpp"
#include <algorithm>
#include <cstddef>
#include <cstring>
#include <fstream>
#include <limits>

namespace fs = std::filesystem;

namespace pglite
{
namespace
{
struct TarBlockHeader
{
    char name[100];
    char mode[8];
    char uid[8];
    char gid[8];
    char size[12];
    char mtime[12];
    char checksum[8];
    char type;
    char link_name[100];
    char magic[6];
    char version[2];
    char uname[32];
    char gname[32];
    char devmajor[8];
    char devminor[8];
    char prefix[155];
    char padding[12];
};
static_assert(sizeof(TarBlockHeader) == TarBlockSize);

/// Returns the field content up to the first NUL byte.
template <size_t N>
std::string field_string(const char (&field)[N])
{
    return {field, strnlen(field, N)};
}

/// Parses a numeric field: octal text, or GNU base-256 when the high bit of the first byte is set.
template <size_t N>
uint64_t parse_numeric(const char (&field)[N], const char* field_name)
{
    const auto* p = reinterpret_cast<const uint8_t*>(field);
    if ((p[0] & 0x80) != 0)
    {
        uint64_t value = p[0] & 0x7f;
        for (size_t i = 1; i < N; ++i)
        {
            if (value > (std::numeric_limits<uint64_t>::max() >> 8))
                throw archive_error{std::string{"tar: "} + field_name + " field overflow"};
            value = (value << 8) | p[i];
        }
        return value;
    }

    size_t i = 0;
    while (i < N && (field[i] == ' ' || field[i] == '\0'))
        ++i;

    uint64_t value = 0;
    for (; i < N && field[i] != '\0' && field[i] != ' '; ++i)
    {
        if (field[i] < '0' || field[i] > '7')
            throw archive_error{std::string{"tar: invalid "} + field_name + " field"};
        if (value > (std::numeric_limits<uint64_t>::max() >> 3))
            throw archive_error{std::string{"tar: "} + field_name + " field overflow"};
        value = (value << 3) | static_cast<uint64_t>(field[i] - '0');
    }
    return value;
}

bool is_zero_block(bytes_view block) noexcept
{
    return std::all_of(block.begin(), block.end(), [](uint8_t b) noexcept { return b == 0; });
}

void verify_checksum(const TarBlockHeader& header, bytes_view block)
{
    const auto expected = parse_numeric(header.checksum, "checksum");

    // The checksum field itself counts as eight spaces.
    constexpr auto checksum_begin = offsetof(TarBlockHeader, checksum);
    constexpr auto checksum_end = checksum_begin + sizeof(TarBlockHeader::checksum);

    uint64_t unsigned_sum = 0;
    int64_t signed_sum = 0;
    for (size_t i = 0; i < block.size(); ++i)
    {
        const uint8_t b = (i >= checksum_begin && i < checksum_end) ? uint8_t{' '} : block[i];
        unsigned_sum += b;
        signed_sum += static_cast<int8_t>(b);
    }

    if (expected != unsigned_sum && static_cast<int64_t>(expected) != signed_sum)
        throw archive_error{"tar: invalid header checksum"};
}

std::string header_name(const TarBlockHeader& header)
{
    auto name = field_string(header.name);
    // Check if USTAR and the filename prefix are set.
    if (std::strncmp(header.magic, "ustar", 5) == 0 && header.prefix[0] != '\0')
        name = field_string(header.prefix) + "/" + name;
    return name;
}

/// The content of a GNU long name entry, without the terminating NUL.
std::string long_name(bytes_view data)
{
    const auto end = std::find(data.begin(), data.end(), uint8_t{0});
    return {data.begin(), end};
}

struct PaxRecords
{
    std::optional<std::string> path;
    std::optional<std::string> link_path;
    std::optional<uint64_t> size;
};

/// Parses PAX extended header records of the form "<length> <key>=<value>\n".
PaxRecords parse_pax_records(bytes_view data)
{
    PaxRecords records;
    std::string_view rest{reinterpret_cast<const char*>(data.data()), data.size()};
    while (!rest.empty() && rest.front() != '\0')
    {
        const auto space = rest.find(' ');
        if (space == std::string_view::npos || space == 0)
            throw archive_error{"tar: malformed pax record"};

        size_t record_size = 0;
        for (const auto c : rest.substr(0, space))
        {
            if (c < '0' || c > '9' || record_size > rest.size())
                throw archive_error{"tar: malformed pax record length"};
            record_size = record_size * 10 + static_cast<size_t>(c - '0');
        }
        if (record_size <= space + 1 || record_size > rest.size() || rest[record_size - 1] != '\n')
            throw archive_error{"tar: malformed pax record length"};

        const auto record = rest.substr(space + 1, record_size - space - 2);
        rest.remove_prefix(record_size);

        const auto eq = record.find('=');
        if (eq == std::string_view::npos)
            throw archive_error{"tar: malformed pax record"};
        const auto key = record.substr(0, eq);
        const auto value = record.substr(eq + 1);

        if (key == "path")
            records.path = std::string{value};
        else if (key == "linkpath")
            records.link_path = std::string{value};
        else if (key == "size")
        {
            uint64_t size = 0;
            for (const auto c : value)
            {
                if (c < '0' || c > '9' || size > (std::numeric_limits<uint64_t>::max() / 10))
                    throw archive_error{"tar: malformed pax size"};
                size = size * 10 + static_cast<uint64_t>(c - '0');
            }
            records.size = size;
        }
    }
    return records;
}

/// Resolves an archive member name against the extraction root.
/// Returns std::nullopt for names denoting the root itself.
std::optional<fs::path> resolve_within(const fs::path& root, const std::string& name)
{
    const auto relative = fs::path{name}.lexically_normal();
    if (relative.has_root_path())
        throw archive_error{"tar: absolute path in archive: " + name};
    if (relative.empty() || relative == ".")
        return std::nullopt;
    if (*relative.begin() == "..")
        throw archive_error{"tar: path escapes extraction root: " + name};
    return root / relative;
}

/// Rejects a destination reached through a symbolic link already on disk below root.
/// The final component is checked only if include_last is set.
void verify_no_symlinks(
    const fs::path& root, const fs::path& dest, const std::string& name, bool include_last)
{
    const auto relative = dest.lexically_relative(root);
    auto last = relative.end();
    if (!include_last && last != relative.begin())
        --last;

    auto current = root;
    for (auto it = relative.begin(); it != last; ++it)
    {
        current /= *it;
        const auto status = fs::symlink_status(current);
        if (fs::is_symlink(status))
            throw archive_error{"tar: path escapes extraction root: " + name};
        if (!fs::exists(status))
            return;
    }
}

void remove_existing(const fs::path& path)
{
    const auto status = fs::symlink_status(path);
    if (fs::exists(status) && !fs::is_directory(status))
        fs::remove(path);
}

void apply_mode(const fs::path& path, uint32_t mode, fs::perms required)
{
    if (mode == 0)
        return;
    fs::permissions(path, static_cast<fs::perms>(mode & 07777) | required);
}

void write_file(const fs::path& path, bytes_view data)
{
    std::ofstream file{path, std::ios::binary | std::ios::trunc};
    if (!file)
        throw environment_error{"Failed to create file: " + path.string()};
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file)
        throw environment_error{"Failed to write file: " + path.string()};
}
}  // namespace

std::optional<TarEntry> TarReader::next()
{
    if (m_done)
        return std::nullopt;

    PaxRecords pending;
    while (true)
    {
        if (m_offset == m_archive.size())
        {
            m_done = true;
            return std::nullopt;
        }
        if (m_archive.size() - m_offset < TarBlockSize)
            throw archive_error{"tar: truncated header"};

        const auto block = m_archive.substr(m_offset, TarBlockSize);
        if (is_zero_block(block))
        {
            m_done = true;
            return std::nullopt;
        }

        TarBlockHeader header;
        std::memcpy(&header, block.data(), sizeof(header));
        verify_checksum(header, block);

        const auto size = pending.size ? *pending.size : parse_numeric(header.size, "size");
        const auto data_offset = m_offset + TarBlockSize;
        if (size > m_archive.size() - data_offset)
            throw archive_error{"tar: truncated data of " + header_name(header)};
        const auto data = m_archive.substr(data_offset, static_cast<size_t>(size));

        const auto padded_size = (size + TarBlockSize - 1) / TarBlockSize * TarBlockSize;
        m_offset = data_offset + static_cast<size_t>(
                                     std::min<uint64_t>(padded_size, m_archive.size() - data_offset));

        switch (header.type)
        {
        case tar_type::PaxHeader:
        {
            auto records = parse_pax_records(data);
            if (records.path)
                pending.path = std::move(records.path);
            if (records.link_path)
                pending.link_path = std::move(records.link_path);
            if (records.size)
                pending.size = records.size;
            continue;
        }
        case tar_type::PaxGlobalHeader:
            continue;
        case tar_type::GnuLongName:
            pending.path = long_name(data);
            continue;
        case tar_type::GnuLongLink:
            pending.link_path = long_name(data);
            continue;
        default:
            break;
        }

        TarEntry entry;
        entry.name = pending.path ? std::move(*pending.path) : header_name(header);
        entry.type = (header.type == tar_type::RegularOld) ? tar_type::Regular : header.type;
        entry.mode = static_cast<uint32_t>(parse_numeric(header.mode, "mode"));
        entry.link_name =
            pending.link_path ? std::move(*pending.link_path) : field_string(header.link_name);
        entry.data = data;
        return entry;
    }
}

void extract(bytes_view archive, const fs::path& root)
{
    TarReader reader{archive};
    while (const auto entry = reader.next())
    {
        const auto dest = resolve_within(root, entry->name);

        switch (entry->type)
        {
        case tar_type::Directory:
        {
            const auto dir = dest ? *dest : root;
            if (dest)
                verify_no_symlinks(root, dir, entry->name, true);
            fs::create_directories(dir);
            apply_mode(dir, entry->mode, fs::perms::owner_all);
            break;
        }
        case tar_type::Regular:
        {
            if (!dest)
                throw archive_error{"tar: regular file without a name"};
            verify_no_symlinks(root, *dest, entry->name, false);
            fs::create_directories(dest->parent_path());
            remove_existing(*dest);
            write_file(*dest, entry->data);
            apply_mode(*dest, entry->mode, fs::perms::owner_read | fs::perms::owner_write);
            break;
        }
        case tar_type::Symlink:
        {
            if (!dest)
                throw archive_error{"tar: symbolic link without a name"};
            verify_no_symlinks(root, *dest, entry->name, false);
            fs::create_directories(dest->parent_path());
            remove_existing(*dest);
            fs::create_symlink(entry->link_name, *dest);
            break;
        }
        case tar_type::HardLink:
        {
            const auto target = resolve_within(root, entry->link_name);
            if (!dest || !target)
                throw archive_error{"tar: invalid hard link " + entry->name};
            verify_no_symlinks(root, *dest, entry->name, false);
            verify_no_symlinks(root, *target, entry->link_name, false);
            fs::create_directories(dest->parent_path());
            remove_existing(*dest);
            fs::create_hard_link(*target, *dest);
            break;
        }
        default:
            throw archive_error{std::string{"unknown file type in tar: "} + entry->type + " (" +
                                entry->name + ")"};
        }
    }
}
}  // namespace pglite
