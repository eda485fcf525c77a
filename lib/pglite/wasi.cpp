// PGLite: PostgreSQL in WebAssembly, hosted on Fizzy
// Copyright 2024 The PGLite Authors.
// SPDX-License-Identifier: Apache-2.0

#include "wasi.hpp"
#include "exceptions.hpp"
#include <uvwasi.h>
#include <algorithm>
#include <cstring>
#include <new>
#include <ostream>
#include <string>
#include <vector>

namespace pglite::wasi
{
namespace
{
/// Linear memory of the calling instance.
struct GuestMemory
{
    uint8_t* data = nullptr;
    size_t size = 0;

    explicit GuestMemory(FizzyInstance* instance) noexcept
      : data{fizzy_get_instance_memory_data(instance)},
        size{data != nullptr ? fizzy_get_instance_memory_size(instance) : 0}
    {}

    bool contains(uint64_t offset, uint64_t length) const noexcept
    {
        return offset <= size && length <= size - offset;
    }

    char* chars(uint32_t offset) const noexcept { return reinterpret_cast<char*>(data + offset); }
};

constexpr uint64_t SizeU32 = sizeof(uint32_t);
constexpr uint64_t SizeU64 = sizeof(uint64_t);

inline Context& context_of(void* host_ctx) noexcept
{
    return *static_cast<Context*>(host_ctx);
}

inline FizzyExecutionResult result(uvwasi_errno_t err) noexcept
{
    FizzyValue value;
    value.i32 = err;
    return {false, true, value};
}

inline FizzyExecutionResult trap() noexcept
{
    return {true, false, {}};
}

using HostFunction = FizzyExecutionResult(
    Context&, GuestMemory&, const FizzyValue* args);

/// Adapts a host function to the engine calling convention.
/// Allocation failures are reported to the guest as ENOMEM.
template <HostFunction* Fn>
FizzyExecutionResult bind(void* host_ctx, FizzyInstance* instance, const FizzyValue* args,
    FizzyExecutionContext*) noexcept
{
    try
    {
        GuestMemory memory{instance};
        return Fn(context_of(host_ctx), memory, args);
    }
    catch (const std::bad_alloc&)
    {
        return result(UVWASI_ENOMEM);
    }
}

FizzyExecutionResult return_enosys(
    void*, FizzyInstance*, const FizzyValue*, FizzyExecutionContext*) noexcept
{
    return result(UVWASI_ENOSYS);
}

FizzyExecutionResult proc_exit(
    void* host_ctx, FizzyInstance*, const FizzyValue* args, FizzyExecutionContext*) noexcept
{
    context_of(host_ctx).set_exit_code(args[0].i32);
    // Unwind the guest. The caller inspects the recorded exit code.
    return trap();
}

/// Copies a list of NUL-terminated strings (argv or environ) into guest memory.
template <typename SizesFn, typename GetFn>
FizzyExecutionResult copy_string_list(GuestMemory& memory, uint32_t list_ptr, uint32_t buf_ptr,
    SizesFn sizes_get, GetFn get)
{
    uvwasi_size_t count = 0;
    uvwasi_size_t buf_size = 0;
    auto ret = sizes_get(&count, &buf_size);
    if (ret != UVWASI_ESUCCESS)
        return result(ret);

    if (!memory.contains(buf_ptr, buf_size) || !memory.contains(list_ptr, count * SizeU32))
        return result(UVWASI_EOVERFLOW);

    std::vector<char*> pointers(count);
    ret = get(pointers.data(), memory.chars(buf_ptr));
    if (ret != UVWASI_ESUCCESS)
        return result(ret);

    for (uvwasi_size_t i = 0; i < count; ++i)
    {
        const auto guest_ptr = static_cast<uint32_t>(buf_ptr + (pointers[i] - pointers[0]));
        uvwasi_serdes_write_uint32_t(memory.data, list_ptr + i * SizeU32, guest_ptr);
    }
    return result(UVWASI_ESUCCESS);
}

FizzyExecutionResult args_get(Context& ctx, GuestMemory& memory, const FizzyValue* args)
{
    auto& uvwasi = ctx.uvwasi();
    return copy_string_list(
        memory, args[0].i32, args[1].i32,
        [&](uvwasi_size_t* count, uvwasi_size_t* size) noexcept {
            return uvwasi.args_sizes_get(count, size);
        },
        [&](char** list, char* buf) noexcept { return uvwasi.args_get(list, buf); });
}

FizzyExecutionResult environ_get(Context& ctx, GuestMemory& memory, const FizzyValue* args)
{
    auto& uvwasi = ctx.uvwasi();
    return copy_string_list(
        memory, args[0].i32, args[1].i32,
        [&](uvwasi_size_t* count, uvwasi_size_t* size) noexcept {
            return uvwasi.environ_sizes_get(count, size);
        },
        [&](char** list, char* buf) noexcept { return uvwasi.environ_get(list, buf); });
}

FizzyExecutionResult args_sizes_get(Context& ctx, GuestMemory& memory, const FizzyValue* args)
{
    const auto argc_ptr = args[0].i32;
    const auto argv_buf_size_ptr = args[1].i32;
    if (!memory.contains(argc_ptr, SizeU32) || !memory.contains(argv_buf_size_ptr, SizeU32))
        return result(UVWASI_EOVERFLOW);

    uvwasi_size_t argc = 0;
    uvwasi_size_t argv_buf_size = 0;
    const auto ret = ctx.uvwasi().args_sizes_get(&argc, &argv_buf_size);
    if (ret == UVWASI_ESUCCESS)
    {
        uvwasi_serdes_write_uint32_t(memory.data, argc_ptr, argc);
        uvwasi_serdes_write_uint32_t(memory.data, argv_buf_size_ptr, argv_buf_size);
    }
    return result(ret);
}

FizzyExecutionResult environ_sizes_get(Context& ctx, GuestMemory& memory, const FizzyValue* args)
{
    const auto count_ptr = args[0].i32;
    const auto buf_size_ptr = args[1].i32;
    if (!memory.contains(count_ptr, SizeU32) || !memory.contains(buf_size_ptr, SizeU32))
        return result(UVWASI_EOVERFLOW);

    uvwasi_size_t count = 0;
    uvwasi_size_t buf_size = 0;
    const auto ret = ctx.uvwasi().environ_sizes_get(&count, &buf_size);
    if (ret == UVWASI_ESUCCESS)
    {
        uvwasi_serdes_write_uint32_t(memory.data, count_ptr, count);
        uvwasi_serdes_write_uint32_t(memory.data, buf_size_ptr, buf_size);
    }
    return result(ret);
}

FizzyExecutionResult clock_res_get(Context& ctx, GuestMemory& memory, const FizzyValue* args)
{
    const auto resolution_ptr = args[1].i32;
    if (!memory.contains(resolution_ptr, SizeU64))
        return result(UVWASI_EOVERFLOW);

    uvwasi_timestamp_t resolution = 0;
    const auto ret = ctx.uvwasi().clock_res_get(args[0].i32, &resolution);
    if (ret == UVWASI_ESUCCESS)
        uvwasi_serdes_write_uint64_t(memory.data, resolution_ptr, resolution);
    return result(ret);
}

FizzyExecutionResult clock_time_get(Context& ctx, GuestMemory& memory, const FizzyValue* args)
{
    const auto time_ptr = args[2].i32;
    if (!memory.contains(time_ptr, SizeU64))
        return result(UVWASI_EOVERFLOW);

    uvwasi_timestamp_t time = 0;
    const auto ret = ctx.uvwasi().clock_time_get(args[0].i32, args[1].i64, &time);
    if (ret == UVWASI_ESUCCESS)
        uvwasi_serdes_write_uint64_t(memory.data, time_ptr, time);
    return result(ret);
}

FizzyExecutionResult fd_advise(Context& ctx, GuestMemory&, const FizzyValue* args)
{
    return result(ctx.uvwasi().fd_advise(
        args[0].i32, args[1].i64, args[2].i64, static_cast<uvwasi_advice_t>(args[3].i32)));
}

FizzyExecutionResult fd_allocate(Context& ctx, GuestMemory&, const FizzyValue* args)
{
    return result(ctx.uvwasi().fd_allocate(args[0].i32, args[1].i64, args[2].i64));
}

FizzyExecutionResult fd_close(Context& ctx, GuestMemory&, const FizzyValue* args)
{
    return result(ctx.uvwasi().fd_close(args[0].i32));
}

FizzyExecutionResult fd_datasync(Context& ctx, GuestMemory&, const FizzyValue* args)
{
    return result(ctx.uvwasi().fd_datasync(args[0].i32));
}

FizzyExecutionResult fd_fdstat_get(Context& ctx, GuestMemory& memory, const FizzyValue* args)
{
    const auto buf_ptr = args[1].i32;
    if (!memory.contains(buf_ptr, UVWASI_SERDES_SIZE_fdstat_t))
        return result(UVWASI_EOVERFLOW);

    uvwasi_fdstat_t stat;
    const auto ret = ctx.uvwasi().fd_fdstat_get(args[0].i32, &stat);
    if (ret == UVWASI_ESUCCESS)
        uvwasi_serdes_write_fdstat_t(memory.data, buf_ptr, &stat);
    return result(ret);
}

FizzyExecutionResult fd_fdstat_set_flags(Context& ctx, GuestMemory&, const FizzyValue* args)
{
    return result(
        ctx.uvwasi().fd_fdstat_set_flags(args[0].i32, static_cast<uvwasi_fdflags_t>(args[1].i32)));
}

FizzyExecutionResult fd_filestat_get(Context& ctx, GuestMemory& memory, const FizzyValue* args)
{
    const auto buf_ptr = args[1].i32;
    if (!memory.contains(buf_ptr, UVWASI_SERDES_SIZE_filestat_t))
        return result(UVWASI_EOVERFLOW);

    uvwasi_filestat_t stat;
    const auto ret = ctx.uvwasi().fd_filestat_get(args[0].i32, &stat);
    if (ret == UVWASI_ESUCCESS)
        uvwasi_serdes_write_filestat_t(memory.data, buf_ptr, &stat);
    return result(ret);
}

FizzyExecutionResult fd_filestat_set_size(Context& ctx, GuestMemory&, const FizzyValue* args)
{
    return result(ctx.uvwasi().fd_filestat_set_size(args[0].i32, args[1].i64));
}

FizzyExecutionResult fd_filestat_set_times(Context& ctx, GuestMemory&, const FizzyValue* args)
{
    return result(ctx.uvwasi().fd_filestat_set_times(
        args[0].i32, args[1].i64, args[2].i64, static_cast<uvwasi_fstflags_t>(args[3].i32)));
}

/// Reads an iovec array from guest memory. Returns an errno on failure.
template <typename IOVec, typename ReadFn>
uvwasi_errno_t read_iovecs(GuestMemory& memory, uint32_t iovs_ptr, uint32_t iovs_len,
    std::vector<IOVec>& iovs, ReadFn read_fn)
{
    // Also bounds the allocation below.
    if (!memory.contains(iovs_ptr, uint64_t{iovs_len} * UVWASI_SERDES_SIZE_iovec_t))
        return UVWASI_EOVERFLOW;

    iovs.resize(iovs_len);
    return read_fn(memory.data, memory.size, iovs_ptr, iovs.data(), iovs_len);
}

FizzyExecutionResult fd_pread(Context& ctx, GuestMemory& memory, const FizzyValue* args)
{
    const auto fd = args[0].i32;
    const auto iovs_ptr = args[1].i32;
    const auto iovs_len = args[2].i32;
    const auto offset = args[3].i64;
    const auto nread_ptr = args[4].i32;
    if (!memory.contains(nread_ptr, SizeU32))
        return result(UVWASI_EOVERFLOW);

    std::vector<uvwasi_iovec_t> iovs;
    auto ret = read_iovecs(memory, iovs_ptr, iovs_len, iovs, uvwasi_serdes_readv_iovec_t);
    if (ret != UVWASI_ESUCCESS)
        return result(ret);

    uvwasi_size_t nread = 0;
    ret = ctx.uvwasi().fd_pread(fd, iovs.data(), iovs_len, offset, &nread);
    uvwasi_serdes_write_uint32_t(memory.data, nread_ptr, nread);
    return result(ret);
}

FizzyExecutionResult fd_prestat_get(Context& ctx, GuestMemory& memory, const FizzyValue* args)
{
    const auto buf_ptr = args[1].i32;
    if (!memory.contains(buf_ptr, UVWASI_SERDES_SIZE_prestat_t))
        return result(UVWASI_EOVERFLOW);

    uvwasi_prestat_t prestat;
    const auto ret = ctx.uvwasi().fd_prestat_get(args[0].i32, &prestat);
    if (ret == UVWASI_ESUCCESS)
        uvwasi_serdes_write_prestat_t(memory.data, buf_ptr, &prestat);
    return result(ret);
}

FizzyExecutionResult fd_prestat_dir_name(Context& ctx, GuestMemory& memory, const FizzyValue* args)
{
    const auto path_ptr = args[1].i32;
    const auto path_len = args[2].i32;
    if (!memory.contains(path_ptr, path_len))
        return result(UVWASI_EOVERFLOW);

    return result(ctx.uvwasi().fd_prestat_dir_name(args[0].i32, memory.chars(path_ptr), path_len));
}

FizzyExecutionResult fd_pwrite(Context& ctx, GuestMemory& memory, const FizzyValue* args)
{
    const auto fd = args[0].i32;
    const auto iovs_ptr = args[1].i32;
    const auto iovs_len = args[2].i32;
    const auto offset = args[3].i64;
    const auto nwritten_ptr = args[4].i32;
    if (!memory.contains(nwritten_ptr, SizeU32))
        return result(UVWASI_EOVERFLOW);

    std::vector<uvwasi_ciovec_t> iovs;
    auto ret = read_iovecs(memory, iovs_ptr, iovs_len, iovs, uvwasi_serdes_readv_ciovec_t);
    if (ret != UVWASI_ESUCCESS)
        return result(ret);

    uvwasi_size_t nwritten = 0;
    ret = ctx.uvwasi().fd_pwrite(fd, iovs.data(), iovs_len, offset, &nwritten);
    uvwasi_serdes_write_uint32_t(memory.data, nwritten_ptr, nwritten);
    return result(ret);
}

FizzyExecutionResult fd_read(Context& ctx, GuestMemory& memory, const FizzyValue* args)
{
    const auto fd = args[0].i32;
    const auto iovs_ptr = args[1].i32;
    const auto iovs_len = args[2].i32;
    const auto nread_ptr = args[3].i32;
    if (!memory.contains(nread_ptr, SizeU32))
        return result(UVWASI_EOVERFLOW);

    std::vector<uvwasi_iovec_t> iovs;
    auto ret = read_iovecs(memory, iovs_ptr, iovs_len, iovs, uvwasi_serdes_readv_iovec_t);
    if (ret != UVWASI_ESUCCESS)
        return result(ret);

    uvwasi_size_t nread = 0;
    ret = ctx.uvwasi().fd_read(fd, iovs.data(), iovs_len, &nread);
    uvwasi_serdes_write_uint32_t(memory.data, nread_ptr, nread);
    return result(ret);
}

FizzyExecutionResult fd_readdir(Context& ctx, GuestMemory& memory, const FizzyValue* args)
{
    const auto buf_ptr = args[1].i32;
    const auto buf_len = args[2].i32;
    const auto bufused_ptr = args[4].i32;
    if (!memory.contains(buf_ptr, buf_len) || !memory.contains(bufused_ptr, SizeU32))
        return result(UVWASI_EOVERFLOW);

    uvwasi_size_t bufused = 0;
    const auto ret = ctx.uvwasi().fd_readdir(
        args[0].i32, memory.data + buf_ptr, buf_len, args[3].i64, &bufused);
    if (ret == UVWASI_ESUCCESS)
        uvwasi_serdes_write_uint32_t(memory.data, bufused_ptr, bufused);
    return result(ret);
}

FizzyExecutionResult fd_renumber(Context& ctx, GuestMemory&, const FizzyValue* args)
{
    return result(ctx.uvwasi().fd_renumber(args[0].i32, args[1].i32));
}

FizzyExecutionResult fd_seek(Context& ctx, GuestMemory& memory, const FizzyValue* args)
{
    const auto newoffset_ptr = args[3].i32;
    if (!memory.contains(newoffset_ptr, SizeU64))
        return result(UVWASI_EOVERFLOW);

    uvwasi_filesize_t newoffset = 0;
    const auto ret = ctx.uvwasi().fd_seek(args[0].i32, static_cast<uvwasi_filedelta_t>(args[1].i64),
        static_cast<uvwasi_whence_t>(args[2].i32), &newoffset);
    if (ret == UVWASI_ESUCCESS)
        uvwasi_serdes_write_uint64_t(memory.data, newoffset_ptr, newoffset);
    return result(ret);
}

FizzyExecutionResult fd_sync(Context& ctx, GuestMemory&, const FizzyValue* args)
{
    return result(ctx.uvwasi().fd_sync(args[0].i32));
}

FizzyExecutionResult fd_tell(Context& ctx, GuestMemory& memory, const FizzyValue* args)
{
    const auto offset_ptr = args[1].i32;
    if (!memory.contains(offset_ptr, SizeU64))
        return result(UVWASI_EOVERFLOW);

    uvwasi_filesize_t offset = 0;
    const auto ret = ctx.uvwasi().fd_tell(args[0].i32, &offset);
    if (ret == UVWASI_ESUCCESS)
        uvwasi_serdes_write_uint64_t(memory.data, offset_ptr, offset);
    return result(ret);
}

FizzyExecutionResult fd_write(Context& ctx, GuestMemory& memory, const FizzyValue* args)
{
    const auto fd = args[0].i32;
    const auto iovs_ptr = args[1].i32;
    const auto iovs_len = args[2].i32;
    const auto nwritten_ptr = args[3].i32;
    if (!memory.contains(nwritten_ptr, SizeU32))
        return result(UVWASI_EOVERFLOW);

    std::vector<uvwasi_ciovec_t> iovs;
    auto ret = read_iovecs(memory, iovs_ptr, iovs_len, iovs, uvwasi_serdes_readv_ciovec_t);
    if (ret != UVWASI_ESUCCESS)
        return result(ret);

    uvwasi_size_t nwritten = 0;
    if (fd == 1 || fd == 2)
    {
        // Standard streams are relayed to the host sinks.
        auto& stream = (fd == 1) ? ctx.out() : ctx.err();
        for (const auto& iov : iovs)
        {
            stream.write(static_cast<const char*>(iov.buf), static_cast<std::streamsize>(iov.buf_len));
            nwritten += iov.buf_len;
        }
        ret = stream ? UVWASI_ESUCCESS : UVWASI_EIO;
    }
    else
        ret = ctx.uvwasi().fd_write(fd, iovs.data(), iovs_len, &nwritten);

    uvwasi_serdes_write_uint32_t(memory.data, nwritten_ptr, nwritten);
    return result(ret);
}

FizzyExecutionResult path_create_directory(
    Context& ctx, GuestMemory& memory, const FizzyValue* args)
{
    const auto path_ptr = args[1].i32;
    const auto path_len = args[2].i32;
    if (!memory.contains(path_ptr, path_len))
        return result(UVWASI_EOVERFLOW);

    return result(
        ctx.uvwasi().path_create_directory(args[0].i32, memory.chars(path_ptr), path_len));
}

FizzyExecutionResult path_filestat_get(Context& ctx, GuestMemory& memory, const FizzyValue* args)
{
    const auto path_ptr = args[2].i32;
    const auto path_len = args[3].i32;
    const auto buf_ptr = args[4].i32;
    if (!memory.contains(path_ptr, path_len) ||
        !memory.contains(buf_ptr, UVWASI_SERDES_SIZE_filestat_t))
        return result(UVWASI_EOVERFLOW);

    uvwasi_filestat_t stat;
    const auto ret = ctx.uvwasi().path_filestat_get(
        args[0].i32, args[1].i32, memory.chars(path_ptr), path_len, &stat);
    if (ret == UVWASI_ESUCCESS)
        uvwasi_serdes_write_filestat_t(memory.data, buf_ptr, &stat);
    return result(ret);
}

FizzyExecutionResult path_filestat_set_times(
    Context& ctx, GuestMemory& memory, const FizzyValue* args)
{
    const auto path_ptr = args[2].i32;
    const auto path_len = args[3].i32;
    if (!memory.contains(path_ptr, path_len))
        return result(UVWASI_EOVERFLOW);

    return result(ctx.uvwasi().path_filestat_set_times(args[0].i32, args[1].i32,
        memory.chars(path_ptr), path_len, args[4].i64, args[5].i64,
        static_cast<uvwasi_fstflags_t>(args[6].i32)));
}

FizzyExecutionResult path_link(Context& ctx, GuestMemory& memory, const FizzyValue* args)
{
    const auto old_path_ptr = args[2].i32;
    const auto old_path_len = args[3].i32;
    const auto new_path_ptr = args[5].i32;
    const auto new_path_len = args[6].i32;
    if (!memory.contains(old_path_ptr, old_path_len) ||
        !memory.contains(new_path_ptr, new_path_len))
        return result(UVWASI_EOVERFLOW);

    return result(ctx.uvwasi().path_link(args[0].i32, args[1].i32, memory.chars(old_path_ptr),
        old_path_len, args[4].i32, memory.chars(new_path_ptr), new_path_len));
}

FizzyExecutionResult path_open(Context& ctx, GuestMemory& memory, const FizzyValue* args)
{
    const auto path_ptr = args[2].i32;
    const auto path_len = args[3].i32;
    const auto fd_ptr = args[8].i32;
    if (!memory.contains(path_ptr, path_len) || !memory.contains(fd_ptr, SizeU32))
        return result(UVWASI_EOVERFLOW);

    uvwasi_fd_t fd = 0;
    const auto ret = ctx.uvwasi().path_open(args[0].i32, args[1].i32, memory.chars(path_ptr),
        path_len, static_cast<uvwasi_oflags_t>(args[4].i32), args[5].i64, args[6].i64,
        static_cast<uvwasi_fdflags_t>(args[7].i32), &fd);
    if (ret == UVWASI_ESUCCESS)
        uvwasi_serdes_write_uint32_t(memory.data, fd_ptr, fd);
    return result(ret);
}

FizzyExecutionResult path_readlink(Context& ctx, GuestMemory& memory, const FizzyValue* args)
{
    const auto path_ptr = args[1].i32;
    const auto path_len = args[2].i32;
    const auto buf_ptr = args[3].i32;
    const auto buf_len = args[4].i32;
    const auto bufused_ptr = args[5].i32;
    if (!memory.contains(path_ptr, path_len) || !memory.contains(buf_ptr, buf_len) ||
        !memory.contains(bufused_ptr, SizeU32))
        return result(UVWASI_EOVERFLOW);

    uvwasi_size_t bufused = 0;
    const auto ret = ctx.uvwasi().path_readlink(
        args[0].i32, memory.chars(path_ptr), path_len, memory.chars(buf_ptr), buf_len, &bufused);
    if (ret == UVWASI_ESUCCESS)
        uvwasi_serdes_write_uint32_t(memory.data, bufused_ptr, bufused);
    return result(ret);
}

FizzyExecutionResult path_remove_directory(
    Context& ctx, GuestMemory& memory, const FizzyValue* args)
{
    const auto path_ptr = args[1].i32;
    const auto path_len = args[2].i32;
    if (!memory.contains(path_ptr, path_len))
        return result(UVWASI_EOVERFLOW);

    return result(
        ctx.uvwasi().path_remove_directory(args[0].i32, memory.chars(path_ptr), path_len));
}

FizzyExecutionResult path_rename(Context& ctx, GuestMemory& memory, const FizzyValue* args)
{
    const auto old_path_ptr = args[1].i32;
    const auto old_path_len = args[2].i32;
    const auto new_path_ptr = args[4].i32;
    const auto new_path_len = args[5].i32;
    if (!memory.contains(old_path_ptr, old_path_len) ||
        !memory.contains(new_path_ptr, new_path_len))
        return result(UVWASI_EOVERFLOW);

    return result(ctx.uvwasi().path_rename(args[0].i32, memory.chars(old_path_ptr), old_path_len,
        args[3].i32, memory.chars(new_path_ptr), new_path_len));
}

FizzyExecutionResult path_symlink(Context& ctx, GuestMemory& memory, const FizzyValue* args)
{
    const auto old_path_ptr = args[0].i32;
    const auto old_path_len = args[1].i32;
    const auto new_path_ptr = args[3].i32;
    const auto new_path_len = args[4].i32;
    if (!memory.contains(old_path_ptr, old_path_len) ||
        !memory.contains(new_path_ptr, new_path_len))
        return result(UVWASI_EOVERFLOW);

    return result(ctx.uvwasi().path_symlink(memory.chars(old_path_ptr), old_path_len, args[2].i32,
        memory.chars(new_path_ptr), new_path_len));
}

FizzyExecutionResult path_unlink_file(Context& ctx, GuestMemory& memory, const FizzyValue* args)
{
    const auto path_ptr = args[1].i32;
    const auto path_len = args[2].i32;
    if (!memory.contains(path_ptr, path_len))
        return result(UVWASI_EOVERFLOW);

    return result(ctx.uvwasi().path_unlink_file(args[0].i32, memory.chars(path_ptr), path_len));
}

FizzyExecutionResult poll_oneoff(Context& ctx, GuestMemory& memory, const FizzyValue* args)
{
    const auto in_ptr = args[0].i32;
    const auto out_ptr = args[1].i32;
    const auto nsubscriptions = args[2].i32;
    const auto nevents_ptr = args[3].i32;
    if (!memory.contains(in_ptr, uint64_t{nsubscriptions} * UVWASI_SERDES_SIZE_subscription_t) ||
        !memory.contains(out_ptr, uint64_t{nsubscriptions} * UVWASI_SERDES_SIZE_event_t) ||
        !memory.contains(nevents_ptr, SizeU32))
        return result(UVWASI_EOVERFLOW);

    std::vector<uvwasi_subscription_t> in(nsubscriptions);
    for (uint32_t i = 0; i < nsubscriptions; ++i)
    {
        uvwasi_serdes_read_subscription_t(
            memory.data, in_ptr + i * UVWASI_SERDES_SIZE_subscription_t, &in[i]);
    }

    std::vector<uvwasi_event_t> out(nsubscriptions);
    uvwasi_size_t nevents = 0;
    const auto ret = ctx.uvwasi().poll_oneoff(in.data(), out.data(), nsubscriptions, &nevents);
    if (ret != UVWASI_ESUCCESS)
        return result(ret);

    nevents = std::min(nevents, nsubscriptions);
    for (uint32_t i = 0; i < nevents; ++i)
        uvwasi_serdes_write_event_t(memory.data, out_ptr + i * UVWASI_SERDES_SIZE_event_t, &out[i]);
    uvwasi_serdes_write_uint32_t(memory.data, nevents_ptr, nevents);
    return result(ret);
}

FizzyExecutionResult random_get(Context& ctx, GuestMemory& memory, const FizzyValue* args)
{
    const auto buf_ptr = args[0].i32;
    const auto buf_len = args[1].i32;
    if (!memory.contains(buf_ptr, buf_len))
        return result(UVWASI_EOVERFLOW);

    return result(ctx.uvwasi().random_get(memory.data + buf_ptr, buf_len));
}

FizzyExecutionResult sched_yield(Context& ctx, GuestMemory&, const FizzyValue*)
{
    return result(ctx.uvwasi().sched_yield());
}

/// A WASI function provided by the host.
///
/// The signature lists input and output types delimited by a colon, where `i` means i32 and
/// `I` means i64. As an example `iI:i` translates to `(i32, i64) -> (i32)`.
struct WasiFunction
{
    const char* name;
    const char* signature;
    FizzyExternalFn function;
};

constexpr WasiFunction wasi_functions[] = {
    {"args_get", "ii:i", bind<args_get>},
    {"args_sizes_get", "ii:i", bind<args_sizes_get>},
    {"clock_res_get", "ii:i", bind<clock_res_get>},
    {"clock_time_get", "iIi:i", bind<clock_time_get>},
    {"environ_get", "ii:i", bind<environ_get>},
    {"environ_sizes_get", "ii:i", bind<environ_sizes_get>},
    {"fd_advise", "iIIi:i", bind<fd_advise>},
    {"fd_allocate", "iII:i", bind<fd_allocate>},
    {"fd_close", "i:i", bind<fd_close>},
    {"fd_datasync", "i:i", bind<fd_datasync>},
    {"fd_fdstat_get", "ii:i", bind<fd_fdstat_get>},
    {"fd_fdstat_set_flags", "ii:i", bind<fd_fdstat_set_flags>},
    {"fd_filestat_get", "ii:i", bind<fd_filestat_get>},
    {"fd_filestat_set_size", "iI:i", bind<fd_filestat_set_size>},
    {"fd_filestat_set_times", "iIIi:i", bind<fd_filestat_set_times>},
    {"fd_pread", "iiiIi:i", bind<fd_pread>},
    {"fd_prestat_dir_name", "iii:i", bind<fd_prestat_dir_name>},
    {"fd_prestat_get", "ii:i", bind<fd_prestat_get>},
    {"fd_pwrite", "iiiIi:i", bind<fd_pwrite>},
    {"fd_read", "iiii:i", bind<fd_read>},
    {"fd_readdir", "iiiIi:i", bind<fd_readdir>},
    {"fd_renumber", "ii:i", bind<fd_renumber>},
    {"fd_seek", "iIii:i", bind<fd_seek>},
    {"fd_sync", "i:i", bind<fd_sync>},
    {"fd_tell", "ii:i", bind<fd_tell>},
    {"fd_write", "iiii:i", bind<fd_write>},
    {"path_create_directory", "iii:i", bind<path_create_directory>},
    {"path_filestat_get", "iiiii:i", bind<path_filestat_get>},
    {"path_filestat_set_times", "iiiiIIi:i", bind<path_filestat_set_times>},
    {"path_link", "iiiiiii:i", bind<path_link>},
    {"path_open", "iiiiiIIii:i", bind<path_open>},
    {"path_readlink", "iiiiii:i", bind<path_readlink>},
    {"path_remove_directory", "iii:i", bind<path_remove_directory>},
    {"path_rename", "iiiiii:i", bind<path_rename>},
    {"path_symlink", "iiiii:i", bind<path_symlink>},
    {"path_unlink_file", "iii:i", bind<path_unlink_file>},
    {"poll_oneoff", "iiii:i", bind<poll_oneoff>},
    {"proc_exit", "i:", proc_exit},
    {"random_get", "ii:i", bind<random_get>},
    {"sched_yield", ":i", bind<sched_yield>},
};

const WasiFunction* find_wasi_function(std::string_view name) noexcept
{
    const auto it = std::find_if(std::begin(wasi_functions), std::end(wasi_functions),
        [name](const WasiFunction& f) noexcept { return name == f.name; });
    return it != std::end(wasi_functions) ? it : nullptr;
}

char type_code(FizzyValueType type) noexcept
{
    if (type == FizzyValueTypeI32)
        return 'i';
    if (type == FizzyValueTypeI64)
        return 'I';
    if (type == FizzyValueTypeF32)
        return 'f';
    if (type == FizzyValueTypeF64)
        return 'F';
    return '?';
}

/// Renders a function type in the signature notation of wasi_functions.
std::string signature_of(const FizzyFunctionType& type)
{
    std::string signature;
    for (size_t i = 0; i < type.inputs_size; ++i)
        signature += type_code(type.inputs[i]);
    signature += ':';
    if (type.output != FizzyValueTypeVoid)
        signature += type_code(type.output);
    return signature;
}
}  // namespace

std::unique_ptr<Instance> instantiate(
    Context& context, bytes_view wasm_binary, uint32_t memory_pages_limit)
{
    if (memory_pages_limit > MaxMemoryPagesLimit)
        throw instantiate_error{"memory pages limit above " + std::to_string(MaxMemoryPagesLimit)};

    FizzyError error;
    std::unique_ptr<const FizzyModule, void (*)(const FizzyModule*)> module{
        fizzy_parse(wasm_binary.data(), wasm_binary.size(), &error), fizzy_free_module};
    if (!module)
        throw instantiate_error{std::string{"parse: "} + error.message +
                                " (only WebAssembly 1.0 is supported, build with -mcpu=mvp)"};

    std::vector<FizzyImportedFunction> imports;
    const auto import_count = fizzy_get_import_count(module.get());
    for (uint32_t i = 0; i < import_count; ++i)
    {
        const auto import = fizzy_get_import_description(module.get(), i);
        const auto import_name = std::string{import.module} + "." + import.name;
        if (import.kind != FizzyExternalKindFunction || std::string_view{import.module} != ModuleName)
            throw instantiate_error{"unresolved import: " + import_name};

        const auto& type = import.desc.function_type;
        FizzyExternalFn function = nullptr;
        if (const auto* wasi_function = find_wasi_function(import.name); wasi_function != nullptr)
        {
            const auto declared = signature_of(type);
            if (declared != wasi_function->signature)
                throw instantiate_error{"import type mismatch: " + import_name + " declared as " +
                                        declared + ", expected " + wasi_function->signature};
            function = wasi_function->function;
        }
        else if (type.output == FizzyValueTypeI32)
            function = return_enosys;
        else
            throw instantiate_error{"unresolved import: " + import_name};

        imports.push_back({import.module, import.name, {type, function, &context}});
    }

    // The instance takes ownership of the module, also on failure.
    auto* instance = fizzy_resolve_instantiate(module.release(), imports.data(), imports.size(),
        nullptr, nullptr, nullptr, 0, memory_pages_limit, &error);
    if (instance == nullptr)
        throw instantiate_error{std::string{"instantiate: "} + error.message};

    return std::make_unique<Instance>(instance);
}

std::optional<uint64_t> call(
    Context& context, Instance& instance, Instance::FuncIdx func_idx, std::string_view name)
{
    context.clear_exit_code();
    const auto result = instance.execute(func_idx);
    if (result.trapped)
    {
        if (const auto exit_code = context.exit_code(); exit_code.has_value())
        {
            if (*exit_code != 0)
                throw exit_error{std::string{name}, *exit_code};
            return std::nullopt;
        }
        throw trap_error{std::string{name}};
    }
    return result.value;
}
}  // namespace pglite::wasi
