// PGLite: PostgreSQL in WebAssembly, hosted on Fizzy
// Copyright 2024 The PGLite Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <wasi_types.h>
#include <memory>
#include <string>
#include <vector>

namespace pglite::wasi
{
/// A directory of the host made visible to the guest.
struct Preopen
{
    /// Path as seen by the guest.
    std::string guest_path;
    /// Path on the host.
    std::string host_path;
};

struct InitOptions
{
    std::vector<std::string> args;
    /// Environment entries in KEY=VALUE form.
    std::vector<std::string> env;
    std::vector<Preopen> preopens;
};

/// UVWASI interface.
///
/// Pointer arguments refer to host memory. Buffers passed to args_get, environ_get,
/// fd_prestat_dir_name, fd_readdir, path_readlink and random_get may point directly into guest
/// memory; the implementation writes the WASI wire format there.
class UVWASI
{
public:
    virtual ~UVWASI();

    virtual uvwasi_errno_t init(const InitOptions& options) noexcept = 0;

    virtual uvwasi_errno_t args_get(char** argv, char* argv_buf) noexcept = 0;

    virtual uvwasi_errno_t args_sizes_get(
        uvwasi_size_t* argc, uvwasi_size_t* argv_buf_size) noexcept = 0;

    virtual uvwasi_errno_t environ_get(char** environment, char* environ_buf) noexcept = 0;

    virtual uvwasi_errno_t environ_sizes_get(
        uvwasi_size_t* environ_count, uvwasi_size_t* environ_buf_size) noexcept = 0;

    virtual uvwasi_errno_t clock_res_get(
        uvwasi_clockid_t clock_id, uvwasi_timestamp_t* resolution) noexcept = 0;

    virtual uvwasi_errno_t clock_time_get(uvwasi_clockid_t clock_id,
        uvwasi_timestamp_t precision, uvwasi_timestamp_t* time) noexcept = 0;

    virtual uvwasi_errno_t fd_advise(uvwasi_fd_t fd, uvwasi_filesize_t offset,
        uvwasi_filesize_t len, uvwasi_advice_t advice) noexcept = 0;

    virtual uvwasi_errno_t fd_allocate(
        uvwasi_fd_t fd, uvwasi_filesize_t offset, uvwasi_filesize_t len) noexcept = 0;

    virtual uvwasi_errno_t fd_close(uvwasi_fd_t fd) noexcept = 0;

    virtual uvwasi_errno_t fd_datasync(uvwasi_fd_t fd) noexcept = 0;

    virtual uvwasi_errno_t fd_fdstat_get(uvwasi_fd_t fd, uvwasi_fdstat_t* buf) noexcept = 0;

    virtual uvwasi_errno_t fd_fdstat_set_flags(uvwasi_fd_t fd, uvwasi_fdflags_t flags) noexcept = 0;

    virtual uvwasi_errno_t fd_filestat_get(uvwasi_fd_t fd, uvwasi_filestat_t* buf) noexcept = 0;

    virtual uvwasi_errno_t fd_filestat_set_size(
        uvwasi_fd_t fd, uvwasi_filesize_t st_size) noexcept = 0;

    virtual uvwasi_errno_t fd_filestat_set_times(uvwasi_fd_t fd, uvwasi_timestamp_t st_atim,
        uvwasi_timestamp_t st_mtim, uvwasi_fstflags_t fst_flags) noexcept = 0;

    virtual uvwasi_errno_t fd_pread(uvwasi_fd_t fd, const uvwasi_iovec_t* iovs,
        uvwasi_size_t iovs_len, uvwasi_filesize_t offset, uvwasi_size_t* nread) noexcept = 0;

    virtual uvwasi_errno_t fd_prestat_get(uvwasi_fd_t fd, uvwasi_prestat_t* buf) noexcept = 0;

    virtual uvwasi_errno_t fd_prestat_dir_name(
        uvwasi_fd_t fd, char* path, uvwasi_size_t path_len) noexcept = 0;

    virtual uvwasi_errno_t fd_pwrite(uvwasi_fd_t fd, const uvwasi_ciovec_t* iovs,
        uvwasi_size_t iovs_len, uvwasi_filesize_t offset, uvwasi_size_t* nwritten) noexcept = 0;

    virtual uvwasi_errno_t fd_read(uvwasi_fd_t fd, const uvwasi_iovec_t* iovs,
        uvwasi_size_t iovs_len, uvwasi_size_t* nread) noexcept = 0;

    virtual uvwasi_errno_t fd_readdir(uvwasi_fd_t fd, void* buf, uvwasi_size_t buf_len,
        uvwasi_dircookie_t cookie, uvwasi_size_t* bufused) noexcept = 0;

    virtual uvwasi_errno_t fd_renumber(uvwasi_fd_t from, uvwasi_fd_t to) noexcept = 0;

    virtual uvwasi_errno_t fd_seek(uvwasi_fd_t fd, uvwasi_filedelta_t offset,
        uvwasi_whence_t whence, uvwasi_filesize_t* newoffset) noexcept = 0;

    virtual uvwasi_errno_t fd_sync(uvwasi_fd_t fd) noexcept = 0;

    virtual uvwasi_errno_t fd_tell(uvwasi_fd_t fd, uvwasi_filesize_t* offset) noexcept = 0;

    virtual uvwasi_errno_t fd_write(uvwasi_fd_t fd, const uvwasi_ciovec_t* iovs,
        uvwasi_size_t iovs_len, uvwasi_size_t* nwritten) noexcept = 0;

    virtual uvwasi_errno_t path_create_directory(
        uvwasi_fd_t fd, const char* path, uvwasi_size_t path_len) noexcept = 0;

    virtual uvwasi_errno_t path_filestat_get(uvwasi_fd_t fd, uvwasi_lookupflags_t flags,
        const char* path, uvwasi_size_t path_len, uvwasi_filestat_t* buf) noexcept = 0;

    virtual uvwasi_errno_t path_filestat_set_times(uvwasi_fd_t fd, uvwasi_lookupflags_t flags,
        const char* path, uvwasi_size_t path_len, uvwasi_timestamp_t st_atim,
        uvwasi_timestamp_t st_mtim, uvwasi_fstflags_t fst_flags) noexcept = 0;

    virtual uvwasi_errno_t path_link(uvwasi_fd_t old_fd, uvwasi_lookupflags_t old_flags,
        const char* old_path, uvwasi_size_t old_path_len, uvwasi_fd_t new_fd,
        const char* new_path, uvwasi_size_t new_path_len) noexcept = 0;

    virtual uvwasi_errno_t path_open(uvwasi_fd_t dirfd, uvwasi_lookupflags_t dirflags,
        const char* path, uvwasi_size_t path_len, uvwasi_oflags_t o_flags,
        uvwasi_rights_t fs_rights_base, uvwasi_rights_t fs_rights_inheriting,
        uvwasi_fdflags_t fs_flags, uvwasi_fd_t* fd) noexcept = 0;

    virtual uvwasi_errno_t path_readlink(uvwasi_fd_t fd, const char* path,
        uvwasi_size_t path_len, char* buf, uvwasi_size_t buf_len,
        uvwasi_size_t* bufused) noexcept = 0;

    virtual uvwasi_errno_t path_remove_directory(
        uvwasi_fd_t fd, const char* path, uvwasi_size_t path_len) noexcept = 0;

    virtual uvwasi_errno_t path_rename(uvwasi_fd_t old_fd, const char* old_path,
        uvwasi_size_t old_path_len, uvwasi_fd_t new_fd, const char* new_path,
        uvwasi_size_t new_path_len) noexcept = 0;

    virtual uvwasi_errno_t path_symlink(const char* old_path, uvwasi_size_t old_path_len,
        uvwasi_fd_t fd, const char* new_path, uvwasi_size_t new_path_len) noexcept = 0;

    virtual uvwasi_errno_t path_unlink_file(
        uvwasi_fd_t fd, const char* path, uvwasi_size_t path_len) noexcept = 0;

    virtual uvwasi_errno_t poll_oneoff(const uvwasi_subscription_t* in, uvwasi_event_t* out,
        uvwasi_size_t nsubscriptions, uvwasi_size_t* nevents) noexcept = 0;

    virtual uvwasi_errno_t random_get(void* buf, uvwasi_size_t buf_len) noexcept = 0;

    virtual uvwasi_errno_t sched_yield() noexcept = 0;
};

std::unique_ptr<UVWASI> create_uvwasi();

}  // namespace pglite::wasi
