// PGLite: PostgreSQL in WebAssembly, hosted on Fizzy
// Copyright 2024 The PGLite Authors.
// SPDX-License-Identifier: Apache-2.0

#include "uvwasi.hpp"
#include <uvwasi.h>
#include <new>

namespace pglite::wasi
{
namespace
{
class UVWASIImpl final : public UVWASI
{
    /// UVWASI state.
    uvwasi_t m_state{};

    bool m_initialized = false;

    void destroy() noexcept
    {
        if (m_initialized)
            uvwasi_destroy(&m_state);
        m_initialized = false;
    }

public:
    UVWASIImpl() = default;
    UVWASIImpl(const UVWASIImpl&) = delete;
    UVWASIImpl& operator=(const UVWASIImpl&) = delete;

    ~UVWASIImpl() final { destroy(); }

    uvwasi_errno_t init(const InitOptions& init_options) noexcept final
    {
        destroy();

        try
        {
            std::vector<const char*> argv;
            for (const auto& arg : init_options.args)
                argv.push_back(arg.c_str());

            // NULL-terminated.
            std::vector<const char*> envp;
            for (const auto& entry : init_options.env)
                envp.push_back(entry.c_str());
            envp.push_back(nullptr);

            std::vector<uvwasi_preopen_t> preopens;
            for (const auto& preopen : init_options.preopens)
                preopens.push_back({preopen.guest_path.c_str(), preopen.host_path.c_str()});

            uvwasi_options_t options;
            uvwasi_options_init(&options);
            options.fd_table_size = 3 + static_cast<uvwasi_size_t>(preopens.size());
            options.preopenc = static_cast<uvwasi_size_t>(preopens.size());
            options.preopens = preopens.data();
            options.argc = static_cast<uvwasi_size_t>(argv.size());
            options.argv = argv.data();
            options.envp = envp.data();
            options.in = 0;
            options.out = 1;
            options.err = 2;

            const auto ret = uvwasi_init(&m_state, &options);
            m_initialized = (ret == UVWASI_ESUCCESS);
            return ret;
        }
        catch (const std::bad_alloc&)
        {
            return UVWASI_ENOMEM;
        }
    }

    uvwasi_errno_t args_get(char** argv, char* argv_buf) noexcept final
    {
        return uvwasi_args_get(&m_state, argv, argv_buf);
    }

    uvwasi_errno_t args_sizes_get(
        uvwasi_size_t* argc, uvwasi_size_t* argv_buf_size) noexcept final
    {
        return uvwasi_args_sizes_get(&m_state, argc, argv_buf_size);
    }

    uvwasi_errno_t environ_get(char** environment, char* environ_buf) noexcept final
    {
        return uvwasi_environ_get(&m_state, environment, environ_buf);
    }

    uvwasi_errno_t environ_sizes_get(
        uvwasi_size_t* environ_count, uvwasi_size_t* environ_buf_size) noexcept final
    {
        return uvwasi_environ_sizes_get(&m_state, environ_count, environ_buf_size);
    }

    uvwasi_errno_t clock_res_get(
        uvwasi_clockid_t clock_id, uvwasi_timestamp_t* resolution) noexcept final
    {
        return uvwasi_clock_res_get(&m_state, clock_id, resolution);
    }

    uvwasi_errno_t clock_time_get(uvwasi_clockid_t clock_id, uvwasi_timestamp_t precision,
        uvwasi_timestamp_t* time) noexcept final
    {
        return uvwasi_clock_time_get(&m_state, clock_id, precision, time);
    }

    uvwasi_errno_t fd_advise(uvwasi_fd_t fd, uvwasi_filesize_t offset, uvwasi_filesize_t len,
        uvwasi_advice_t advice) noexcept final
    {
        return uvwasi_fd_advise(&m_state, fd, offset, len, advice);
    }

    uvwasi_errno_t fd_allocate(
        uvwasi_fd_t fd, uvwasi_filesize_t offset, uvwasi_filesize_t len) noexcept final
    {
        return uvwasi_fd_allocate(&m_state, fd, offset, len);
    }

    uvwasi_errno_t fd_close(uvwasi_fd_t fd) noexcept final { return uvwasi_fd_close(&m_state, fd); }

    uvwasi_errno_t fd_datasync(uvwasi_fd_t fd) noexcept final
    {
        return uvwasi_fd_datasync(&m_state, fd);
    }

    uvwasi_errno_t fd_fdstat_get(uvwasi_fd_t fd, uvwasi_fdstat_t* buf) noexcept final
    {
        return uvwasi_fd_fdstat_get(&m_state, fd, buf);
    }

    uvwasi_errno_t fd_fdstat_set_flags(uvwasi_fd_t fd, uvwasi_fdflags_t flags) noexcept final
    {
        return uvwasi_fd_fdstat_set_flags(&m_state, fd, flags);
    }

    uvwasi_errno_t fd_filestat_get(uvwasi_fd_t fd, uvwasi_filestat_t* buf) noexcept final
    {
        return uvwasi_fd_filestat_get(&m_state, fd, buf);
    }

    uvwasi_errno_t fd_filestat_set_size(uvwasi_fd_t fd, uvwasi_filesize_t st_size) noexcept final
    {
        return uvwasi_fd_filestat_set_size(&m_state, fd, st_size);
    }

    uvwasi_errno_t fd_filestat_set_times(uvwasi_fd_t fd, uvwasi_timestamp_t st_atim,
        uvwasi_timestamp_t st_mtim, uvwasi_fstflags_t fst_flags) noexcept final
    {
        return uvwasi_fd_filestat_set_times(&m_state, fd, st_atim, st_mtim, fst_flags);
    }

    uvwasi_errno_t fd_pread(uvwasi_fd_t fd, const uvwasi_iovec_t* iovs, uvwasi_size_t iovs_len,
        uvwasi_filesize_t offset, uvwasi_size_t* nread) noexcept final
    {
        return uvwasi_fd_pread(&m_state, fd, iovs, iovs_len, offset, nread);
    }

    uvwasi_errno_t fd_prestat_get(uvwasi_fd_t fd, uvwasi_prestat_t* buf) noexcept final
    {
        return uvwasi_fd_prestat_get(&m_state, fd, buf);
    }

    uvwasi_errno_t fd_prestat_dir_name(
        uvwasi_fd_t fd, char* path, uvwasi_size_t path_len) noexcept final
    {
        return uvwasi_fd_prestat_dir_name(&m_state, fd, path, path_len);
    }

    uvwasi_errno_t fd_pwrite(uvwasi_fd_t fd, const uvwasi_ciovec_t* iovs, uvwasi_size_t iovs_len,
        uvwasi_filesize_t offset, uvwasi_size_t* nwritten) noexcept final
    {
        return uvwasi_fd_pwrite(&m_state, fd, iovs, iovs_len, offset, nwritten);
    }

    uvwasi_errno_t fd_read(uvwasi_fd_t fd, const uvwasi_iovec_t* iovs, uvwasi_size_t iovs_len,
        uvwasi_size_t* nread) noexcept final
    {
        return uvwasi_fd_read(&m_state, fd, iovs, iovs_len, nread);
    }

    uvwasi_errno_t fd_readdir(uvwasi_fd_t fd, void* buf, uvwasi_size_t buf_len,
        uvwasi_dircookie_t cookie, uvwasi_size_t* bufused) noexcept final
    {
        return uvwasi_fd_readdir(&m_state, fd, buf, buf_len, cookie, bufused);
    }

    uvwasi_errno_t fd_renumber(uvwasi_fd_t from, uvwasi_fd_t to) noexcept final
    {
        return uvwasi_fd_renumber(&m_state, from, to);
    }

    uvwasi_errno_t fd_seek(uvwasi_fd_t fd, uvwasi_filedelta_t offset, uvwasi_whence_t whence,
        uvwasi_filesize_t* newoffset) noexcept final
    {
        return uvwasi_fd_seek(&m_state, fd, offset, whence, newoffset);
    }

    uvwasi_errno_t fd_sync(uvwasi_fd_t fd) noexcept final { return uvwasi_fd_sync(&m_state, fd); }

    uvwasi_errno_t fd_tell(uvwasi_fd_t fd, uvwasi_filesize_t* offset) noexcept final
    {
        return uvwasi_fd_tell(&m_state, fd, offset);
    }

    uvwasi_errno_t fd_write(uvwasi_fd_t fd, const uvwasi_ciovec_t* iovs, uvwasi_size_t iovs_len,
        uvwasi_size_t* nwritten) noexcept final
    {
        return uvwasi_fd_write(&m_state, fd, iovs, iovs_len, nwritten);
    }

    uvwasi_errno_t path_create_directory(
        uvwasi_fd_t fd, const char* path, uvwasi_size_t path_len) noexcept final
    {
        return uvwasi_path_create_directory(&m_state, fd, path, path_len);
    }

    uvwasi_errno_t path_filestat_get(uvwasi_fd_t fd, uvwasi_lookupflags_t flags,
        const char* path, uvwasi_size_t path_len, uvwasi_filestat_t* buf) noexcept final
    {
        return uvwasi_path_filestat_get(&m_state, fd, flags, path, path_len, buf);
    }

    uvwasi_errno_t path_filestat_set_times(uvwasi_fd_t fd, uvwasi_lookupflags_t flags,
        const char* path, uvwasi_size_t path_len, uvwasi_timestamp_t st_atim,
        uvwasi_timestamp_t st_mtim, uvwasi_fstflags_t fst_flags) noexcept final
    {
        return uvwasi_path_filestat_set_times(
            &m_state, fd, flags, path, path_len, st_atim, st_mtim, fst_flags);
    }

    uvwasi_errno_t path_link(uvwasi_fd_t old_fd, uvwasi_lookupflags_t old_flags,
        const char* old_path, uvwasi_size_t old_path_len, uvwasi_fd_t new_fd,
        const char* new_path, uvwasi_size_t new_path_len) noexcept final
    {
        return uvwasi_path_link(
            &m_state, old_fd, old_flags, old_path, old_path_len, new_fd, new_path, new_path_len);
    }

    uvwasi_errno_t path_open(uvwasi_fd_t dirfd, uvwasi_lookupflags_t dirflags, const char* path,
        uvwasi_size_t path_len, uvwasi_oflags_t o_flags, uvwasi_rights_t fs_rights_base,
        uvwasi_rights_t fs_rights_inheriting, uvwasi_fdflags_t fs_flags,
        uvwasi_fd_t* fd) noexcept final
    {
        return uvwasi_path_open(&m_state, dirfd, dirflags, path, path_len, o_flags,
            fs_rights_base, fs_rights_inheriting, fs_flags, fd);
    }

    uvwasi_errno_t path_readlink(uvwasi_fd_t fd, const char* path, uvwasi_size_t path_len,
        char* buf, uvwasi_size_t buf_len, uvwasi_size_t* bufused) noexcept final
    {
        return uvwasi_path_readlink(&m_state, fd, path, path_len, buf, buf_len, bufused);
    }

    uvwasi_errno_t path_remove_directory(
        uvwasi_fd_t fd, const char* path, uvwasi_size_t path_len) noexcept final
    {
        return uvwasi_path_remove_directory(&m_state, fd, path, path_len);
    }

    uvwasi_errno_t path_rename(uvwasi_fd_t old_fd, const char* old_path,
        uvwasi_size_t old_path_len, uvwasi_fd_t new_fd, const char* new_path,
        uvwasi_size_t new_path_len) noexcept final
    {
        return uvwasi_path_rename(
            &m_state, old_fd, old_path, old_path_len, new_fd, new_path, new_path_len);
    }

    uvwasi_errno_t path_symlink(const char* old_path, uvwasi_size_t old_path_len,
        uvwasi_fd_t fd, const char* new_path, uvwasi_size_t new_path_len) noexcept final
    {
        return uvwasi_path_symlink(&m_state, old_path, old_path_len, fd, new_path, new_path_len);
    }

    uvwasi_errno_t path_unlink_file(
        uvwasi_fd_t fd, const char* path, uvwasi_size_t path_len) noexcept final
    {
        return uvwasi_path_unlink_file(&m_state, fd, path, path_len);
    }

    uvwasi_errno_t poll_oneoff(const uvwasi_subscription_t* in, uvwasi_event_t* out,
        uvwasi_size_t nsubscriptions, uvwasi_size_t* nevents) noexcept final
    {
        return uvwasi_poll_oneoff(&m_state, in, out, nsubscriptions, nevents);
    }

    uvwasi_errno_t random_get(void* buf, uvwasi_size_t buf_len) noexcept final
    {
        return uvwasi_random_get(&m_state, buf, buf_len);
    }

    uvwasi_errno_t sched_yield() noexcept final { return uvwasi_sched_yield(&m_state); }
};
}  // namespace

UVWASI::~UVWASI() {}

std::unique_ptr<UVWASI> create_uvwasi()
{
    return std::make_unique<UVWASIImpl>();
}
}  // namespace pglite::wasi
