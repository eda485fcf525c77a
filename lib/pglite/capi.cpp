// PGLite: PostgreSQL in WebAssembly, hosted on Fizzy
// Copyright 2024 The PGLite Authors.
// SPDX-License-Identifier: Apache-2.0

#include "exceptions.hpp"
#include "pglite.hpp"
#include <pglite/pglite.h>
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <streambuf>

namespace
{
inline void set_success(PGLiteError* error) noexcept
{
    if (error == nullptr)
        return;

    error->code = PGLiteSuccess;
    error->exit_code = 0;
    error->message[0] = '\0';
}

// Copying a string into a fixed-size static buffer, guaranteed to not overrun it and to always end
// the destination string with a null terminator.
template <size_t N>
inline size_t truncating_strlcpy(char (&dest)[N], const char* src) noexcept
{
    static_assert(N >= 4);

    const auto src_len = strlen(src);
    const auto copy_len = std::min(src_len, N - 1);
    memcpy(dest, src, copy_len);
    if (copy_len < src_len)
    {
        dest[copy_len - 3] = '.';
        dest[copy_len - 2] = '.';
        dest[copy_len - 1] = '.';
    }
    dest[copy_len] = '\0';
    return copy_len;
}

inline void set_error_code_and_message(
    PGLiteErrorCode code, const char* message, PGLiteError* error) noexcept
{
    error->code = code;
    error->exit_code = 0;
    truncating_strlcpy(error->message, message);
}

inline void set_error_from_current_exception(PGLiteError* error) noexcept
{
    if (error == nullptr)
        return;

    try
    {
        throw;
    }
    catch (const pglite::exit_error& e)
    {
        set_error_code_and_message(PGLiteErrorExit, e.what(), error);
        error->exit_code = e.exit_code();
    }
    catch (const pglite::exception& e)
    {
        set_error_code_and_message(e.code, e.what(), error);
    }
    catch (const std::filesystem::filesystem_error& e)
    {
        set_error_code_and_message(PGLiteErrorEnvironment, e.what(), error);
    }
    catch (const std::bad_alloc&)
    {
        set_error_code_and_message(
            PGLiteErrorMemoryAllocationFailed, "memory allocation failed", error);
    }
    catch (const std::exception& e)
    {
        set_error_code_and_message(PGLiteErrorOther, e.what(), error);
    }
    catch (...)
    {
        set_error_code_and_message(PGLiteErrorOther, "unknown error", error);
    }
}

/// Stream buffer forwarding everything to a PGLiteWriteFn.
class CallbackBuf final : public std::streambuf
{
    PGLiteWriteFn m_write;
    void* m_context;

protected:
    std::streamsize xsputn(const char* s, std::streamsize n) override
    {
        m_write(m_context, s, static_cast<size_t>(n));
        return n;
    }

    int_type overflow(int_type ch) override
    {
        if (traits_type::eq_int_type(ch, traits_type::eof()))
            return traits_type::not_eof(ch);

        const auto c = traits_type::to_char_type(ch);
        m_write(m_context, &c, 1);
        return ch;
    }

public:
    CallbackBuf(PGLiteWriteFn write, void* context) noexcept : m_write{write}, m_context{context} {}
};

/// An output sink: either a callback or a process stream.
class Sink
{
    std::unique_ptr<CallbackBuf> m_buf;
    std::ostream m_stream;

public:
    Sink(PGLiteWriteFn write, void* context, std::ostream& fallback)
      : m_buf{write != nullptr ? std::make_unique<CallbackBuf>(write, context) : nullptr},
        m_stream{m_buf != nullptr ? m_buf.get() : fallback.rdbuf()}
    {}

    std::ostream& stream() noexcept { return m_stream; }
};
}  // namespace

/// The session behind the opaque handle. The sinks outlive the session using them.
struct PGLite
{
    Sink out;
    Sink err;
    std::unique_ptr<pglite::PGLite> session;

    explicit PGLite(const PGLiteOptions& options)
      : out{options.write_stdout, options.write_context, std::cout},
        err{options.write_stderr, options.write_context, std::cerr}
    {}
};

extern "C" {

void pglite_init_options(PGLiteOptions* options) noexcept
{
    options->root_dir = nullptr;
    options->bundle = nullptr;
    options->bundle_size = 0;
    options->write_stdout = nullptr;
    options->write_stderr = nullptr;
    options->write_context = nullptr;
    options->memory_pages_limit = pglite::DefaultMemoryPagesLimit;
}

bool pglite_has_embedded_bundle(void) noexcept
{
    return !pglite::embedded_bundle().empty();
}

PGLite* pglite_create(const PGLiteOptions* options, PGLiteError* error) noexcept
{
    try
    {
        PGLiteOptions defaults;
        pglite_init_options(&defaults);
        if (options == nullptr)
            options = &defaults;

        pglite::Config config;
        if (options->root_dir != nullptr)
            config.root_dir = options->root_dir;
        if (options->bundle != nullptr)
            config.bundle = {options->bundle, options->bundle_size};
        config.memory_pages_limit = options->memory_pages_limit;

        auto handle = std::make_unique<PGLite>(*options);
        handle->session = pglite::PGLite::create(config, handle->out.stream(), handle->err.stream());

        set_success(error);
        return handle.release();
    }
    catch (...)
    {
        set_error_from_current_exception(error);
        return nullptr;
    }
}

bool pglite_query(PGLite* pglite, const char* sql, PGLiteError* error) noexcept
{
    try
    {
        pglite->session->query(sql);
        set_success(error);
        return true;
    }
    catch (...)
    {
        set_error_from_current_exception(error);
        return false;
    }
}

bool pglite_run_queries(PGLite* pglite, const char* input, PGLiteError* error) noexcept
{
    try
    {
        pglite->session->run_queries(input);
        set_success(error);
        return true;
    }
    catch (...)
    {
        set_error_from_current_exception(error);
        return false;
    }
}

void pglite_free(PGLite* pglite) noexcept
{
    delete pglite;
}
}
