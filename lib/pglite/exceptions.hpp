// PGLite: PostgreSQL in WebAssembly, hosted on Fizzy
// Copyright 2024 The PGLite Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <pglite/pglite.h>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace pglite
{
struct exception : std::runtime_error
{
    PGLiteErrorCode code = PGLiteErrorOther;

    exception(PGLiteErrorCode _code, const char* message) noexcept
      : std::runtime_error(message), code(_code)
    {}
    exception(PGLiteErrorCode _code, const std::string& message) noexcept
      : std::runtime_error(message.c_str()), code(_code)
    {}
    exception(const exception& other) noexcept : std::runtime_error(other), code(other.code) {}
    ~exception() noexcept override;
};

struct archive_error : exception
{
    explicit archive_error(const std::string& message) noexcept
      : exception(PGLiteErrorArchive, message)
    {}

    ~archive_error() noexcept override;
};

struct environment_error : exception
{
    explicit environment_error(const std::string& message) noexcept
      : exception(PGLiteErrorEnvironment, message)
    {}

    ~environment_error() noexcept override;
};

struct instantiate_error : exception
{
    explicit instantiate_error(const std::string& message) noexcept
      : exception(PGLiteErrorInstantiationFailed, message)
    {}

    ~instantiate_error() noexcept override;
};

struct trap_error : exception
{
    explicit trap_error(const std::string& function)
      : exception(PGLiteErrorTrap, function + ": execution aborted with WebAssembly trap")
    {}

    ~trap_error() noexcept override;
};

struct exit_error : exception
{
    exit_error(const std::string& function, uint32_t exit_code)
      : exception(PGLiteErrorExit, function + ": wasm exit_code: " + std::to_string(exit_code)),
        m_exit_code{exit_code}
    {}

    ~exit_error() noexcept override;

    uint32_t exit_code() const noexcept { return m_exit_code; }

private:
    uint32_t m_exit_code = 0;
};
}  // namespace pglite
