// PGLite: PostgreSQL in WebAssembly, hosted on Fizzy
// Copyright 2024 The PGLite Authors.
// SPDX-License-Identifier: Apache-2.0

#include "exceptions.hpp"

namespace pglite
{
exception::~exception() noexcept = default;
archive_error::~archive_error() noexcept = default;
environment_error::~environment_error() noexcept = default;
instantiate_error::~instantiate_error() noexcept = default;
trap_error::~trap_error() noexcept = default;
exit_error::~exit_error() noexcept = default;
}  // namespace pglite
