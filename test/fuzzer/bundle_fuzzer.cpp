// PGLite: PostgreSQL in WebAssembly, hosted on Fizzy
// Copyright 2024 The PGLite Authors.
// SPDX-License-Identifier: Apache-2.0

#include "exceptions.hpp"
#include "gzip.hpp"
#include "tar.hpp"
#include <new>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t data_size) noexcept
{
    try
    {
        const pglite::bytes_view input{data, data_size};

        // Raw input is read as a tar archive, gzip input is decompressed first.
        const auto archive = (data_size >= 2 && data[0] == 0x1f && data[1] == 0x8b) ?
                                 pglite::gunzip(input) :
                                 pglite::bytes{input};
        pglite::TarReader reader{archive};
        while (reader.next().has_value())
        {
        }
    }
    catch (const pglite::archive_error&)
    {}
    catch (const std::bad_alloc&)
    {}
    return 0;
}
