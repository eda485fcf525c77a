// PGLite: PostgreSQL in WebAssembly, hosted on Fizzy
// Copyright 2024 The PGLite Authors.
// SPDX-License-Identifier: Apache-2.0

#include "gzip.hpp"
#include "exceptions.hpp"
#include <zlib.h>
#include <limits>

namespace pglite
{
namespace
{
constexpr size_t ChunkSize = 64 * 1024;

/// Window bits selecting the gzip wrapper.
constexpr int GzipWindowBits = MAX_WBITS | 16;

class InflateStream
{
    z_stream m_stream{};

public:
    InflateStream()
    {
        if (inflateInit2(&m_stream, GzipWindowBits) != Z_OK)
            throw archive_error{"inflateInit2 failed"};
    }

    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;

    ~InflateStream() noexcept { inflateEnd(&m_stream); }

    z_stream* operator->() noexcept { return &m_stream; }

    void reset()
    {
        if (inflateReset(&m_stream) != Z_OK)
            throw archive_error{"inflateReset failed"};
    }

    [[noreturn]] void fail(const char* what) const
    {
        std::string message{"gzip: "};
        message += (m_stream.msg != nullptr) ? m_stream.msg : what;
        throw archive_error{message};
    }
};
}  // namespace

bytes gunzip(bytes_view input)
{
    if (input.empty())
        throw archive_error{"gzip: empty input"};
    if (input.size() > std::numeric_limits<uInt>::max())
        throw archive_error{"gzip: input too large"};

    InflateStream zs;
    // zlib is not const-correct.
    zs->next_in = const_cast<Bytef*>(input.data());
    zs->avail_in = static_cast<uInt>(input.size());

    bytes output;
    uint8_t chunk[ChunkSize];
    while (true)
    {
        zs->next_out = chunk;
        zs->avail_out = sizeof(chunk);

        const auto ret = inflate(zs.operator->(), Z_NO_FLUSH);
        output.append(chunk, sizeof(chunk) - zs->avail_out);

        if (ret == Z_STREAM_END)
        {
            if (zs->avail_in == 0)
                break;

            // Another gzip member follows.
            zs.reset();
            continue;
        }

        if (ret == Z_BUF_ERROR || (ret == Z_OK && zs->avail_in == 0 && zs->avail_out != 0))
            throw archive_error{"gzip: unexpected end of stream"};
        if (ret != Z_OK)
            zs.fail("corrupt stream");
    }
    return output;
}
}  // namespace pglite
