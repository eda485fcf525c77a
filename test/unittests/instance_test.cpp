// PGLite: PostgreSQL in WebAssembly, hosted on Fizzy
// Copyright 2024 The PGLite Authors.
// SPDX-License-Identifier: Apache-2.0

#include "instance.hpp"
#include "wasi.hpp"
#include <gmock/gmock.h>
#include <test/utils/asserts.hpp>
#include <test/utils/hex.hpp>
#include <test/utils/stub_uvwasi.hpp>
#include <sstream>

using namespace pglite;
using namespace pglite::test;

namespace
{
/* wat2wasm
  (memory (export "memory") 1)
  (func (export "add") (param i32 i32) (result i32) (i32.add (local.get 0) (local.get 1)))
  (func (export "wide") (result i64) (i64.const 0x1122334455667788))
  (func (export "nothing"))
  (func (export "trap") unreachable)
*/
const auto instance_wasm = from_hex(
    "0061736d01000000010e0360027f7f017f6000017e600000030504000102020503010001072805066d656d6f72"
    "79020003616464000004776964650001076e6f7468696e670002047472617000030a1d040700200020016a0b0c"
    "004288ef99abc5e88c91110b02000b0300000b");

class instance_test : public testing::Test
{
public:
    StubUVWASI uvwasi;
    std::ostringstream out;
    wasi::Context context{uvwasi, out, out};
};
}  // namespace

TEST_F(instance_test, find_function)
{
    const auto instance = wasi::instantiate(context, instance_wasm);
    EXPECT_EQ(instance->find_function("add"), 0);
    EXPECT_EQ(instance->find_function("trap"), 3);
    EXPECT_EQ(instance->find_function("memory"), std::nullopt);
    EXPECT_EQ(instance->find_function("missing"), std::nullopt);
}

TEST_F(instance_test, has_exported_memory)
{
    const auto instance = wasi::instantiate(context, instance_wasm);
    EXPECT_TRUE(instance->has_exported_memory("memory"));
    EXPECT_FALSE(instance->has_exported_memory("add"));

    /* wat2wasm
      (func (export "f"))
    */
    const auto no_memory =
        wasi::instantiate(context, from_hex("0061736d0100000001040160000003020100070501016600000a"
                                            "040102000b"));
    EXPECT_FALSE(no_memory->has_exported_memory("memory"));
    EXPECT_TRUE(no_memory->memory().empty());
}

TEST_F(instance_test, execute)
{
    const auto instance = wasi::instantiate(context, instance_wasm);
    EXPECT_THAT(instance->execute(0, {40, 2}), Result(42));
    EXPECT_THAT(instance->execute(0, {0xffffffff, 2}), Result(1));
    EXPECT_THAT(instance->execute(1), Result(0x1122334455667788));
    EXPECT_THAT(instance->execute(2), Result());
    EXPECT_THAT(instance->execute(3), Traps());
}

TEST_F(instance_test, execute_argument_count_mismatch)
{
    const auto instance = wasi::instantiate(context, instance_wasm);
    EXPECT_THROW_MESSAGE(instance->execute(0, {1}), std::invalid_argument, "argument count mismatch");
    EXPECT_THROW_MESSAGE(instance->execute(2, {1}), std::invalid_argument, "argument count mismatch");
}

TEST_F(instance_test, write_memory)
{
    const auto instance = wasi::instantiate(context, instance_wasm);
    ASSERT_EQ(instance->memory().size(), PageSize);

    instance->write_memory(1, "0a0b0c"_bytes);
    EXPECT_EQ(hex(instance->memory().substr(0, 5)), "000a0b0c00");

    instance->write_memory(PageSize - 2, "ffff"_bytes);
    EXPECT_EQ(hex(instance->memory().substr(PageSize - 3)), "00ffff");

    instance->write_memory(PageSize, {});
}

TEST_F(instance_test, write_memory_out_of_bounds)
{
    const auto instance = wasi::instantiate(context, instance_wasm);
    EXPECT_THROW_MESSAGE(instance->write_memory(PageSize - 1, "ffff"_bytes), std::out_of_range,
        "write of 2 bytes at address 65535 exceeds memory size 65536");
    EXPECT_THROW_MESSAGE(instance->write_memory(PageSize + 1, {}), std::out_of_range,
        "write of 0 bytes at address 65537 exceeds memory size 65536");
    EXPECT_EQ(hex(instance->memory().substr(PageSize - 1)), "00");
}
