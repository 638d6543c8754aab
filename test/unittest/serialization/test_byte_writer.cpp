/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#include "gtest_helpers.hpp"  // NOLINT(misc-include-cleaner)
#include "tracking_memory_resource.hpp"
#include "verification_utilities.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libparcel/errors.hpp>
#include <libparcel/serialization/byte_writer.hpp>
#include <libparcel/types.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>
#include <cstddef>

namespace
{

using namespace libparcel;                 // NOLINT This our main concern here in the unit tests.
using namespace libparcel::serialization;  // NOLINT This our main concern here in the unit tests.

using libparcel::verification_utilities::b;

using testing::_;
using testing::ElementsAre;
using testing::Eq;
using testing::IsEmpty;
using testing::Optional;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestByteWriter : public testing::Test
{
protected:
    void TearDown() override
    {
        EXPECT_THAT(mr_.allocations, IsEmpty());
        EXPECT_THAT(mr_.total_allocated_bytes, mr_.total_deallocated_bytes);
    }

    ByteWriter::Buffer makeBuffer(const std::size_t capacity)
    {
        ByteWriter::Buffer buffer{&mr_};
        buffer.reserve(capacity);
        return buffer;
    }

    // MARK: Data members:

    // NOLINTBEGIN
    TrackingMemoryResource mr_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestByteWriter, fixed_width_integers_are_big_endian)
{
    auto       buffer = makeBuffer(16);
    ByteWriter writer{buffer, 16};

    EXPECT_THAT(writer.writeU8(0xA1), Eq(cetl::nullopt));
    EXPECT_THAT(writer.writeU16(0xB2C3), Eq(cetl::nullopt));
    EXPECT_THAT(writer.writeU32(0xD4E5F607), Eq(cetl::nullopt));

    EXPECT_THAT(writer.size(), 7);
    EXPECT_THAT(writer.remaining(), 9);
    EXPECT_THAT(buffer, ElementsAre(b(0xA1), b(0xB2), b(0xC3), b(0xD4), b(0xE5), b(0xF6), b(0x07)));
}

TEST_F(TestByteWriter, varint_encodings)
{
    auto       buffer = makeBuffer(32);
    ByteWriter writer{buffer, 32};

    // Samples of RFC 9000, appendix A.1.
    EXPECT_THAT(writer.writeVarint(37), Eq(cetl::nullopt));
    EXPECT_THAT(writer.writeVarint(15293), Eq(cetl::nullopt));
    EXPECT_THAT(writer.writeVarint(494878333), Eq(cetl::nullopt));
    EXPECT_THAT(writer.writeVarint(151288809941952652ULL), Eq(cetl::nullopt));

    EXPECT_THAT(buffer,
                ElementsAre(b(0x25),
                            b(0x7B), b(0xBD),
                            b(0x9D), b(0x7F), b(0x3E), b(0x7D),
                            b(0xC2), b(0x19), b(0x7C), b(0x5E), b(0xFF), b(0x14), b(0xE8), b(0x8C)));
}

TEST_F(TestByteWriter, length_prefixed_bytes)
{
    const std::array<cetl::byte, 3> payload{b(0x01), b(0x02), b(0x03)};

    auto       buffer = makeBuffer(8);
    ByteWriter writer{buffer, 8};

    EXPECT_THAT(writer.writeLengthPrefixedBytes(payload), Eq(cetl::nullopt));
    EXPECT_THAT(writer.writeLengthPrefixedBytes(PayloadFragment{}), Eq(cetl::nullopt));
    EXPECT_THAT(writer.writeBytes(payload), Eq(cetl::nullopt));

    EXPECT_THAT(buffer, ElementsAre(b(3), b(0x01), b(0x02), b(0x03), b(0), b(0x01), b(0x02), b(0x03)));
}

TEST_F(TestByteWriter, limit)
{
    const std::array<cetl::byte, 1> payload{b(0x42)};

    auto       buffer = makeBuffer(8);
    ByteWriter writer{buffer, 3};

    EXPECT_THAT(writer.writeU16(0x1234), Eq(cetl::nullopt));
    EXPECT_THAT(writer.remaining(), 1);

    // Nothing is written on failure.
    EXPECT_THAT(writer.writeU16(0x5678), Optional(_));
    EXPECT_THAT(writer.writeLengthPrefixedBytes(payload), Optional(_));
    EXPECT_THAT(writer.size(), 2);

    EXPECT_THAT(writer.writeBytes(payload), Eq(cetl::nullopt));
    EXPECT_THAT(writer.remaining(), 0);
    EXPECT_THAT(writer.writeU8(0), Optional(_));
    EXPECT_THAT(buffer, ElementsAre(b(0x12), b(0x34), b(0x42)));
}

TEST_F(TestByteWriter, buffer_is_never_grown)
{
    auto              buffer   = makeBuffer(2);
    const std::size_t capacity = buffer.capacity();
    ByteWriter        writer{buffer, capacity + 100};

    const auto allocations_before = mr_.total_allocations;
    EXPECT_THAT(writer.remaining(), capacity);
    for (std::size_t i = 0; i < capacity; ++i)
    {
        EXPECT_THAT(writer.writeU8(1), Eq(cetl::nullopt));
    }
    EXPECT_THAT(writer.remaining(), 0);
    EXPECT_THAT(writer.writeU8(1), Optional(_));
    EXPECT_THAT(writer.size(), capacity);
    EXPECT_THAT(mr_.total_allocations, allocations_before);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
