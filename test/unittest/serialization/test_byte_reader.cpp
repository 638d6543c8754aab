/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#include "gtest_helpers.hpp"  // NOLINT(misc-include-cleaner)
#include "verification_utilities.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libparcel/errors.hpp>
#include <libparcel/serialization/byte_reader.hpp>
#include <libparcel/types.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>
#include <cstdint>

namespace
{

using namespace libparcel;                 // NOLINT This our main concern here in the unit tests.
using namespace libparcel::serialization;  // NOLINT This our main concern here in the unit tests.

using libparcel::verification_utilities::b;

using testing::_;
using testing::VariantWith;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

// MARK: - Tests:

TEST(TestByteReader, fixed_width_integers_are_big_endian)
{
    const std::array<cetl::byte, 7> bytes{b(0xA1), b(0xB2), b(0xC3), b(0xD4), b(0xE5), b(0xF6), b(0x07)};
    ByteReader                      reader{bytes};

    EXPECT_THAT(reader.readU8(), VariantWith<std::uint8_t>(0xA1));
    EXPECT_THAT(reader.readU16(), VariantWith<std::uint16_t>(0xB2C3));
    EXPECT_THAT(reader.readU32(), VariantWith<std::uint32_t>(0xD4E5F607));
    EXPECT_TRUE(reader.empty());
    EXPECT_THAT(reader.readU8(), VariantWith<CapacityError>(_));
}

TEST(TestByteReader, varint_decodings)
{
    const std::array<cetl::byte, 17> bytes{b(0x25),
                                           b(0x7B), b(0xBD),
                                           b(0x9D), b(0x7F), b(0x3E), b(0x7D),
                                           b(0xC2), b(0x19), b(0x7C), b(0x5E), b(0xFF), b(0x14), b(0xE8), b(0x8C),
                                           b(0x40), b(0x25)};
    ByteReader reader{bytes};

    EXPECT_THAT(reader.readVarint(), VariantWith<std::uint64_t>(37));
    EXPECT_THAT(reader.readVarint(), VariantWith<std::uint64_t>(15293));
    EXPECT_THAT(reader.readVarint(), VariantWith<std::uint64_t>(494878333));
    EXPECT_THAT(reader.readVarint(), VariantWith<std::uint64_t>(151288809941952652ULL));

    // Non-minimal (two bytes) encoding of 37 is still a valid one.
    EXPECT_THAT(reader.readVarint(), VariantWith<std::uint64_t>(37));
    EXPECT_TRUE(reader.empty());
}

TEST(TestByteReader, truncated_varint)
{
    const std::array<cetl::byte, 3> bytes{b(0x9D), b(0x7F), b(0x3E)};
    ByteReader                      reader{bytes};

    EXPECT_THAT(reader.readVarint(), VariantWith<CapacityError>(_));
    EXPECT_THAT(reader.remaining(), 3);

    ByteReader empty_reader{PayloadFragment{}};
    EXPECT_THAT(empty_reader.readVarint(), VariantWith<CapacityError>(_));
}

TEST(TestByteReader, length_prefixed_bytes_are_views)
{
    const std::array<cetl::byte, 6> bytes{b(3), b(1), b(2), b(3), b(0), b(7)};
    ByteReader                      reader{bytes};

    const auto first = reader.readLengthPrefixedBytes();
    ASSERT_THAT(first, VariantWith<PayloadFragment>(_));
    EXPECT_THAT(cetl::get<PayloadFragment>(first).data(), bytes.data() + 1);
    EXPECT_THAT(cetl::get<PayloadFragment>(first).size(), 3);

    const auto second = reader.readLengthPrefixedBytes();
    ASSERT_THAT(second, VariantWith<PayloadFragment>(_));
    EXPECT_THAT(cetl::get<PayloadFragment>(second).size(), 0);

    // Length 7 claims more bytes than remain - nothing should be consumed.
    EXPECT_THAT(reader.readLengthPrefixedBytes(), VariantWith<CapacityError>(_));
    EXPECT_THAT(reader.remaining(), 1);
}

TEST(TestByteReader, raw_bytes)
{
    const std::array<cetl::byte, 4> bytes{b(1), b(2), b(3), b(4)};
    ByteReader                      reader{bytes};

    EXPECT_THAT(reader.readBytes(5), VariantWith<CapacityError>(_));
    EXPECT_THAT(reader.remaining(), 4);

    const auto all = reader.readBytes(4);
    ASSERT_THAT(all, VariantWith<PayloadFragment>(_));
    EXPECT_THAT(cetl::get<PayloadFragment>(all).data(), bytes.data());
    EXPECT_TRUE(reader.empty());
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
