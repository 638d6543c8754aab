/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#include "gtest_helpers.hpp"  // NOLINT(misc-include-cleaner)
#include "tracking_memory_resource.hpp"
#include "verification_utilities.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libparcel/errors.hpp>
#include <libparcel/packet/header.hpp>
#include <libparcel/packet/message.hpp>
#include <libparcel/packet/packet_reader.hpp>
#include <libparcel/types.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>

namespace
{

using namespace libparcel;          // NOLINT This our main concern here in the unit tests.
using namespace libparcel::packet;  // NOLINT This our main concern here in the unit tests.

using libparcel::verification_utilities::b;
using libparcel::verification_utilities::toVector;

using testing::_;
using testing::ElementsAre;
using testing::IsEmpty;
using testing::Optional;
using testing::VariantWith;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestPacketReader : public testing::Test
{
protected:
    void TearDown() override
    {
        EXPECT_THAT(mr_.allocations, IsEmpty());
        EXPECT_THAT(mr_.total_allocated_bytes, mr_.total_deallocated_bytes);
    }

    // MARK: Data members:

    // NOLINTBEGIN
    TrackingMemoryResource mr_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestPacketReader, data_packet)
{
    const std::array<cetl::byte, 24> bytes{
        // Header: Data, id=0x0102, last_ack=0, bitfield=0, tick=5
        b(0), b(1), b(2), b(0), b(0), b(0), b(0), b(0), b(0), b(0), b(5),
        // Channel 3 block with 2 messages
        b(3), b(2), b(0), b(1), b(0xAA), b(1), b(0), b(9), b(0),
        // Channel 70 (2-byte varint) block with 1 empty message
        b(0x40), b(70), b(1), b(0)};
    // The last message is cut short on purpose: its length prefix is missing.
    auto maybe_parsed = PacketReader::parse(bytes, mr_);
    EXPECT_THAT(maybe_parsed, VariantWith<ParseFailure>(VariantWith<CapacityError>(_)));

    const std::array<cetl::byte, 25> complete{
        b(0), b(1), b(2), b(0), b(0), b(0), b(0), b(0), b(0), b(0), b(5),
        b(3), b(2), b(0), b(1), b(0xAA), b(1), b(0), b(9), b(0),
        b(0x40), b(70), b(1), b(0), b(0)};
    maybe_parsed = PacketReader::parse(complete, mr_);
    ASSERT_THAT(maybe_parsed, VariantWith<ParsedPacket>(_));
    const auto& parsed = cetl::get<ParsedPacket>(maybe_parsed);

    EXPECT_THAT(parsed.header.packet_type, PacketType::Data);
    EXPECT_THAT(parsed.header.packet_id, 0x0102);
    EXPECT_THAT(parsed.header.tick, 5);
    EXPECT_FALSE(parsed.fragment.has_value());

    ASSERT_THAT(parsed.messages.size(), 3);
    EXPECT_THAT(parsed.messages[0].channel_id, 3);
    EXPECT_THAT(parsed.messages[0].message.id, cetl::nullopt);
    EXPECT_THAT(toVector(parsed.messages[0].message.bytes), ElementsAre(b(0xAA)));
    EXPECT_THAT(parsed.messages[1].channel_id, 3);
    EXPECT_THAT(parsed.messages[1].message.id, Optional(9));
    EXPECT_THAT(parsed.messages[1].message.bytes, IsEmpty());
    EXPECT_THAT(parsed.messages[2].channel_id, 70);
    EXPECT_THAT(parsed.messages[2].message.bytes, IsEmpty());
}

TEST_F(TestPacketReader, fragment_packet)
{
    const std::array<cetl::byte, 22> bytes{
        // Header: DataFragment, id=7
        b(1), b(0), b(7), b(0), b(0), b(0), b(0), b(0), b(0), b(0), b(0),
        // Channel 4, message 0x0203, fragment 1 of 2, 2 bytes
        b(4), b(2), b(3), b(1), b(2), b(2), b(0xCC), b(0xDD),
        // Trailing channel 4 block with 1 message
        b(4), b(1), b(0)};
    // The trailing message lacks its length byte - let's first parse only the fragment.
    auto maybe_parsed = PacketReader::parse({bytes.data(), 19}, mr_);
    ASSERT_THAT(maybe_parsed, VariantWith<ParsedPacket>(_));
    {
        const auto& parsed = cetl::get<ParsedPacket>(maybe_parsed);
        EXPECT_THAT(parsed.header.packet_type, PacketType::DataFragment);
        ASSERT_TRUE(parsed.fragment.has_value());
        EXPECT_THAT(parsed.fragment->channel_id, 4);
        EXPECT_THAT(parsed.fragment->fragment.message_id, 0x0203);
        EXPECT_THAT(parsed.fragment->fragment.fragment_id, 1);
        EXPECT_THAT(parsed.fragment->fragment.num_fragments, 2);
        EXPECT_THAT(toVector(parsed.fragment->fragment.bytes), ElementsAre(b(0xCC), b(0xDD)));
        EXPECT_THAT(parsed.messages, IsEmpty());
    }

    maybe_parsed = PacketReader::parse(bytes, mr_);
    EXPECT_THAT(maybe_parsed, VariantWith<ParseFailure>(VariantWith<CapacityError>(_)));
}

TEST_F(TestPacketReader, malformed_blocks)
{
    // Zero message count is never written.
    const std::array<cetl::byte, 13> zero_count{b(0), b(0), b(0), b(0), b(0), b(0), b(0), b(0), b(0), b(0), b(0),
                                                b(1), b(0)};
    EXPECT_THAT(PacketReader::parse(zero_count, mr_), VariantWith<ParseFailure>(VariantWith<ArgumentError>(_)));

    // Channel id beyond 16 bits.
    const std::array<cetl::byte, 16> big_channel{b(0), b(0), b(0), b(0), b(0), b(0), b(0), b(0), b(0), b(0), b(0),
                                                 b(0x81), b(0), b(0), b(0), b(1)};
    EXPECT_THAT(PacketReader::parse(big_channel, mr_), VariantWith<ParseFailure>(VariantWith<ArgumentError>(_)));

    // Header only is a valid (although useless) packet.
    EXPECT_THAT(PacketReader::parse({zero_count.data(), PacketHeader::encodedSize()}, mr_),
                VariantWith<ParsedPacket>(_));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
