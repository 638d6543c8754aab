/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBPARCEL_PACKET_PACKET_READER_HPP_INCLUDED
#define LIBPARCEL_PACKET_PACKET_READER_HPP_INCLUDED

#include "header.hpp"
#include "message.hpp"
#include "types.hpp"

#include "libparcel/errors.hpp"
#include "libparcel/serialization/byte_reader.hpp"
#include "libparcel/types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <limits>
#include <utility>

namespace libparcel
{
namespace packet
{

/// @brief Defines the leading fragment of a `DataFragment` packet.
///
struct ParsedFragment final
{
    ChannelId    channel_id{};
    FragmentData fragment;

};  // ParsedFragment

/// @brief Defines one single message of a channel block.
///
struct ParsedMessage final
{
    ChannelId  channel_id{};
    SingleData message;

};  // ParsedMessage

/// @brief Defines content of a decoded packet.
///
/// All payload bytes are views into the original packet payload.
///
struct ParsedPacket final
{
    using Messages = libparcel::detail::VarArray<ParsedMessage>;

    explicit ParsedPacket(cetl::pmr::memory_resource& memory)
        : messages{&memory}
    {
    }

    PacketHeader header;

    /// Present only for `PacketType::DataFragment` packets.
    cetl::optional<ParsedFragment> fragment;

    /// Messages of all channel blocks, in the order they were written.
    Messages messages;

};  // ParsedPacket

/// @brief Decodes outbound packets back into their content.
///
/// In use for diagnostics and verification of the packer output.
/// Fragments are not reassembled - that is the job of the receiving side.
///
class PacketReader final
{
public:
    CETL_NODISCARD static Expected<ParsedPacket, ParseFailure> parse(const PayloadFragment       payload,
                                                                     cetl::pmr::memory_resource& memory)
    {
        serialization::ByteReader reader{payload};
        ParsedPacket              parsed{memory};

        auto maybe_header = PacketHeader::deserialize(reader);
        if (auto* const failure = cetl::get_if<ParseFailure>(&maybe_header))
        {
            return std::move(*failure);
        }
        parsed.header = cetl::get<PacketHeader>(maybe_header);

        if (parsed.header.packet_type == PacketType::DataFragment)
        {
            auto maybe_channel_id = readChannelId(reader);
            if (auto* const failure = cetl::get_if<ParseFailure>(&maybe_channel_id))
            {
                return std::move(*failure);
            }

            auto maybe_fragment = FragmentData::deserialize(reader);
            if (auto* const failure = cetl::get_if<ParseFailure>(&maybe_fragment))
            {
                return std::move(*failure);
            }

            parsed.fragment = ParsedFragment{cetl::get<ChannelId>(maybe_channel_id),
                                             cetl::get<FragmentData>(maybe_fragment)};
        }

        while (!reader.empty())
        {
            if (auto failure = readChannelBlock(reader, parsed.messages))
            {
                return std::move(*failure);
            }
        }

        return parsed;
    }

private:
    CETL_NODISCARD static Expected<ChannelId, ParseFailure> readChannelId(serialization::ByteReader& reader)
    {
        const auto maybe_value = reader.readVarint();
        if (const auto* const failure = cetl::get_if<CapacityError>(&maybe_value))
        {
            return *failure;
        }
        const auto value = cetl::get<std::uint64_t>(maybe_value);
        if (value > std::numeric_limits<ChannelId>::max())
        {
            return ArgumentError{};
        }
        return static_cast<ChannelId>(value);
    }

    /// Reads `[channel_id: varint][count: u8][message * count]`. Zero count is malformed.
    ///
    CETL_NODISCARD static cetl::optional<ParseFailure> readChannelBlock(serialization::ByteReader& reader,
                                                                        ParsedPacket::Messages&    messages)
    {
        auto maybe_channel_id = readChannelId(reader);
        if (auto* const failure = cetl::get_if<ParseFailure>(&maybe_channel_id))
        {
            return std::move(*failure);
        }
        const auto channel_id = cetl::get<ChannelId>(maybe_channel_id);

        const auto maybe_count = reader.readU8();
        if (const auto* const failure = cetl::get_if<CapacityError>(&maybe_count))
        {
            return ParseFailure{*failure};
        }
        const auto count = cetl::get<std::uint8_t>(maybe_count);
        if (count == 0)
        {
            return ParseFailure{ArgumentError{}};
        }

        for (std::uint8_t index = 0; index < count; ++index)
        {
            auto maybe_message = SingleData::deserialize(reader);
            if (auto* const failure = cetl::get_if<ParseFailure>(&maybe_message))
            {
                return std::move(*failure);
            }
            if (!libparcel::detail::tryAppend(messages,
                                              ParsedMessage{channel_id, cetl::get<SingleData>(maybe_message)}))
            {
                return ParseFailure{MemoryError{}};
            }
        }
        return cetl::nullopt;
    }

};  // PacketReader

}  // namespace packet
}  // namespace libparcel

#endif  // LIBPARCEL_PACKET_PACKET_READER_HPP_INCLUDED
