/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBPARCEL_PACKET_MESSAGE_HPP_INCLUDED
#define LIBPARCEL_PACKET_MESSAGE_HPP_INCLUDED

#include "types.hpp"

#include "libparcel/errors.hpp"
#include "libparcel/serialization/byte_reader.hpp"
#include "libparcel/serialization/byte_writer.hpp"
#include "libparcel/serialization/varint.hpp"
#include "libparcel/types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>

namespace libparcel
{
namespace packet
{

/// @brief Defines one complete (not fragmented) outbound message.
///
/// Wire format: `[has_id: u8][message_id: u16, only if has_id][length: varint][bytes]`.
///
struct SingleData final
{
    /// Present only if the sender expects an acknowledgment of the message delivery.
    cetl::optional<MessageId> id;

    /// Message payload. Should fit into a single packet (together with the packet and channel headers).
    PayloadFragment bytes;

    /// @brief Gets number of bytes needed to serialize this message.
    ///
    CETL_NODISCARD std::size_t encodedSize() const noexcept
    {
        const std::size_t id_size = id.has_value() ? sizeof(MessageId) : 0U;
        return 1U + id_size + serialization::varintSize(bytes.size()) + bytes.size();
    }

    CETL_NODISCARD cetl::optional<CapacityError> serialize(serialization::ByteWriter& writer) const
    {
        if (writer.remaining() < encodedSize())
        {
            return CapacityError{};
        }

        if (id.has_value())
        {
            if (auto failure = writer.writeU8(1))
            {
                return failure;
            }
            if (auto failure = writer.writeU16(id.value()))
            {
                return failure;
            }
        }
        else if (auto failure = writer.writeU8(0))
        {
            return failure;
        }
        return writer.writeLengthPrefixedBytes(bytes);
    }

    CETL_NODISCARD static Expected<SingleData, ParseFailure> deserialize(serialization::ByteReader& reader)
    {
        SingleData message{};

        const auto has_id = reader.readU8();
        if (const auto* const failure = cetl::get_if<CapacityError>(&has_id))
        {
            return *failure;
        }
        switch (cetl::get<std::uint8_t>(has_id))
        {
        case 0:
            break;
        case 1: {
            const auto id = reader.readU16();
            if (const auto* const failure = cetl::get_if<CapacityError>(&id))
            {
                return *failure;
            }
            message.id = cetl::get<std::uint16_t>(id);
            break;
        }
        default:
            return ArgumentError{};
        }

        const auto bytes = reader.readLengthPrefixedBytes();
        if (const auto* const failure = cetl::get_if<CapacityError>(&bytes))
        {
            return *failure;
        }
        message.bytes = cetl::get<PayloadFragment>(bytes);
        return message;
    }

};  // SingleData

/// @brief Defines one slice of a message which is too large to fit into a single packet.
///
/// Wire format: `[message_id: u16][fragment_id: u8][num_fragments: u8][length: varint][bytes]`.
///
struct FragmentData final
{
    /// Identifies the parent message. Shared by all fragments of the message.
    MessageId message_id{};

    /// Zero-based index of this slice among the parent's fragments.
    FragmentIndex fragment_id{};

    /// Total number of fragments of the parent message.
    FragmentIndex num_fragments{};

    /// Slice payload. Exactly `config::Packet::FragmentSize()` bytes for all but the last fragment.
    PayloadFragment bytes;

    CETL_NODISCARD bool isLastFragment() const noexcept
    {
        return (num_fragments > 0) && (fragment_id == (num_fragments - 1));
    }

    CETL_NODISCARD std::size_t encodedSize() const noexcept
    {
        return encodedSize(bytes.size());
    }

    /// @brief Gets number of bytes of a serialized fragment with the given payload size.
    ///
    static constexpr std::size_t encodedSize(const std::size_t payload_size) noexcept
    {
        return sizeof(MessageId) + sizeof(FragmentIndex) + sizeof(FragmentIndex) +
               serialization::varintSize(payload_size) + payload_size;
    }

    CETL_NODISCARD cetl::optional<CapacityError> serialize(serialization::ByteWriter& writer) const
    {
        if (writer.remaining() < encodedSize())
        {
            return CapacityError{};
        }

        if (auto failure = writer.writeU16(message_id))
        {
            return failure;
        }
        if (auto failure = writer.writeU8(fragment_id))
        {
            return failure;
        }
        if (auto failure = writer.writeU8(num_fragments))
        {
            return failure;
        }
        return writer.writeLengthPrefixedBytes(bytes);
    }

    CETL_NODISCARD static Expected<FragmentData, ParseFailure> deserialize(serialization::ByteReader& reader)
    {
        if (reader.remaining() < (sizeof(MessageId) + sizeof(FragmentIndex) + sizeof(FragmentIndex)))
        {
            return CapacityError{};
        }

        FragmentData fragment{};
        fragment.message_id    = cetl::get<std::uint16_t>(reader.readU16());
        fragment.fragment_id   = cetl::get<std::uint8_t>(reader.readU8());
        fragment.num_fragments = cetl::get<std::uint8_t>(reader.readU8());
        if (fragment.fragment_id >= fragment.num_fragments)
        {
            return ArgumentError{};
        }

        const auto bytes = reader.readLengthPrefixedBytes();
        if (const auto* const failure = cetl::get_if<CapacityError>(&bytes))
        {
            return *failure;
        }
        fragment.bytes = cetl::get<PayloadFragment>(bytes);
        return fragment;
    }

};  // FragmentData

/// @brief Records that a message (or one fragment of it) was placed into a packet.
///
/// Used downstream to mark the message as delivered or lost once the packet gets acknowledged (or not).
///
struct MessageAck final
{
    MessageId                     message_id{};
    cetl::optional<FragmentIndex> fragment_id;

    friend bool operator==(const MessageAck& lhs, const MessageAck& rhs) noexcept
    {
        return (lhs.message_id == rhs.message_id) && (lhs.fragment_id == rhs.fragment_id);
    }
    friend bool operator!=(const MessageAck& lhs, const MessageAck& rhs) noexcept
    {
        return !(lhs == rhs);
    }

};  // MessageAck

/// @brief Defines a message acknowledgment record tagged with the owning channel.
///
struct ChannelMessageAck final
{
    ChannelId  channel_id{};
    MessageAck ack;

    friend bool operator==(const ChannelMessageAck& lhs, const ChannelMessageAck& rhs) noexcept
    {
        return (lhs.channel_id == rhs.channel_id) && (lhs.ack == rhs.ack);
    }
    friend bool operator!=(const ChannelMessageAck& lhs, const ChannelMessageAck& rhs) noexcept
    {
        return !(lhs == rhs);
    }

};  // ChannelMessageAck

}  // namespace packet
}  // namespace libparcel

#endif  // LIBPARCEL_PACKET_MESSAGE_HPP_INCLUDED
