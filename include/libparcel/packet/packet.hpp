/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBPARCEL_PACKET_PACKET_HPP_INCLUDED
#define LIBPARCEL_PACKET_PACKET_HPP_INCLUDED

#include "header.hpp"
#include "message.hpp"
#include "types.hpp"

#include "libparcel/config.hpp"
#include "libparcel/errors.hpp"
#include "libparcel/logging.hpp"
#include "libparcel/serialization/byte_writer.hpp"
#include "libparcel/serialization/varint.hpp"
#include "libparcel/types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/pf20/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <utility>

namespace libparcel
{
namespace packet
{

/// @brief Defines one in-progress (or finished) outbound datagram.
///
/// The packet keeps a capacity ledger which allows the packer to commit to a layout
/// before bytes are physically written:
/// - `payload` holds already written bytes (always starting with the serialized header);
/// - `prewritten_size` holds bytes which were reserved (decided to be written) but not written yet.
///
/// The invariant `payload.size() + prewritten_size <= config::Packet::MaxPayloadSize()` holds at all times.
/// Every commit releases exactly the amount of bytes it writes; releasing more than was reserved
/// is reported as `AccountingError`.
///
class Packet final
{
public:
    using Payload     = libparcel::detail::VarArray<cetl::byte>;
    using MessageAcks = libparcel::detail::VarArray<ChannelMessageAck>;

    /// @brief Makes a new packet of single messages.
    ///
    /// Payload buffer is pre-allocated (from the given memory) for the max payload size,
    /// and it is pre-populated with the serialized header.
    ///
    CETL_NODISCARD static Expected<Packet, AnyFailure> make(cetl::pmr::memory_resource& memory,
                                                            const PacketHeader&         header)
    {
        Packet packet{header.packet_id, header.packet_type, memory};

        packet.payload_.reserve(config::Packet::MaxPayloadSize());
        if (packet.payload_.capacity() < config::Packet::MaxPayloadSize())
        {
            return MemoryError{};
        }

        serialization::ByteWriter writer{packet.payload_, config::Packet::MaxPayloadSize()};
        if (auto failure = header.serialize(writer))
        {
            return *failure;
        }

        return packet;
    }

    /// @brief Makes a new packet which carries the given fragment.
    ///
    /// The whole initial content is the header, the channel id and the fragment itself.
    /// The packet starts with exactly one message ack (for the fragment).
    ///
    CETL_NODISCARD static Expected<Packet, AnyFailure> makeFragment(cetl::pmr::memory_resource& memory,
                                                                    const PacketHeader&         header,
                                                                    const ChannelId             channel_id,
                                                                    const FragmentData&         fragment)
    {
        auto maybe_packet = make(memory, header);
        if (auto* const failure = cetl::get_if<AnyFailure>(&maybe_packet))
        {
            return std::move(*failure);
        }
        auto packet = cetl::get<Packet>(std::move(maybe_packet));

        serialization::ByteWriter writer{packet.payload_, config::Packet::MaxPayloadSize()};
        if (auto failure = writer.writeVarint(channel_id))
        {
            return *failure;
        }
        if (auto failure = fragment.serialize(writer))
        {
            return *failure;
        }

        const ChannelMessageAck ack{channel_id, MessageAck{fragment.message_id, fragment.fragment_id}};
        if (!libparcel::detail::tryAppend(packet.message_acks_, ack))
        {
            return MemoryError{};
        }

        return packet;
    }

    Packet(const Packet&)            = delete;
    Packet& operator=(const Packet&) = delete;
    Packet(Packet&&)                 = default;
    Packet& operator=(Packet&&)      = default;

    ~Packet() = default;

    /// @brief Gets number of bytes which a channel block header takes (the channel id and the message count).
    ///
    static constexpr std::size_t channelHeaderSize(const ChannelId channel_id) noexcept
    {
        return serialization::varintSize(channel_id) + sizeof(std::uint8_t);
    }

    CETL_NODISCARD PacketId getPacketId() const noexcept
    {
        return packet_id_;
    }

    CETL_NODISCARD PacketType getPacketType() const noexcept
    {
        return packet_type_;
    }

    /// @brief Gets the written bytes (header-prefixed, ready for transmission once the packet is finished).
    ///
    CETL_NODISCARD PayloadFragment getPayload() const noexcept
    {
        return {payload_.data(), payload_.size()};
    }

    /// @brief Gets acknowledgment records of all messages (and fragments) committed into this packet.
    ///
    CETL_NODISCARD cetl::span<const ChannelMessageAck> getMessageAcks() const noexcept
    {
        return {message_acks_.data(), message_acks_.size()};
    }

    /// @brief Gets number of reserved, but not yet written, bytes.
    ///
    CETL_NODISCARD std::size_t getPrewrittenSize() const noexcept
    {
        return prewritten_size_;
    }

    /// @brief Gets number of bytes which are neither written nor reserved.
    ///
    CETL_NODISCARD std::size_t getRemainingCapacity() const noexcept
    {
        const std::size_t used = payload_.size() + prewritten_size_;
        return (used < config::Packet::MaxPayloadSize()) ? (config::Packet::MaxPayloadSize() - used) : 0;
    }

    /// @brief Checks whether there is still room for a block header of the given channel.
    ///
    CETL_NODISCARD bool canFitChannel(const ChannelId channel_id) const noexcept
    {
        return canFit(channelHeaderSize(channel_id));
    }

    /// @brief Checks whether `additional_size` more bytes could be reserved.
    ///
    CETL_NODISCARD bool canFit(const std::size_t additional_size) const noexcept
    {
        return additional_size <= getRemainingCapacity();
    }

    /// @brief Reserves the given amount of bytes (if they fit).
    ///
    /// @return `true` if the bytes were reserved; otherwise the ledger stays untouched.
    ///
    CETL_NODISCARD bool reserve(const std::size_t size) noexcept
    {
        if (!canFit(size))
        {
            return false;
        }
        prewritten_size_ += size;
        return true;
    }

    /// @brief Returns previously reserved bytes back (without writing anything).
    ///
    CETL_NODISCARD cetl::optional<AnyFailure> release(const std::size_t size)
    {
        if (size > prewritten_size_)
        {
            getLogger().error("Packet {}: attempt to release {} bytes while only {} are reserved.",
                              packet_id_,
                              size,
                              prewritten_size_);
            return AccountingError{};
        }
        prewritten_size_ -= size;
        return cetl::nullopt;
    }

    /// @brief Writes the block header of a channel (its id and the number of messages which follow).
    ///
    /// The header bytes are expected to be reserved in advance (see `canFitChannel` and `reserve`).
    ///
    CETL_NODISCARD cetl::optional<AnyFailure> commitChannelHeader(const ChannelId    channel_id,
                                                                  const std::uint8_t message_count)
    {
        if (auto failure = release(channelHeaderSize(channel_id)))
        {
            return failure;
        }

        serialization::ByteWriter writer{payload_, config::Packet::MaxPayloadSize()};
        if (auto failure = writer.writeVarint(channel_id))
        {
            return AnyFailure{*failure};
        }
        if (auto failure = writer.writeU8(message_count))
        {
            return AnyFailure{*failure};
        }
        return cetl::nullopt;
    }

    /// @brief Writes a single message, and records its ack (if the message has an id).
    ///
    /// The message bytes are expected to be reserved in advance (see `reserve`).
    ///
    CETL_NODISCARD cetl::optional<AnyFailure> commitMessage(const ChannelId channel_id, const SingleData& message)
    {
        if (auto failure = release(message.encodedSize()))
        {
            return failure;
        }

        serialization::ByteWriter writer{payload_, config::Packet::MaxPayloadSize()};
        if (auto failure = message.serialize(writer))
        {
            return AnyFailure{*failure};
        }

        if (message.id.has_value())
        {
            const ChannelMessageAck ack{channel_id, MessageAck{message.id.value(), cetl::nullopt}};
            if (!libparcel::detail::tryAppend(message_acks_, ack))
            {
                return AnyFailure{MemoryError{}};
            }
        }
        return cetl::nullopt;
    }

    /// @brief Finishes the packet by shrinking its buffers to the actually written length.
    ///
    /// Nothing should be written into the packet afterwards.
    ///
    void finish()
    {
        CETL_DEBUG_ASSERT(prewritten_size_ == 0, "All reservations should be committed or released.");

        payload_.shrink_to_fit();
        message_acks_.shrink_to_fit();
    }

private:
    Packet(const PacketId packet_id, const PacketType packet_type, cetl::pmr::memory_resource& memory)
        : packet_id_{packet_id}
        , packet_type_{packet_type}
        , payload_{&memory}
        , message_acks_{&memory}
        , prewritten_size_{0}
    {
    }

    // MARK: Data members:

    PacketId    packet_id_;
    PacketType  packet_type_;
    Payload     payload_;
    MessageAcks message_acks_;
    std::size_t prewritten_size_;

};  // Packet

}  // namespace packet
}  // namespace libparcel

#endif  // LIBPARCEL_PACKET_PACKET_HPP_INCLUDED
