/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBPARCEL_PACKET_HEADER_HPP_INCLUDED
#define LIBPARCEL_PACKET_HEADER_HPP_INCLUDED

#include "packet_id_generator.hpp"
#include "types.hpp"

#include "libparcel/errors.hpp"
#include "libparcel/serialization/byte_reader.hpp"
#include "libparcel/serialization/byte_writer.hpp"
#include "libparcel/types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>

namespace libparcel
{
namespace packet
{

enum class PacketType : std::uint8_t
{
    /// Packet contains only channel blocks of single (not fragmented) messages.
    Data = 0,

    /// Packet starts with one fragment of a large message,
    /// optionally followed by channel blocks of single messages.
    DataFragment = 1,
};

/// @brief Defines the header which every packet starts with.
///
/// Wire format (11 bytes, big-endian):
/// `[packet_type: u8][packet_id: u16][last_ack_packet_id: u16][ack_bitfield: u32][tick: u16]`.
///
/// Meaning of the ack fields is owned by the reliability layer; the packet builder only stamps the tick.
///
struct PacketHeader final
{
    PacketType    packet_type{PacketType::Data};
    PacketId      packet_id{};
    PacketId      last_ack_packet_id{};
    std::uint32_t ack_bitfield{};
    Tick          tick{};

    /// @brief Gets number of bytes of the serialized header.
    ///
    static constexpr std::size_t encodedSize() noexcept
    {
        return sizeof(std::uint8_t) + sizeof(PacketId) + sizeof(PacketId) + sizeof(std::uint32_t) + sizeof(Tick);
    }

    CETL_NODISCARD cetl::optional<CapacityError> serialize(serialization::ByteWriter& writer) const
    {
        // Checked up front so that a header is never written partially.
        if (writer.remaining() < encodedSize())
        {
            return CapacityError{};
        }

        if (auto failure = writer.writeU8(static_cast<std::uint8_t>(packet_type)))
        {
            return failure;
        }
        if (auto failure = writer.writeU16(packet_id))
        {
            return failure;
        }
        if (auto failure = writer.writeU16(last_ack_packet_id))
        {
            return failure;
        }
        if (auto failure = writer.writeU32(ack_bitfield))
        {
            return failure;
        }
        return writer.writeU16(tick);
    }

    CETL_NODISCARD static Expected<PacketHeader, ParseFailure> deserialize(serialization::ByteReader& reader)
    {
        if (reader.remaining() < encodedSize())
        {
            return CapacityError{};
        }

        const auto raw_type = cetl::get<std::uint8_t>(reader.readU8());
        if (raw_type > static_cast<std::uint8_t>(PacketType::DataFragment))
        {
            return ArgumentError{};
        }

        PacketHeader header{};
        header.packet_type        = static_cast<PacketType>(raw_type);
        header.packet_id          = cetl::get<std::uint16_t>(reader.readU16());
        header.last_ack_packet_id = cetl::get<std::uint16_t>(reader.readU16());
        header.ack_bitfield       = cetl::get<std::uint32_t>(reader.readU32());
        header.tick               = cetl::get<std::uint16_t>(reader.readU16());
        return header;
    }

};  // PacketHeader

/// @brief Defines interface of the packet header manager.
///
/// The manager issues a fresh packet header (with a new sequence number) on demand.
/// Implementations shared between threads should be synchronized externally.
///
class IPacketHeaderManager
{
public:
    IPacketHeaderManager(const IPacketHeaderManager&)                = delete;
    IPacketHeaderManager(IPacketHeaderManager&&) noexcept            = delete;
    IPacketHeaderManager& operator=(const IPacketHeaderManager&)     = delete;
    IPacketHeaderManager& operator=(IPacketHeaderManager&&) noexcept = delete;

    /// @brief Prepares a header for a new outbound packet.
    ///
    /// @param packet_type Type of the packet to be built.
    /// @return Header with a fresh `packet_id` which differs from the ones issued recently.
    ///
    virtual PacketHeader prepareSendPacketHeader(const PacketType packet_type) = 0;

protected:
    IPacketHeaderManager()  = default;
    ~IPacketHeaderManager() = default;

};  // IPacketHeaderManager

/// @brief Defines the default packet header manager.
///
/// Packet ids are issued sequentially. The ack fields are the ones most recently
/// supplied by the reliability layer via `setAckState`.
///
class PacketHeaderManager final : public IPacketHeaderManager
{
public:
    PacketHeaderManager() = default;

    PacketHeaderManager(const PacketHeaderManager&)                = delete;
    PacketHeaderManager(PacketHeaderManager&&) noexcept            = delete;
    PacketHeaderManager& operator=(const PacketHeaderManager&)     = delete;
    PacketHeaderManager& operator=(PacketHeaderManager&&) noexcept = delete;

    ~PacketHeaderManager() = default;

    /// @brief Updates acknowledgment fields which will be put into all subsequent headers.
    ///
    void setAckState(const PacketId last_ack_packet_id, const std::uint32_t ack_bitfield) noexcept
    {
        last_ack_packet_id_ = last_ack_packet_id;
        ack_bitfield_       = ack_bitfield;
    }

    detail::PacketIdGenerator& packetIdGenerator() noexcept
    {
        return packet_id_generator_;
    }

    // MARK: IPacketHeaderManager

    PacketHeader prepareSendPacketHeader(const PacketType packet_type) override
    {
        return PacketHeader{packet_type, packet_id_generator_.nextPacketId(), last_ack_packet_id_, ack_bitfield_, 0};
    }

private:
    // MARK: Data members:

    detail::PacketIdGenerator packet_id_generator_;
    PacketId                  last_ack_packet_id_{0};
    std::uint32_t             ack_bitfield_{0};

};  // PacketHeaderManager

}  // namespace packet
}  // namespace libparcel

#endif  // LIBPARCEL_PACKET_HEADER_HPP_INCLUDED
