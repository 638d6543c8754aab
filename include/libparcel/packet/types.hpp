/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBPARCEL_PACKET_TYPES_HPP_INCLUDED
#define LIBPARCEL_PACKET_TYPES_HPP_INCLUDED

#include <cstdint>

namespace libparcel
{
namespace packet
{

/// @brief `ChannelId` is an opaque network identifier of a logical channel.
///
/// It's assigned externally (by the channel registry). Channels are always written
/// into packets in ascending order of their ids.
///
using ChannelId = std::uint16_t;

/// @brief `MessageId` is a wrapping 16-bit identifier of a message within its channel.
///
using MessageId = std::uint16_t;

/// @brief `FragmentIndex` is a zero-based index of a fragment within its parent message.
///
/// The same type is used for the total number of fragments, so a message could have at most 255 fragments.
///
using FragmentIndex = std::uint8_t;

/// @brief `PacketId` is a wrapping 16-bit sequence number of a packet.
///
using PacketId = std::uint16_t;

/// @brief `Tick` is a wrapping 16-bit logical tick of the simulation.
///
using Tick = std::uint16_t;

}  // namespace packet
}  // namespace libparcel

#endif  // LIBPARCEL_PACKET_TYPES_HPP_INCLUDED
