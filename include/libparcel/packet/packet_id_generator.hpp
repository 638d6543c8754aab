/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBPARCEL_PACKET_PACKET_ID_GENERATOR_HPP_INCLUDED
#define LIBPARCEL_PACKET_PACKET_ID_GENERATOR_HPP_INCLUDED

#include "types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <utility>

namespace libparcel
{
namespace packet
{

/// Internal implementation details of the packet layer.
/// Not supposed to be used directly by the users of the library.
///
namespace detail
{

/// @brief Defines a trivial packet ID generator.
///
/// The generator simply increments the packet ID, wrapping around at `2^16`.
/// Receiving side is expected to compare packet ids with wrap-around arithmetic.
///
class PacketIdGenerator
{
public:
    /// @brief Returns the next packet ID.
    ///
    CETL_NODISCARD PacketId nextPacketId() noexcept
    {
        return std::exchange(next_packet_id_, static_cast<PacketId>(next_packet_id_ + 1U));
    }

    /// @brief Peeks the packet ID which will be returned by the next `nextPacketId` call.
    ///
    CETL_NODISCARD PacketId peekNextPacketId() const noexcept
    {
        return next_packet_id_;
    }

    /// @brief Sets next packet ID.
    ///
    /// In use for testing purposes.
    ///
    void setNextPacketId(const PacketId packet_id) noexcept
    {
        next_packet_id_ = packet_id;
    }

private:
    // MARK: Data members:

    PacketId next_packet_id_{0};

};  // PacketIdGenerator

}  // namespace detail
}  // namespace packet
}  // namespace libparcel

#endif  // LIBPARCEL_PACKET_PACKET_ID_GENERATOR_HPP_INCLUDED
