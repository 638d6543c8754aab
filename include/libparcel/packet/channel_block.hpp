/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBPARCEL_PACKET_CHANNEL_BLOCK_HPP_INCLUDED
#define LIBPARCEL_PACKET_CHANNEL_BLOCK_HPP_INCLUDED

#include "message.hpp"
#include "packet.hpp"
#include "types.hpp"

#include "libparcel/config.hpp"
#include "libparcel/errors.hpp"
#include "libparcel/logging.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/pf20/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>

namespace libparcel
{
namespace packet
{
namespace detail
{

/// @brief Defines one channel block of a packet while it's being packed.
///
/// Block goes through two phases:
/// 1. Reservation - the channel header is reserved by `open`, and then messages are reserved one by one
///    (see `tryReserve`) while they fit into the packet (and the block message limit).
/// 2. Commit - the header (with the final message count) and all reserved messages are written by `commit`.
///    Empty block writes nothing; its header reservation is released instead.
///
/// Every opened block must be committed exactly once, otherwise the packet ledger keeps
/// a dangling reservation.
///
class ChannelBlock final
{
    static_assert(config::Packet::MaxMessagesPerChannelBlock() > 0, "A block must take at least one message.");
    static_assert(config::Packet::MaxMessagesPerChannelBlock() <= std::numeric_limits<std::uint8_t>::max(),
                  "Message count of a block is encoded as a single byte.");

public:
    /// @brief Opens a new block by reserving its channel header in the given packet.
    ///
    /// @return An empty optional if even the channel header doesn't fit (the packet stays untouched).
    ///
    CETL_NODISCARD static cetl::optional<ChannelBlock> open(Packet& packet, const ChannelId channel_id)
    {
        if (!packet.reserve(Packet::channelHeaderSize(channel_id)))
        {
            return cetl::nullopt;
        }
        return ChannelBlock{packet, channel_id};
    }

    CETL_NODISCARD ChannelId getChannelId() const noexcept
    {
        return channel_id_;
    }

    /// @brief Gets number of messages reserved so far.
    ///
    CETL_NODISCARD std::size_t getReservedCount() const noexcept
    {
        return reserved_count_;
    }

    /// @brief Gets number of bytes which are still available for messages of this block.
    ///
    CETL_NODISCARD std::size_t getRemainingCapacity() const noexcept
    {
        return packet_->getRemainingCapacity();
    }

    /// @brief Gets number of messages which still could be added to this block (regardless of their size).
    ///
    CETL_NODISCARD std::size_t getRemainingCount() const noexcept
    {
        return config::Packet::MaxMessagesPerChannelBlock() - reserved_count_;
    }

    /// @brief Tries to reserve space for one more message.
    ///
    /// @return `true` if reserved; `false` if either the packet is full or the block reached its message limit.
    ///
    CETL_NODISCARD bool tryReserve(const SingleData& message)
    {
        if ((getRemainingCount() == 0) || !packet_->reserve(message.encodedSize()))
        {
            return false;
        }
        ++reserved_count_;
        return true;
    }

    /// @brief Commits the block by writing its header and all reserved messages.
    ///
    /// @param messages The very same messages (in the same order) which were reserved by `tryReserve`.
    ///
    CETL_NODISCARD cetl::optional<AnyFailure> commit(const cetl::span<const SingleData> messages)
    {
        if (messages.size() != reserved_count_)
        {
            getLogger().error("Channel {} block: {} messages to commit, but {} were reserved.",
                              channel_id_,
                              messages.size(),
                              reserved_count_);
            return AccountingError{};
        }

        if (reserved_count_ == 0)
        {
            return packet_->release(Packet::channelHeaderSize(channel_id_));
        }

        if (auto failure = packet_->commitChannelHeader(channel_id_, static_cast<std::uint8_t>(reserved_count_)))
        {
            return failure;
        }
        for (const auto& message : messages)
        {
            if (auto failure = packet_->commitMessage(channel_id_, message))
            {
                return failure;
            }
        }
        return cetl::nullopt;
    }

private:
    ChannelBlock(Packet& packet, const ChannelId channel_id) noexcept
        : packet_{&packet}
        , channel_id_{channel_id}
        , reserved_count_{0}
    {
    }

    // MARK: Data members:

    Packet*     packet_;
    ChannelId   channel_id_;
    std::size_t reserved_count_;

};  // ChannelBlock

}  // namespace detail
}  // namespace packet
}  // namespace libparcel

#endif  // LIBPARCEL_PACKET_CHANNEL_BLOCK_HPP_INCLUDED
