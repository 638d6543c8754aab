/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBPARCEL_PACKET_PACKET_BUILDER_HPP_INCLUDED
#define LIBPARCEL_PACKET_PACKET_BUILDER_HPP_INCLUDED

#include "channel_block.hpp"
#include "channel_queues.hpp"
#include "header.hpp"
#include "message.hpp"
#include "packet.hpp"
#include "packing_strategy.hpp"
#include "types.hpp"

#include "libparcel/config.hpp"
#include "libparcel/errors.hpp"
#include "libparcel/logging.hpp"
#include "libparcel/serialization/varint.hpp"
#include "libparcel/types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/pf20/cetlpf.hpp>

#include <cstddef>
#include <limits>
#include <utility>

namespace libparcel
{
namespace packet
{

/// @brief Defines the outbound packet builder.
///
/// Builder converts per-channel queues of pending messages into a sequence of packets,
/// each of them bounded by `config::Packet::MaxPayloadSize()`. Channels are processed
/// in ascending order of their ids, and within a channel:
/// 1. Single messages are ordered by the packing strategy (smallest first by default).
/// 2. The packet left open by previous channel (if any) is filled with the channel messages.
/// 3. Every fragment goes into its own fresh packet. Packet of a last fragment may be
///    filled with leftover single messages of the channel (see `Options::fill_last_fragment`).
/// 4. Remaining single messages are packed into as many fresh packets as needed.
///    The last of them stays open, so that the next channel could continue filling it.
///
/// Only one packet is open at a time. Every message and fragment ends up in exactly one packet.
///
class PacketBuilder final
{
    // A full fragment has to fit into its own packet even on a channel with the widest id.
    static_assert(PacketHeader::encodedSize() + serialization::varintSize(std::numeric_limits<ChannelId>::max()) +
                          FragmentData::encodedSize(config::Packet::FragmentSize()) <=
                      config::Packet::MaxPayloadSize(),
                  "Fragment size doesn't leave room for the packet and fragment headers.");

public:
    using PacketArray = libparcel::detail::VarArray<Packet>;

    /// @brief Defines runtime options of the builder.
    ///
    struct Options
    {
        /// Whether packet of the last fragment of a message should be shared with single messages.
        bool fill_last_fragment{config::Builder::FillLastFragment()};
    };

    PacketBuilder(cetl::pmr::memory_resource& memory,
                  IPacketHeaderManager&       header_manager,
                  const IPackingStrategy&     packing_strategy,
                  const Options               options)
        : memory_{memory}
        , header_manager_{header_manager}
        , packing_strategy_{packing_strategy}
        , options_{options}
    {
    }

    PacketBuilder(cetl::pmr::memory_resource& memory, IPacketHeaderManager& header_manager)
        : PacketBuilder{memory, header_manager, GreedyPackingStrategy::instance(), Options{}}
    {
    }

    PacketBuilder(cetl::pmr::memory_resource& memory, IPacketHeaderManager& header_manager, const Options options)
        : PacketBuilder{memory, header_manager, GreedyPackingStrategy::instance(), options}
    {
    }

    PacketBuilder(const PacketBuilder&)                = delete;
    PacketBuilder(PacketBuilder&&) noexcept            = delete;
    PacketBuilder& operator=(const PacketBuilder&)     = delete;
    PacketBuilder& operator=(PacketBuilder&&) noexcept = delete;

    ~PacketBuilder() = default;

    CETL_NODISCARD const Options& getOptions() const noexcept
    {
        return options_;
    }

    /// @brief Builds packets from all pending messages of the given channels.
    ///
    /// On success all channel queues are consumed (cleared). On failure no packets are returned,
    /// and the queues keep all their messages (although single messages might be reordered),
    /// so the build could be retried later.
    ///
    /// @param current_tick The tick to be stamped into every packet header.
    /// @param channels Pending messages per channel.
    /// @return Finished packets in the order they should be sent, or a failure:
    ///         - `ArgumentError` if a message doesn't fit into an empty packet, or a fragment is malformed;
    ///         - `MemoryError` if there is not enough memory for packets or their acks;
    ///         - `CapacityError` or `AccountingError` in case of an internal packing fault.
    ///
    CETL_NODISCARD Expected<PacketArray, AnyFailure> buildPackets(const Tick current_tick, ChannelQueues& channels)
    {
        if (auto failure = validate(channels))
        {
            return std::move(*failure);
        }

        BuildState state{current_tick, memory_};
        for (auto& channel : channels.channels())
        {
            if (auto failure = packChannel(state, channel))
            {
                return std::move(*failure);
            }
        }
        if (auto failure = closePacket(state))
        {
            return std::move(*failure);
        }

        channels.clear();
        return std::move(state.packets);
    }

private:
    /// @brief Holds state of a single `buildPackets` call.
    ///
    struct BuildState
    {
        BuildState(const Tick current_tick, cetl::pmr::memory_resource& memory)
            : tick{current_tick}
            , packets{&memory}
        {
        }

        Tick                   tick;
        cetl::optional<Packet> open_packet;
        PacketArray            packets;
    };

    /// Size of an otherwise empty packet with a single channel block for the given channel.
    ///
    static constexpr std::size_t emptyPacketOverhead(const ChannelId channel_id) noexcept
    {
        return PacketHeader::encodedSize() + Packet::channelHeaderSize(channel_id);
    }

    /// @brief Verifies that every message (and fragment) could be packed at all.
    ///
    /// Done up front, so that a bad message never leaves a partially built packet sequence.
    ///
    CETL_NODISCARD static cetl::optional<AnyFailure> validate(const ChannelQueues& channels)
    {
        constexpr std::size_t max_size = config::Packet::MaxPayloadSize();

        for (const auto& channel : channels.channels())
        {
            for (const auto& message : channel.single_messages)
            {
                if ((emptyPacketOverhead(channel.channel_id) + message.encodedSize()) > max_size)
                {
                    getLogger().warn("Channel {}: message of {} bytes doesn't fit into a packet.",
                                     channel.channel_id,
                                     message.bytes.size());
                    return ArgumentError{};
                }
            }
            for (const auto& fragment : channel.fragment_messages)
            {
                const std::size_t fragment_packet_size = PacketHeader::encodedSize() +
                                                         serialization::varintSize(channel.channel_id) +
                                                         fragment.encodedSize();
                if ((fragment.bytes.size() > config::Packet::FragmentSize()) ||
                    (fragment.fragment_id >= fragment.num_fragments) || (fragment_packet_size > max_size))
                {
                    getLogger().warn("Channel {}: invalid fragment {}/{} of message {} ({} bytes).",
                                     channel.channel_id,
                                     fragment.fragment_id,
                                     fragment.num_fragments,
                                     fragment.message_id,
                                     fragment.bytes.size());
                    return ArgumentError{};
                }
            }
        }
        return cetl::nullopt;
    }

    CETL_NODISCARD cetl::optional<AnyFailure> packChannel(BuildState& state, ChannelMessages& channel)
    {
        if (channel.empty())
        {
            return cetl::nullopt;
        }

        const ChannelId channel_id = channel.channel_id;
        getLogger().trace("Channel {}: packing {} single message(s) and {} fragment(s).",
                          channel_id,
                          channel.single_messages.size(),
                          channel.fragment_messages.size());

        const cetl::span<SingleData> singles{channel.single_messages.data(), channel.single_messages.size()};
        packing_strategy_.order(singles);
        std::size_t next_single = 0;

        // 1. Continue filling the packet left open by the previous channel.
        if (state.open_packet.has_value() && !singles.empty())
        {
            if (auto failure = fillOpenPacket(state, channel_id, singles, next_single))
            {
                return failure;
            }
        }

        // 2. Every fragment goes into its own fresh packet.
        for (const auto& fragment : channel.fragment_messages)
        {
            if (auto failure = closePacket(state))
            {
                return failure;
            }
            if (auto failure = openFragmentPacket(state, channel_id, fragment))
            {
                return failure;
            }

            if (!fragment.isLastFragment() || !options_.fill_last_fragment)
            {
                if (auto failure = closePacket(state))
                {
                    return failure;
                }
            }
            else if (next_single < singles.size())
            {
                if (auto failure = fillOpenPacket(state, channel_id, singles, next_single))
                {
                    return failure;
                }
            }
        }

        // 3. Whatever is left goes into fresh packets.
        while (next_single < singles.size())
        {
            if (state.open_packet.has_value() && !state.open_packet->canFitChannel(channel_id))
            {
                if (auto failure = closePacket(state))
                {
                    return failure;
                }
            }

            const bool is_fresh_packet = !state.open_packet.has_value();
            if (is_fresh_packet)
            {
                if (auto failure = openSinglePacket(state))
                {
                    return failure;
                }
            }

            const std::size_t packed_before = next_single;
            if (auto failure = fillOpenPacket(state, channel_id, singles, next_single))
            {
                return failure;
            }
            if (is_fresh_packet && (next_single == packed_before))
            {
                // Can't happen for validated messages, unless a custom strategy refuses to select anything.
                getLogger().error("Channel {}: no message could be packed into an empty packet.", channel_id);
                return AccountingError{};
            }
        }

        return cetl::nullopt;
    }

    /// @brief Fills the open packet with a block of (not yet packed) single messages of the channel.
    ///
    /// The packet is closed if either its capacity got exhausted before all messages were packed,
    /// or even the channel header doesn't fit. Otherwise it stays open.
    ///
    CETL_NODISCARD cetl::optional<AnyFailure> fillOpenPacket(BuildState&                        state,
                                                             const ChannelId                    channel_id,
                                                             const cetl::span<const SingleData> singles,
                                                             std::size_t&                       next_single)
    {
        CETL_DEBUG_ASSERT(state.open_packet.has_value(), "There should be an open packet to fill.");

        auto block = detail::ChannelBlock::open(*state.open_packet, channel_id);
        if (!block.has_value())
        {
            return closePacket(state);
        }

        const auto        pending  = singles.subspan(next_single);
        const std::size_t selected = packing_strategy_.selectPrefix(pending,
                                                                     block->getRemainingCapacity(),
                                                                     block->getRemainingCount());
        for (std::size_t index = 0; (index < selected) && (index < pending.size()); ++index)
        {
            if (!block->tryReserve(pending[index]))
            {
                break;
            }
        }

        const std::size_t reserved = block->getReservedCount();
        if (auto failure = block->commit(pending.first(reserved)))
        {
            return failure;
        }
        next_single += reserved;

        if (next_single < singles.size())
        {
            return closePacket(state);
        }
        return cetl::nullopt;
    }

    CETL_NODISCARD cetl::optional<AnyFailure> openSinglePacket(BuildState& state)
    {
        auto header = header_manager_.prepareSendPacketHeader(PacketType::Data);
        header.tick = state.tick;

        auto maybe_packet = Packet::make(memory_, header);
        if (auto* const failure = cetl::get_if<AnyFailure>(&maybe_packet))
        {
            return std::move(*failure);
        }
        state.open_packet.emplace(cetl::get<Packet>(std::move(maybe_packet)));
        return cetl::nullopt;
    }

    CETL_NODISCARD cetl::optional<AnyFailure> openFragmentPacket(BuildState&         state,
                                                                 const ChannelId     channel_id,
                                                                 const FragmentData& fragment)
    {
        auto header = header_manager_.prepareSendPacketHeader(PacketType::DataFragment);
        header.tick = state.tick;

        auto maybe_packet = Packet::makeFragment(memory_, header, channel_id, fragment);
        if (auto* const failure = cetl::get_if<AnyFailure>(&maybe_packet))
        {
            return std::move(*failure);
        }
        state.open_packet.emplace(cetl::get<Packet>(std::move(maybe_packet)));
        return cetl::nullopt;
    }

    /// @brief Finishes the open packet (if any), and moves it to the output array.
    ///
    CETL_NODISCARD static cetl::optional<AnyFailure> closePacket(BuildState& state)
    {
        if (!state.open_packet.has_value())
        {
            return cetl::nullopt;
        }

        auto& packet = *state.open_packet;
        packet.finish();
        getLogger().debug("Packet {} closed: {} bytes, {} ack(s).",
                          packet.getPacketId(),
                          packet.getPayload().size(),
                          packet.getMessageAcks().size());

        if (!libparcel::detail::tryAppend(state.packets, std::move(packet)))
        {
            return MemoryError{};
        }
        state.open_packet.reset();
        return cetl::nullopt;
    }

    // MARK: Data members:

    cetl::pmr::memory_resource& memory_;
    IPacketHeaderManager&       header_manager_;
    const IPackingStrategy&     packing_strategy_;
    const Options               options_;

};  // PacketBuilder

}  // namespace packet
}  // namespace libparcel

#endif  // LIBPARCEL_PACKET_PACKET_BUILDER_HPP_INCLUDED
