/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBPARCEL_PACKET_CHANNEL_QUEUES_HPP_INCLUDED
#define LIBPARCEL_PACKET_CHANNEL_QUEUES_HPP_INCLUDED

#include "message.hpp"
#include "types.hpp"

#include "libparcel/errors.hpp"
#include "libparcel/types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/pf20/cetlpf.hpp>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <utility>

namespace libparcel
{
namespace packet
{

/// @brief Defines pending outbound messages of a single channel.
///
struct ChannelMessages final
{
    using SingleMessages   = libparcel::detail::VarArray<SingleData>;
    using FragmentMessages = libparcel::detail::VarArray<FragmentData>;

    ChannelMessages(const ChannelId id, cetl::pmr::memory_resource& memory)
        : channel_id{id}
        , single_messages{&memory}
        , fragment_messages{&memory}
    {
    }

    CETL_NODISCARD bool empty() const noexcept
    {
        return single_messages.empty() && fragment_messages.empty();
    }

    ChannelId        channel_id;
    SingleMessages   single_messages;
    FragmentMessages fragment_messages;

};  // ChannelMessages

/// @brief Defines an ordered mapping from channel id to pending messages of the channel.
///
/// Channels are always kept (and so iterated) in ascending order of their ids.
/// Payload bytes of queued messages are not copied - they must outlive the queues.
///
class ChannelQueues final
{
    using Channels = libparcel::detail::VarArray<ChannelMessages>;

public:
    explicit ChannelQueues(cetl::pmr::memory_resource& memory)
        : memory_{memory}
        , channels_{&memory}
    {
    }

    ChannelQueues(const ChannelQueues&)                = delete;
    ChannelQueues(ChannelQueues&&) noexcept            = delete;
    ChannelQueues& operator=(const ChannelQueues&)     = delete;
    ChannelQueues& operator=(ChannelQueues&&) noexcept = delete;

    ~ChannelQueues() = default;

    /// @brief Queues a single message at the end of the channel queue.
    ///
    CETL_NODISCARD cetl::optional<MemoryError> pushSingle(const ChannelId channel_id, const SingleData& message)
    {
        auto* const channel = findOrInsert(channel_id);
        if ((channel == nullptr) || !libparcel::detail::tryAppend(channel->single_messages, message))
        {
            return MemoryError{};
        }
        return cetl::nullopt;
    }

    /// @brief Queues a fragment at the end of the channel fragment queue.
    ///
    CETL_NODISCARD cetl::optional<MemoryError> pushFragment(const ChannelId channel_id, const FragmentData& fragment)
    {
        auto* const channel = findOrInsert(channel_id);
        if ((channel == nullptr) || !libparcel::detail::tryAppend(channel->fragment_messages, fragment))
        {
            return MemoryError{};
        }
        return cetl::nullopt;
    }

    /// @brief Queues all given fragments (f.e. the ones of a single large message) in order.
    ///
    CETL_NODISCARD cetl::optional<MemoryError> pushFragments(const ChannelId                      channel_id,
                                                             const cetl::span<const FragmentData> fragments)
    {
        for (const auto& fragment : fragments)
        {
            if (auto failure = pushFragment(channel_id, fragment))
            {
                return failure;
            }
        }
        return cetl::nullopt;
    }

    /// @brief Finds pending messages of the given channel.
    ///
    /// @return `nullptr` if nothing was ever queued for the channel.
    ///
    CETL_NODISCARD ChannelMessages* find(const ChannelId channel_id) noexcept
    {
        const std::size_t index = lowerBound(channel_id);
        return ((index < channels_.size()) && (channels_[index].channel_id == channel_id)) ? &channels_[index]
                                                                                            : nullptr;
    }

    CETL_NODISCARD cetl::span<ChannelMessages> channels() noexcept
    {
        return {channels_.data(), channels_.size()};
    }

    CETL_NODISCARD cetl::span<const ChannelMessages> channels() const noexcept
    {
        return {channels_.data(), channels_.size()};
    }

    /// @brief Gets total number of queued single messages and fragments (across all channels).
    ///
    CETL_NODISCARD std::size_t totalMessages() const noexcept
    {
        std::size_t total = 0;
        for (const auto& channel : channels_)
        {
            total += channel.single_messages.size() + channel.fragment_messages.size();
        }
        return total;
    }

    CETL_NODISCARD bool empty() const noexcept
    {
        return totalMessages() == 0;
    }

    /// @brief Removes all channels (together with their pending messages).
    ///
    void clear() noexcept
    {
        channels_.clear();
    }

private:
    /// @brief Gets index of the first channel which id is not less than the given one.
    ///
    CETL_NODISCARD std::size_t lowerBound(const ChannelId channel_id) const noexcept
    {
        const auto it = std::lower_bound(channels_.begin(),
                                         channels_.end(),
                                         channel_id,
                                         [](const ChannelMessages& channel, const ChannelId id) {
                                             return channel.channel_id < id;
                                         });
        return static_cast<std::size_t>(std::distance(channels_.begin(), it));
    }

    CETL_NODISCARD ChannelMessages* findOrInsert(const ChannelId channel_id)
    {
        const std::size_t index = lowerBound(channel_id);
        if ((index < channels_.size()) && (channels_[index].channel_id == channel_id))
        {
            return &channels_[index];
        }

        // New channel is appended at the end, and then rotated into its sorted position.
        if (!libparcel::detail::tryAppend(channels_, ChannelMessages{channel_id, memory_}))
        {
            return nullptr;
        }
        const auto first = channels_.begin() + static_cast<std::ptrdiff_t>(index);
        std::rotate(first, channels_.end() - 1, channels_.end());
        return &channels_[index];
    }

    // MARK: Data members:

    cetl::pmr::memory_resource& memory_;
    Channels                    channels_;

};  // ChannelQueues

}  // namespace packet
}  // namespace libparcel

#endif  // LIBPARCEL_PACKET_CHANNEL_QUEUES_HPP_INCLUDED
