/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBPARCEL_PACKET_PACKING_STRATEGY_HPP_INCLUDED
#define LIBPARCEL_PACKET_PACKING_STRATEGY_HPP_INCLUDED

#include "message.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf20/cetlpf.hpp>

#include <algorithm>
#include <cstddef>

namespace libparcel
{
namespace packet
{

/// @brief Defines interface of a strategy which decides what single messages go into a channel block.
///
class IPackingStrategy
{
public:
    IPackingStrategy(const IPackingStrategy&)                = delete;
    IPackingStrategy(IPackingStrategy&&) noexcept            = delete;
    IPackingStrategy& operator=(const IPackingStrategy&)     = delete;
    IPackingStrategy& operator=(IPackingStrategy&&) noexcept = delete;

    /// @brief Reorders single messages of a channel before they get packed.
    ///
    /// Messages are packed (and so delivered) in the resulting order.
    ///
    virtual void order(cetl::span<SingleData> messages) const = 0;

    /// @brief Selects how many leading candidates should go into the current channel block.
    ///
    /// @param candidates Remaining (already ordered) messages of the channel.
    /// @param capacity Number of bytes still available in the packet.
    /// @param max_count Max number of messages the block could still take.
    /// @return Length of the selected prefix. Zero means that the current packet can't take any more of them.
    ///
    virtual std::size_t selectPrefix(const cetl::span<const SingleData> candidates,
                                     const std::size_t                  capacity,
                                     const std::size_t                  max_count) const = 0;

protected:
    IPackingStrategy()  = default;
    ~IPackingStrategy() = default;

};  // IPackingStrategy

/// @brief Defines the default greedy packing strategy.
///
/// Messages are ordered by their encoded size (smallest first, stable), and then packed
/// one by one until the first message which doesn't fit. This is a heuristic: it doesn't
/// look for an optimal set of messages and never skips a message to fit a later one.
///
class GreedyPackingStrategy final : public IPackingStrategy
{
public:
    GreedyPackingStrategy() = default;

    GreedyPackingStrategy(const GreedyPackingStrategy&)                = delete;
    GreedyPackingStrategy(GreedyPackingStrategy&&) noexcept            = delete;
    GreedyPackingStrategy& operator=(const GreedyPackingStrategy&)     = delete;
    GreedyPackingStrategy& operator=(GreedyPackingStrategy&&) noexcept = delete;

    ~GreedyPackingStrategy() = default;

    /// @brief Gets the shared (stateless) instance of the strategy.
    ///
    static const GreedyPackingStrategy& instance() noexcept
    {
        static const GreedyPackingStrategy strategy{};
        return strategy;
    }

    // MARK: IPackingStrategy

    void order(cetl::span<SingleData> messages) const override
    {
        std::stable_sort(messages.begin(), messages.end(), [](const SingleData& lhs, const SingleData& rhs) {
            return lhs.encodedSize() < rhs.encodedSize();
        });
    }

    std::size_t selectPrefix(const cetl::span<const SingleData> candidates,
                             const std::size_t                  capacity,
                             const std::size_t                  max_count) const override
    {
        std::size_t count = 0;
        std::size_t total = 0;
        for (const auto& candidate : candidates)
        {
            const std::size_t size = candidate.encodedSize();
            if ((count == max_count) || (size > capacity - total))
            {
                break;
            }
            total += size;
            ++count;
        }
        return count;
    }

};  // GreedyPackingStrategy

}  // namespace packet
}  // namespace libparcel

#endif  // LIBPARCEL_PACKET_PACKING_STRATEGY_HPP_INCLUDED
