/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBPARCEL_PACKET_FRAGMENTER_HPP_INCLUDED
#define LIBPARCEL_PACKET_FRAGMENTER_HPP_INCLUDED

#include "message.hpp"
#include "types.hpp"

#include "libparcel/config.hpp"
#include "libparcel/errors.hpp"
#include "libparcel/logging.hpp"
#include "libparcel/types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <cstddef>
#include <limits>

namespace libparcel
{
namespace packet
{

/// @brief Slices large messages into fragments.
///
class Fragmenter final
{
public:
    using Fragments = libparcel::detail::VarArray<FragmentData>;

    /// @brief Gets number of fragments needed for a payload of the given size.
    ///
    static constexpr std::size_t fragmentsCount(const std::size_t payload_size) noexcept
    {
        return (payload_size == 0) ? 1U : ((payload_size + config::Packet::FragmentSize() - 1U) /
                                           config::Packet::FragmentSize());
    }

    /// @brief Appends fragments of the given payload to the end of `out` array.
    ///
    /// All fragments (but the last one) have exactly `config::Packet::FragmentSize()` bytes.
    /// Fragments are views into the original payload - no bytes are copied.
    ///
    /// @return `ArgumentError` if the payload needs more fragments than `FragmentIndex` could count.
    ///         `MemoryError` if the `out` array couldn't grow (its content is unspecified then).
    ///
    CETL_NODISCARD static cetl::optional<AnyFailure> buildFragments(const MessageId       message_id,
                                                                    const PayloadFragment payload,
                                                                    Fragments&            out)
    {
        const std::size_t num_fragments = fragmentsCount(payload.size());
        if (num_fragments > std::numeric_limits<FragmentIndex>::max())
        {
            getLogger().warn("Message {}: {} bytes need {} fragments (max {}).",
                             message_id,
                             payload.size(),
                             num_fragments,
                             std::numeric_limits<FragmentIndex>::max());
            return ArgumentError{};
        }

        out.reserve(out.size() + num_fragments);
        if (out.capacity() < (out.size() + num_fragments))
        {
            return MemoryError{};
        }

        std::size_t offset = 0;
        for (std::size_t index = 0; index < num_fragments; ++index)
        {
            const std::size_t size = std::min(config::Packet::FragmentSize(), payload.size() - offset);
            out.push_back(FragmentData{message_id,
                                       static_cast<FragmentIndex>(index),
                                       static_cast<FragmentIndex>(num_fragments),
                                       payload.subspan(offset, size)});
            offset += size;
        }
        return cetl::nullopt;
    }

};  // Fragmenter

}  // namespace packet
}  // namespace libparcel

#endif  // LIBPARCEL_PACKET_FRAGMENTER_HPP_INCLUDED
