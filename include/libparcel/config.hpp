/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBPARCEL_CONFIG_HPP_INCLUDED
#define LIBPARCEL_CONFIG_HPP_INCLUDED

#include <spdlog/common.h>

#include <cstddef>

namespace libparcel
{

/// Defines various configuration parameters of libparcel.
///
/// All methods are `static constexpr` - they are evaluated at compile time.
/// A custom configuration could be supplied by defining `LIBPARCEL_CONFIG` macro
/// (before inclusion of any libparcel header) as a type derived from `libparcel::Config`.
///
/// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
///
struct Config
{
    /// Defines various configuration parameters of a packet.
    ///
    struct Packet
    {
        /// Defines the largest payload (in bytes, including the packet header) of a single datagram.
        ///
        static constexpr std::size_t MaxPayloadSize()
        {
            return 1200;
        }

        /// Defines size of a fragment slice (in bytes).
        ///
        /// A full fragment packet is the header (11), the widest channel id varint (4),
        /// fragment metadata (4 + 2 bytes of length varint) and the slice itself,
        /// so 1179 bytes exactly fill a 1200 bytes packet.
        ///
        static constexpr std::size_t FragmentSize()
        {
            return 1179;
        }

        /// Defines max number of messages in a single channel block.
        ///
        /// Message count is written as a single byte right after the channel id.
        ///
        static constexpr std::size_t MaxMessagesPerChannelBlock()  // NOSONAR cpp:S799
        {
            return 255;
        }

    };  // Packet

    /// Defines various configuration parameters of the packet builder.
    ///
    struct Builder
    {
        /// Defines default value of `PacketBuilder::Options::fill_last_fragment`.
        ///
        static constexpr bool FillLastFragment()
        {
            return true;
        }

    };  // Builder

    struct Logging
    {
        static constexpr const char* LoggerName()
        {
            return "libparcel";
        }

        static constexpr spdlog::level::level_enum DefaultLevel()
        {
            return spdlog::level::warn;
        }

    };  // Logging

};  // Config

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

#ifdef LIBPARCEL_CONFIG
using config = LIBPARCEL_CONFIG;
#else
using config = Config;
#endif

}  // namespace libparcel

#endif  // LIBPARCEL_CONFIG_HPP_INCLUDED
