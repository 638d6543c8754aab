/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBPARCEL_GTEST_HELPERS_HPP_INCLUDED
#define LIBPARCEL_GTEST_HELPERS_HPP_INCLUDED

#include <libparcel/errors.hpp>
#include <libparcel/packet/header.hpp>
#include <libparcel/packet/message.hpp>
#include <libparcel/types.hpp>

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/pf20/cetlpf.hpp>

#include <gmock/gmock.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <ios>
#include <ostream>

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

// MARK: - GTest Printers:

namespace cetl
{
namespace pf17
{

inline std::ostream& operator<<(std::ostream& os, const cetl::byte& b)
{
    const auto flags = os.flags();
    os << "0x" << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << static_cast<std::uint32_t>(b);
    os.flags(flags);
    return os;
}

template <typename T>
inline void PrintTo(const cetl::optional<T>& opt, std::ostream* os)
{
    if (!opt.has_value())
    {
        *os << "(nullopt)";
        return;
    }
    *os << "(" << testing::PrintToString(opt.value()) << ")";
}

}  // namespace pf17

namespace pf20
{

/// Payloads are up to a datagram long, so only their head is printed.
///
inline std::ostream& operator<<(std::ostream& os, const cetl::span<const cetl::byte>& bytes)
{
    constexpr std::size_t MaxPrinted = 16;

    os << "{size=" << bytes.size() << ", data=[";
    for (std::size_t index = 0; index < std::min(bytes.size(), MaxPrinted); ++index)
    {
        os << bytes[index] << " ";
    }
    if (bytes.size() > MaxPrinted)
    {
        os << "...";
    }
    return os << "]}";
}

}  // namespace pf20
}  // namespace cetl

namespace libparcel
{

inline void PrintTo(const ArgumentError&, std::ostream* os)
{
    *os << "ArgumentError";
}

inline void PrintTo(const MemoryError&, std::ostream* os)
{
    *os << "MemoryError";
}

inline void PrintTo(const CapacityError&, std::ostream* os)
{
    *os << "CapacityError";
}

inline void PrintTo(const AccountingError&, std::ostream* os)
{
    *os << "AccountingError";
}

namespace packet
{

inline void PrintTo(const PacketType packet_type, std::ostream* os)
{
    switch (packet_type)
    {
    case PacketType::Data:
        *os << "Data";
        break;
    case PacketType::DataFragment:
        *os << "DataFragment";
        break;
    default:
        *os << "PacketType{" << static_cast<std::uint32_t>(packet_type) << "}";
        break;
    }
}

inline void PrintTo(const MessageAck& ack, std::ostream* os)
{
    *os << "MessageAck{id=" << ack.message_id << ", fragment=";
    if (ack.fragment_id.has_value())
    {
        *os << static_cast<std::uint32_t>(ack.fragment_id.value());
    }
    else
    {
        *os << "none";
    }
    *os << "}";
}

inline void PrintTo(const ChannelMessageAck& channel_ack, std::ostream* os)
{
    *os << "{channel=" << channel_ack.channel_id << ", ";
    PrintTo(channel_ack.ack, os);
    *os << "}";
}

inline void PrintTo(const SingleData& message, std::ostream* os)
{
    *os << "SingleData{id=";
    if (message.id.has_value())
    {
        *os << message.id.value();
    }
    else
    {
        *os << "none";
    }
    *os << ", size=" << message.bytes.size() << "}";
}

inline void PrintTo(const FragmentData& fragment, std::ostream* os)
{
    *os << "FragmentData{id=" << fragment.message_id << ", "
        << static_cast<std::uint32_t>(fragment.fragment_id) << "/" << static_cast<std::uint32_t>(fragment.num_fragments)
        << ", size=" << fragment.bytes.size() << "}";
}

// MARK: - GTest Matchers:

/// Matches a message (or fragment) which views exactly the given payload (the same memory, not a copy).
///
MATCHER_P(ViewsPayload, payload, "")
{
    return (arg.bytes.data() == payload.data()) && (arg.bytes.size() == payload.size());
}

template <typename Bytes>
auto ViewsBytesOf(const Bytes& bytes)
{
    return ViewsPayload(PayloadFragment{bytes.data(), bytes.size()});
}

}  // namespace packet
}  // namespace libparcel

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

#endif  // LIBPARCEL_GTEST_HELPERS_HPP_INCLUDED
