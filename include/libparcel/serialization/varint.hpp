/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBPARCEL_SERIALIZATION_VARINT_HPP_INCLUDED
#define LIBPARCEL_SERIALIZATION_VARINT_HPP_INCLUDED

#include <cstddef>
#include <cstdint>

namespace libparcel
{
namespace serialization
{

/// Variable length integers are encoded in the QUIC style: two most significant bits of the first byte
/// select total length of the encoding (`0b00` - 1 byte, `0b01` - 2, `0b10` - 4, `0b11` - 8 bytes),
/// and the remaining bits hold the value in big-endian order.
///
/// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

/// @brief Max value which could be encoded as a varint.
///
constexpr std::uint64_t VarintMax = (std::uint64_t{1} << 62U) - 1U;

/// @brief Gets number of bytes needed to encode the given value as a varint.
///
constexpr std::size_t varintSize(const std::uint64_t value) noexcept
{
    if (value < (std::uint64_t{1} << 6U))
    {
        return 1;
    }
    if (value < (std::uint64_t{1} << 14U))
    {
        return 2;
    }
    if (value < (std::uint64_t{1} << 30U))
    {
        return 4;
    }
    return 8;
}

/// @brief Gets total varint length (in bytes) from the first byte of an encoding.
///
constexpr std::size_t varintSizeFromPrefix(const std::uint8_t first_byte) noexcept
{
    return std::size_t{1} << (first_byte >> 6U);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace serialization
}  // namespace libparcel

#endif  // LIBPARCEL_SERIALIZATION_VARINT_HPP_INCLUDED
