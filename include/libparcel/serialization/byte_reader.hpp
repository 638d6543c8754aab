/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBPARCEL_SERIALIZATION_BYTE_READER_HPP_INCLUDED
#define LIBPARCEL_SERIALIZATION_BYTE_READER_HPP_INCLUDED

#include "varint.hpp"

#include "libparcel/errors.hpp"
#include "libparcel/types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>

namespace libparcel
{
namespace serialization
{

/// @brief Consumes big-endian encoded values from the front of an immutable byte span.
///
/// Any attempt to read past the end of the span fails with `CapacityError`,
/// and the reading position is not advanced in such case.
///
/// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
///
class ByteReader final
{
public:
    explicit ByteReader(const PayloadFragment bytes) noexcept
        : bytes_{bytes}
        , offset_{0}
    {
    }

    CETL_NODISCARD std::size_t remaining() const noexcept
    {
        return bytes_.size() - offset_;
    }

    CETL_NODISCARD bool empty() const noexcept
    {
        return remaining() == 0;
    }

    CETL_NODISCARD Expected<std::uint8_t, CapacityError> readU8()
    {
        return readBigEndian<std::uint8_t>(1);
    }

    CETL_NODISCARD Expected<std::uint16_t, CapacityError> readU16()
    {
        return readBigEndian<std::uint16_t>(2);
    }

    CETL_NODISCARD Expected<std::uint32_t, CapacityError> readU32()
    {
        return readBigEndian<std::uint32_t>(4);
    }

    CETL_NODISCARD Expected<std::uint64_t, CapacityError> readVarint()
    {
        if (empty())
        {
            return CapacityError{};
        }
        const auto        first_byte = static_cast<std::uint8_t>(bytes_[offset_]);
        const std::size_t size       = varintSizeFromPrefix(first_byte);

        auto result = readBigEndian<std::uint64_t>(size);
        if (auto* const value = cetl::get_if<std::uint64_t>(&result))
        {
            // Strip the length tag (two most significant bits of the encoding).
            const std::size_t value_bits = (size * 8U) - 2U;
            *value &= (std::uint64_t{1} << value_bits) - 1U;
        }
        return result;
    }

    /// @brief Reads raw bytes (without any length prefix).
    ///
    /// The result is a view into the original span (no copying).
    ///
    CETL_NODISCARD Expected<PayloadFragment, CapacityError> readBytes(const std::size_t size)
    {
        if (remaining() < size)
        {
            return CapacityError{};
        }
        const PayloadFragment result = bytes_.subspan(offset_, size);
        offset_ += size;
        return result;
    }

    /// @brief Reads varint length prefix followed by the bytes.
    ///
    CETL_NODISCARD Expected<PayloadFragment, CapacityError> readLengthPrefixedBytes()
    {
        const std::size_t start = offset_;

        auto size = readVarint();
        if (auto* const failure = cetl::get_if<CapacityError>(&size))
        {
            return *failure;
        }
        auto result = readBytes(cetl::get<std::uint64_t>(size));
        if (cetl::holds_alternative<CapacityError>(result))
        {
            offset_ = start;
        }
        return result;
    }

private:
    template <typename T>
    CETL_NODISCARD Expected<T, CapacityError> readBigEndian(const std::size_t size)
    {
        if (remaining() < size)
        {
            return CapacityError{};
        }

        std::uint64_t value = 0;
        for (std::size_t i = 0; i < size; ++i)
        {
            value = (value << 8U) | static_cast<std::uint8_t>(bytes_[offset_ + i]);
        }
        offset_ += size;
        return static_cast<T>(value);
    }

    // MARK: Data members:

    PayloadFragment bytes_;
    std::size_t     offset_;

};  // ByteReader

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace serialization
}  // namespace libparcel

#endif  // LIBPARCEL_SERIALIZATION_BYTE_READER_HPP_INCLUDED
