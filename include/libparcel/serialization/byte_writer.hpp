/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBPARCEL_SERIALIZATION_BYTE_WRITER_HPP_INCLUDED
#define LIBPARCEL_SERIALIZATION_BYTE_WRITER_HPP_INCLUDED

#include "varint.hpp"

#include "libparcel/errors.hpp"
#include "libparcel/types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>

namespace libparcel
{
namespace serialization
{

/// @brief Appends big-endian encoded values to the end of a byte buffer.
///
/// The writer never allocates memory: the buffer is expected to be pre-reserved by the owner
/// (up to the `limit`), so any attempt to go beyond the limit or the buffer capacity
/// is reported as `CapacityError` (with the buffer left untouched).
///
/// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
///
class ByteWriter final
{
public:
    using Buffer = libparcel::detail::VarArray<cetl::byte>;

    ByteWriter(Buffer& buffer, const std::size_t limit) noexcept
        : buffer_{buffer}
        , limit_{limit}
    {
    }

    ByteWriter(const ByteWriter&)                = delete;
    ByteWriter(ByteWriter&&) noexcept            = delete;
    ByteWriter& operator=(const ByteWriter&)     = delete;
    ByteWriter& operator=(ByteWriter&&) noexcept = delete;

    ~ByteWriter() = default;

    /// @brief Gets total number of bytes in the underlying buffer.
    ///
    CETL_NODISCARD std::size_t size() const noexcept
    {
        return buffer_.size();
    }

    /// @brief Gets number of bytes which still could be written.
    ///
    /// Bounded by both the limit and the capacity already reserved in the buffer.
    ///
    CETL_NODISCARD std::size_t remaining() const noexcept
    {
        const std::size_t bound = std::min(limit_, buffer_.capacity());
        return (buffer_.size() < bound) ? (bound - buffer_.size()) : 0;
    }

    CETL_NODISCARD cetl::optional<CapacityError> writeU8(const std::uint8_t value)
    {
        return writeBigEndian(value, 1);
    }

    CETL_NODISCARD cetl::optional<CapacityError> writeU16(const std::uint16_t value)
    {
        return writeBigEndian(value, 2);
    }

    CETL_NODISCARD cetl::optional<CapacityError> writeU32(const std::uint32_t value)
    {
        return writeBigEndian(value, 4);
    }

    /// @brief Writes the value as a QUIC style varint (see `varintSize`).
    ///
    CETL_NODISCARD cetl::optional<CapacityError> writeVarint(const std::uint64_t value)
    {
        CETL_DEBUG_ASSERT(value <= VarintMax, "Value is too big to be encoded as varint.");

        const std::size_t size = varintSize(value);
        switch (size)
        {
        case 1:
            return writeBigEndian(value, 1);
        case 2:
            return writeBigEndian(value | 0x4000U, 2);
        case 4:
            return writeBigEndian(value | 0x8000'0000U, 4);
        default:
            return writeBigEndian((value & VarintMax) | 0xC000'0000'0000'0000ULL, 8);
        }
    }

    /// @brief Writes raw bytes (without any length prefix).
    ///
    CETL_NODISCARD cetl::optional<CapacityError> writeBytes(const PayloadFragment bytes)
    {
        if (!canWrite(bytes.size()))
        {
            return CapacityError{};
        }
        for (const cetl::byte single_byte : bytes)
        {
            buffer_.push_back(single_byte);
        }
        return cetl::nullopt;
    }

    /// @brief Writes the varint length prefix followed by the bytes.
    ///
    /// Both parts are checked up front, so nothing is written in case of failure.
    ///
    CETL_NODISCARD cetl::optional<CapacityError> writeLengthPrefixedBytes(const PayloadFragment bytes)
    {
        if (!canWrite(varintSize(bytes.size()) + bytes.size()))
        {
            return CapacityError{};
        }
        if (auto failure = writeVarint(bytes.size()))
        {
            return failure;
        }
        return writeBytes(bytes);
    }

private:
    CETL_NODISCARD bool canWrite(const std::size_t size) const noexcept
    {
        const std::size_t new_size = buffer_.size() + size;
        return (new_size <= limit_) && (new_size <= buffer_.capacity());
    }

    CETL_NODISCARD cetl::optional<CapacityError> writeBigEndian(const std::uint64_t value, const std::size_t size)
    {
        if (!canWrite(size))
        {
            return CapacityError{};
        }
        for (std::size_t shift = size; shift > 0; --shift)
        {
            buffer_.push_back(static_cast<cetl::byte>((value >> ((shift - 1U) * 8U)) & 0xFFU));
        }
        return cetl::nullopt;
    }

    // MARK: Data members:

    Buffer&           buffer_;
    const std::size_t limit_;

};  // ByteWriter

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace serialization
}  // namespace libparcel

#endif  // LIBPARCEL_SERIALIZATION_BYTE_WRITER_HPP_INCLUDED
