/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBPARCEL_TYPES_HPP_INCLUDED
#define LIBPARCEL_TYPES_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/pf20/cetlpf.hpp>
#include <cetl/variable_length_array.hpp>

#include <algorithm>
#include <cstddef>
#include <utility>

namespace libparcel
{

// TODO: Switch to `cetl::expected` once it is available at CETL repo.
template <typename Success, typename Failure>
using Expected = cetl::variant<Success, Failure>;

/// @brief Defines an immutable view of payload bytes.
///
/// Payload bytes are always owned by the caller, and should outlive any object which refers to them.
///
using PayloadFragment = cetl::span<const cetl::byte>;

/// Internal implementation details.
/// Not supposed to be used directly by the users of the library.
///
namespace detail
{

template <typename Concrete>
using PmrAllocator = cetl::pmr::polymorphic_allocator<Concrete>;

template <typename T>
using VarArray = cetl::VariableLengthArray<T, PmrAllocator<T>>;

/// @brief Appends a new item to the end of the given array, growing its capacity if needed.
///
/// @return `false` if there was not enough memory to grow the array (the array stays untouched).
///
template <typename T, typename Item>
CETL_NODISCARD bool tryAppend(VarArray<T>& array, Item&& item)
{
    if (array.size() == array.capacity())
    {
        const std::size_t new_capacity = std::max<std::size_t>(array.capacity() * 2U, 4U);
        array.reserve(new_capacity);
        if (array.capacity() < new_capacity)
        {
            // This is out of memory situation.
            return false;
        }
    }

    array.emplace_back(std::forward<Item>(item));
    return true;
}

}  // namespace detail
}  // namespace libparcel

#endif  // LIBPARCEL_TYPES_HPP_INCLUDED
