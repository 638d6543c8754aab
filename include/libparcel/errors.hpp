/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBPARCEL_ERRORS_HPP_INCLUDED
#define LIBPARCEL_ERRORS_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>

namespace libparcel
{

/// @brief Defines a generic error that is issued when a memory allocation fails.
///
struct MemoryError final
{};

/// @brief Defines a generic error that is issued when an argument is invalid.
///
struct ArgumentError final
{};

/// @brief Defines an error that is issued when a buffer limit is reached.
///
/// On the write side it means that encoder attempted to write past the max payload size.
/// On the read side it means that decoder attempted to read past the end of its input.
///
struct CapacityError final
{};

/// @brief Defines an internal error of the reserve/commit accounting of a packet.
///
/// Issued when a commit releases more bytes than were previously reserved.
/// Never happens in correct operation - it always indicates a bug in the packer.
///
struct AccountingError final
{};

/// @brief Defines any possible error of the packet building.
///
/// General taxonomy of results is such that:
/// - A method returns (via `cetl::variant`) either an expected `Success` type, or a `Failure` type.
/// - If the success result type is `void`, then `cetl::optional<Failure>` in in use (instead of `cetl::variant`).
/// - The failure result type is a `cetl::variant` of all possible "primitive" error types that may occur in the method.
///   The "Failure" suffix is used to denote such variant types; "Error" suffix denotes the "primitive" error types.
///
using AnyFailure = cetl::variant<ArgumentError, MemoryError, CapacityError, AccountingError>;

/// @brief Defines any possible error of the packet parsing.
///
using ParseFailure = cetl::variant<ArgumentError, MemoryError, CapacityError>;

}  // namespace libparcel

#endif  // LIBPARCEL_ERRORS_HPP_INCLUDED
