#pragma once
/**
 * @file error.hpp
 * @brief Error taxonomy shared by every pinview component.
 *
 * Errors are values. Library paths never throw; they return
 * Expected<T> and the caller decides. Precondition violations
 * (NullInput, TypeSizeMismatch) are detected at the call site regardless of
 * the safety mode. UseAfterRelease is only ever produced by a checked token.
 */

#include <cstdint>

#include "pinview/compat/expected.hpp"

namespace pinview {

/// @brief Failure reasons reported through Expected<T>.
enum class Error : std::uint8_t {
  NullInput = 1,              ///< Container argument absent at a builder entry point
  TypeSizeMismatch,           ///< Reinterpretation between element types of different size
  UseAfterRelease,            ///< Safety token validated after the view was released
  NullObject,                 ///< Heap or registry asked to pin an absent object
  UnknownTicket,              ///< Unpin of a ticket/entry this owner never issued
  BackingStorageUnavailable,  ///< Sequence storage layout could not be interpreted
  HandleReleased,             ///< Release requested on a handle that is no longer Active
  SchedulerStopped            ///< Job system no longer accepts work
};

/// @brief Result alias used across the public API.
template <class T>
using Expected = pinview_detail::expected<T, Error>;

/// @brief Build the error branch of an Expected<T>.
inline pinview_detail::unexpected<Error> fail(Error e) noexcept {
  return pinview_detail::unexpected<Error>(e);
}

/// @brief Stable, log-friendly name of an error ("null_input", ...).
const char* to_string(Error e) noexcept;

} // namespace pinview
