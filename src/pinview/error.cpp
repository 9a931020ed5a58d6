/**
 * @file error.cpp
 * @brief Names for pinview::Error values.
 */
#include "pinview/error.hpp"

namespace pinview {

const char* to_string(Error e) noexcept {
  switch (e) {
    case Error::NullInput:                 return "null_input";
    case Error::TypeSizeMismatch:          return "type_size_mismatch";
    case Error::UseAfterRelease:           return "use_after_release";
    case Error::NullObject:                return "null_object";
    case Error::UnknownTicket:             return "unknown_ticket";
    case Error::BackingStorageUnavailable: return "backing_storage_unavailable";
    case Error::HandleReleased:            return "handle_released";
    case Error::SchedulerStopped:          return "scheduler_stopped";
  }
  return "unknown";
}

} // namespace pinview
