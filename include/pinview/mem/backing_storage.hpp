// =============================================================
// File: include/pinview/mem/backing_storage.hpp
// =============================================================
#pragma once

#include <concepts>
#include <cstddef>
#include <string>
#include <utility>

#include "pinview/config/modes.hpp"
#include "pinview/error.hpp"
#include "pinview/gc/managed_array.hpp"
#include "pinview/obs/observability.hpp"

namespace pinview::mem {

/**
 * @file backing_storage.hpp
 * @brief Zero-copy access to the contiguous storage of a resizable sequence.
 *
 * A sequence takes part by exposing the capability itself:
 *   - is_null()         -> bool                            (absent sequence)
 *   - backing_storage() -> gc::ManagedArray<value_type>   (current storage)
 *   - size()            -> std::size_t                     (logical length)
 * gc::ManagedList<T> does. Nothing here reads a container's private layout.
 *
 * The extractor still validates what it is handed. A layout it cannot
 * interpret (no backing array, or a logical size the array cannot hold) is a
 * mismatch, resolved by config::StorageFallback:
 *   - Fail  -> Error::BackingStorageUnavailable
 *   - Empty -> a zero-element Storage (null array), reported to the observer.
 */

/// @brief Sequences that hand out their own backing storage.
template <class S>
concept ExposesBackingStorage = requires(const S& s) {
  typename S::value_type;
  { s.is_null() } -> std::convertible_to<bool>;
  { s.backing_storage() } -> std::same_as<gc::ManagedArray<typename S::value_type>>;
  { s.size() } -> std::convertible_to<std::size_t>;
};

/// @brief Storage snapshot: the array plus how many of its elements are live.
template <class T>
struct Storage {
  gc::ManagedArray<T> array{};
  std::size_t         size{0};

  /// True for the zero-element fallback (nothing to pin).
  bool empty_fallback() const noexcept { return array.is_null() && size == 0; }
};

/**
 * @brief Obtain @p seq's current backing storage without copying.
 * @param seq       A non-null sequence (null checks belong to the caller).
 * @param fallback  Policy on layout mismatch.
 * @param observer  Receives an ExtractionFallback event when Empty is applied (nullable).
 */
template <ExposesBackingStorage Seq>
Expected<Storage<typename Seq::value_type>>
get_backing_storage(const Seq& seq, config::StorageFallback fallback, obs::Observer* observer = nullptr) {
  using T = typename Seq::value_type;

  gc::ManagedArray<T> array = seq.backing_storage();
  const std::size_t size = static_cast<std::size_t>(seq.size());

  const bool layout_ok = !array.is_null() && size <= array.length();
  if (layout_ok) {
    return Storage<T>{std::move(array), size};
  }

  if (fallback == config::StorageFallback::Fail) {
    return fail(Error::BackingStorageUnavailable);
  }

  if (observer) {
    observer->record(obs::ViewEvent{
      .kind = obs::EventKind::ExtractionFallback,
      .detail = array.is_null() ? "no backing array"
                                : "size " + std::to_string(size) + " exceeds capacity " +
                                  std::to_string(array.length())});
  }
  return Storage<T>{};
}

} // namespace pinview::mem
