// =============================================================
// File: include/pinview/mem/pin_registry.hpp
// =============================================================
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

#include "pinview/error.hpp"
#include "pinview/gc/heap.hpp"

namespace pinview::mem {

class PinRegistry;

/**
 * @file pin_registry.hpp
 * @brief Owned pin records on top of the heap's opaque pin tickets.
 *
 * Design:
 *  - The heap hands out a bare PinTicket; PinRegistry wraps it in a PinEntry,
 *    a move-only record that remembers which registry issued it.
 *  - unpin() consumes the entry (takes it by rvalue), so the one-unpin-per-pin
 *    rule is visible in the types: a moved-from entry is empty and is refused.
 *  - Preventing a second unpin of the *same* logical pin is the owner's job
 *    (view::ViewHandle), not this layer's.
 */
class PinEntry final {
public:
  PinEntry() noexcept = default;

  PinEntry(const PinEntry&)            = delete;
  PinEntry& operator=(const PinEntry&) = delete;

  PinEntry(PinEntry&& other) noexcept
    : owner_(other.owner_), ticket_(other.ticket_) {
    other.owner_  = nullptr;
    other.ticket_ = 0;
  }

  /// @brief Move assignment. The target must be empty (overwriting a live entry leaks it).
  PinEntry& operator=(PinEntry&& other) noexcept {
    if (this != &other) {
      owner_  = other.owner_;
      ticket_ = other.ticket_;
      other.owner_  = nullptr;
      other.ticket_ = 0;
    }
    return *this;
  }

  /// @brief True once released or moved from.
  bool empty() const noexcept { return owner_ == nullptr; }

  /// @brief Underlying heap ticket (0 when empty).
  gc::PinTicket ticket() const noexcept { return ticket_; }

private:
  friend class PinRegistry;
  PinEntry(PinRegistry* owner, gc::PinTicket ticket) noexcept
    : owner_(owner), ticket_(ticket) {}

  PinRegistry*  owner_{nullptr};
  gc::PinTicket ticket_{0};
};

/// @brief A stable address plus the entry that keeps it stable.
struct Pinned {
  void*    address{nullptr};
  PinEntry entry{};
};

/**
 * @brief Pin/unpin front-end for one gc::Heap.
 *
 * Thread roles: any thread may pin; any thread (typically a job worker running a
 * deferred release) may unpin. Counters are relaxed atomics.
 */
class PinRegistry final {
public:
  explicit PinRegistry(gc::Heap& heap) noexcept : heap_(heap) {}

  PinRegistry(const PinRegistry&)            = delete;
  PinRegistry& operator=(const PinRegistry&) = delete;

  /// @brief Pin @p object and return its stable address.
  /// @return NullObject if @p object is the null reference or belongs to another heap.
  [[nodiscard]] Expected<Pinned> pin(const gc::Root& object);

  /// @brief Release the pin held by @p entry, leaving it empty.
  /// @return UnknownTicket if @p entry is empty or was issued by another registry.
  Expected<void> unpin(PinEntry&& entry);

  /// @brief Entries issued and not yet unpinned.
  std::size_t live_pins() const noexcept {
    return static_cast<std::size_t>(pins_.load(std::memory_order_relaxed) -
                                    unpins_.load(std::memory_order_relaxed));
  }

  gc::Heap& heap() const noexcept { return heap_; }

  /// Stats counters (atomic, cumulative since start).
  struct Stats {
    std::uint64_t pins{0}, unpins{0}, failures{0};
  };
  Stats stats() const noexcept;

private:
  gc::Heap&                  heap_;
  std::atomic<std::uint64_t> pins_{0}, unpins_{0}, failures_{0};
};

} // namespace pinview::mem
