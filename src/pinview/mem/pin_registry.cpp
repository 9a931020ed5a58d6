// =============================================================
// File: src/pinview/mem/pin_registry.cpp
// =============================================================
#include "pinview/mem/pin_registry.hpp"

#include <utility>

namespace pinview::mem {

Expected<Pinned> PinRegistry::pin(const gc::Root& object) {
  if (object.is_null() || object.heap() != &heap_) {
    failures_.fetch_add(1, std::memory_order_relaxed);
    return fail(Error::NullObject);
  }

  auto res = heap_.pin(object.id());
  if (!res) {
    failures_.fetch_add(1, std::memory_order_relaxed);
    return fail(res.error());
  }

  pins_.fetch_add(1, std::memory_order_relaxed);
  return Pinned{res->address, PinEntry(this, res->ticket)};
}

Expected<void> PinRegistry::unpin(PinEntry&& entry) {
  if (entry.empty() || entry.owner_ != this) {
    failures_.fetch_add(1, std::memory_order_relaxed);
    return fail(Error::UnknownTicket);
  }

  // The entry is spent even if the heap rejects its ticket.
  PinEntry consumed = std::move(entry);
  auto res = heap_.unpin(consumed.ticket_);
  if (!res) {
    failures_.fetch_add(1, std::memory_order_relaxed);
    return res;
  }
  unpins_.fetch_add(1, std::memory_order_relaxed);
  return {};
}

PinRegistry::Stats PinRegistry::stats() const noexcept {
  return Stats{pins_.load(std::memory_order_relaxed),
               unpins_.load(std::memory_order_relaxed),
               failures_.load(std::memory_order_relaxed)};
}

} // namespace pinview::mem
