#pragma once
// pinview: gc::Heap
// The automatic memory manager the views are built on.
//   • Objects are flat payloads (arrays of trivially copyable elements) owned by the heap.
//   • Liveness is root counted: every gc::Root copy is one strong root.
//   • compact() relocates every unpinned payload; collect() reclaims every object
//     with no roots and no pins. A pinned object neither moves nor dies.
//   • pin()/unpin() hand out opaque tickets, one per pin; an object may be pinned
//     several times concurrently.
// Thread-safety: one mutex guards the object and ticket tables; every operation is
// bounded work under that lock. The heap must outlive every Root it issued.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "pinview/error.hpp"

namespace pinview::gc {

/// Identity of a managed object. 0 is the absent (null) reference.
using ObjectId = std::uint64_t;
inline constexpr ObjectId kNullObject = 0;

/// Opaque pin identifier issued by Heap::pin. 0 is never issued.
using PinTicket = std::uint64_t;

class Heap;

/// @brief Result of a successful pin: stable payload address + ticket to unpin with.
struct PinResult {
    void*     address{nullptr};
    PinTicket ticket{0};
};

// -----------------------------------------------------------------------------
// Root
// -----------------------------------------------------------------------------
///
/// Strong reference to a managed object. Copying adds a root, destruction drops one.
/// A default-constructed Root is the null reference.
///
class Root final {
public:
    Root() noexcept = default;
    Root(const Root& other) noexcept;
    Root& operator=(const Root& other) noexcept;
    Root(Root&& other) noexcept;
    Root& operator=(Root&& other) noexcept;
    ~Root();

    [[nodiscard]] bool is_null() const noexcept { return heap_ == nullptr || id_ == kNullObject; }
    explicit operator bool() const noexcept { return !is_null(); }

    [[nodiscard]] Heap*    heap() const noexcept { return heap_; }
    [[nodiscard]] ObjectId id() const noexcept { return id_; }

    /// Drop this root (becomes null).
    void reset() noexcept;

private:
    friend class Heap;
    /// Adopts a root the heap already counted.
    Root(Heap* heap, ObjectId id) noexcept : heap_(heap), id_(id) {}

    Heap*    heap_{nullptr};
    ObjectId id_{kNullObject};
};

// -----------------------------------------------------------------------------
// Heap
// -----------------------------------------------------------------------------
class Heap final {
public:
    Heap();
    ~Heap();

    Heap(const Heap&)            = delete;
    Heap& operator=(const Heap&) = delete;

    /**
     * @brief Allocate a zero-filled payload of @p length elements.
     * @param element_size  sizeof one element.
     * @param element_align alignof one element (payloads are at least cache-line aligned).
     * @param length        Element count; 0 is allowed and still yields a distinct object.
     * @return Root to the new object.
     */
    Root allocate(std::size_t element_size, std::size_t element_align, std::size_t length);

    /// Pin @p id: its payload keeps its address and is not reclaimed until unpinned.
    /// @return NullObject if @p id is null or not a live object.
    [[nodiscard]] Expected<PinResult> pin(ObjectId id);

    /// Release one pin. @return UnknownTicket if @p ticket is not outstanding.
    Expected<void> unpin(PinTicket ticket);

    /// Current payload address of @p id, nullptr if unknown. Unpinned payloads may move.
    [[nodiscard]] void* address_of(ObjectId id) const noexcept;

    /// Element count of @p id, 0 if unknown.
    [[nodiscard]] std::size_t length_of(ObjectId id) const noexcept;

    /// Pins currently held on @p id.
    [[nodiscard]] std::size_t pins_on(ObjectId id) const noexcept;

    /// Relocate every unpinned payload to fresh storage. @return objects moved.
    std::size_t compact();

    /// Reclaim every object with no roots and no pins. @return objects reclaimed.
    std::size_t collect();

    /// Outstanding pin tickets.
    [[nodiscard]] std::size_t pinned_count() const noexcept;

    /// Objects not yet reclaimed.
    [[nodiscard]] std::size_t live_objects() const noexcept;

    /// Stats counters (cumulative since construction).
    struct Stats {
        std::uint64_t allocations{0}, pins{0}, unpins{0}, relocations{0}, reclaimed{0};
    };
    [[nodiscard]] Stats stats() const noexcept;

private:
    friend class Root;

    struct Object;
    struct PayloadDeleter {
        std::size_t align;
        void operator()(std::byte* p) const noexcept;
    };
    using Payload = std::unique_ptr<std::byte, PayloadDeleter>;

    static Payload make_payload(std::size_t bytes, std::size_t align);

    void add_root(ObjectId id) noexcept;
    void drop_root(ObjectId id) noexcept;

    mutable std::mutex mu_;
    std::unordered_map<ObjectId, std::unique_ptr<Object>> objects_;
    std::unordered_map<PinTicket, ObjectId>               tickets_;
    ObjectId  next_id_{1};
    PinTicket next_ticket_{1};
    Stats     stats_{};
};

} // namespace pinview::gc
