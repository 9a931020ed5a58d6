// Heap: Implementation Notes
// Objects live in an id → Object table; pins live in a ticket → id table.
//   • A pin bumps Object::pins and records the ticket; unpin reverses both.
//   • compact() copies every unpinned payload into a fresh allocation and frees
//     the old one, so addresses of unpinned objects are never stable.
//   • collect() erases objects with roots == 0 && pins == 0.
// All bookkeeping is under mu_; payload copies in compact() happen under mu_ too,
// which is what keeps a concurrent pin() from observing a half-moved object.

#include "pinview/gc/heap.hpp"
#include "pinview/config/constants.hpp"

#include <algorithm>
#include <cstring>
#include <new>
#include <utility>

namespace pinview::gc {

struct Heap::Object {
    ObjectId    id{kNullObject};
    std::size_t element_size{0};
    std::size_t align{0};
    std::size_t length{0};
    Payload     payload{nullptr, PayloadDeleter{0}};
    std::size_t roots{0};
    std::size_t pins{0};

    std::size_t bytes() const noexcept { return element_size * length; }
};

//------------------------------- Root -----------------------------------------

Root::Root(const Root& other) noexcept : heap_(other.heap_), id_(other.id_) {
    if (!is_null()) heap_->add_root(id_);
}

Root& Root::operator=(const Root& other) noexcept {
    if (this != &other) {
        if (!other.is_null()) other.heap_->add_root(other.id_);
        reset();
        heap_ = other.heap_;
        id_   = other.id_;
    }
    return *this;
}

Root::Root(Root&& other) noexcept
    : heap_(std::exchange(other.heap_, nullptr)),
      id_(std::exchange(other.id_, kNullObject)) {}

Root& Root::operator=(Root&& other) noexcept {
    if (this != &other) {
        reset();
        heap_ = std::exchange(other.heap_, nullptr);
        id_   = std::exchange(other.id_, kNullObject);
    }
    return *this;
}

Root::~Root() { reset(); }

void Root::reset() noexcept {
    if (!is_null()) heap_->drop_root(id_);
    heap_ = nullptr;
    id_   = kNullObject;
}

//------------------------------- Payload --------------------------------------

void Heap::PayloadDeleter::operator()(std::byte* p) const noexcept {
    ::operator delete[](p, std::align_val_t(align));
}

Heap::Payload Heap::make_payload(std::size_t bytes, std::size_t align) {
    // Zero-length objects still get one byte so every live object has a distinct address.
    const std::size_t n = std::max<std::size_t>(bytes, 1);
    auto* raw = static_cast<std::byte*>(::operator new[](n, std::align_val_t(align)));
    std::memset(raw, 0, n);
    return Payload(raw, PayloadDeleter{align});
}

//------------------------------- Heap -----------------------------------------

Heap::Heap() = default;
Heap::~Heap() = default;

Root Heap::allocate(std::size_t element_size, std::size_t element_align, std::size_t length) {
    const std::size_t align = std::max(element_align, config::constants::HEAP_PAYLOAD_ALIGNMENT);
    auto obj = std::make_unique<Object>();
    obj->element_size = element_size;
    obj->align        = align;
    obj->length       = length;
    obj->payload      = make_payload(element_size * length, align);
    obj->roots        = 1; // adopted by the returned Root

    std::lock_guard<std::mutex> lk(mu_);
    const ObjectId id = next_id_++;
    obj->id = id;
    objects_.emplace(id, std::move(obj));
    ++stats_.allocations;
    return Root(this, id);
}

Expected<PinResult> Heap::pin(ObjectId id) {
    if (id == kNullObject) return fail(Error::NullObject);

    std::lock_guard<std::mutex> lk(mu_);
    auto it = objects_.find(id);
    if (it == objects_.end()) return fail(Error::NullObject);

    Object& obj = *it->second;
    ++obj.pins;
    const PinTicket ticket = next_ticket_++;
    tickets_.emplace(ticket, id);
    ++stats_.pins;
    return PinResult{obj.payload.get(), ticket};
}

Expected<void> Heap::unpin(PinTicket ticket) {
    std::lock_guard<std::mutex> lk(mu_);
    auto t = tickets_.find(ticket);
    if (t == tickets_.end()) return fail(Error::UnknownTicket);

    auto it = objects_.find(t->second);
    tickets_.erase(t);
    // A pinned object is never reclaimed, so the lookup cannot miss.
    if (it != objects_.end() && it->second->pins > 0) --it->second->pins;
    ++stats_.unpins;
    return {};
}

void* Heap::address_of(ObjectId id) const noexcept {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = objects_.find(id);
    return it == objects_.end() ? nullptr : it->second->payload.get();
}

std::size_t Heap::length_of(ObjectId id) const noexcept {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = objects_.find(id);
    return it == objects_.end() ? 0 : it->second->length;
}

std::size_t Heap::pins_on(ObjectId id) const noexcept {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = objects_.find(id);
    return it == objects_.end() ? 0 : it->second->pins;
}

std::size_t Heap::compact() {
    std::lock_guard<std::mutex> lk(mu_);
    std::size_t moved = 0;
    for (auto& [id, obj] : objects_) {
        if (obj->pins > 0) continue;
        Payload fresh = make_payload(obj->bytes(), obj->align);
        if (obj->bytes() > 0) std::memcpy(fresh.get(), obj->payload.get(), obj->bytes());
        obj->payload = std::move(fresh);
        ++moved;
    }
    stats_.relocations += moved;
    return moved;
}

std::size_t Heap::collect() {
    std::lock_guard<std::mutex> lk(mu_);
    const std::size_t reclaimed = std::erase_if(objects_, [](const auto& kv) {
        return kv.second->roots == 0 && kv.second->pins == 0;
    });
    stats_.reclaimed += reclaimed;
    return reclaimed;
}

std::size_t Heap::pinned_count() const noexcept {
    std::lock_guard<std::mutex> lk(mu_);
    return tickets_.size();
}

std::size_t Heap::live_objects() const noexcept {
    std::lock_guard<std::mutex> lk(mu_);
    return objects_.size();
}

Heap::Stats Heap::stats() const noexcept {
    std::lock_guard<std::mutex> lk(mu_);
    return stats_;
}

void Heap::add_root(ObjectId id) noexcept {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = objects_.find(id);
    if (it != objects_.end()) ++it->second->roots;
}

void Heap::drop_root(ObjectId id) noexcept {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = objects_.find(id);
    if (it != objects_.end() && it->second->roots > 0) --it->second->roots;
}

} // namespace pinview::gc
