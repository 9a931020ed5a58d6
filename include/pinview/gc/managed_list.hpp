#pragma once
/**
 * @file managed_list.hpp
 * @brief Resizable managed sequence backed by a ManagedArray<T>.
 *
 * Layout: a shared header {heap, items, size} where items is a managed array
 * with length (capacity) >= size. Growth allocates a larger array, copies the
 * live prefix and drops the old array's root; the old array is reclaimed by
 * the next Heap::collect() unless something (a view) still pins it.
 *
 * The list exposes its storage explicitly through backing_storage() and size();
 * mem::get_backing_storage() relies on that capability rather than on any
 * private layout.
 *
 * Reference semantics: copies share the same header, like the managed
 * containers they model. A default-constructed list is the absent (null) list.
 */

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <memory>
#include <stdexcept>

#include "pinview/config/constants.hpp"
#include "pinview/gc/heap.hpp"
#include "pinview/gc/managed_array.hpp"

namespace pinview::gc {

template <class T>
class ManagedList final {
public:
    using value_type = T;

    /// @brief The absent (null) list.
    ManagedList() noexcept = default;

    /// @brief Create an empty list on @p heap with room for @p capacity elements.
    static ManagedList create(Heap& heap, std::size_t capacity = 0) {
        ManagedList l;
        l.state_ = std::make_shared<State>(State{&heap, make_array<T>(heap, capacity), 0});
        return l;
    }

    [[nodiscard]] bool is_null() const noexcept { return !state_; }
    explicit operator bool() const noexcept { return !is_null(); }

    /// Logical element count.
    [[nodiscard]] std::size_t size() const noexcept { return state_ ? state_->size : 0; }

    /// Length of the current backing array.
    [[nodiscard]] std::size_t capacity() const noexcept {
        return state_ ? state_->items.length() : 0;
    }

    /// The array currently holding the elements. Its identity changes on growth,
    /// reserve() and shrink_to_fit().
    [[nodiscard]] ManagedArray<T> backing_storage() const noexcept {
        return state_ ? state_->items : ManagedArray<T>{};
    }

    // --------------------------- Element access ------------------------------
    /// @throws std::out_of_range on a bad index (mirrors std::vector::at).
    [[nodiscard]] T at(std::size_t i) const {
        check_index(i);
        return state_->items[i];
    }

    void set(std::size_t i, const T& v) {
        check_index(i);
        state_->items[i] = v;
    }

    // --------------------------- Mutations -----------------------------------
    void push_back(const T& v) {
        State& s = state();
        if (s.size == s.items.length()) {
            const std::size_t cap = s.items.length();
            grow_to(cap == 0 ? config::constants::LIST_INITIAL_CAPACITY
                             : cap * config::constants::LIST_GROWTH_FACTOR);
        }
        s.items[s.size++] = v;
    }

    void pop_back() {
        State& s = state();
        if (s.size == 0) throw std::out_of_range("ManagedList::pop_back on empty list");
        --s.size;
    }

    /// Grow (zero-filling new slots) or shrink the logical size.
    void resize(std::size_t n) {
        State& s = state();
        if (n > s.items.length()) grow_to(n);
        if (n > s.size) std::memset(static_cast<void*>(s.items.data() + s.size), 0, (n - s.size) * sizeof(T));
        s.size = n;
    }

    void reserve(std::size_t n) {
        if (n > capacity()) grow_to(n);
    }

    /// Reallocate so that capacity() == size().
    void shrink_to_fit() {
        State& s = state();
        if (s.items.length() != s.size) reallocate(s.size);
    }

    void clear() noexcept {
        if (state_) state_->size = 0;
    }

private:
    struct State {
        Heap*           heap;
        ManagedArray<T> items;
        std::size_t     size;
    };

    State& state() {
        if (!state_) throw std::logic_error("ManagedList: operation on a null list");
        return *state_;
    }

    void check_index(std::size_t i) const {
        if (!state_ || i >= state_->size) throw std::out_of_range("ManagedList: index out of range");
    }

    void grow_to(std::size_t min_capacity) {
        const std::size_t cap = capacity();
        reallocate(std::max(min_capacity, cap * config::constants::LIST_GROWTH_FACTOR));
    }

    void reallocate(std::size_t new_capacity) {
        State& s = state();
        ManagedArray<T> fresh = make_array<T>(*s.heap, new_capacity);
        const std::size_t keep = std::min(s.size, new_capacity);
        if (keep > 0) std::memcpy(static_cast<void*>(fresh.data()), s.items.data(), keep * sizeof(T));
        s.items = std::move(fresh);
        s.size  = keep;
    }

    std::shared_ptr<State> state_;
};

} // namespace pinview::gc
