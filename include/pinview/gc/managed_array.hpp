#pragma once
/**
 * @file managed_array.hpp
 * @brief Typed, rooted reference to a fixed-length managed array.
 *
 * A ManagedArray<T> is a reference, not a value: copies alias the same heap
 * object and each copy keeps it alive. Element access goes through the heap's
 * current payload address, which changes whenever Heap::compact() relocates an
 * unpinned array. Code that needs a stable address pins it (see mem::PinRegistry).
 *
 * @tparam T Element type. Must be trivially copyable (payloads are moved with memcpy).
 */

#include <cstddef>
#include <type_traits>
#include <utility>

#include "pinview/gc/heap.hpp"

namespace pinview::gc {

template <class T>
class ManagedArray;

template <class T>
ManagedArray<T> make_array(Heap& heap, std::size_t length);

template <class T>
class ManagedArray final {
    static_assert(std::is_trivially_copyable_v<T>,
                  "ManagedArray<T>: T must be trivially copyable");

public:
    using value_type = T;

    /// @brief The absent (null) array. Non-null arrays come from make_array().
    ManagedArray() noexcept = default;

    [[nodiscard]] bool is_null() const noexcept { return root_.is_null(); }
    explicit operator bool() const noexcept { return !is_null(); }

    /// Element count (fixed for the lifetime of the object).
    [[nodiscard]] std::size_t length() const noexcept { return is_null() ? 0 : length_; }

    /// Current payload address. Not stable across Heap::compact() unless pinned.
    [[nodiscard]] T* data() const noexcept {
        return is_null() ? nullptr : static_cast<T*>(root_.heap()->address_of(root_.id()));
    }

    /// Unchecked element access through the current address.
    T& operator[](std::size_t i) const noexcept { return data()[i]; }

    [[nodiscard]] const Root& root() const noexcept { return root_; }
    [[nodiscard]] Heap*       heap() const noexcept { return root_.heap(); }
    [[nodiscard]] ObjectId    id() const noexcept { return root_.id(); }

    /// Same heap object (reference equality).
    friend bool operator==(const ManagedArray& a, const ManagedArray& b) noexcept {
        return a.root_.heap() == b.root_.heap() && a.root_.id() == b.root_.id();
    }

private:
    template <class U>
    friend ManagedArray<U> make_array(Heap& heap, std::size_t length);

    /// Wraps a root the heap allocated with exactly @p length elements of T.
    ManagedArray(Root root, std::size_t length) noexcept
        : root_(std::move(root)), length_(length) {}

    Root        root_{};
    std::size_t length_{0};
};

/// @brief Allocate a zero-filled managed array of @p length elements on @p heap.
template <class T>
ManagedArray<T> make_array(Heap& heap, std::size_t length) {
    return ManagedArray<T>(heap.allocate(sizeof(T), alignof(T), length), length);
}

} // namespace pinview::gc
