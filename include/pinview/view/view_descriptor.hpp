#pragma once
/**
 * @file view_descriptor.hpp
 * @brief Unmanaged pointer + length over pinned managed storage.
 *
 * A ViewDescriptor is a plain value: copy it into as many jobs as needed. It
 * captures address and element count when built and never changes. For a view
 * of a ManagedList the count is the list's size at that moment; later growth
 * or shrinking of the list is not reflected (and growth may move the list to
 * a new array while this view keeps the old one pinned).
 *
 * Access paths:
 *  - span()           validates the safety token first (UseAfterRelease in checked mode)
 *  - unchecked_span() never validates
 */

#include <cstddef>
#include <span>
#include <utility>

#include "pinview/error.hpp"
#include "pinview/safety/safety_token.hpp"

namespace pinview::view {

template <class T>
class ViewDescriptor final {
public:
    using element_type = T;

    ViewDescriptor() noexcept = default;
    ViewDescriptor(T* data, std::size_t count, safety::SafetyToken token) noexcept
        : data_(data), count_(count), token_(std::move(token)) {}

    [[nodiscard]] T*          data() const noexcept { return data_; }
    [[nodiscard]] std::size_t size() const noexcept { return count_; }
    [[nodiscard]] static constexpr std::size_t stride() noexcept { return sizeof(T); }
    [[nodiscard]] std::size_t size_bytes() const noexcept { return count_ * sizeof(T); }
    [[nodiscard]] bool        empty() const noexcept { return count_ == 0; }

    /// Checked access path.
    [[nodiscard]] Expected<std::span<T>> span() const {
        if (auto ok = token_.validate(); !ok) return fail(ok.error());
        return std::span<T>(data_, count_);
    }

    [[nodiscard]] std::span<T> unchecked_span() const noexcept { return std::span<T>(data_, count_); }

    /// @return UseAfterRelease once the owning handle released the view (checked mode).
    [[nodiscard]] Expected<void> validate() const { return token_.validate(); }

    [[nodiscard]] const safety::SafetyToken& token() const noexcept { return token_; }

private:
    T*                  data_{nullptr};
    std::size_t         count_{0};
    safety::SafetyToken token_{};
};

} // namespace pinview::view
