#pragma once
/**
 * @file safety_token.hpp
 * @brief Validity flag shared by a view handle and every copy of its descriptor.
 *
 * The checked/unchecked switch is one capability with two implementations:
 *  - CheckedPolicy issues tokens that carry state (Valid -> Invalidated, never back);
 *    validate() on an invalidated token fails with Error::UseAfterRelease and is
 *    reported to the observer.
 *  - UncheckedPolicy issues stateless tokens; validate() always succeeds and
 *    invalidate() does nothing.
 * make_policy() picks one from config::SafetyMode, once, when a builder is made.
 */

#include <atomic>
#include <cstdint>
#include <memory>
#include <utility>

#include "pinview/config/modes.hpp"
#include "pinview/error.hpp"
#include "pinview/obs/observability.hpp"

namespace pinview::safety {

class CheckedPolicy;

/** @class SafetyToken
 *  @brief Cheap-to-copy handle on a shared validity flag. A default token is unchecked.
 */
class SafetyToken final {
public:
    SafetyToken() noexcept = default;

    /// True if this token carries state (issued by a CheckedPolicy).
    [[nodiscard]] bool checked() const noexcept { return state_ != nullptr; }

    /// True unless checked and invalidated.
    [[nodiscard]] bool valid() const noexcept {
        return !state_ || state_->valid.load(std::memory_order_acquire);
    }

    /// Id of the view this token guards (0 for unchecked tokens).
    [[nodiscard]] std::uint64_t id() const noexcept { return state_ ? state_->id : 0; }

    /// @return UseAfterRelease if checked and invalidated; success otherwise.
    [[nodiscard]] Expected<void> validate() const;

    /// Valid -> Invalidated. Idempotent; no-op on unchecked tokens.
    void invalidate() const noexcept;

private:
    friend class CheckedPolicy;

    struct State {
        std::atomic<bool> valid{true};
        std::uint64_t     id{0};
        obs::Observer*    observer{nullptr};
    };

    explicit SafetyToken(std::shared_ptr<State> s) noexcept : state_(std::move(s)) {}

    std::shared_ptr<State> state_;
};

/** @class SafetyPolicy
 *  @brief Issues tokens for new views.
 */
class SafetyPolicy {
public:
    virtual ~SafetyPolicy() = default;
    /// New Valid token for the view numbered @p view_id.
    virtual SafetyToken issue(std::uint64_t view_id) = 0;
    virtual config::SafetyMode mode() const noexcept = 0;
};

class CheckedPolicy final : public SafetyPolicy {
public:
    explicit CheckedPolicy(obs::Observer* observer = nullptr) noexcept : observer_(observer) {}
    SafetyToken issue(std::uint64_t view_id) override;
    config::SafetyMode mode() const noexcept override { return config::SafetyMode::Checked; }

private:
    obs::Observer* observer_;
};

class UncheckedPolicy final : public SafetyPolicy {
public:
    SafetyToken issue(std::uint64_t) override { return SafetyToken{}; }
    config::SafetyMode mode() const noexcept override { return config::SafetyMode::Unchecked; }
};

/// @brief Policy for @p mode; @p observer receives use-after-release reports (checked only).
std::unique_ptr<SafetyPolicy> make_policy(config::SafetyMode mode, obs::Observer* observer = nullptr);

} // namespace pinview::safety
