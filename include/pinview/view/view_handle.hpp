#pragma once
/**
 * @file view_handle.hpp
 * @brief Owned capability over one pin and one safety token.
 *
 * Lifecycle: Active -> Released (terminal).
 *  - release():          invalidate token, then unpin, synchronously.
 *  - release_after(dep): invalidate token now; a DeferredRelease job scheduled
 *                        after @p dep performs the unpin. Returns that job's handle.
 * Either call moves the handle to Released; a second call returns HandleReleased.
 *
 * A handle destroyed (or overwritten by move assignment) while Active releases
 * synchronously. In checked mode that is reported as a leak.
 */

#include <cstddef>
#include <cstdint>

#include "pinview/error.hpp"
#include "pinview/jobs/job_system.hpp"
#include "pinview/mem/pin_registry.hpp"
#include "pinview/obs/observability.hpp"
#include "pinview/safety/safety_token.hpp"

namespace pinview::view {

class ViewBuilder;

/// @brief Collaborators a handle releases through. Owned by the ViewBuilder.
struct ViewContext {
    mem::PinRegistry* registry{nullptr};
    jobs::JobSystem*  jobs{nullptr};
    obs::Observer*    observer{nullptr};
};

class ViewHandle final {
public:
    enum class State : std::uint8_t { Active, Released };

    /// @brief A handle that owns nothing (Released).
    ViewHandle() noexcept = default;

    ViewHandle(const ViewHandle&)            = delete;
    ViewHandle& operator=(const ViewHandle&) = delete;

    ViewHandle(ViewHandle&& other) noexcept;
    ViewHandle& operator=(ViewHandle&& other) noexcept;
    ~ViewHandle();

    /// @brief Invalidate the token, then unpin.
    /// @return HandleReleased if not Active; the registry's error if the unpin failed.
    Expected<void> release();

    /**
     * @brief Invalidate the token now and unpin after @p dependency completes.
     * @return Completion handle of the unpin; HandleReleased if not Active;
     *         SchedulerStopped if the job system refused the job (the pin is
     *         then released synchronously).
     */
    [[nodiscard]] Expected<jobs::JobHandle> release_after(const jobs::JobHandle& dependency);

    [[nodiscard]] State         state() const noexcept { return state_; }
    [[nodiscard]] bool          active() const noexcept { return state_ == State::Active; }
    [[nodiscard]] std::uint64_t id() const noexcept { return id_; }
    [[nodiscard]] const safety::SafetyToken& token() const noexcept { return token_; }

    /// True if the handle holds a heap pin (false for an empty fallback view).
    [[nodiscard]] bool holds_pin() const noexcept { return !entry_.empty(); }

private:
    friend class ViewBuilder;

    ViewHandle(ViewContext ctx, std::uint64_t id, mem::PinEntry entry,
               safety::SafetyToken token, std::size_t elements, std::size_t bytes) noexcept;

    void record(obs::EventKind kind, const char* detail) const;
    void drop_active() noexcept;

    ViewContext         ctx_{};
    std::uint64_t       id_{0};
    mem::PinEntry       entry_{};
    safety::SafetyToken token_{};
    std::size_t         elements_{0};
    std::size_t         bytes_{0};
    State               state_{State::Released};
};

} // namespace pinview::view
