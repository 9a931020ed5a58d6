/**
 * @file safety_token.cpp
 * @brief Checked and unchecked safety policies.
 */
#include "pinview/safety/safety_token.hpp"

namespace pinview::safety {

Expected<void> SafetyToken::validate() const {
    if (!state_ || state_->valid.load(std::memory_order_acquire)) return {};

    if (state_->observer) {
        state_->observer->record(obs::ViewEvent{
            .kind = obs::EventKind::UseAfterRelease,
            .view_id = state_->id,
            .detail = "access after release"});
    }
    return fail(Error::UseAfterRelease);
}

void SafetyToken::invalidate() const noexcept {
    if (state_) state_->valid.store(false, std::memory_order_release);
}

SafetyToken CheckedPolicy::issue(std::uint64_t view_id) {
    auto s = std::make_shared<SafetyToken::State>();
    s->id = view_id;
    s->observer = observer_;
    return SafetyToken(std::move(s));
}

std::unique_ptr<SafetyPolicy> make_policy(config::SafetyMode mode, obs::Observer* observer) {
    if (mode == config::SafetyMode::Checked) return std::make_unique<CheckedPolicy>(observer);
    return std::make_unique<UncheckedPolicy>();
}

} // namespace pinview::safety
