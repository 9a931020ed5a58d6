/**
 * @file view_handle.cpp
 * @brief Synchronous and deferred release of a view's pin.
 */
#include "pinview/view/view_handle.hpp"

#include <cstdio>
#include <exception>
#include <memory>
#include <utility>

namespace pinview::view {

namespace {

/// Job that owns a pin entry and releases it once its dependency completed.
/// If the job never runs (scheduling refused) the destructor releases instead.
class DeferredRelease final : public jobs::Job {
public:
    DeferredRelease(mem::PinRegistry& registry, mem::PinEntry entry, obs::Observer* observer,
                    std::uint64_t view_id, std::size_t elements, std::size_t bytes) noexcept
        : registry_(registry), entry_(std::move(entry)), observer_(observer),
          view_id_(view_id), elements_(elements), bytes_(bytes) {}

    ~DeferredRelease() override {
        if (entry_.empty()) return;
        try {
            report(registry_.unpin(std::move(entry_)), obs::EventKind::Unpin, "scheduler_stopped");
        } catch (const std::exception& e) {
            std::fprintf(stderr, "pinview: view %llu release failed: %s\n",
                         static_cast<unsigned long long>(view_id_), e.what());
        }
    }

    void execute() override {
        if (entry_.empty()) return; // empty fallback view: nothing pinned
        report(registry_.unpin(std::move(entry_)), obs::EventKind::DeferredUnpin, "");
    }

    const char* name() const noexcept override { return "deferred_release"; }

private:
    void report(const Expected<void>& r, obs::EventKind ok_kind, const char* detail) const {
        if (!observer_) return;
        obs::ViewEvent ev{.kind = r ? ok_kind : obs::EventKind::Failure,
                          .view_id = view_id_,
                          .elements = elements_,
                          .bytes = bytes_,
                          .detail = r ? detail : to_string(r.error())};
        observer_->record(ev);
    }

    mem::PinRegistry& registry_;
    mem::PinEntry     entry_;
    obs::Observer*    observer_;
    std::uint64_t     view_id_;
    std::size_t       elements_;
    std::size_t       bytes_;
};

} // namespace

ViewHandle::ViewHandle(ViewContext ctx, std::uint64_t id, mem::PinEntry entry,
                       safety::SafetyToken token, std::size_t elements, std::size_t bytes) noexcept
    : ctx_(ctx), id_(id), entry_(std::move(entry)), token_(std::move(token)),
      elements_(elements), bytes_(bytes), state_(State::Active) {}

ViewHandle::ViewHandle(ViewHandle&& other) noexcept
    : ctx_(other.ctx_), id_(other.id_), entry_(std::move(other.entry_)),
      token_(std::move(other.token_)), elements_(other.elements_), bytes_(other.bytes_),
      state_(std::exchange(other.state_, State::Released)) {}

ViewHandle& ViewHandle::operator=(ViewHandle&& other) noexcept {
    if (this != &other) {
        drop_active();
        ctx_      = other.ctx_;
        id_       = other.id_;
        entry_    = std::move(other.entry_);
        token_    = std::move(other.token_);
        elements_ = other.elements_;
        bytes_    = other.bytes_;
        state_    = std::exchange(other.state_, State::Released);
    }
    return *this;
}

ViewHandle::~ViewHandle() {
    drop_active();
}

Expected<void> ViewHandle::release() {
    if (state_ != State::Active) return fail(Error::HandleReleased);
    state_ = State::Released;

    token_.invalidate();
    if (entry_.empty()) return {};

    auto r = ctx_.registry->unpin(std::move(entry_));
    if (!r) {
        record(obs::EventKind::Failure, to_string(r.error()));
        return r;
    }
    record(obs::EventKind::Unpin, "");
    return {};
}

Expected<jobs::JobHandle> ViewHandle::release_after(const jobs::JobHandle& dependency) {
    if (state_ != State::Active) return fail(Error::HandleReleased);
    state_ = State::Released;

    token_.invalidate();
    auto job = std::make_unique<DeferredRelease>(*ctx_.registry, std::move(entry_), ctx_.observer,
                                                 id_, elements_, bytes_);
    auto scheduled = ctx_.jobs->schedule(std::move(job), dependency);
    if (!scheduled) {
        // The refused job was destroyed, which released the pin.
        record(obs::EventKind::Failure, to_string(scheduled.error()));
        return fail(scheduled.error());
    }
    return scheduled;
}

void ViewHandle::record(obs::EventKind kind, const char* detail) const {
    if (!ctx_.observer) return;
    ctx_.observer->record(obs::ViewEvent{.kind = kind, .view_id = id_, .elements = elements_,
                                         .bytes = bytes_, .detail = detail});
}

void ViewHandle::drop_active() noexcept {
    if (state_ != State::Active) return;
    try {
        if (token_.checked()) record(obs::EventKind::Leak, "handle destroyed while active");
        if (auto r = release(); !r) {
            std::fprintf(stderr, "pinview: view %llu release on destroy failed: %s\n",
                         static_cast<unsigned long long>(id_), to_string(r.error()));
        }
    } catch (const std::exception& e) {
        std::fprintf(stderr, "pinview: view %llu release on destroy threw: %s\n",
                     static_cast<unsigned long long>(id_), e.what());
    }
}

} // namespace pinview::view
