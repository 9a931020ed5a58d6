#include "pinview/view/view_builder.hpp"

namespace pinview::view {

namespace {
obs::Observer* pick_observer(const config::RuntimeConfig& cfg, obs::Observer* given) {
    if (given) return given;
    return cfg.log_events ? obs::make_simple_observer() : obs::make_quiet_observer();
}
} // namespace

ViewBuilder::ViewBuilder(gc::Heap& heap, jobs::JobSystem& jobs,
                         config::RuntimeConfig cfg, obs::Observer* observer)
    : cfg_(cfg),
      observer_(pick_observer(cfg, observer)),
      registry_(heap),
      policy_(safety::make_policy(cfg.safety, observer_)),
      ctx_{&registry_, &jobs, observer_} {}

void ViewBuilder::record_pin(std::uint64_t id, std::size_t elements, std::size_t bytes) {
    observer_->record(obs::ViewEvent{.kind = obs::EventKind::Pin, .view_id = id,
                                     .elements = elements, .bytes = bytes, .detail = ""});
}

} // namespace pinview::view
