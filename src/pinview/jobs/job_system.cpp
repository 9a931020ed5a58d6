// JobSystem: Implementation Notes
// Each scheduled job is a JobNode with a pending-dependency counter.
//   • schedule(): pending starts at 1 (a guard held by the scheduler itself), plus one
//     per dependency still running. The node registers itself as a dependent of
//     each such dependency, then drops the guard; whoever brings pending to 0
//     enqueues the node. The guard keeps a dependency that completes mid-scan
//     from enqueueing the node twice or too early.
//   • complete(): marks the node done under its own mutex, wakes waiters, then
//     releases one pending count on every dependent. A dependent may belong to
//     another JobSystem; it is enqueued on its owner, and only the owner's
//     in_flight_ counts it.
// A completed node never gains dependents, so completion propagates exactly once.

#include "pinview/jobs/job_system.hpp"
#include "pinview/config/constants.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <utility>

namespace pinview::jobs {

namespace detail {

struct JobNode {
  std::uint64_t                           id{0};
  JobSystem*                              owner{nullptr};
  std::unique_ptr<Job>                    job;
  std::atomic<std::size_t>                pending{1};
  std::mutex                              mu;
  std::condition_variable                 cv;
  bool                                    done{false};  ///< Guarded by mu
  std::vector<std::shared_ptr<JobNode>>   dependents;   ///< Guarded by mu
};

} // namespace detail

namespace {

class FunctionJob final : public Job {
public:
  explicit FunctionJob(std::function<void()> fn) : fn_(std::move(fn)) {}
  void execute() override { if (fn_) fn_(); }
  const char* name() const noexcept override { return "function"; }
private:
  std::function<void()> fn_;
};

} // namespace

//------------------------------- JobHandle ------------------------------------

bool JobHandle::is_completed() const noexcept {
  if (!node_) return true;
  std::lock_guard<std::mutex> lk(node_->mu);
  return node_->done;
}

void JobHandle::wait() const {
  if (!node_) return;
  std::unique_lock<std::mutex> lk(node_->mu);
  node_->cv.wait(lk, [&]{ return node_->done; });
}

std::uint64_t JobHandle::id() const noexcept {
  return node_ ? node_->id : 0;
}

//------------------------------- JobSystem ------------------------------------

JobSystem::JobSystem(std::size_t workers) {
  if (workers == 0) {
    workers = std::max<std::size_t>(std::thread::hardware_concurrency(),
                                    config::constants::WORKER_THREADS_MIN);
  }
  workers_.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    workers_.emplace_back([this]{ worker_loop(); });
  }
}

JobSystem::~JobSystem() {
  {
    std::unique_lock<std::mutex> lk(mu_);
    accepting_ = false;
    // Drain. Jobs waiting on another system's jobs keep this system alive until those complete.
    idle_cv_.wait(lk, [&]{ return in_flight_.load(std::memory_order_acquire) == 0; });
    exit_ = true;
  }
  ready_cv_.notify_all();
  for (auto& t : workers_) {
    if (t.joinable()) t.join();
  }
}

Expected<JobHandle> JobSystem::schedule(std::unique_ptr<Job> job, std::span<const JobHandle> deps) {
  auto node = std::make_shared<detail::JobNode>();
  node->id    = next_id_.fetch_add(1, std::memory_order_relaxed);
  node->owner = this;
  node->job = std::move(job);

  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!accepting_) return fail(Error::SchedulerStopped);
    in_flight_.fetch_add(1, std::memory_order_acq_rel);
  }

  for (const auto& dep : deps) {
    const auto& dn = dep.node_;
    if (!dn) continue;
    std::lock_guard<std::mutex> lk(dn->mu);
    if (dn->done) continue;
    node->pending.fetch_add(1, std::memory_order_relaxed);
    dn->dependents.push_back(node);
  }

  // Drop the scheduling guard.
  if (node->pending.fetch_sub(1, std::memory_order_acq_rel) == 1) {
    enqueue_ready(node);
  }
  return JobHandle(std::move(node));
}

Expected<JobHandle> JobSystem::schedule(std::unique_ptr<Job> job, const JobHandle& dep) {
  return schedule(std::move(job), std::span<const JobHandle>(&dep, 1));
}

Expected<JobHandle> JobSystem::schedule(std::function<void()> fn, const JobHandle& dep) {
  return schedule(std::make_unique<FunctionJob>(std::move(fn)), dep);
}

Expected<JobHandle> JobSystem::combine(std::span<const JobHandle> deps) {
  return schedule(std::make_unique<FunctionJob>(nullptr), deps);
}

void JobSystem::wait_idle() {
  std::unique_lock<std::mutex> lk(mu_);
  idle_cv_.wait(lk, [&]{ return in_flight_.load(std::memory_order_acquire) == 0; });
}

void JobSystem::enqueue_ready(std::shared_ptr<detail::JobNode> node) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    ready_.push_back(std::move(node));
  }
  ready_cv_.notify_one();
}

void JobSystem::worker_loop() {
  for (;;) {
    std::shared_ptr<detail::JobNode> node;
    {
      std::unique_lock<std::mutex> lk(mu_);
      ready_cv_.wait(lk, [&]{ return exit_ || !ready_.empty(); });
      if (ready_.empty()) return; // exit_ and drained
      node = std::move(ready_.front());
      ready_.pop_front();
    }

    try {
      if (node->job) node->job->execute();
    } catch (const std::exception& e) {
      // A failed job still completes; dependents must not be stranded.
      std::fprintf(stderr, "pinview: job %llu (%s) threw: %s\n",
                   static_cast<unsigned long long>(node->id), node->job->name(), e.what());
    } catch (...) {
      std::fprintf(stderr, "pinview: job %llu (%s) threw a non-standard exception\n",
                   static_cast<unsigned long long>(node->id), node->job->name());
    }
    node->job.reset();
    complete(node);
  }
}

void JobSystem::complete(const std::shared_ptr<detail::JobNode>& node) {
  std::vector<std::shared_ptr<detail::JobNode>> dependents;
  {
    std::lock_guard<std::mutex> lk(node->mu);
    node->done = true;
    dependents.swap(node->dependents);
  }
  node->cv.notify_all();

  for (auto& d : dependents) {
    if (d->pending.fetch_sub(1, std::memory_order_acq_rel) == 1) {
      JobSystem* owner = d->owner;
      owner->enqueue_ready(std::move(d));
    }
  }

  {
    std::lock_guard<std::mutex> lk(mu_);
    in_flight_.fetch_sub(1, std::memory_order_acq_rel);
  }
  idle_cv_.notify_all();
}

} // namespace pinview::jobs
