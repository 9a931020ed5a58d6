/**
 * @file job_system.hpp
 * @brief Dependency-graph job executor (the task engine views are handed to).
 *
 * Design goals:
 *  - A job runs only after every job it depends on has completed; dependency
 *    edges are the only ordering primitive (no locks exposed to callers).
 *  - schedule() never blocks on the graph: it records edges and returns a
 *    JobHandle immediately.
 *  - A JobHandle is the completion token of one job. A default JobHandle is
 *    already complete, so it is a valid "no dependency".
 *  - Shutdown drains: the destructor runs every scheduled job before joining.
 *
 * Thread roles:
 *  - Any thread may schedule() (including a running job).
 *  - N worker threads pop ready jobs from one shared queue.
 */
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <thread>
#include <vector>

#include "pinview/error.hpp"

namespace pinview::jobs {

/// @brief Unit of work. Executed exactly once on a worker thread.
class Job {
public:
  virtual ~Job() = default;
  virtual void execute() = 0;
  /// Short label used when a job fails.
  virtual const char* name() const noexcept { return "job"; }
};

namespace detail {
struct JobNode;
} // namespace detail

/**
 * @brief Completion token of a scheduled job.
 */
class JobHandle final {
public:
  /// @brief Already-completed handle (no dependency).
  JobHandle() noexcept = default;

  /// True once the job (and so all its dependencies) has completed.
  bool is_completed() const noexcept;

  /// Block the calling thread until completion.
  void wait() const;

  /// Job id (0 for the default handle).
  std::uint64_t id() const noexcept;

private:
  friend class JobSystem;
  explicit JobHandle(std::shared_ptr<detail::JobNode> node) noexcept : node_(std::move(node)) {}
  std::shared_ptr<detail::JobNode> node_;
};

/**
 * @brief Fixed pool of workers executing jobs in dependency order.
 */
class JobSystem final {
public:
  /// @param workers Pool size; 0 = std::thread::hardware_concurrency() (at least 1).
  explicit JobSystem(std::size_t workers = 0);

  /// Drains every scheduled job, then joins the workers.
  ~JobSystem();

  JobSystem(const JobSystem&)            = delete;
  JobSystem& operator=(const JobSystem&) = delete;

  /**
   * @brief Schedule @p job to run after all of @p deps complete.
   * @return Handle of the new job, or SchedulerStopped once shutdown began
   *         (the job is destroyed without running).
   */
  [[nodiscard]] Expected<JobHandle> schedule(std::unique_ptr<Job> job, std::span<const JobHandle> deps = {});

  /// @brief Single-dependency convenience overload.
  [[nodiscard]] Expected<JobHandle> schedule(std::unique_ptr<Job> job, const JobHandle& dep);

  /// @brief Schedule a callable as a job.
  [[nodiscard]] Expected<JobHandle> schedule(std::function<void()> fn, const JobHandle& dep = {});

  /// @brief Handle that completes when every handle in @p deps has completed.
  [[nodiscard]] Expected<JobHandle> combine(std::span<const JobHandle> deps);

  /// Number of worker threads.
  std::size_t worker_count() const noexcept { return workers_.size(); }

  /// Jobs scheduled and not yet completed.
  std::size_t pending() const noexcept { return in_flight_.load(std::memory_order_acquire); }

  /// Block until every job scheduled so far has completed.
  void wait_idle();

private:
  void worker_loop();
  void enqueue_ready(std::shared_ptr<detail::JobNode> node);
  void complete(const std::shared_ptr<detail::JobNode>& node);

  std::mutex                                    mu_;
  std::condition_variable                       ready_cv_;   ///< Workers wait for ready jobs
  std::condition_variable                       idle_cv_;    ///< wait_idle()/shutdown wait for drain
  std::deque<std::shared_ptr<detail::JobNode>>  ready_;      ///< Jobs whose dependencies completed
  bool                                          accepting_{true};
  bool                                          exit_{false};
  std::atomic<std::size_t>                      in_flight_{0};
  std::atomic<std::uint64_t>                    next_id_{1};
  std::vector<std::thread>                      workers_;
};

} // namespace pinview::jobs
