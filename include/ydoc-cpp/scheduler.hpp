/// @file scheduler.hpp
/// @brief Step-wise jobs and the drivers that run them.
///
/// Reconciliation work is written as a Job: a sequence of small steps. The
/// synchronous driver runs the steps back-to-back; the asynchronous driver
/// posts one step at a time to a host RunLoop so that other tasks of the
/// host can run in between. Both drive the same step sequence and therefore
/// leave the same document state and fire the same observers.

#pragma once

#include <ydoc-cpp/error.hpp>

#include <chrono>
#include <concepts>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <type_traits>
#include <utility>

namespace ydoc_cpp {

/// A unit of reconciliation work split into steps.
class Job {
public:
    virtual ~Job() = default;

    /// Perform one step.
    /// @return False once the job has finished; step() is not called again.
    virtual auto step() -> bool = 0;

    /// Stop early. The document is left in the state reached so far, with
    /// every applied write committed.
    virtual void cancel() {}
};

/// Run every step of `job` on the calling thread.
void run_to_completion(Job& job);

/// A single-threaded FIFO task queue owned by the host.
///
/// Tasks run on whichever thread calls run_one(), run_until_idle() or
/// run(). The loop remembers how long its longest task took.
///
/// @code
/// auto loop = RunLoop{};
/// auto done = run_async(loop, job);
/// loop.run_until_idle();
/// done.get();
/// @endcode
class RunLoop {
public:
    RunLoop() = default;

    RunLoop(const RunLoop&) = delete;
    auto operator=(const RunLoop&) -> RunLoop& = delete;
    RunLoop(RunLoop&&) = delete;
    auto operator=(RunLoop&&) -> RunLoop& = delete;

    /// Queue a task. Safe to call from any thread.
    void post(std::function<void()> task);

    /// Run the oldest queued task, if any.
    /// @return False if the queue was empty.
    auto run_one() -> bool;

    /// Run tasks until the queue is empty, including tasks posted meanwhile.
    /// @return The number of tasks run.
    auto run_until_idle() -> std::size_t;

    /// Run tasks as they arrive until `stop` is requested. Tasks still queued
    /// at that point stay queued.
    void run(std::stop_token stop);

    /// Number of queued tasks.
    auto pending() const -> std::size_t;

    /// Duration of the longest task run so far.
    auto longest_task() const -> std::chrono::nanoseconds;

    /// Number of tasks run so far.
    auto tasks_run() const -> std::size_t;

private:
    void execute(std::function<void()>& task);

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<std::function<void()>> tasks_;
    std::chrono::nanoseconds longest_{0};
    std::size_t tasks_run_{0};
};

namespace detail {

// One asynchronous run: re-posts itself after every step until the job
// finishes, fails or is stopped.
template <typename J, typename Finish>
class AsyncRun : public std::enable_shared_from_this<AsyncRun<J, Finish>> {
public:
    using result_type = std::invoke_result_t<Finish&, J&>;

    AsyncRun(RunLoop& loop, std::shared_ptr<J> job, Finish finish, std::stop_token stop)
        : loop_{loop}, job_{std::move(job)}, finish_{std::move(finish)}, stop_{std::move(stop)} {}

    auto future() -> std::future<result_type> { return promise_.get_future(); }

    void schedule() {
        loop_.post([self = this->shared_from_this()] { self->tick(); });
    }

private:
    void tick() {
        try {
            if (stop_.stop_requested()) {
                job_->cancel();
                promise_.set_exception(std::make_exception_ptr(
                    Error{ErrorKind::cancelled, "job cancelled between steps"}));
                return;
            }
            if (job_->step()) {
                schedule();
                return;
            }
            if constexpr (std::is_void_v<result_type>) {
                finish_(*job_);
                promise_.set_value();
            } else {
                promise_.set_value(finish_(*job_));
            }
        } catch (...) {
            job_->cancel();
            promise_.set_exception(std::current_exception());
        }
    }

    RunLoop& loop_;
    std::shared_ptr<J> job_;
    Finish finish_;
    std::stop_token stop_;
    std::promise<result_type> promise_;
};

}  // namespace detail

/// Drive `job` on `loop`, one step per task.
///
/// `finish` is invoked with the job after its last step; its result becomes
/// the value of the returned future. If the job throws, the job is cancelled
/// and the future carries the exception. If `stop` is requested between two
/// steps, the job is cancelled and the future carries
/// Error{ErrorKind::cancelled}.
template <typename J, typename Finish>
    requires std::derived_from<J, Job> && std::invocable<Finish&, J&>
auto run_async(RunLoop& loop, std::shared_ptr<J> job, Finish finish,
               std::stop_token stop = {}) -> std::future<std::invoke_result_t<Finish&, J&>> {
    auto run = std::make_shared<detail::AsyncRun<J, Finish>>(
        loop, std::move(job), std::move(finish), std::move(stop));
    auto result = run->future();
    run->schedule();
    return result;
}

/// Drive `job` on `loop`, one step per task; the future becomes ready after
/// the last step.
template <typename J>
    requires std::derived_from<J, Job>
auto run_async(RunLoop& loop, std::shared_ptr<J> job, std::stop_token stop = {})
    -> std::future<void> {
    return run_async(loop, std::move(job), [](J&) {}, std::move(stop));
}

}  // namespace ydoc_cpp
