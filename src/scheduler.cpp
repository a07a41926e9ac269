#include <ydoc-cpp/scheduler.hpp>

#include <algorithm>

namespace ydoc_cpp {

void run_to_completion(Job& job) {
    while (job.step()) {
    }
}

void RunLoop::post(std::function<void()> task) {
    {
        auto lock = std::scoped_lock{mutex_};
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

auto RunLoop::run_one() -> bool {
    auto task = std::function<void()>{};
    {
        auto lock = std::scoped_lock{mutex_};
        if (tasks_.empty()) return false;
        task = std::move(tasks_.front());
        tasks_.pop_front();
    }
    execute(task);
    return true;
}

auto RunLoop::run_until_idle() -> std::size_t {
    auto count = std::size_t{0};
    while (run_one()) ++count;
    return count;
}

void RunLoop::run(std::stop_token stop) {
    while (true) {
        auto task = std::function<void()>{};
        {
            auto lock = std::unique_lock{mutex_};
            // a stop wins over queued tasks
            if (!cv_.wait(lock, stop, [&] { return !tasks_.empty(); }) ||
                stop.stop_requested()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        execute(task);
    }
}

void RunLoop::execute(std::function<void()>& task) {
    const auto start = std::chrono::steady_clock::now();
    task();
    const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start);

    auto lock = std::scoped_lock{mutex_};
    longest_ = std::max(longest_, elapsed);
    ++tasks_run_;
}

auto RunLoop::pending() const -> std::size_t {
    auto lock = std::scoped_lock{mutex_};
    return tasks_.size();
}

auto RunLoop::longest_task() const -> std::chrono::nanoseconds {
    auto lock = std::scoped_lock{mutex_};
    return longest_;
}

auto RunLoop::tasks_run() const -> std::size_t {
    auto lock = std::scoped_lock{mutex_};
    return tasks_run_;
}

}  // namespace ydoc_cpp
