#pragma once

// Process-global work-stealing executor via Taskflow.
//
// Sized to std::thread::hardware_concurrency(). Large notebook reads
// materialise their cells through it.
//
// Internal header, not installed.

#include <taskflow/taskflow.hpp>
#include <taskflow/algorithm/for_each.hpp>

#include <cstddef>
#include <utility>

namespace ydoc_cpp::detail {

// Created on first use, destroyed at exit.
inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

// Run fn(i) for every i in [0, count) on the global executor and wait.
template <typename Fn>
void parallel_for(std::size_t count, Fn&& fn) {
    auto taskflow = tf::Taskflow{};
    taskflow.for_each_index(std::size_t{0}, count, std::size_t{1}, std::forward<Fn>(fn));
    global_executor().run(taskflow).wait();
}

}  // namespace ydoc_cpp::detail
