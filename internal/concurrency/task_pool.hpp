#pragma once

#include <cstddef>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include "internal/concurrency/task_queue.hpp"
#include "internal/util/errors.hpp"

namespace meshdeploy::concurrency {

/*
  Fixed set of worker threads running long-latency operations (provider
  calls, uploads, launches) on behalf of one coordinating flow.

  The pool size is the concurrency limit. Only the coordinator submits and
  waits; tasks never wait on each other, so a small pool cannot deadlock.
*/
class TaskPool {
 public:
  TaskPool(std::string name, std::size_t workers);
  ~TaskPool();

  TaskPool(const TaskPool&)            = delete;
  TaskPool& operator=(const TaskPool&) = delete;

  // Throws util::InvalidState after Shutdown.
  template <typename Fn>
  auto Submit(Fn&& fn) -> std::future<std::invoke_result_t<Fn>> {
    using Result = std::invoke_result_t<Fn>;
    auto task    = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
    auto future  = task->get_future();
    if (!queue_.Enqueue([task] { (*task)(); })) {
      throw util::InvalidState("task pool " + name_ + " is shut down");
    }
    return future;
  }

  // Drains queued tasks, then joins the workers.
  void Shutdown();

  std::size_t Size() const {
    return threads_.size();
  }

 private:
  void Run();

  const std::string        name_;
  TaskQueue                queue_;
  std::vector<std::thread> threads_;
};

} // namespace meshdeploy::concurrency
