#include "internal/concurrency/task_pool.hpp"

#include <algorithm>
#include <utility>

namespace meshdeploy::concurrency {

TaskPool::TaskPool(std::string name, std::size_t workers) : name_(std::move(name)) {
  const auto count = std::max<std::size_t>(workers, 1);
  threads_.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    threads_.emplace_back(&TaskPool::Run, this);
  }
}

TaskPool::~TaskPool() {
  Shutdown();
}

void TaskPool::Shutdown() {
  queue_.Shutdown();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
}

void TaskPool::Run() {
  while (auto task = queue_.Dequeue()) {
    // packaged_task stores exceptions in its future
    (*task)();
  }
}

} // namespace meshdeploy::concurrency
