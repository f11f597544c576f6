#include "internal/concurrency/task_pool.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

using meshdeploy::concurrency::TaskPool;

void TestResultsAndExceptionsFlowThroughFutures() {
  TaskPool pool("results", 2);
  auto     value  = pool.Submit([] { return 41 + 1; });
  auto     broken = pool.Submit([]() -> int { throw std::runtime_error("boom"); });

  assert(value.get() == 42);
  try {
    broken.get();
    assert(false);
  } catch (const std::runtime_error& e) {
    assert(std::string(e.what()) == "boom");
  }
}

void TestPoolSizeBoundsConcurrency() {
  TaskPool         pool("bounded", 3);
  std::atomic<int> active{0};
  std::atomic<int> peak{0};

  std::vector<std::future<void>> futures;
  for (int i = 0; i < 12; ++i) {
    futures.push_back(pool.Submit([&] {
      const int now = ++active;
      int       seen = peak.load();
      while (now > seen && !peak.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      --active;
    }));
  }
  for (auto& future : futures) {
    future.get();
  }

  assert(pool.Size() == 3);
  assert(peak.load() <= 3);
  assert(peak.load() >= 1);
}

void TestSubmitAfterShutdownThrows() {
  TaskPool pool("closed", 1);
  auto     pending = pool.Submit([] { return 7; });
  pool.Shutdown();
  assert(pending.get() == 7);

  try {
    pool.Submit([] { return 0; });
    assert(false);
  } catch (const meshdeploy::util::InvalidState&) {
  }
}

} // namespace

int main() {
  TestResultsAndExceptionsFlowThroughFutures();
  TestPoolSizeBoundsConcurrency();
  TestSubmitAfterShutdownThrows();

  std::cout << "meshdeploy_unit_task_pool: pass\n";
  return 0;
}
