#include "TimerQueue.hpp"

#include "TestHeaders.hpp"

using namespace dbridge;

TEST_CASE("Timers fire in deadline order", "[TimerQueue]") {
  TimerQueue timers;
  std::mutex firedMutex;
  vector<int> fired;
  auto record = [&](int n) {
    return [&, n]() {
      lock_guard<std::mutex> guard(firedMutex);
      fired.push_back(n);
    };
  };
  timers.schedule(60, record(3));
  timers.schedule(20, record(1));
  timers.schedule(40, record(2));
  REQUIRE(waitUntil([&]() {
    lock_guard<std::mutex> guard(firedMutex);
    return fired.size() == 3;
  }));
  lock_guard<std::mutex> guard(firedMutex);
  REQUIRE(fired == vector<int>({1, 2, 3}));
  REQUIRE(timers.size() == 0);
}

TEST_CASE("Cancelled timers never fire", "[TimerQueue]") {
  TimerQueue timers;
  std::atomic<int> count(0);
  TimerId id = timers.schedule(50, [&count]() { count++; });
  timers.schedule(80, [&count]() { count += 10; });
  REQUIRE(timers.cancel(id));
  REQUIRE_FALSE(timers.cancel(id));
  REQUIRE(waitUntil([&count]() { return count == 10; }));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  REQUIRE(count.load() == 10);
}

TEST_CASE("A callback may schedule another timer", "[TimerQueue]") {
  TimerQueue timers;
  std::atomic<bool> second(false);
  timers.schedule(0, [&]() {
    timers.schedule(10, [&second]() { second = true; });
  });
  REQUIRE(waitUntil([&second]() { return second.load(); }));
}

TEST_CASE("Shutdown drops pending timers", "[TimerQueue]") {
  TimerQueue timers;
  std::atomic<bool> fired(false);
  timers.schedule(60 * 1000, [&fired]() { fired = true; });
  REQUIRE(timers.size() == 1);
  timers.shutdown();
  REQUIRE(timers.size() == 0);
  REQUIRE_FALSE(fired.load());
  REQUIRE_THROWS_AS(timers.schedule(1, []() {}), std::runtime_error);
  // Idempotent
  timers.shutdown();
}
