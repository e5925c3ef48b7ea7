#ifndef __DBRIDGE_TIMER_QUEUE__
#define __DBRIDGE_TIMER_QUEUE__

#include "Headers.hpp"

namespace dbridge {
typedef uint64_t TimerId;

/**
 * @brief Runs callbacks on a dedicated thread once their deadline passes.
 *
 * Callbacks fire without the internal lock held, so a callback may schedule
 * or cancel other timers.  A timer that was cancelled before it fired never
 * runs.
 */
class TimerQueue {
 public:
  explicit TimerQueue(const string& _threadName = "timer");
  ~TimerQueue();

  /**
   * @brief Schedules @p fn to run after @p delayMs milliseconds.
   * @return An id that can be passed to cancel().
   */
  TimerId schedule(int64_t delayMs, function<void()> fn);

  /**
   * @brief Cancels a pending timer.
   * @return true if the timer was still pending.
   */
  bool cancel(TimerId id);

  /** @brief Number of timers that have not fired or been cancelled. */
  size_t size();

  /**
   * @brief Stops the timer thread and drops every pending timer.  Safe to call
   * more than once.
   */
  void shutdown();

 protected:
  typedef std::chrono::steady_clock Clock;

  struct Timer {
    Clock::time_point deadline;
    function<void()> fn;
  };

  void run();

  string threadName;
  std::mutex timerMutex;
  std::condition_variable timerChanged;
  // Ordered by (deadline, id) so timers with equal deadlines fire in
  // scheduling order.
  map<pair<Clock::time_point, TimerId>, function<void()>> timers;
  map<TimerId, Clock::time_point> deadlines;
  TimerId nextId;
  bool stopped;
  shared_ptr<thread> timerThread;
};
}  // namespace dbridge

#endif  // __DBRIDGE_TIMER_QUEUE__
