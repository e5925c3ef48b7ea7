#include "TimerQueue.hpp"

namespace dbridge {
TimerQueue::TimerQueue(const string& _threadName)
    : threadName(_threadName), nextId(1), stopped(false) {
  timerThread.reset(new thread(&TimerQueue::run, this));
}

TimerQueue::~TimerQueue() { shutdown(); }

TimerId TimerQueue::schedule(int64_t delayMs, function<void()> fn) {
  lock_guard<std::mutex> guard(timerMutex);
  if (stopped) {
    throw std::runtime_error("Timer queue is shut down");
  }
  TimerId id = nextId++;
  auto deadline =
      Clock::now() + std::chrono::milliseconds(max<int64_t>(delayMs, 0));
  timers[make_pair(deadline, id)] = fn;
  deadlines[id] = deadline;
  timerChanged.notify_all();
  return id;
}

bool TimerQueue::cancel(TimerId id) {
  lock_guard<std::mutex> guard(timerMutex);
  auto it = deadlines.find(id);
  if (it == deadlines.end()) {
    return false;
  }
  timers.erase(make_pair(it->second, id));
  deadlines.erase(it);
  timerChanged.notify_all();
  return true;
}

size_t TimerQueue::size() {
  lock_guard<std::mutex> guard(timerMutex);
  return timers.size();
}

void TimerQueue::shutdown() {
  shared_ptr<thread> t;
  {
    lock_guard<std::mutex> guard(timerMutex);
    stopped = true;
    if (!timers.empty()) {
      VLOG(1) << "Dropping " << timers.size() << " pending timers";
    }
    timers.clear();
    deadlines.clear();
    timerChanged.notify_all();
    t.swap(timerThread);
  }
  if (t) {
    if (t->get_id() == std::this_thread::get_id()) {
      // Shut down from inside a callback; the thread exits on its own.
      t->detach();
    } else {
      t->join();
    }
  }
}

void TimerQueue::run() {
  el::Helpers::setThreadName(threadName);
  std::unique_lock<std::mutex> lock(timerMutex);
  while (!stopped) {
    if (timers.empty()) {
      timerChanged.wait(lock);
      continue;
    }
    auto it = timers.begin();
    if (Clock::now() < it->first.first) {
      timerChanged.wait_until(lock, it->first.first);
      continue;
    }
    function<void()> fn = it->second;
    deadlines.erase(it->first.second);
    timers.erase(it);
    lock.unlock();
    try {
      fn();
    } catch (const std::exception& e) {
      LOG(ERROR) << "Timer callback threw: " << e.what();
    }
    lock.lock();
  }
}
}  // namespace dbridge
