#ifndef __DBRIDGE_CALLBACK_LIST__
#define __DBRIDGE_CALLBACK_LIST__

#include "Headers.hpp"

namespace dbridge {
typedef uint64_t SubscriptionId;

/**
 * @brief A thread-safe list of subscribers addressed by the id returned from
 * add().
 *
 * invoke() copies the list under the lock and calls every callback without it,
 * so a callback may add or remove subscribers (including itself).  An
 * exception escaping one callback is logged and the others still run.
 */
template <typename... Args>
class CallbackList {
 public:
  typedef function<void(Args...)> Callback;

  CallbackList() : nextId(1) {}

  SubscriptionId add(Callback callback) {
    lock_guard<std::mutex> guard(listMutex);
    SubscriptionId id = nextId++;
    callbacks.push_back(make_pair(id, callback));
    return id;
  }

  /** @return false if @p id is not subscribed. */
  bool remove(SubscriptionId id) {
    lock_guard<std::mutex> guard(listMutex);
    for (auto it = callbacks.begin(); it != callbacks.end(); ++it) {
      if (it->first == id) {
        callbacks.erase(it);
        return true;
      }
    }
    return false;
  }

  /** @return The number of callbacks that were invoked. */
  int invoke(Args... args) {
    vector<pair<SubscriptionId, Callback>> snapshot;
    {
      lock_guard<std::mutex> guard(listMutex);
      snapshot = callbacks;
    }
    for (auto& it : snapshot) {
      try {
        it.second(args...);
      } catch (const std::exception& e) {
        LOG(ERROR) << "Subscriber " << it.first << " threw: " << e.what();
      }
    }
    return int(snapshot.size());
  }

  size_t size() {
    lock_guard<std::mutex> guard(listMutex);
    return callbacks.size();
  }

  void clear() {
    lock_guard<std::mutex> guard(listMutex);
    callbacks.clear();
  }

 protected:
  std::mutex listMutex;
  vector<pair<SubscriptionId, Callback>> callbacks;
  SubscriptionId nextId;
};
}  // namespace dbridge

#endif  // __DBRIDGE_CALLBACK_LIST__
