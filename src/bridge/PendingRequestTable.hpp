#ifndef __DBRIDGE_PENDING_REQUEST_TABLE__
#define __DBRIDGE_PENDING_REQUEST_TABLE__

#include "BridgeErrors.hpp"
#include "Envelope.hpp"
#include "Headers.hpp"
#include "TimerQueue.hpp"

namespace dbridge {
/**
 * @brief Tracks in-flight requests by correlation id and settles each of them
 * exactly once: on response, rejection, timeout, cancellation or teardown.
 *
 * Every entry is removed from the table under the lock before its promise is
 * touched, so whichever path removes it first is the only one that settles it.
 */
class PendingRequestTable {
 public:
  PendingRequestTable();
  ~PendingRequestTable();

  /**
   * @brief Registers a request and arms its timeout.
   * @throws std::invalid_argument if @p correlationId is already in flight.
   * @return The future the caller waits on.
   */
  shared_future<ResponseEnvelope> registerRequest(const string& correlationId,
                                                  int64_t timeoutMs);

  /**
   * @brief Resolves (success) or rejects with ProtocolError (failure) the
   * request matching the response.
   * @return false if no request with that id is pending.
   */
  bool settle(const ResponseEnvelope& response);

  /** @brief Rejects one request with @p error. */
  bool reject(const string& correlationId, std::exception_ptr error);

  /** @brief Rejects one request with CancelledError. */
  bool cancel(const string& correlationId);

  /** @brief Rejects every pending request with @p error and empties the table. */
  void teardownAll(std::exception_ptr error);

  bool contains(const string& correlationId);
  size_t size();

 protected:
  struct PendingRequest {
    string correlationId;
    shared_ptr<promise<ResponseEnvelope>> result;
    TimerId timeoutTimer;
    int64_t createdAt;
  };

  /**
   * @brief Removes the entry under the lock and disarms its timer.
   * @return false if it was already gone.
   */
  bool take(const string& correlationId, PendingRequest* pending);
  void onTimeout(const string& correlationId, int64_t timeoutMs);

  std::mutex tableMutex;
  unordered_map<string, PendingRequest> requests;
  // Declared last so its thread is joined before the table goes away.
  TimerQueue timers;
};
}  // namespace dbridge

#endif  // __DBRIDGE_PENDING_REQUEST_TABLE__
