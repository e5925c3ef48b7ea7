#ifndef __DBRIDGE_BACKOFF_POLICY__
#define __DBRIDGE_BACKOFF_POLICY__

#include "Headers.hpp"

namespace dbridge {
/**
 * @brief Exponential retry delay: initial * multiplier^attempt, capped at max.
 */
class BackoffPolicy {
 public:
  BackoffPolicy(int64_t _initialDelayMs = 1000, double _multiplier = 2.0,
                int64_t _maxDelayMs = 30000);

  /**
   * @brief Returns the delay to wait before retry number @p attempt
   * (zero-based).  Negative attempts are treated as zero.
   */
  int64_t delay(int attempt) const;

  int64_t getInitialDelayMs() const { return initialDelayMs; }
  double getMultiplier() const { return multiplier; }
  int64_t getMaxDelayMs() const { return maxDelayMs; }

 protected:
  int64_t initialDelayMs;
  double multiplier;
  int64_t maxDelayMs;
};
}  // namespace dbridge

#endif  // __DBRIDGE_BACKOFF_POLICY__
