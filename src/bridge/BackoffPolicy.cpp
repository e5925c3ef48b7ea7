#include "BackoffPolicy.hpp"

#include <cmath>

namespace dbridge {
BackoffPolicy::BackoffPolicy(int64_t _initialDelayMs, double _multiplier,
                             int64_t _maxDelayMs)
    : initialDelayMs(_initialDelayMs),
      multiplier(_multiplier),
      maxDelayMs(_maxDelayMs) {
  if (initialDelayMs < 0 || maxDelayMs < initialDelayMs || multiplier < 1.0) {
    throw std::invalid_argument("Invalid backoff parameters");
  }
}

int64_t BackoffPolicy::delay(int attempt) const {
  if (attempt < 0) {
    attempt = 0;
  }
  // Computed in floating point so large attempt counts saturate instead of
  // overflowing.
  double d = double(initialDelayMs) * std::pow(multiplier, double(attempt));
  if (d >= double(maxDelayMs)) {
    return maxDelayMs;
  }
  return int64_t(d);
}
}  // namespace dbridge
