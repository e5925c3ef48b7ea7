#ifndef __DBRIDGE_BRIDGE_CONFIG__
#define __DBRIDGE_BRIDGE_CONFIG__

#include "Headers.hpp"
#include "SocketEndpoint.hpp"

namespace dbridge {
/**
 * @brief Endpoint, credentials and timing knobs of one bridge client.
 *
 * Defaults are usable as-is against a local bridge.  Files use the INI layout
 * below; keys that are absent keep their current value.
 *
 *   [Networking] host port path token client_id
 *   [Timeouts]   connect_timeout_ms request_timeout_ms
 *   [Reconnect]  max_attempts initial_backoff_ms multiplier max_backoff_ms
 *   [Debug]      verbose logsize
 */
class BridgeConfig {
 public:
  BridgeConfig();

  string host;
  int port;
  string path;
  string authToken;
  string clientId;

  int64_t connectTimeoutMs;
  int64_t requestTimeoutMs;

  int maxReconnectAttempts;
  int64_t initialBackoffMs;
  double backoffMultiplier;
  int64_t maxBackoffMs;

  int verbose;
  string maxLogSize;

  /**
   * @brief Overlays the values found in an INI file.
   * @throws std::runtime_error if the file cannot be read or a value does not
   * parse.
   */
  void loadFromFile(const string& filename);

  /**
   * @brief Checks ranges and relationships between values.
   * @throws std::runtime_error describing the first invalid value.
   */
  void validate() const;

  SocketEndpoint getEndpoint() const {
    return SocketEndpoint(host, port, path);
  }
};
}  // namespace dbridge

#endif  // __DBRIDGE_BRIDGE_CONFIG__
