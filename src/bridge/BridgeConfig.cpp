#include "BridgeConfig.hpp"

#include "SimpleIni.h"

namespace dbridge {
namespace {
int64_t parseInteger(const char* section, const char* key, const char* value) {
  try {
    size_t pos;
    int64_t parsed = stoll(value, &pos);
    if (pos != strlen(value)) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw std::runtime_error(string("Invalid integer for ") + section + "/" +
                             key + ": " + value);
  }
}

double parseDouble(const char* section, const char* key, const char* value) {
  try {
    size_t pos;
    double parsed = stod(value, &pos);
    if (pos != strlen(value)) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw std::runtime_error(string("Invalid number for ") + section + "/" +
                             key + ": " + value);
  }
}
}  // namespace

BridgeConfig::BridgeConfig()
    : host(DEFAULT_BRIDGE_HOST),
      port(DEFAULT_BRIDGE_PORT),
      path(DEFAULT_BRIDGE_PATH),
      clientId(genRandomAlphaNum(16)),
      connectTimeoutMs(10 * 1000),
      requestTimeoutMs(30 * 1000),
      maxReconnectAttempts(5),
      initialBackoffMs(1000),
      backoffMultiplier(2.0),
      maxBackoffMs(30 * 1000),
      verbose(0),
      maxLogSize("20971520") {}

void BridgeConfig::loadFromFile(const string& filename) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + filename);
  }
  const char* value;

  if ((value = ini.GetValue("Networking", "host", NULL))) {
    host = value;
  }
  if ((value = ini.GetValue("Networking", "port", NULL))) {
    port = int(parseInteger("Networking", "port", value));
  }
  if ((value = ini.GetValue("Networking", "path", NULL))) {
    path = value;
  }
  if ((value = ini.GetValue("Networking", "token", NULL))) {
    authToken = value;
  }
  if ((value = ini.GetValue("Networking", "client_id", NULL))) {
    clientId = value;
  }

  if ((value = ini.GetValue("Timeouts", "connect_timeout_ms", NULL))) {
    connectTimeoutMs = parseInteger("Timeouts", "connect_timeout_ms", value);
  }
  if ((value = ini.GetValue("Timeouts", "request_timeout_ms", NULL))) {
    requestTimeoutMs = parseInteger("Timeouts", "request_timeout_ms", value);
  }

  if ((value = ini.GetValue("Reconnect", "max_attempts", NULL))) {
    maxReconnectAttempts =
        int(parseInteger("Reconnect", "max_attempts", value));
  }
  if ((value = ini.GetValue("Reconnect", "initial_backoff_ms", NULL))) {
    initialBackoffMs = parseInteger("Reconnect", "initial_backoff_ms", value);
  }
  if ((value = ini.GetValue("Reconnect", "multiplier", NULL))) {
    backoffMultiplier = parseDouble("Reconnect", "multiplier", value);
  }
  if ((value = ini.GetValue("Reconnect", "max_backoff_ms", NULL))) {
    maxBackoffMs = parseInteger("Reconnect", "max_backoff_ms", value);
  }

  if ((value = ini.GetValue("Debug", "verbose", NULL))) {
    verbose = int(parseInteger("Debug", "verbose", value));
  }
  if ((value = ini.GetValue("Debug", "logsize", NULL))) {
    // make sure maxLogSize is a string of int value
    maxLogSize = to_string(parseInteger("Debug", "logsize", value));
  }
  LOG(INFO) << "Loaded bridge config from " << filename;
}

void BridgeConfig::validate() const {
  if (host.empty()) {
    throw std::runtime_error("Bridge host must not be empty");
  }
  if (port <= 0 || port > 65535) {
    throw std::runtime_error("Invalid bridge port: " + to_string(port));
  }
  if (path.empty() || path[0] != '/') {
    throw std::runtime_error("Bridge path must start with '/': " + path);
  }
  if (clientId.empty()) {
    throw std::runtime_error("Client id must not be empty");
  }
  if (connectTimeoutMs <= 0) {
    throw std::runtime_error("connect_timeout_ms must be positive");
  }
  if (requestTimeoutMs <= 0) {
    throw std::runtime_error("request_timeout_ms must be positive");
  }
  if (maxReconnectAttempts < 0) {
    throw std::runtime_error("max_attempts must not be negative");
  }
  if (initialBackoffMs <= 0) {
    throw std::runtime_error("initial_backoff_ms must be positive");
  }
  if (backoffMultiplier < 1.0) {
    throw std::runtime_error("multiplier must be at least 1");
  }
  if (maxBackoffMs < initialBackoffMs) {
    throw std::runtime_error(
        "max_backoff_ms must not be smaller than initial_backoff_ms");
  }
  if (verbose < 0 || verbose > 9) {
    throw std::runtime_error("verbose must be between 0 and 9");
  }
}
}  // namespace dbridge
