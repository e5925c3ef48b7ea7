#ifndef __DBRIDGE_HEADERS__
#define __DBRIDGE_HEADERS__

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <google/protobuf/message_lite.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <paths.h>
#include <pthread.h>
#include <resolv.h>
#include <signal.h>
#include <sodium.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "DeviceBridge.pb.h"
#include "easylogging++.h"

using namespace std;
namespace fs = std::filesystem;

// The bridge handshake version supported by this binary
static const int PROTOCOL_VERSION = 1;

// Default remote control endpoint
const string DEFAULT_BRIDGE_HOST = "localhost";
const int DEFAULT_BRIDGE_PORT = 3001;
const string DEFAULT_BRIDGE_PATH = "/";

#define STFATAL LOG(FATAL) << "Fatal: "

#define STERROR LOG(ERROR) << "Error: "

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << errno << "): " << strerror(errno);

// On BSD/OSX we can get EINVAL if the remote side has closed the connection
// before we have initialized it.
#define FATAL_FAIL_UNLESS_EINVAL(X)     \
  if (((X) == -1) && errno != EINVAL)   \
    STFATAL << "Error: (" << errno << "): " << strerror(errno);

#ifndef DBRIDGE_VERSION
#define DBRIDGE_VERSION "unknown"
#endif

namespace dbridge {
inline bool waitOnSocketData(int fd, int64_t timeoutMs = 1000) {
  fd_set fdset;
  FD_ZERO(&fdset);
  FD_SET(fd, &fdset);
  timeval tv;
  tv.tv_sec = timeoutMs / 1000;
  tv.tv_usec = (timeoutMs % 1000) * 1000;
  VLOG(4) << "Before selecting sockFd";
  if (select(fd + 1, &fdset, NULL, NULL, &tv) == -1) {
    if (errno == EINTR) {
      return false;
    }
    // Most likely the descriptor was closed by another thread.
    throw std::runtime_error(string("select failed: ") + strerror(errno));
  }
  return FD_ISSET(fd, &fdset);
}

inline string genRandomAlphaNum(int len) {
  static const char alphanum[] =
      "0123456789"
      "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
      "abcdefghijklmnopqrstuvwxyz";
  string s(len, '\0');

  for (int i = 0; i < len; ++i) {
    s[i] = alphanum[randombytes_uniform(sizeof(alphanum) - 1)];
  }

  return s;
}

inline int64_t millisecondsSinceEpoch() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}

inline void InterruptSignalHandler(int signum) {
  STERROR << "Got interrupt";
  CLOG(INFO, "stdout") << endl
                       << "Got interrupt (perhaps ctrl+c?).  Exiting." << endl;
  ::exit(signum);
}
}  // namespace dbridge

#endif  // __DBRIDGE_HEADERS__
