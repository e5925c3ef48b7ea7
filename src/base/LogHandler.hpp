#ifndef __DBRIDGE_LOG_HANDLER__
#define __DBRIDGE_LOG_HANDLER__

#include "Headers.hpp"

namespace dbridge {
/**
 * @brief Configures easylogging++ for the bridge client and its tools.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points the configuration at a fresh log file under @p path.
   * @param defaultConf Base easylogging configuration that will be mutated.
   * @param logToStdout Mirror every log line on stdout as well.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStdout = false, bool appendPid = false,
                            string maxlogsize = "20971520");

  /**
   * @brief Applies @p conf to the default logger, sets the verbosity level
   * and installs log rotation.
   */
  static void apply(const el::Configurations &conf, int verbosity);

  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the "stdout" logger so it writes bare messages, used
   * for user facing output.
   */
  static void setupStdoutLogger();

 private:
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace dbridge
#endif  // __DBRIDGE_LOG_HANDLER__
