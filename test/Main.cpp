#define CATCH_CONFIG_RUNNER

#include <cstring>

#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace dbridge;

int main(int argc, char **argv) {
  bool listOnly = false;
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--list-tests") == 0 || strcmp(argv[i], "-l") == 0) {
      listOnly = true;
      break;
    }
  }

  // Setup easylogging configurations
  el::Configurations defaultConf =
      dbridge::LogHandler::setupLogHandler(&argc, &argv);
  dbridge::LogHandler::setupStdoutLogger();

  dbridge::HandleTerminate();

  if (sodium_init() == -1) {
    STFATAL << "libsodium init failed";
  }

  string logDirectoryPattern =
      GetTempDirectory() + string("dbridge_test_XXXXXXXX");
  string logDirectory = string(mkdtemp(&logDirectoryPattern[0]));
  if (!listOnly) {
    CLOG(INFO, "stdout") << "Writing log to " << logDirectory << endl;
  }
  dbridge::LogHandler::setupLogFiles(&defaultConf, logDirectory, "log", false,
                                     true);
  // Raise to 9 when chasing a failure
  dbridge::LogHandler::apply(defaultConf, 1);
  el::Helpers::setThreadName("test-main");

  int result = Catch::Session().run(argc, argv);

  el::Helpers::uninstallPreRollOutCallback();
  fs::remove_all(logDirectory);
  return result;
}
