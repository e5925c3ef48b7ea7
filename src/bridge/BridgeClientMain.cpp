#include <cxxopts.hpp>

#include "BridgeClient.hpp"
#include "BridgeConfig.hpp"
#include "Headers.hpp"
#include "LogHandler.hpp"

using namespace dbridge;

namespace {
std::atomic<bool> keepWatching(true);

void stopWatching(int) { keepWatching = false; }

void handleParseException(std::exception& e, cxxopts::Options& options) {
  CLOG(INFO, "stdout") << "Exception: " << e.what() << "\n" << endl;
  CLOG(INFO, "stdout") << options.help({}) << endl;
  exit(1);
}

void requireArgs(const vector<string>& args, size_t count,
                 const string& usage) {
  if (args.size() < count) {
    CLOG(INFO, "stdout") << "Usage: dbridge [OPTION...] " << usage << endl;
    exit(1);
  }
}

void printJson(const json& j) { CLOG(INFO, "stdout") << j.dump(2) << endl; }

int runAction(BridgeClient& client, const string& action,
              const vector<string>& args) {
  if (action == "devices") {
    printJson(client.discoverDevices());
  } else if (action == "exec") {
    requireArgs(args, 3, "exec <deviceId> <platform> <command>");
    json session = client.createTerminalSession(args[0], args[1]);
    string sessionId = session.value("id", string());
    if (sessionId.empty()) {
      throw ProtocolError("Terminal session has no id: " + session.dump());
    }
    printJson(client.executeTerminalCommand(sessionId, args[2]));
    client.closeTerminalSession(sessionId);
  } else if (action == "history") {
    requireArgs(args, 1, "history <sessionId>");
    printJson(client.getTerminalHistory(args[0]));
  } else if (action == "sessions") {
    printJson(client.listTerminalSessions());
  } else if (action == "permissions") {
    requireArgs(args, 1, "permissions <deviceId> [appId]");
    printJson(client.listPermissions(args[0], args.size() > 1 ? args[1] : ""));
  } else if (action == "watch") {
    requireArgs(args, 1, "watch <kind>");
    MessageKind kind;
    if (!parseMessageKind(args[0], &kind)) {
      CLOG(INFO, "stdout") << "Unknown message kind: " << args[0] << endl;
      return 1;
    }
    client.subscribe(kind, [](const BroadcastMessage& message) {
      json j = {{"type", messageKindToString(message.kind) + ":" +
                             message.event},
                {"data", message.data}};
      CLOG(INFO, "stdout") << j.dump() << endl;
    });
    client.onError([](const BridgeError& error) {
      CLOG(INFO, "stdout") << "Bridge error: " << error.what() << endl;
      if (dynamic_cast<const ExhaustedRetriesError*>(&error)) {
        keepWatching = false;
      }
    });
    client.connect();
    ::signal(SIGINT, stopWatching);
    while (keepWatching) {
      usleep(100 * 1000);
    }
  } else {
    CLOG(INFO, "stdout") << "Unknown action: " << action << endl;
    return 1;
  }
  return 0;
}
}  // namespace

int main(int argc, char** argv) {
  string tmpDir = GetTempDirectory();

  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  dbridge::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, dbridge::InterruptSignalHandler);

  cxxopts::Options options("dbridge", "Command line client for a device bridge");
  int exitCode = 0;
  try {
    options.positional_help("<action> [args...]");
    options.custom_help(
        "[OPTION...] <action> [args...]\n\n"
        "  Actions: devices, exec <deviceId> <platform> <command>,\n"
        "  sessions, history <sessionId>, permissions <deviceId> [appId],\n"
        "  watch <kind>");

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("host", "Bridge host name", cxxopts::value<std::string>())  //
        ("p,port", "Bridge port", cxxopts::value<int>())             //
        ("path", "Bridge endpoint path", cxxopts::value<std::string>())  //
        ("token", "Token presented during the handshake",
         cxxopts::value<std::string>())  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("timeout", "Request timeout in milliseconds",
         cxxopts::value<int64_t>())  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>())  //
        ("l,logdir", "Base directory for log files.",
         cxxopts::value<std::string>()->default_value(tmpDir))  //
        ("logtostdout", "Write log to stdout")                  //
        ("action", "Action to run", cxxopts::value<std::string>())  //
        ("args", "Action arguments",
         cxxopts::value<std::vector<std::string>>());

    options.parse_positional({"action", "args"});
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }

    if (result.count("version")) {
      CLOG(INFO, "stdout") << "dbridge version " << DBRIDGE_VERSION << endl;
      exit(0);
    }

    if (!result.count("action")) {
      CLOG(INFO, "stdout") << "Missing action" << endl;
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(1);
    }

    BridgeConfig config;
    string cfgfilename = result["cfgfile"].as<string>();
    if (!cfgfilename.empty()) {
      config.loadFromFile(cfgfilename);
    }
    // Command line flags win over the config file
    if (result.count("host")) {
      config.host = result["host"].as<string>();
    }
    if (result.count("port")) {
      config.port = result["port"].as<int>();
    }
    if (result.count("path")) {
      config.path = result["path"].as<string>();
    }
    if (result.count("token")) {
      config.authToken = result["token"].as<string>();
    }
    if (result.count("timeout")) {
      config.requestTimeoutMs = result["timeout"].as<int64_t>();
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    config.validate();

    LogHandler::setupLogFiles(&defaultConf, result["logdir"].as<string>(),
                              "dbridge", result.count("logtostdout"), true,
                              config.maxLogSize);
    LogHandler::apply(defaultConf, config.verbose);
    el::Helpers::setThreadName("dbridge-main");

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    vector<string> args;
    if (result.count("args")) {
      args = result["args"].as<vector<string>>();
    }

    BridgeClient client(config);
    try {
      exitCode = runAction(client, result["action"].as<string>(), args);
    } catch (const BridgeError& be) {
      LOG(ERROR) << "Action failed: " << be.what();
      CLOG(INFO, "stdout") << "Error: " << be.what() << endl;
      exitCode = 1;
    }
    client.disconnect();
  } catch (cxxopts::exceptions::exception& oe) {
    handleParseException(oe, options);
  } catch (std::runtime_error& re) {
    CLOG(INFO, "stdout") << "Error: " << re.what() << endl;
    exitCode = 1;
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  google::protobuf::ShutdownProtobufLibrary();

  return exitCode;
}
