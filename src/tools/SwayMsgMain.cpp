#include <cxxopts.hpp>

#include "EventDispatcher.hpp"
#include "Headers.hpp"
#include "IpcClient.hpp"
#include "JsonLib.hpp"
#include "LogHandler.hpp"
#include "SocketPath.hpp"
#include "UnixSocketHandler.hpp"

using namespace swayipc;

namespace {
const int EXIT_IPC_ERROR = 1;
const int EXIT_REQUEST_FAILED = 2;

void handleParseException(std::exception& e, cxxopts::Options& options) {
  CLOG(INFO, "stdout") << "Exception: " << e.what() << "\n" << endl;
  CLOG(INFO, "stdout") << options.help({}) << endl;
  exit(EXIT_IPC_ERROR);
}

string formatPayload(const string& payload, bool raw) {
  if (raw) {
    return payload;
  }
  json parsed = json::parse(payload, nullptr, false);
  if (parsed.is_discarded()) {
    return payload;
  }
  return parsed.dump(2);
}

// Accepts either a JSON array of names or a space separated list.
vector<uint32_t> parseEventNames(const string& payload) {
  vector<string> names;
  if (!payload.empty() && payload[0] == '[') {
    json parsed = json::parse(payload);
    for (const auto& name : parsed) {
      names.push_back(name.get<string>());
    }
  } else {
    for (const auto& name : split(payload, ' ')) {
      if (!name.empty()) {
        names.push_back(name);
      }
    }
  }

  vector<uint32_t> types;
  for (const auto& name : names) {
    auto type = eventTypeFromSubscriptionName(name);
    if (!type) {
      throw EncodingError("Unknown event type: " + name);
    }
    types.push_back(*type);
  }
  return types;
}

int monitor(shared_ptr<SocketHandler> socketHandler,
            const SocketPath& socketPath, const string& payload, bool raw) {
  vector<uint32_t> types = parseEventNames(payload);
  if (types.empty()) {
    throw EncodingError("Monitor mode needs at least one event type");
  }

  EventDispatcher dispatcher(socketHandler, socketPath);
  dispatcher.setEventTypes(types);
  for (uint32_t type : types) {
    dispatcher.registerHandler(type, [raw](const EventRecord& record) {
      CLOG(INFO, "stdout") << formatPayload(record.getBody(), raw) << endl;
    });
  }
  try {
    dispatcher.start();
  } catch (const ConnectionClosedError& err) {
    LOG(INFO) << "Window manager closed the connection: " << err.what();
  }
  return 0;
}

int sendRequest(shared_ptr<SocketHandler> socketHandler,
                const SocketPath& socketPath, const string& typeName,
                const string& payload, bool raw, bool quiet) {
  auto type = requestTypeFromName(typeName);
  if (!type) {
    throw EncodingError("Unknown message type: " + typeName);
  }
  if (*type == SUBSCRIBE) {
    throw EncodingError("Use -m/--monitor to subscribe to events");
  }

  IpcClient client(socketHandler, socketPath);
  IpcReply reply = client.request(*type, payload);
  if (!quiet) {
    CLOG(INFO, "stdout") << formatPayload(reply.payload, raw) << endl;
  }
  return reply.success ? 0 : EXIT_REQUEST_FAILED;
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  swayipc::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, swayipc::InterruptSignalHandler);

  cxxopts::Options options("swayipc-msg",
                           "Send messages to sway/i3 and watch its events");
  try {
    options.positional_help("[payload...]");
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("s,socket", "Path of the IPC socket (default: $SWAYSOCK)",
         cxxopts::value<std::string>())  //
        ("t,type", "Message type, e.g. command, get_tree, tick",
         cxxopts::value<std::string>()->default_value("command"))  //
        ("m,monitor",
         "Subscribe to the event types given as payload and print events "
         "until the connection closes")  //
        ("r,raw", "Print payloads as received, without pretty-printing")  //
        ("q,quiet", "Don't print the reply")                              //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"))  //
        ("logdir", "Also write logs to files in this directory",
         cxxopts::value<std::string>())  //
        ("payload", "Payload", cxxopts::value<std::vector<std::string>>());
    options.parse_positional({"payload"});

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "swayipc-msg version " SWAYIPC_VERSION << endl;
      exit(0);
    }

    LogHandler::setVerbosity(result["verbose"].as<int>());
    if (result.count("logdir")) {
      LogHandler::setupLogFiles(&defaultConf,
                                result["logdir"].as<std::string>(),
                                "swayipc-msg");
    }
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);

    string payload;
    if (result.count("payload")) {
      for (const auto& word :
           result["payload"].as<std::vector<std::string>>()) {
        if (!payload.empty()) {
          payload += " ";
        }
        payload += word;
      }
    }

    shared_ptr<SocketHandler> socketHandler(new UnixSocketHandler());
    try {
      SocketPath socketPath;
      if (result.count("socket")) {
        socketPath.setPathOverride(result["socket"].as<std::string>());
      }
      if (result.count("monitor")) {
        return monitor(socketHandler, socketPath, payload, result.count("raw"));
      }
      return sendRequest(socketHandler, socketPath,
                         result["type"].as<std::string>(), payload,
                         result.count("raw"), result.count("quiet"));
    } catch (const IpcError& err) {
      CLOG(INFO, "stdout") << "Error: " << err.what() << endl;
      return EXIT_IPC_ERROR;
    } catch (const json::exception& err) {
      CLOG(INFO, "stdout") << "Error: invalid event list: " << err.what()
                           << endl;
      return EXIT_IPC_ERROR;
    }
  } catch (cxxopts::exceptions::exception& oe) {
    handleParseException(oe, options);
  }
  return 0;
}
