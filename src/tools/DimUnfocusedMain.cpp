#include <cxxopts.hpp>

#include "EventDispatcher.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"
#include "LogHandler.hpp"
#include "SocketPath.hpp"
#include "UnixSocketHandler.hpp"

using namespace swayipc;

namespace {
// Dims every tiled window, then brings the focused one back to full opacity.
optional<string> dimCommandForFocus(const EventRecord& record,
                                    const string& opacity) {
  json event = json::parse(record.getBody());
  auto id = event.at("container").at("id").get<int64_t>();
  return "[tiling] opacity " + opacity + "; [con_id=" + to_string(id) +
         "] opacity 1";
}
}  // namespace

int main(int argc, char** argv) {
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  swayipc::HandleTerminate();
  ::signal(SIGINT, swayipc::InterruptSignalHandler);

  cxxopts::Options options("swayipc-dim-unfocused",
                           "Lower the opacity of every unfocused window");
  try {
    options.add_options()         //
        ("h,help", "Print help")  //
        ("s,socket", "Path of the IPC socket (default: $SWAYSOCK)",
         cxxopts::value<std::string>())  //
        ("o,opacity", "Opacity of unfocused windows",
         cxxopts::value<double>()->default_value("0.75"))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"))  //
        ("logdir", "Also write logs to files in this directory",
         cxxopts::value<std::string>());

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }

    double opacityValue = result["opacity"].as<double>();
    if (opacityValue < 0.0 || opacityValue > 1.0) {
      CLOG(INFO, "stdout") << "Opacity must be between 0 and 1" << endl;
      exit(1);
    }
    std::ostringstream opacityStream;
    opacityStream << opacityValue;
    string opacity = opacityStream.str();

    LogHandler::setVerbosity(result["verbose"].as<int>());
    if (result.count("logdir")) {
      LogHandler::setupLogFiles(&defaultConf,
                                result["logdir"].as<std::string>(),
                                "swayipc-dim-unfocused");
    }
    el::Loggers::reconfigureLogger("default", defaultConf);

    shared_ptr<SocketHandler> socketHandler(new UnixSocketHandler());
    try {
      SocketPath socketPath;
      if (result.count("socket")) {
        socketPath.setPathOverride(result["socket"].as<std::string>());
      }
      EventDispatcher dispatcher(socketHandler, socketPath);
      dispatcher.registerCommandHandler(
          EVENT_WINDOW, "focus", [opacity](const EventRecord& record) {
            return dimCommandForFocus(record, opacity);
          });
      dispatcher.registerHandler(
          EVENT_SHUTDOWN, [&dispatcher](const EventRecord&) {
            LOG(INFO) << "Window manager is exiting";
            dispatcher.stop();
          });
      dispatcher.start();
    } catch (const IpcError& err) {
      CLOG(INFO, "stdout") << "Error: " << err.what() << endl;
      return 1;
    }
  } catch (cxxopts::exceptions::exception& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }
  return 0;
}
