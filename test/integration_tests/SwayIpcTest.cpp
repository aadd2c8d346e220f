#include "EventDispatcher.hpp"
#include "EventSubscription.hpp"
#include "FakeWindowManager.hpp"
#include "IpcClient.hpp"
#include "TestHeaders.hpp"
#include "UnixSocketHandler.hpp"

using namespace swayipc;

namespace {
const std::chrono::milliseconds WAIT_TIMEOUT(5000);

SocketPath socketPathFor(const FakeWindowManager& windowManager) {
  SocketPath socketPath;
  socketPath.setPathOverride(windowManager.getPath());
  return socketPath;
}
}  // namespace

TEST_CASE("Requests over a Unix socket", "[SwayIpc]") {
  FakeWindowManager windowManager;
  shared_ptr<SocketHandler> socketHandler(new UnixSocketHandler());
  IpcClient client(socketHandler, socketPathFor(windowManager));

  SECTION("A command reply is returned unmodified") {
    Frame reply = client.call(RUN_COMMAND, "floating toggle");
    REQUIRE(reply == Frame(RUN_COMMAND, "[{\"success\":true}]"));
    REQUIRE(windowManager.getCommands() ==
            vector<string>({"floating toggle"}));
  }

  SECTION("Failures are reported") {
    IpcReply reply = client.runCommand("bogus");
    REQUIRE_FALSE(reply.success);
  }

  SECTION("Several requests share one connection") {
    REQUIRE(client.getVersion().payload.find("fake 1.0") != string::npos);
    REQUIRE(client.getWorkspaces().payload == "[]");
    REQUIRE(client.runCommand("reload").success);
    REQUIRE(socketHandler->getActiveSockets().size() == 1);
  }

  client.disconnect();
  REQUIRE(socketHandler->getActiveSockets().empty());
}

TEST_CASE("Connecting to a missing socket", "[SwayIpc]") {
  shared_ptr<SocketHandler> socketHandler(new UnixSocketHandler());
  SocketPath socketPath;
  socketPath.setPathOverride(GetTempDirectory() +
                             "swayipc_missing_dir/sway-ipc.sock");
  IpcClient client(socketHandler, socketPath);
  REQUIRE_THROWS_AS(client.getTree(), ConnectionError);
  REQUIRE_THROWS_AS(
      EventSubscription(socketHandler, socketPath, {EVENT_WINDOW}),
      ConnectionError);
}

TEST_CASE("Socket path from the environment", "[SwayIpc]") {
  FakeWindowManager windowManager;
  const char* previous = ::getenv(SWAY_SOCKET_ENV);
  optional<string> saved;
  if (previous != NULL) {
    saved = string(previous);
  }
  ::setenv(SWAY_SOCKET_ENV, windowManager.getPath().c_str(), 1);

  shared_ptr<SocketHandler> socketHandler(new UnixSocketHandler());
  IpcClient client(socketHandler, SocketPath());
  REQUIRE(client.runCommand("exec true").success);

  if (saved) {
    ::setenv(SWAY_SOCKET_ENV, saved->c_str(), 1);
  } else {
    ::unsetenv(SWAY_SOCKET_ENV);
  }
}

TEST_CASE("Subscription ended by the server", "[SwayIpc]") {
  FakeWindowManager windowManager;
  shared_ptr<SocketHandler> socketHandler(new UnixSocketHandler());
  EventSubscription subscription(socketHandler, windowManager.getEndpoint(),
                                 {EVENT_WORKSPACE, EVENT_SHUTDOWN});
  subscription.subscribe();
  REQUIRE(windowManager.waitForSubscribers(1, WAIT_TIMEOUT));
  REQUIRE(windowManager.getSubscribePayloads() ==
          vector<string>({"[\"workspace\",\"shutdown\"]"}));

  windowManager.broadcast(EVENT_WORKSPACE, "{\"change\":\"focus\"}");
  windowManager.broadcast(EVENT_SHUTDOWN, "{\"change\":\"exit\"}");
  windowManager.closeSubscribers();

  EventRecord first = subscription.next(WAIT_TIMEOUT);
  REQUIRE(first.getType() == EVENT_WORKSPACE);
  EventRecord second = subscription.next(WAIT_TIMEOUT);
  REQUIRE(second.getType() == EVENT_SHUTDOWN);
  REQUIRE(second.getBody() == "{\"change\":\"exit\"}");
  REQUIRE_THROWS_AS(subscription.next(WAIT_TIMEOUT), ConnectionClosedError);
  REQUIRE_THROWS_AS(subscription.next(WAIT_TIMEOUT), ConnectionClosedError);
}

TEST_CASE("Dispatcher reacting to focus changes", "[SwayIpc]") {
  FakeWindowManager windowManager;
  shared_ptr<SocketHandler> socketHandler(new UnixSocketHandler());
  EventDispatcher dispatcher(socketHandler, socketPathFor(windowManager));

  atomic<int> focusEvents(0);
  dispatcher.registerCommandHandler(
      EVENT_WINDOW, "focus",
      [&focusEvents](const EventRecord&) -> optional<string> {
        focusEvents++;
        return string("[tiling] opacity 0.8; [con_id=12] opacity 1");
      });
  dispatcher.startAsync();
  REQUIRE(windowManager.waitForSubscribers(1, WAIT_TIMEOUT));
  REQUIRE(windowManager.getSubscribePayloads() ==
          vector<string>({"[\"window\"]"}));

  SECTION("Commands go over a second connection") {
    windowManager.broadcast(EVENT_WINDOW,
                            "{\"change\":\"focus\",\"container\":{\"id\":12}}");
    REQUIRE(windowManager.waitForCommands(1, WAIT_TIMEOUT));
    REQUIRE(windowManager.getCommands() ==
            vector<string>({"[tiling] opacity 0.8; [con_id=12] opacity 1"}));
    dispatcher.stop();
    REQUIRE_NOTHROW(dispatcher.join());
    REQUIRE(focusEvents == 1);
  }

  SECTION("The server closing mid-subscription ends the loop") {
    windowManager.broadcast(EVENT_WINDOW, "{\"change\":\"title\"}");
    windowManager.closeSubscribers();
    REQUIRE_THROWS_AS(dispatcher.join(), ConnectionClosedError);
    REQUIRE(dispatcher.getState() == EventDispatcher::STOPPED);
    REQUIRE(focusEvents == 0);
  }
}
