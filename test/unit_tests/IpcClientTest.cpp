#include "IpcClient.hpp"
#include "SocketPairHandler.hpp"
#include "TestHeaders.hpp"

using namespace swayipc;

namespace {
SocketPath fakeSocketPath() {
  SocketPath socketPath;
  socketPath.setPathOverride("/fake/sway.sock");
  return socketPath;
}

// Reads one request from `peer` and answers it with `reply`.
thread answerOnce(int peer, uint32_t expectedType, const string& reply,
                  Frame* received) {
  return thread([peer, expectedType, reply, received]() {
    *received = readFrame(peer);
    writeFrame(peer, expectedType, reply);
  });
}
}  // namespace

TEST_CASE("Reply success is the AND of every success field", "[IpcClient]") {
  REQUIRE(IpcClient::replySucceeded("[{\"success\":true}]"));
  REQUIRE(IpcClient::replySucceeded("{\"success\":true}"));
  REQUIRE(IpcClient::replySucceeded(
      "[{\"success\":true},{\"success\":true}]"));
  REQUIRE_FALSE(IpcClient::replySucceeded(
      "[{\"success\":true},{\"success\":false,\"error\":\"Unknown "
      "command\"}]"));
  REQUIRE_FALSE(IpcClient::replySucceeded("{\"success\":false}"));

  SECTION("Replies without success fields count as success") {
    REQUIRE(IpcClient::replySucceeded("[]"));
    REQUIRE(IpcClient::replySucceeded("[\"mark1\",\"mark2\"]"));
    REQUIRE(IpcClient::replySucceeded("{\"human_readable\":\"sway 1.9\"}"));
    REQUIRE(IpcClient::replySucceeded(""));
    REQUIRE(IpcClient::replySucceeded("not json"));
  }
}

TEST_CASE("IpcClient runs a command", "[IpcClient]") {
  auto handler = make_shared<SocketPairHandler>();
  int peer = handler->queueConnection();
  IpcClient client(handler, fakeSocketPath());

  Frame received;
  thread server =
      answerOnce(peer, RUN_COMMAND, "[{\"success\":true}]", &received);
  Frame reply = client.call(RUN_COMMAND, "floating toggle");
  server.join();

  REQUIRE(received == Frame(RUN_COMMAND, "floating toggle"));
  REQUIRE(reply == Frame(RUN_COMMAND, "[{\"success\":true}]"));
  ::close(peer);
}

TEST_CASE("IpcClient typed requests", "[IpcClient]") {
  auto handler = make_shared<SocketPairHandler>();
  int peer = handler->queueConnection();
  IpcClient client(handler, fakeSocketPath());
  Frame received;

  SECTION("Successful command") {
    thread server =
        answerOnce(peer, RUN_COMMAND, "[{\"success\":true}]", &received);
    IpcReply reply = client.runCommand("workspace 2");
    server.join();
    REQUIRE(reply.success);
    REQUIRE(reply.payload == "[{\"success\":true}]");
    REQUIRE(received.getPayload() == "workspace 2");
  }

  SECTION("Failed command") {
    string failure =
        "[{\"success\":false,\"parse_error\":true,\"error\":\"Unknown/invalid "
        "command 'bogus'\"}]";
    thread server = answerOnce(peer, RUN_COMMAND, failure, &received);
    IpcReply reply = client.runCommand("bogus");
    server.join();
    REQUIRE_FALSE(reply.success);
    REQUIRE(reply.payload == failure);
  }

  SECTION("Queries send an empty payload") {
    thread server = answerOnce(peer, GET_TREE, "{\"id\":1}", &received);
    IpcReply reply = client.getTree();
    server.join();
    REQUIRE(received == Frame(GET_TREE, ""));
    REQUIRE(reply.success);
    REQUIRE(reply.payload == "{\"id\":1}");
  }

  SECTION("Bar config takes an optional bar id") {
    thread server = answerOnce(peer, GET_BAR_CONFIG, "{\"id\":\"bar-0\"}",
                               &received);
    client.getBarConfig("bar-0");
    server.join();
    REQUIRE(received == Frame(GET_BAR_CONFIG, "bar-0"));
  }

  SECTION("Ticks carry their payload") {
    thread server =
        answerOnce(peer, SEND_TICK, "{\"success\":true}", &received);
    REQUIRE(client.sendTick("hello").success);
    server.join();
    REQUIRE(received == Frame(SEND_TICK, "hello"));
  }

  SECTION("One connection serves many requests") {
    thread server([peer]() {
      ReceiveBuffer buffer;
      for (int i = 0; i < 3; i++) {
        Frame request = readFrame(peer, &buffer);
        writeFrame(peer, request.getType(), "[]");
      }
    });
    client.getWorkspaces();
    client.getOutputs();
    client.getSeats();
    server.join();
    REQUIRE(handler->getConnectAttempts() == 1);
  }

  ::close(peer);
}

TEST_CASE("IpcClient refuses to send subscriptions and events",
          "[IpcClient]") {
  auto handler = make_shared<SocketPairHandler>();
  IpcClient client(handler, fakeSocketPath());
  REQUIRE_THROWS_AS(client.call(SUBSCRIBE, "[\"window\"]"), EncodingError);
  REQUIRE_THROWS_AS(client.call(EVENT_WINDOW, ""), EncodingError);
  // Nothing was sent, so no connection was made.
  REQUIRE(handler->getConnectAttempts() == 0);
}

TEST_CASE("IpcClient reconnects after losing its connection",
          "[IpcClient]") {
  auto handler = make_shared<SocketPairHandler>();
  int firstPeer = handler->queueConnection();
  IpcClient client(handler, fakeSocketPath());

  Frame received;
  thread server = answerOnce(firstPeer, GET_VERSION, "{}", &received);
  client.getVersion();
  server.join();
  ::close(firstPeer);

  REQUIRE_THROWS_AS(client.getVersion(), IpcError);

  int secondPeer = handler->queueConnection();
  server = answerOnce(secondPeer, GET_VERSION, "{\"major\":1}", &received);
  IpcReply reply = client.getVersion();
  server.join();
  REQUIRE(reply.payload == "{\"major\":1}");
  REQUIRE(handler->getConnectAttempts() == 2);
  ::close(secondPeer);
}

TEST_CASE("IpcClient surfaces connect failures", "[IpcClient]") {
  auto handler = make_shared<SocketPairHandler>();
  IpcClient client(handler, fakeSocketPath());
  REQUIRE_THROWS_AS(client.getTree(), ConnectionError);
}

TEST_CASE("IpcClient call timeout", "[IpcClient]") {
  auto handler = make_shared<SocketPairHandler>();
  int peer = handler->queueConnection();
  IpcClient client(handler, fakeSocketPath());
  REQUIRE_THROWS_AS(
      client.call(GET_TREE, "", std::chrono::milliseconds(50)), TimeoutError);
  // The connection is dropped so a late reply can't be mistaken for the
  // answer to the next request.
  REQUIRE(handler->getActiveSockets().empty());
  ::close(peer);
}

TEST_CASE("IpcClient interrupt", "[IpcClient]") {
  auto handler = make_shared<SocketPairHandler>();
  int peer = handler->queueConnection();
  IpcClient client(handler, fakeSocketPath());

  SECTION("Releases a call waiting on its reply") {
    atomic<bool> closedSeen(false);
    thread caller([&client, &closedSeen]() {
      try {
        client.runCommand("exec true");
      } catch (const ConnectionClosedError&) {
        closedSeen = true;
      }
    });
    // Once the request has arrived the caller is waiting on the reply.
    REQUIRE(readFrame(peer) == Frame(RUN_COMMAND, "exec true"));
    client.interrupt();
    caller.join();
    REQUIRE(closedSeen);
    REQUIRE(handler->getActiveSockets().empty());
  }

  SECTION("Later calls fail until disconnect()") {
    client.interrupt();
    REQUIRE_THROWS_AS(client.getVersion(), ConnectionClosedError);
    // Nothing was sent, so no connection was made.
    REQUIRE(handler->getConnectAttempts() == 0);

    client.disconnect();
    Frame received;
    thread server = answerOnce(peer, GET_VERSION, "{\"major\":1}", &received);
    REQUIRE(client.getVersion().payload == "{\"major\":1}");
    server.join();
    REQUIRE(handler->getConnectAttempts() == 1);
  }

  ::close(peer);
}
