#ifndef __SWAYIPC_IPC_CLIENT__
#define __SWAYIPC_IPC_CLIENT__

#include "Frame.hpp"
#include "Headers.hpp"
#include "IpcTransport.hpp"
#include "SocketHandler.hpp"
#include "SocketPath.hpp"

namespace swayipc {
/**
 * @brief Outcome of a request: the raw reply payload and whether the window
 * manager reported success.
 */
struct IpcReply {
  bool success;
  string payload;
};

/**
 * @brief Request/reply client.
 *
 * Each call sends one request and blocks for exactly one reply on a
 * connection that is never used for subscriptions.  The connection is opened
 * on the first call and reused; if a call fails on the transport level it is
 * dropped and the next call reconnects.  Calls are serialized, so one client
 * may be shared between threads.
 */
class IpcClient {
 public:
  IpcClient(shared_ptr<SocketHandler> _socketHandler,
            const SocketPath& _socketPath);
  virtual ~IpcClient();

  /**
   * @brief Sends a request and returns the reply frame unmodified.
   *
   * The reply type is not checked against the request type.
   */
  Frame call(uint32_t type, const string& payload = "");

  /**
   * @brief Same as \ref call with a receive deadline.
   * @throws TimeoutError, after which the connection is dropped since the
   * late reply would otherwise be taken for the answer to the next request.
   */
  Frame call(uint32_t type, const string& payload,
             std::chrono::milliseconds timeout);

  /** @brief Runs one or more commands separated by ',' or ';'. */
  IpcReply runCommand(const string& command) {
    return request(RUN_COMMAND, command);
  }
  IpcReply getWorkspaces() { return request(GET_WORKSPACES); }
  IpcReply getOutputs() { return request(GET_OUTPUTS); }
  IpcReply getTree() { return request(GET_TREE); }
  IpcReply getMarks() { return request(GET_MARKS); }
  /** @brief Lists bar ids, or the config of one bar when `barId` is set. */
  IpcReply getBarConfig(const string& barId = "") {
    return request(GET_BAR_CONFIG, barId);
  }
  IpcReply getVersion() { return request(GET_VERSION); }
  IpcReply getBindingModes() { return request(GET_BINDING_MODES); }
  IpcReply getConfig() { return request(GET_CONFIG); }
  /** @brief Sends a tick to every client subscribed to tick events. */
  IpcReply sendTick(const string& payload = "") {
    return request(SEND_TICK, payload);
  }
  IpcReply sync() { return request(SYNC); }
  IpcReply getBindingState() { return request(GET_BINDING_STATE); }
  IpcReply getInputs() { return request(GET_INPUTS); }
  IpcReply getSeats() { return request(GET_SEATS); }

  /** @brief Sends `type` and evaluates the reply's success fields. */
  IpcReply request(uint32_t type, const string& payload = "");

  /**
   * @brief Closes the cached connection, if any, and clears a previous
   * interrupt().
   */
  void disconnect();

  /**
   * @brief Releases a call blocked on another thread; it throws
   * ConnectionClosedError.  Later calls fail the same way until
   * disconnect() is called.
   */
  void interrupt();

  /**
   * @brief Evaluates a JSON reply: false if any top-level "success" field
   * (of the reply object, or of each object in a reply array) is false.
   * Replies without such fields, or that aren't JSON, count as successful.
   */
  static bool replySucceeded(const string& payload);

 protected:
  Frame callLocked(uint32_t type, const string& payload,
                   const optional<std::chrono::milliseconds>& timeout);

  /** @brief Socket API handed to every transport we open. */
  shared_ptr<SocketHandler> socketHandler;
  /** @brief Resolved at connect time so a missing socket fails late. */
  SocketPath socketPath;
  /** @brief Cached request/reply connection, null until the first call. */
  unique_ptr<IpcTransport> transport;
  /** @brief Serializes calls on the shared connection. */
  mutex clientMutex;
  /**
   * @brief Guards swapping `transport` and `interrupted`, so interrupt()
   * never waits for a call in progress.
   */
  mutex interruptMutex;
  bool interrupted;
};
}  // namespace swayipc

#endif  // __SWAYIPC_IPC_CLIENT__
