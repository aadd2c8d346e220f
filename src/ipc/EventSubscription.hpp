#ifndef __SWAYIPC_EVENT_SUBSCRIPTION__
#define __SWAYIPC_EVENT_SUBSCRIPTION__

#include "Frame.hpp"
#include "Headers.hpp"
#include "IpcTransport.hpp"
#include "SocketHandler.hpp"
#include "SocketPath.hpp"

namespace swayipc {
/**
 * @brief A connection switched into push mode by SUBSCRIBE.
 *
 * The constructor opens a dedicated connection; subscribe() sends SUBSCRIBE
 * and checks the acknowledgement.  The two are separate so another thread
 * can interrupt() a handshake the server never answers.  After that, next()
 * hands out one event per call for as long as the connection lives.  The stream cannot be restarted: once the
 * connection has closed, every call to next() throws ConnectionClosedError.
 */
class EventSubscription {
 public:
  /** @throws ConnectionError if the socket can't be reached. */
  EventSubscription(shared_ptr<SocketHandler> _socketHandler,
                    const SocketEndpoint& endpoint,
                    const vector<uint32_t>& _eventTypes);

  EventSubscription(shared_ptr<SocketHandler> _socketHandler,
                    const SocketPath& socketPath,
                    const vector<uint32_t>& _eventTypes)
      : EventSubscription(_socketHandler, socketPath.resolveOrThrow(),
                          _eventTypes) {}

  virtual ~EventSubscription();

  /**
   * @brief Sends SUBSCRIBE and waits for the acknowledgement.  Call once.
   * @throws EncodingError for event types that have no subscription name,
   * SubscriptionError if the server refuses, ProtocolError if the reply is
   * not a SUBSCRIBE reply, ConnectionClosedError if interrupted.
   */
  void subscribe();

  /**
   * @brief Blocks until the next event arrives.
   * @throws ConnectionClosedError when the stream has ended, ProtocolError
   * if a non-event frame shows up, IoError on a failed read.
   */
  EventRecord next();

  /** @brief Same as next(), but throws TimeoutError after `timeout`. */
  EventRecord next(std::chrono::milliseconds timeout);

  /** @brief Releases a next() blocked on another thread. */
  void interrupt();

  /** @brief Ends the stream and closes the connection. */
  void close();

  inline bool isFinished() { return finished; }

  inline const vector<uint32_t>& getEventTypes() const { return eventTypes; }

  /** @brief Whether events of `type` were asked for. */
  bool covers(uint32_t type) const;

  /** @brief JSON array of subscription names, as sent to the server. */
  static string buildSubscribePayload(const vector<uint32_t>& eventTypes);

 protected:
  EventRecord toEventRecord(const Frame& frame);
  void checkSubscribed();

  /** @brief Dedicated push-mode connection. */
  IpcTransport transport;
  /** @brief Event types this stream was subscribed to. */
  vector<uint32_t> eventTypes;
  /** @brief Set once the stream has ended for good. */
  atomic<bool> finished;
  /** @brief Set once subscribe() has been called. */
  atomic<bool> subscribed;
};
}  // namespace swayipc

#endif  // __SWAYIPC_EVENT_SUBSCRIPTION__
