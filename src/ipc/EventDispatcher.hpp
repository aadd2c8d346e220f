#ifndef __SWAYIPC_EVENT_DISPATCHER__
#define __SWAYIPC_EVENT_DISPATCHER__

#include "EventSubscription.hpp"
#include "Frame.hpp"
#include "Headers.hpp"
#include "IpcClient.hpp"
#include "SocketHandler.hpp"
#include "SocketPath.hpp"

namespace swayipc {
/** @brief Matches every change type of an event category. */
const string ANY_CHANGE = "";

/** @brief Handler that only observes events. */
typedef std::function<void(const EventRecord&)> EventCallback;
/**
 * @brief Handler that may answer an event with a command, which the
 * dispatcher runs through its own request/reply connection.
 */
typedef std::function<optional<string>(const EventRecord&)> CommandCallback;
/** @brief Receives the failures of handlers (after they've been logged). */
typedef std::function<void(const EventRecord&, const string&)>
    HandlerErrorCallback;

/**
 * @brief Routes events from a subscription to registered handlers.
 *
 * Handlers are matched on (event type, change), where change is the
 * "change" field of the event body ("new", "focus", ...).  Every matching
 * handler runs, in registration order, on the dispatch thread; the next event
 * is only read once they are all done.
 *
 * A handler that throws is logged and reported to the error callback, and
 * the loop goes on with the remaining handlers and events.  Errors of the
 * subscription itself end the loop and are rethrown from start() (or
 * join() when running with startAsync()).
 *
 * The dispatcher goes from IDLE to RUNNING once, and ends in STOPPED.
 */
class EventDispatcher {
 public:
  enum State { IDLE, RUNNING, STOPPED };

  EventDispatcher(shared_ptr<SocketHandler> _socketHandler,
                  const SocketPath& _socketPath);
  virtual ~EventDispatcher();

  /**
   * @brief Adds a handler for `eventType` events whose change is `change`,
   * or any change for ANY_CHANGE.  May be called while running.
   * @return Id that can be passed to removeHandler().
   */
  int registerHandler(uint32_t eventType, const string& change,
                      EventCallback callback);

  int registerHandler(uint32_t eventType, EventCallback callback) {
    return registerHandler(eventType, ANY_CHANGE, callback);
  }

  /** @brief Like registerHandler(), for handlers that return a command. */
  int registerCommandHandler(uint32_t eventType, const string& change,
                             CommandCallback callback);

  /**
   * @brief Removes a handler.  A dispatch already in progress still runs it.
   * @return false if no handler has that id.
   */
  bool removeHandler(int id);

  void setErrorHandler(HandlerErrorCallback callback);

  /**
   * @brief Subscribes to exactly these event types instead of the ones the
   * handlers are registered for.  Only effective before start().
   */
  void setEventTypes(const vector<uint32_t>& types);

  /** @brief Runs every handler matching the event. */
  void dispatch(const EventRecord& record);

  /**
   * @brief Subscribes and dispatches events on the calling thread until the
   * stream ends or stop() is called.
   * @throws the subscription's error, unless it was caused by stop().
   */
  void start();

  /** @brief Runs the same loop as start() on a new thread. */
  void startAsync();

  /**
   * @brief Waits for the thread started by startAsync() and rethrows the
   * error that ended it, if any.
   */
  void join();

  /**
   * @brief Ends the loop.  Safe from any thread, including from a handler.
   * Shuts down the subscription (even mid-handshake) and the connection
   * used for handler commands, so no blocked read outlives it.
   */
  void stop();

  inline State getState() { return state; }

  /** @brief The event types start() subscribes to. */
  vector<uint32_t> getSubscribedEventTypes();

  /** @brief Reads the "change" field of an event body, if it has one. */
  static optional<string> extractChange(const string& body);

 protected:
  struct HandlerRegistration {
    int id;
    uint32_t eventType;
    string change;
    CommandCallback callback;

    bool matches(uint32_t type, const optional<string>& eventChange) const {
      if (type != eventType) {
        return false;
      }
      if (change == ANY_CHANGE) {
        return true;
      }
      return eventChange && *eventChange == change;
    }
  };

  int addRegistration(uint32_t eventType, const string& change,
                      CommandCallback callback);
  void transitionToRunning();
  void runUntilStopped();
  void runLoop();
  void reportHandlerError(const EventRecord& record, const string& error);

  /** @brief Socket API used for the subscription. */
  shared_ptr<SocketHandler> socketHandler;
  /** @brief Where the subscription connects to. */
  SocketPath socketPath;
  /** @brief Separate connection for commands returned by handlers. */
  IpcClient commandClient;

  atomic<State> state;
  atomic<bool> stopRequested;

  /** @brief Guards handlers, nextHandlerId, eventTypes, errorHandler. */
  recursive_mutex handlerMutex;
  vector<HandlerRegistration> handlers;
  int nextHandlerId;
  optional<vector<uint32_t>> eventTypes;
  HandlerErrorCallback errorHandler;

  /** @brief Guards subscription and loopError. */
  mutex loopMutex;
  shared_ptr<EventSubscription> subscription;
  shared_ptr<std::thread> loopThread;
  std::exception_ptr loopError;
};
}  // namespace swayipc

#endif  // __SWAYIPC_EVENT_DISPATCHER__
