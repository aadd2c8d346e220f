#include "EventDispatcher.hpp"

#include "JsonLib.hpp"

namespace swayipc {
EventDispatcher::EventDispatcher(shared_ptr<SocketHandler> _socketHandler,
                                 const SocketPath& _socketPath)
    : socketHandler(_socketHandler),
      socketPath(_socketPath),
      commandClient(_socketHandler, _socketPath),
      state(IDLE),
      stopRequested(false),
      nextHandlerId(1) {}

EventDispatcher::~EventDispatcher() {
  stop();
  if (loopThread && loopThread->joinable()) {
    loopThread->join();
  }
  if (loopError) {
    try {
      std::rethrow_exception(loopError);
    } catch (const std::exception& err) {
      LOG(INFO) << "Dispatcher destroyed after its loop failed: "
                << err.what();
    }
  }
}

int EventDispatcher::registerHandler(uint32_t eventType, const string& change,
                                     EventCallback callback) {
  return addRegistration(
      eventType, change,
      [callback](const EventRecord& record) -> optional<string> {
        callback(record);
        return std::nullopt;
      });
}

int EventDispatcher::registerCommandHandler(uint32_t eventType,
                                            const string& change,
                                            CommandCallback callback) {
  return addRegistration(eventType, change, callback);
}

int EventDispatcher::addRegistration(uint32_t eventType, const string& change,
                                     CommandCallback callback) {
  if (!isEventType(eventType)) {
    throw std::runtime_error("Handlers can only be registered for events, not " +
                             messageTypeName(eventType));
  }
  int id;
  {
    lock_guard<recursive_mutex> guard(handlerMutex);
    id = nextHandlerId++;
    handlers.push_back(HandlerRegistration{id, eventType, change, callback});
  }
  VLOG(1) << "Registered handler " << id << " for "
          << messageTypeName(eventType) << "/"
          << (change == ANY_CHANGE ? "*" : change);

  {
    lock_guard<mutex> guard(loopMutex);
    if (subscription && !subscription->covers(eventType)) {
      LOG(WARNING) << "Handler " << id << " is registered for "
                   << messageTypeName(eventType)
                   << " which the running subscription does not include";
    }
  }
  return id;
}

bool EventDispatcher::removeHandler(int id) {
  lock_guard<recursive_mutex> guard(handlerMutex);
  for (auto it = handlers.begin(); it != handlers.end(); ++it) {
    if (it->id == id) {
      handlers.erase(it);
      return true;
    }
  }
  return false;
}

void EventDispatcher::setErrorHandler(HandlerErrorCallback callback) {
  lock_guard<recursive_mutex> guard(handlerMutex);
  errorHandler = callback;
}

void EventDispatcher::setEventTypes(const vector<uint32_t>& types) {
  lock_guard<recursive_mutex> guard(handlerMutex);
  eventTypes = types;
}

vector<uint32_t> EventDispatcher::getSubscribedEventTypes() {
  lock_guard<recursive_mutex> guard(handlerMutex);
  if (eventTypes) {
    return *eventTypes;
  }
  vector<uint32_t> types;
  for (uint32_t type : allEventTypes()) {
    for (const auto& handler : handlers) {
      if (handler.eventType == type) {
        types.push_back(type);
        break;
      }
    }
  }
  for (const auto& handler : handlers) {
    if (!eventSubscriptionName(handler.eventType)) {
      LOG(WARNING) << "Cannot subscribe to "
                   << messageTypeName(handler.eventType) << " for handler "
                   << handler.id;
    }
  }
  if (types.empty()) {
    types = allEventTypes();
  }
  return types;
}

optional<string> EventDispatcher::extractChange(const string& body) {
  json event = json::parse(body, nullptr, false);
  if (event.is_discarded() || !event.is_object()) {
    return std::nullopt;
  }
  auto it = event.find("change");
  if (it == event.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<string>();
}

void EventDispatcher::dispatch(const EventRecord& record) {
  optional<string> change = extractChange(record.getBody());
  vector<HandlerRegistration> snapshot;
  {
    lock_guard<recursive_mutex> guard(handlerMutex);
    snapshot = handlers;
  }
  VLOG(2) << "Dispatching " << messageTypeName(record.getType()) << "/"
          << change.value_or("-");

  for (const auto& handler : snapshot) {
    if (!handler.matches(record.getType(), change)) {
      continue;
    }
    try {
      optional<string> command = handler.callback(record);
      if (command && !command->empty()) {
        VLOG(1) << "Handler " << handler.id << " requested: " << *command;
        IpcReply reply;
        try {
          reply = commandClient.runCommand(*command);
        } catch (const IpcError& err) {
          if (stopRequested) {
            LOG(INFO) << "Dropped command from handler " << handler.id
                      << " on stop: " << err.what();
            return;
          }
          throw;
        }
        if (!reply.success) {
          LOG(WARNING) << "Command from handler " << handler.id
                       << " failed: " << reply.payload;
        }
      }
    } catch (const std::exception& err) {
      LOG(ERROR) << "Handler " << handler.id << " failed on "
                 << messageTypeName(record.getType()) << ": " << err.what();
      reportHandlerError(record, err.what());
    } catch (...) {
      LOG(ERROR) << "Handler " << handler.id << " failed on "
                 << messageTypeName(record.getType())
                 << " with a non-standard exception";
      reportHandlerError(record, "unknown exception");
    }
  }
}

void EventDispatcher::reportHandlerError(const EventRecord& record,
                                         const string& error) {
  HandlerErrorCallback callback;
  {
    lock_guard<recursive_mutex> guard(handlerMutex);
    callback = errorHandler;
  }
  if (!callback) {
    return;
  }
  try {
    callback(record, error);
  } catch (const std::exception& err) {
    LOG(ERROR) << "Handler error callback failed: " << err.what();
  }
}

void EventDispatcher::transitionToRunning() {
  State expected = IDLE;
  if (!state.compare_exchange_strong(expected, RUNNING)) {
    throw std::runtime_error("EventDispatcher can only be started once");
  }
}

void EventDispatcher::start() {
  transitionToRunning();
  runUntilStopped();
}

void EventDispatcher::startAsync() {
  transitionToRunning();
  loopThread.reset(new std::thread([this]() {
    el::Helpers::setThreadName("EventDispatcher");
    try {
      runUntilStopped();
    } catch (const std::exception& err) {
      LOG(INFO) << "Dispatcher loop ended: " << err.what();
      lock_guard<mutex> guard(loopMutex);
      loopError = std::current_exception();
    }
  }));
}

void EventDispatcher::join() {
  if (loopThread && loopThread->joinable()) {
    loopThread->join();
  }
  std::exception_ptr error;
  {
    lock_guard<mutex> guard(loopMutex);
    error = loopError;
    loopError = nullptr;
  }
  if (error) {
    std::rethrow_exception(error);
  }
}

void EventDispatcher::runUntilStopped() {
  auto finish = [this]() {
    state = STOPPED;
    lock_guard<mutex> guard(loopMutex);
    if (subscription) {
      subscription->close();
      subscription.reset();
    }
  };
  try {
    runLoop();
  } catch (...) {
    finish();
    throw;
  }
  finish();
}

void EventDispatcher::runLoop() {
  if (stopRequested) {
    return;
  }
  auto sub = make_shared<EventSubscription>(socketHandler, socketPath,
                                            getSubscribedEventTypes());
  {
    lock_guard<mutex> guard(loopMutex);
    subscription = sub;
  }
  // stop() may have run before the subscription was visible to it.
  if (stopRequested) {
    return;
  }
  try {
    sub->subscribe();
  } catch (const IpcError& err) {
    if (stopRequested) {
      LOG(INFO) << "Dispatcher stopped while subscribing: " << err.what();
      return;
    }
    throw;
  }
  LOG(INFO) << "Dispatching events";

  while (true) {
    EventRecord record;
    try {
      record = sub->next();
    } catch (const IpcError& err) {
      if (stopRequested) {
        LOG(INFO) << "Dispatcher stopped";
        return;
      }
      LOG(WARNING) << "Event stream ended: " << err.what();
      throw;
    }
    dispatch(record);
    if (stopRequested) {
      LOG(INFO) << "Dispatcher stopped by a handler";
      return;
    }
  }
}

void EventDispatcher::stop() {
  stopRequested = true;
  State expected = IDLE;
  if (state.compare_exchange_strong(expected, STOPPED)) {
    return;
  }
  {
    lock_guard<mutex> guard(loopMutex);
    if (subscription) {
      subscription->interrupt();
    }
  }
  // A handler's command may be waiting on its reply.
  commandClient.interrupt();
}
}  // namespace swayipc
