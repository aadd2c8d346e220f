#include "EventSubscription.hpp"

#include "IpcClient.hpp"
#include "JsonLib.hpp"

namespace swayipc {
EventSubscription::EventSubscription(shared_ptr<SocketHandler> _socketHandler,
                                     const SocketEndpoint& endpoint,
                                     const vector<uint32_t>& _eventTypes)
    : transport(_socketHandler, endpoint),
      eventTypes(_eventTypes),
      finished(false),
      subscribed(false) {}

void EventSubscription::subscribe() {
  if (subscribed.exchange(true)) {
    throw std::runtime_error("EventSubscription::subscribe() called twice");
  }
  try {
    string payload = buildSubscribePayload(eventTypes);
    LOG(INFO) << "Subscribing to " << payload << " on "
              << transport.getEndpoint();
    transport.sendFrame(SUBSCRIBE, payload);
    Frame ack = transport.receiveFrame();
    if (ack.getType() != SUBSCRIBE) {
      throw ProtocolError("Expected a SUBSCRIBE reply, got " +
                          messageTypeName(ack.getType()));
    }
    if (!IpcClient::replySucceeded(ack.getPayload())) {
      throw SubscriptionError("Subscription to " + payload +
                              " was rejected: " + ack.getPayload());
    }
  } catch (const IpcError&) {
    finished = true;
    throw;
  }
  VLOG(1) << "Subscription acknowledged";
}

void EventSubscription::checkSubscribed() {
  if (!subscribed) {
    throw std::runtime_error("EventSubscription::next() before subscribe()");
  }
  if (finished) {
    throw ConnectionClosedError("Event stream has already ended");
  }
}

EventSubscription::~EventSubscription() { close(); }

string EventSubscription::buildSubscribePayload(
    const vector<uint32_t>& eventTypes) {
  json names = json::array();
  for (uint32_t type : eventTypes) {
    auto name = eventSubscriptionName(type);
    if (!name) {
      throw EncodingError("Cannot subscribe to " + messageTypeName(type) +
                          ": no subscription name is known for it");
    }
    names.push_back(*name);
  }
  return names.dump();
}

bool EventSubscription::covers(uint32_t type) const {
  return std::find(eventTypes.begin(), eventTypes.end(), type) !=
         eventTypes.end();
}

EventRecord EventSubscription::next() {
  checkSubscribed();
  try {
    return toEventRecord(transport.receiveFrame());
  } catch (const TimeoutError&) {
    throw;
  } catch (const IpcError&) {
    finished = true;
    throw;
  }
}

EventRecord EventSubscription::next(std::chrono::milliseconds timeout) {
  checkSubscribed();
  try {
    return toEventRecord(transport.receiveFrame(timeout));
  } catch (const TimeoutError&) {
    throw;
  } catch (const IpcError&) {
    finished = true;
    throw;
  }
}

EventRecord EventSubscription::toEventRecord(const Frame& frame) {
  if (!frame.isEvent()) {
    throw ProtocolError("Got non-event frame " +
                        messageTypeName(frame.getType()) +
                        " on a subscription");
  }
  return EventRecord(frame);
}

void EventSubscription::interrupt() { transport.interrupt(); }

void EventSubscription::close() {
  finished = true;
  transport.close();
}
}  // namespace swayipc
