#include "IpcClient.hpp"

#include "JsonLib.hpp"

namespace swayipc {
IpcClient::IpcClient(shared_ptr<SocketHandler> _socketHandler,
                     const SocketPath& _socketPath)
    : socketHandler(_socketHandler),
      socketPath(_socketPath),
      interrupted(false) {}

IpcClient::~IpcClient() { disconnect(); }

Frame IpcClient::call(uint32_t type, const string& payload) {
  lock_guard<mutex> guard(clientMutex);
  return callLocked(type, payload, std::nullopt);
}

Frame IpcClient::call(uint32_t type, const string& payload,
                      std::chrono::milliseconds timeout) {
  lock_guard<mutex> guard(clientMutex);
  return callLocked(type, payload, timeout);
}

Frame IpcClient::callLocked(
    uint32_t type, const string& payload,
    const optional<std::chrono::milliseconds>& timeout) {
  if (isEventType(type)) {
    throw EncodingError("Cannot send event type " + messageTypeName(type) +
                        " as a request");
  }
  if (type == SUBSCRIBE) {
    // The server would switch this connection to push mode.
    throw EncodingError("SUBSCRIBE needs its own connection, use "
                        "EventSubscription");
  }
  {
    lock_guard<mutex> guard(interruptMutex);
    if (interrupted) {
      throw ConnectionClosedError("Client was interrupted");
    }
  }
  if (!transport) {
    unique_ptr<IpcTransport> connected(
        new IpcTransport(socketHandler, socketPath.resolveOrThrow()));
    lock_guard<mutex> guard(interruptMutex);
    if (interrupted) {
      throw ConnectionClosedError("Client was interrupted while connecting");
    }
    transport = std::move(connected);
  }
  try {
    transport->sendFrame(type, payload);
    Frame reply =
        timeout ? transport->receiveFrame(*timeout) : transport->receiveFrame();
    VLOG(2) << messageTypeName(type) << " answered with " << reply;
    return reply;
  } catch (const IpcError& err) {
    LOG(INFO) << "Dropping connection after failed " << messageTypeName(type)
              << ": " << err.what();
    lock_guard<mutex> guard(interruptMutex);
    transport.reset();
    throw;
  }
}

IpcReply IpcClient::request(uint32_t type, const string& payload) {
  Frame reply = call(type, payload);
  IpcReply result;
  result.payload = reply.getPayload();
  result.success = replySucceeded(result.payload);
  if (!result.success) {
    LOG(INFO) << messageTypeName(type) << " reported failure: "
              << result.payload;
  }
  return result;
}

void IpcClient::disconnect() {
  lock_guard<mutex> guard(clientMutex);
  lock_guard<mutex> interruptGuard(interruptMutex);
  transport.reset();
  interrupted = false;
}

void IpcClient::interrupt() {
  lock_guard<mutex> guard(interruptMutex);
  interrupted = true;
  if (transport) {
    transport->interrupt();
  }
}

bool IpcClient::replySucceeded(const string& payload) {
  json reply = json::parse(payload, nullptr, false);
  if (reply.is_discarded()) {
    return true;
  }
  auto objectSucceeded = [](const json& object) {
    if (!object.is_object()) {
      return true;
    }
    auto it = object.find("success");
    return it == object.end() || !it->is_boolean() || it->get<bool>();
  };
  if (reply.is_array()) {
    for (const auto& element : reply) {
      if (!objectSucceeded(element)) {
        return false;
      }
    }
    return true;
  }
  return objectSucceeded(reply);
}
}  // namespace swayipc
