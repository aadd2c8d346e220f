#ifndef __SWAYIPC_FRAME__
#define __SWAYIPC_FRAME__

#include "Headers.hpp"
#include "MessageType.hpp"

namespace swayipc {
/**
 * @brief One complete protocol message: a raw message type and its payload.
 *
 * The payload is opaque here.  By convention it is UTF-8 JSON, except for
 * RUN_COMMAND and SEND_TICK requests which carry plain text.
 */
class Frame {
 public:
  Frame() : type(0) {}
  Frame(uint32_t _type, const string& _payload)
      : type(_type), payload(_payload) {}

  uint32_t getType() const { return type; }
  const string& getPayload() const { return payload; }
  bool isEvent() const { return isEventType(type); }

  /** @brief Size of the frame on the wire, header included. */
  size_t length() const { return IPC_HEADER_SIZE + payload.length(); }

  bool operator==(const Frame& other) const {
    return type == other.type && payload == other.payload;
  }
  bool operator!=(const Frame& other) const { return !(*this == other); }

 protected:
  uint32_t type;
  string payload;
};

/**
 * @brief A frame received on a subscription connection.
 */
class EventRecord {
 public:
  EventRecord() : type(0) {}
  EventRecord(uint32_t _type, const string& _body) : type(_type), body(_body) {}
  explicit EventRecord(const Frame& frame)
      : type(frame.getType()), body(frame.getPayload()) {}

  uint32_t getType() const { return type; }
  const string& getBody() const { return body; }

 protected:
  uint32_t type;
  string body;
};

inline ostream& operator<<(ostream& os, const Frame& frame) {
  return os << messageTypeName(frame.getType()) << " ("
            << frame.getPayload().length() << " bytes)";
}
}  // namespace swayipc

#endif  // __SWAYIPC_FRAME__
