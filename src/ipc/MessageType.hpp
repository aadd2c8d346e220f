#ifndef __SWAYIPC_MESSAGE_TYPE__
#define __SWAYIPC_MESSAGE_TYPE__

#include "Headers.hpp"

namespace swayipc {
/** @brief High bit that marks a message type as an event. */
const uint32_t EVENT_FLAG = 0x80000000;

/**
 * @brief Message types understood by sway and i3.
 *
 * Frames carry the type as a raw 32-bit value so that types added by newer
 * window managers survive a decode/encode cycle; these names only cover the
 * ones we know about.
 */
enum MessageType : uint32_t {
  RUN_COMMAND = 0,
  GET_WORKSPACES = 1,
  SUBSCRIBE = 2,
  GET_OUTPUTS = 3,
  GET_TREE = 4,
  GET_MARKS = 5,
  GET_BAR_CONFIG = 6,
  GET_VERSION = 7,
  GET_BINDING_MODES = 8,
  GET_CONFIG = 9,
  SEND_TICK = 10,
  SYNC = 11,
  GET_BINDING_STATE = 12,
  GET_INPUTS = 100,
  GET_SEATS = 101,

  EVENT_WORKSPACE = EVENT_FLAG | 0,
  EVENT_MODE = EVENT_FLAG | 2,
  EVENT_WINDOW = EVENT_FLAG | 3,
  EVENT_BARCONFIG_UPDATE = EVENT_FLAG | 4,
  EVENT_BINDING = EVENT_FLAG | 5,
  EVENT_SHUTDOWN = EVENT_FLAG | 6,
  EVENT_TICK = EVENT_FLAG | 7,
  EVENT_BAR_STATE_UPDATE = EVENT_FLAG | 0x14,
  EVENT_INPUT = EVENT_FLAG | 0x15,
};

inline bool isEventType(uint32_t type) { return (type & EVENT_FLAG) != 0; }

/**
 * @brief Returns the canonical name ("GET_TREE", "EVENT_WINDOW"), or
 * "UNKNOWN(0x...)" for types we don't know.
 */
string messageTypeName(uint32_t type);

/**
 * @brief Parses a request type name, case-insensitively and with or without
 * its verb ("tree", "get_tree", "GET_TREE", "command").  Event types are not
 * accepted since they can't be sent.
 */
optional<uint32_t> requestTypeFromName(const string& name);

/**
 * @brief Name used for the event in a SUBSCRIBE payload ("window",
 * "barconfig_update").  nullopt for request types and unknown events.
 */
optional<string> eventSubscriptionName(uint32_t type);

/** @brief Inverse of \ref eventSubscriptionName. */
optional<uint32_t> eventTypeFromSubscriptionName(const string& name);

/** @brief Every event type we can subscribe to, in protocol order. */
vector<uint32_t> allEventTypes();
}  // namespace swayipc

#endif  // __SWAYIPC_MESSAGE_TYPE__
