#include "MessageType.hpp"

namespace swayipc {
namespace {
struct RequestTypeInfo {
  uint32_t type;
  const char* name;
};

struct EventTypeInfo {
  uint32_t type;
  const char* name;
  const char* subscriptionName;
};

const RequestTypeInfo REQUEST_TYPES[] = {
    {RUN_COMMAND, "RUN_COMMAND"},
    {GET_WORKSPACES, "GET_WORKSPACES"},
    {SUBSCRIBE, "SUBSCRIBE"},
    {GET_OUTPUTS, "GET_OUTPUTS"},
    {GET_TREE, "GET_TREE"},
    {GET_MARKS, "GET_MARKS"},
    {GET_BAR_CONFIG, "GET_BAR_CONFIG"},
    {GET_VERSION, "GET_VERSION"},
    {GET_BINDING_MODES, "GET_BINDING_MODES"},
    {GET_CONFIG, "GET_CONFIG"},
    {SEND_TICK, "SEND_TICK"},
    {SYNC, "SYNC"},
    {GET_BINDING_STATE, "GET_BINDING_STATE"},
    {GET_INPUTS, "GET_INPUTS"},
    {GET_SEATS, "GET_SEATS"},
};

const EventTypeInfo EVENT_TYPES[] = {
    {EVENT_WORKSPACE, "EVENT_WORKSPACE", "workspace"},
    {EVENT_MODE, "EVENT_MODE", "mode"},
    {EVENT_WINDOW, "EVENT_WINDOW", "window"},
    {EVENT_BARCONFIG_UPDATE, "EVENT_BARCONFIG_UPDATE", "barconfig_update"},
    {EVENT_BINDING, "EVENT_BINDING", "binding"},
    {EVENT_SHUTDOWN, "EVENT_SHUTDOWN", "shutdown"},
    {EVENT_TICK, "EVENT_TICK", "tick"},
    {EVENT_BAR_STATE_UPDATE, "EVENT_BAR_STATE_UPDATE", "bar_state_update"},
    {EVENT_INPUT, "EVENT_INPUT", "input"},
};

string toUpper(string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}
}  // namespace

string messageTypeName(uint32_t type) {
  for (const auto& info : REQUEST_TYPES) {
    if (info.type == type) {
      return info.name;
    }
  }
  for (const auto& info : EVENT_TYPES) {
    if (info.type == type) {
      return info.name;
    }
  }
  std::ostringstream ss;
  ss << "UNKNOWN(0x" << std::hex << type << ")";
  return ss.str();
}

optional<uint32_t> requestTypeFromName(const string& name) {
  string upper = toUpper(name);
  for (const auto& info : REQUEST_TYPES) {
    string candidate(info.name);
    if (upper == candidate) {
      return info.type;
    }
    // Also accept the short forms swaymsg uses: "tree", "command", "tick".
    for (const char* verb : {"GET_", "RUN_", "SEND_"}) {
      string prefix(verb);
      if (candidate.rfind(prefix, 0) == 0 &&
          upper == candidate.substr(prefix.length())) {
        return info.type;
      }
    }
  }
  return std::nullopt;
}

optional<string> eventSubscriptionName(uint32_t type) {
  for (const auto& info : EVENT_TYPES) {
    if (info.type == type) {
      return string(info.subscriptionName);
    }
  }
  return std::nullopt;
}

optional<uint32_t> eventTypeFromSubscriptionName(const string& name) {
  for (const auto& info : EVENT_TYPES) {
    if (name == info.subscriptionName) {
      return info.type;
    }
  }
  return std::nullopt;
}

vector<uint32_t> allEventTypes() {
  vector<uint32_t> types;
  for (const auto& info : EVENT_TYPES) {
    types.push_back(info.type);
  }
  return types;
}
}  // namespace swayipc
