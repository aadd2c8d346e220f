#ifndef __SWAYIPC_SOCKET_ENDPOINT__
#define __SWAYIPC_SOCKET_ENDPOINT__

#include "Headers.hpp"

namespace swayipc {
/**
 * @brief Filesystem path of a Unix domain socket the window manager listens
 * on.
 */
class SocketEndpoint {
 public:
  SocketEndpoint() : name("") {}

  explicit SocketEndpoint(const string &_name) : name(_name) {}

  const string &getName() const { return name; }

  bool empty() const { return name.empty(); }

 protected:
  string name;
};

inline ostream &operator<<(ostream &os, const SocketEndpoint &self) {
  return os << self.getName(), os;
}
}  // namespace swayipc

#endif  // __SWAYIPC_SOCKET_ENDPOINT__
