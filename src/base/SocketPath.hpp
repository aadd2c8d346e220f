#ifndef __SWAYIPC_SOCKET_PATH__
#define __SWAYIPC_SOCKET_PATH__

#include "Headers.hpp"
#include "SocketEndpoint.hpp"

namespace swayipc {

/**
 * A helper class to find the window manager's IPC socket.
 *
 * The path is taken from, in order:
 * - an explicit override (\ref setPathOverride), typically a command line
 *   flag;
 * - the SWAYSOCK environment variable, then I3SOCK;
 * - the first socket matching sway's naming pattern
 *   `sway-ipc.<uid>.<pid>.sock` in $XDG_RUNTIME_DIR, or in /run/user/<uid>
 *   when XDG_RUNTIME_DIR is unset or relative.
 *
 * Resolution never fails on its own: the caller decides what to do when
 * nothing is found, which lets connect time (not startup) report the error.
 */
class SocketPath {
 public:
  SocketPath();

  /**
   * Overrides the socket path to a user-specified location. Note that this
   * disables the auto-detection behavior.
   */
  void setPathOverride(const string& path);

  /** @brief Returns the endpoint to connect to, or nullopt if none resolves. */
  optional<SocketEndpoint> resolve() const;

  /**
   * @brief Same as \ref resolve but throws ConnectionError when no path can
   * be found.
   */
  SocketEndpoint resolveOrThrow() const;

  /** @brief Directory searched for sway's default socket name. */
  static string getRuntimeDirectory();

 private:
  /** @brief User-overridden path that bypasses auto-detection. */
  optional<string> pathOverride;
};

}  // namespace swayipc

#endif  // __SWAYIPC_SOCKET_PATH__
