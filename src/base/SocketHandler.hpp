#ifndef __SWAYIPC_SOCKET_HANDLER__
#define __SWAYIPC_SOCKET_HANDLER__

#include "Headers.hpp"
#include "IpcErrors.hpp"
#include "SocketEndpoint.hpp"

namespace swayipc {
/**
 * @brief Provides an abstract API for socket reads/writes and lifecycle
 * management.
 */
class SocketHandler {
 public:
  /** @brief Ensures derived handlers can clean up platform-specific resources.
   */
  virtual ~SocketHandler() {}

  /**
   * @brief Blocks until fd becomes readable or the timeout expires.
   * @return true when data (or EOF) is ready to be read.
   */
  virtual bool waitForData(int fd, int64_t sec, int64_t usec) = 0;
  /**
   * @brief Reads up to count bytes from fd.
   */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /**
   * @brief Writes up to count bytes to fd.
   */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Attempts to write all bytes, throwing IoError if the operation
   * times out or fails.
   * @param timeout Whether to give up after the transfer stalls for too long.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count, bool timeout);

  /**
   * @brief Opens a connection to the specified endpoint.
   * @return File descriptor representing the socket, or -1 with errno set.
   */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Shuts down both directions of fd so that blocked readers wake up
   * with EOF.  The descriptor stays allocated until close().
   */
  virtual void shutdown(int fd) = 0;
  /** @brief Closes the supplied socket descriptor. */
  virtual void close(int fd) = 0;
  /** @brief Returns all currently active (read/write) sockets. */
  virtual vector<int> getActiveSockets() = 0;
};
}  // namespace swayipc

#endif  // __SWAYIPC_SOCKET_HANDLER__
