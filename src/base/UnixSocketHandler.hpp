#ifndef __SWAYIPC_UNIX_SOCKET_HANDLER__
#define __SWAYIPC_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace swayipc {
/**
 * @brief Default SocketHandler implementation using POSIX AF_UNIX stream
 * sockets with mutex guards.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  UnixSocketHandler();
  virtual ~UnixSocketHandler() {}

  /**
   * @brief Blocks with select() until the fd becomes readable.
   */
  virtual bool waitForData(int fd, int64_t sec, int64_t usec);
  /** @brief Reads up to `count` bytes while holding the per-socket mutex. */
  virtual ssize_t read(int fd, void* buf, size_t count);
  /** @brief Writes `count` bytes by retrying until completion or timeout. */
  virtual ssize_t write(int fd, const void* buf, size_t count);
  /**
   * @brief Connects to the socket file named by the endpoint.
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /** @brief Shuts down a tracked descriptor without releasing it. */
  virtual void shutdown(int fd);
  /** @brief Closes the descriptor and removes it from the tracked set. */
  virtual void close(int fd);
  /** @brief Returns all actively tracked sockets. */
  virtual vector<int> getActiveSockets();

 protected:
  /**
   * @brief Ensures that a descriptor is tracked and has its own mutex.
   */
  void addToActiveSockets(int fd);
  /**
   * @brief Returns the mutex guarding `fd`, or null if it isn't tracked.
   */
  shared_ptr<recursive_mutex> lookupSocketMutex(int fd, const char* operation);
  /**
   * @brief Performs per-socket initialization (non-blocking, signal handling).
   */
  virtual void initSocket(int fd);

  /** @brief Mutex per active socket to ensure serial read/write. */
  map<int, shared_ptr<recursive_mutex>> activeSocketMutexes;
  /** @brief Guards access to the active socket map. */
  recursive_mutex globalMutex;
};
}  // namespace swayipc

#endif  // __SWAYIPC_UNIX_SOCKET_HANDLER__
