#ifndef __SWAYIPC_IPC_TRANSPORT__
#define __SWAYIPC_IPC_TRANSPORT__

#include "Frame.hpp"
#include "Headers.hpp"
#include "IpcErrors.hpp"
#include "ReceiveBuffer.hpp"
#include "SocketEndpoint.hpp"
#include "SocketHandler.hpp"

namespace swayipc {
/**
 * @brief One connection to the window manager's IPC socket.
 *
 * Sends and receives whole frames.  Owns the ReceiveBuffer for the
 * connection, so receiveFrame() must only ever be called from one thread at
 * a time.  interrupt() and close() may come from any thread.
 */
class IpcTransport {
 public:
  /**
   * @brief Connects to the endpoint.
   * @throws ConnectionError if the socket is missing or refuses us.
   */
  IpcTransport(shared_ptr<SocketHandler> _socketHandler,
               const SocketEndpoint& _endpoint);
  /** @brief Closes the connection if it's still open. */
  virtual ~IpcTransport();

  IpcTransport(const IpcTransport&) = delete;
  IpcTransport& operator=(const IpcTransport&) = delete;

  /**
   * @brief Encodes and writes a whole frame, retrying short writes.
   * @throws EncodingError, or IoError after which the connection is dead.
   */
  void sendFrame(uint32_t type, const string& payload);

  /**
   * @brief Blocks until a complete frame has been received.
   * @throws ConnectionClosedError if the peer hangs up first, IoError on a
   * failed read, ProtocolError on a corrupt header.
   */
  Frame receiveFrame();

  /**
   * @brief Like receiveFrame(), but gives up after `timeout`.
   * @throws TimeoutError on expiry.  Bytes read so far stay buffered, so the
   * call can simply be repeated.
   */
  Frame receiveFrame(std::chrono::milliseconds timeout);

  /**
   * @brief Wakes up a reader blocked in receiveFrame() on another thread.
   * The reader sees ConnectionClosedError; the descriptor stays allocated
   * until close().
   */
  void interrupt();

  /**
   * @brief Releases the socket.  Safe to call more than once.  If another
   * thread is inside receiveFrame(), the socket is shut down instead and
   * released when that reader leaves with ConnectionClosedError.
   */
  void close();

  bool isClosed();


  inline const SocketEndpoint& getEndpoint() const { return endpoint; }

  /** @brief Bytes received past the last complete frame. */
  inline size_t bufferedBytes() const { return receiveBuffer.size(); }

 protected:
  Frame receiveFrameWithDeadline(
      const optional<std::chrono::steady_clock::time_point>& deadline);
  Frame readUntilFrame(
      int fd, const optional<std::chrono::steady_clock::time_point>& deadline);
  /** @brief Called by the reader on its way out of receiveFrame(). */
  void finishRead();
  /** @brief Closes socketFd.  transportMutex must be held. */
  void releaseLocked();

  /** @brief Socket API used for all reads/writes. */
  shared_ptr<SocketHandler> socketHandler;
  /** @brief Where we're connected to, kept for log messages. */
  SocketEndpoint endpoint;
  /** @brief Connected descriptor, -1 once closed. */
  int socketFd;
  /** @brief Bytes read from socketFd that don't form a full frame yet. */
  ReceiveBuffer receiveBuffer;
  /** @brief Guards socketFd, readerActive and closeRequested. */
  recursive_mutex transportMutex;
  /** @brief A thread is inside receiveFrame(). */
  bool readerActive;
  /** @brief close() was called while a reader was active. */
  bool closeRequested;
};
}  // namespace swayipc

#endif  // __SWAYIPC_IPC_TRANSPORT__
