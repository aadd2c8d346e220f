#ifndef __SWAYIPC_IPC_ERRORS__
#define __SWAYIPC_IPC_ERRORS__

#include "Headers.hpp"

namespace swayipc {
/**
 * @brief Base class of every error raised by the IPC core.
 *
 * Framing and transport errors always propagate to the caller.  None of them
 * are retried internally; reconnect policy belongs to the application.
 */
class IpcError : public std::runtime_error {
 public:
  explicit IpcError(const string& what) : std::runtime_error(what) {}
};

/** @brief The payload does not fit in the 32-bit length field. */
class EncodingError : public IpcError {
 public:
  explicit EncodingError(const string& what) : IpcError(what) {}
};

/**
 * @brief Byte alignment with the peer was lost (bad magic, unexpected frame).
 * The connection cannot be used any more.
 */
class ProtocolError : public IpcError {
 public:
  explicit ProtocolError(const string& what) : IpcError(what) {}
};

/** @brief No socket path could be resolved, or the connect was refused. */
class ConnectionError : public IpcError {
 public:
  explicit ConnectionError(const string& what) : IpcError(what) {}
};

/** @brief The peer closed the connection before a full frame arrived. */
class ConnectionClosedError : public IpcError {
 public:
  explicit ConnectionClosedError(const string& what) : IpcError(what) {}
};

/** @brief A read or write failed for a reason other than a clean close. */
class IoError : public IpcError {
 public:
  explicit IoError(const string& what) : IpcError(what) {}
};

/**
 * @brief A receive with a deadline expired.  The connection and any partial
 * frame already buffered stay usable.
 */
class TimeoutError : public IpcError {
 public:
  explicit TimeoutError(const string& what) : IpcError(what) {}
};

/** @brief The window manager answered a SUBSCRIBE with success=false. */
class SubscriptionError : public IpcError {
 public:
  explicit SubscriptionError(const string& what) : IpcError(what) {}
};
}  // namespace swayipc

#endif  // __SWAYIPC_IPC_ERRORS__
