#include "IpcTransport.hpp"

#include "FrameCodec.hpp"

namespace swayipc {
namespace {
// Large replies (GET_TREE on a busy desktop) run into hundreds of KB.
const size_t READ_CHUNK_SIZE = 64 * 1024;
// Without a deadline we still wake up periodically so a shutdown is noticed.
const int64_t IDLE_WAIT_USEC = 1000 * 1000;
}  // namespace

IpcTransport::IpcTransport(shared_ptr<SocketHandler> _socketHandler,
                           const SocketEndpoint& _endpoint)
    : socketHandler(_socketHandler),
      endpoint(_endpoint),
      socketFd(-1),
      readerActive(false),
      closeRequested(false) {
  socketFd = socketHandler->connect(endpoint);
  if (socketFd < 0) {
    auto localErrno = GetErrno();
    string s = string("Could not connect to ") + endpoint.getName() + ": " +
               strerror(localErrno);
    LOG(INFO) << s;
    throw ConnectionError(s);
  }
  VLOG(1) << "Transport connected to " << endpoint << " on fd " << socketFd;
}

IpcTransport::~IpcTransport() { close(); }

void IpcTransport::sendFrame(uint32_t type, const string& payload) {
  string s = FrameCodec::encode(type, payload);
  int fd;
  {
    lock_guard<recursive_mutex> guard(transportMutex);
    fd = socketFd;
  }
  if (fd < 0) {
    throw IoError("Tried to send on a closed transport");
  }
  VLOG(3) << "Sending " << messageTypeName(type) << " with "
          << payload.length() << " byte payload on fd " << fd;
  socketHandler->writeAllOrThrow(fd, s.data(), s.length(), true);
}

Frame IpcTransport::receiveFrame() { return receiveFrameWithDeadline({}); }

Frame IpcTransport::receiveFrame(std::chrono::milliseconds timeout) {
  return receiveFrameWithDeadline(std::chrono::steady_clock::now() + timeout);
}

Frame IpcTransport::receiveFrameWithDeadline(
    const optional<std::chrono::steady_clock::time_point>& deadline) {
  int fd;
  {
    lock_guard<recursive_mutex> guard(transportMutex);
    if (socketFd < 0 || closeRequested) {
      throw ConnectionClosedError("Tried to receive on a closed transport");
    }
    fd = socketFd;
    readerActive = true;
  }

  try {
    Frame frame = readUntilFrame(fd, deadline);
    finishRead();
    return frame;
  } catch (...) {
    finishRead();
    throw;
  }
}

void IpcTransport::finishRead() {
  lock_guard<recursive_mutex> guard(transportMutex);
  readerActive = false;
  if (closeRequested) {
    releaseLocked();
  }
}

Frame IpcTransport::readUntilFrame(
    int fd, const optional<std::chrono::steady_clock::time_point>& deadline) {
  Frame frame;
  char buf[READ_CHUNK_SIZE];
  while (true) {
    if (receiveBuffer.extractFrame(&frame)) {
      VLOG(3) << "Received " << frame << " on fd " << fd;
      return frame;
    }

    int64_t waitUsec = IDLE_WAIT_USEC;
    if (deadline) {
      auto remaining = std::chrono::duration_cast<std::chrono::microseconds>(
                           *deadline - std::chrono::steady_clock::now())
                           .count();
      if (remaining <= 0) {
        throw TimeoutError("Timed out waiting for a frame from " +
                           endpoint.getName());
      }
      waitUsec = std::min<int64_t>(waitUsec, remaining);
    }
    if (!socketHandler->waitForData(fd, waitUsec / 1000000,
                                    waitUsec % 1000000)) {
      continue;
    }

    ssize_t bytesRead = socketHandler->read(fd, buf, sizeof(buf));
    if (bytesRead == 0) {
      VLOG(1) << "Connection to " << endpoint << " closed with "
              << receiveBuffer.size() << " bytes buffered";
      throw ConnectionClosedError("Connection to " + endpoint.getName() +
                                  " closed by peer");
    }
    if (bytesRead < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        continue;
      }
      throw IoError(string("Failed to read from ") + endpoint.getName() +
                    ": " + strerror(localErrno));
    }
    VLOG(4) << "Read " << bytesRead << " bytes from fd " << fd;
    receiveBuffer.append(buf, size_t(bytesRead));
  }
}

void IpcTransport::interrupt() {
  lock_guard<recursive_mutex> guard(transportMutex);
  if (socketFd >= 0) {
    LOG(INFO) << "Interrupting transport to " << endpoint;
    socketHandler->shutdown(socketFd);
  }
}

void IpcTransport::close() {
  lock_guard<recursive_mutex> guard(transportMutex);
  if (socketFd < 0) {
    return;
  }
  if (readerActive) {
    // The reader still uses the fd and the buffer; it releases both on exit.
    VLOG(1) << "Closing transport to " << endpoint << " once its reader exits";
    closeRequested = true;
    socketHandler->shutdown(socketFd);
    return;
  }
  releaseLocked();
}

void IpcTransport::releaseLocked() {
  if (socketFd < 0) {
    return;
  }
  VLOG(1) << "Closing transport to " << endpoint;
  socketHandler->close(socketFd);
  socketFd = -1;
  closeRequested = false;
  receiveBuffer.clear();
}

bool IpcTransport::isClosed() {
  lock_guard<recursive_mutex> guard(transportMutex);
  return socketFd < 0 || closeRequested;
}
}  // namespace swayipc
