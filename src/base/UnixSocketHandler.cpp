#include "UnixSocketHandler.hpp"

namespace swayipc {
UnixSocketHandler::UnixSocketHandler() {}

bool UnixSocketHandler::waitForData(int fd, int64_t sec, int64_t usec) {
  fd_set input;
  FD_ZERO(&input);
  FD_SET(fd, &input);
  struct timeval timeout;
  timeout.tv_sec = sec;
  timeout.tv_usec = usec;
  int n = select(fd + 1, &input, NULL, NULL, &timeout);
  if (n == -1) {
    // Interrupted or the fd went away, let the next read report it.
    VLOG(4) << "socket select failed: " << strerror(GetErrno());
    return false;
  } else if (n == 0)
    return false;
  if (!FD_ISSET(fd, &input)) {
    STFATAL << "FD_ISSET is false but we should have data by now.";
  }
  VLOG(4) << "socket " << fd << " has data";
  return true;
}

shared_ptr<recursive_mutex> UnixSocketHandler::lookupSocketMutex(
    int fd, const char *operation) {
  if (fd <= 0) {
    STFATAL << "Tried to " << operation << " an invalid socket: " << fd;
  }
  lock_guard<std::recursive_mutex> guard(globalMutex);
  auto it = activeSocketMutexes.find(fd);
  if (it == activeSocketMutexes.end()) {
    LOG(INFO) << "Tried to " << operation << " socket " << fd
              << " after it was closed";
    return shared_ptr<recursive_mutex>();
  }
  return it->second;
}

ssize_t UnixSocketHandler::read(int fd, void *buf, size_t count) {
  auto socketMutex = lookupSocketMutex(fd, "read from");
  if (!socketMutex) {
    SetErrno(EPIPE);
    return -1;
  }
  lock_guard<recursive_mutex> guard(*socketMutex);
  ssize_t readBytes = ::read(fd, buf, count);
  auto localErrno = GetErrno();
  if (readBytes < 0 && localErrno != EAGAIN && localErrno != EWOULDBLOCK &&
      localErrno != EINTR) {
    LOG(WARNING) << "Error reading from " << fd << ": "
                 << strerror(localErrno);
  }
  SetErrno(localErrno);
  return readBytes;
}

ssize_t UnixSocketHandler::write(int fd, const void *buf, size_t count) {
  auto socketMutex = lookupSocketMutex(fd, "write to");
  if (!socketMutex) {
    SetErrno(EPIPE);
    return -1;
  }
  // A window manager that stops reading for this long is wedged.
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(5);
  const char *bytes = (const char *)buf;
  size_t bytesWritten = 0;
  while (bytesWritten < count) {
    ssize_t w;
    {
      lock_guard<recursive_mutex> guard(*socketMutex);
#ifdef MSG_NOSIGNAL
      w = ::send(fd, bytes + bytesWritten, count - bytesWritten, MSG_NOSIGNAL);
#else
      w = ::write(fd, bytes + bytesWritten, count - bytesWritten);
#endif
    }
    if (w >= 0) {
      bytesWritten += w;
      continue;
    }
    auto localErrno = GetErrno();
    if (localErrno != EAGAIN && localErrno != EWOULDBLOCK &&
        localErrno != EINTR) {
      return -1;
    }
    if (std::chrono::steady_clock::now() > deadline) {
      VLOG(1) << "Gave up writing to " << fd << " after " << bytesWritten
              << " of " << count << " bytes";
      SetErrno(ETIMEDOUT);
      return -1;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  VLOG(4) << "Wrote " << count << " bytes to fd " << fd;
  return count;
}

int UnixSocketHandler::connect(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> mutexGuard(globalMutex);

  const string &socketPath = endpoint.getName();
  sockaddr_un remote;
  memset(&remote, 0, sizeof(remote));
  if (socketPath.empty() || socketPath.length() >= sizeof(remote.sun_path)) {
    LOG(INFO) << "Invalid socket path: '" << socketPath << "'";
    SetErrno(ENAMETOOLONG);
    return -1;
  }

  int sockFd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(sockFd);
  initSocket(sockFd);
  remote.sun_family = AF_UNIX;
  strncpy(remote.sun_path, socketPath.c_str(), sizeof(remote.sun_path) - 1);

  VLOG(3) << "Connecting to " << endpoint << " with fd " << sockFd;
  int result =
      ::connect(sockFd, (struct sockaddr *)&remote, sizeof(sockaddr_un));
  auto localErrno = GetErrno();
  if (result < 0 && localErrno != EINPROGRESS) {
    VLOG(3) << "Connection result: " << result << " (" << strerror(localErrno)
            << ")";
    ::shutdown(sockFd, SHUT_RDWR);
    FATAL_FAIL(::close(sockFd));
    SetErrno(localErrno);
    return -1;
  }

  fd_set fdset;
  FD_ZERO(&fdset);
  FD_SET(sockFd, &fdset);
  timeval tv;
  tv.tv_sec = 3; /* 3 second timeout */
  tv.tv_usec = 0;
  VLOG(4) << "Before selecting sockFd";
  select(sockFd + 1, NULL, &fdset, NULL, &tv);

  if (FD_ISSET(sockFd, &fdset)) {
    VLOG(4) << "sockFd " << sockFd << " is selected";
    int so_error;
    socklen_t len = sizeof so_error;

    FATAL_FAIL(
        ::getsockopt(sockFd, SOL_SOCKET, SO_ERROR, (char *)&so_error, &len));

    if (so_error != 0) {
      LOG(INFO) << "Error connecting to " << endpoint << ": " << so_error
                << " " << strerror(so_error);
      FATAL_FAIL(::close(sockFd));
      SetErrno(so_error);
      return -1;
    }
  } else {
    LOG(INFO) << "Timed out connecting to " << endpoint;
    FATAL_FAIL(::close(sockFd));
    SetErrno(ETIMEDOUT);
    return -1;
  }

  LOG(INFO) << "Connected to endpoint " << endpoint << " with fd " << sockFd;
  addToActiveSockets(sockFd);
  return sockFd;
}

void UnixSocketHandler::addToActiveSockets(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  if (activeSocketMutexes.find(fd) != activeSocketMutexes.end()) {
    STFATAL << "Tried to insert an fd that already exists: " << fd;
  }
  activeSocketMutexes.insert(
      make_pair(fd, shared_ptr<recursive_mutex>(new recursive_mutex())));
}

void UnixSocketHandler::shutdown(int fd) {
  lock_guard<std::recursive_mutex> globalGuard(globalMutex);
  if (activeSocketMutexes.find(fd) == activeSocketMutexes.end()) {
    LOG(INFO) << "Tried to shut down a socket that has been closed: " << fd;
    return;
  }
  VLOG(1) << "Shutting down connection: " << fd;
  // The reader holds the per-socket mutex only while inside ::read, which
  // never blocks on a non-blocking socket, so we don't take it here.
  if (::shutdown(fd, SHUT_RDWR) == -1 && GetErrno() != ENOTCONN) {
    LOG(WARNING) << "Error shutting down " << fd << ": "
                 << strerror(GetErrno());
  }
}

void UnixSocketHandler::close(int fd) {
  if (fd == -1) {
    return;
  }
  lock_guard<std::recursive_mutex> globalGuard(globalMutex);
  auto socketMutex = lookupSocketMutex(fd, "close");
  if (!socketMutex) {
    STERROR << "Tried to close a connection that doesn't exist: " << fd;
    return;
  }
  // Wait for a reader or writer on another thread to leave the socket.
  lock_guard<std::recursive_mutex> guard(*socketMutex);
  VLOG(1) << "Closing connection: " << fd;
  FATAL_FAIL(::close(fd));
  activeSocketMutexes.erase(fd);
}

vector<int> UnixSocketHandler::getActiveSockets() {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  vector<int> fds;
  for (auto it : activeSocketMutexes) {
    fds.push_back(it.first);
  }
  return fds;
}

void UnixSocketHandler::initSocket(int fd) {
#if !defined(MSG_NOSIGNAL)
  {
    // If we don't have MSG_NOSIGNAL, use SO_NOSIGPIPE
    int val = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, (void *)&val, sizeof(val)) ==
        -1) {
      // On Debian + ARM processors, this can fail.  if so, just ignore SIGPIPE
      // globally
      ::signal(SIGPIPE, SIG_IGN);
    }
  }
#endif
  {
    int opts;
    opts = fcntl(fd, F_GETFL);
    FATAL_FAIL_UNLESS_EINVAL(opts);
    opts |= O_NONBLOCK;
    FATAL_FAIL_UNLESS_EINVAL(fcntl(fd, F_SETFL, opts));
  }
}
}  // namespace swayipc
