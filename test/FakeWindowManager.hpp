#ifndef __SWAYIPC_FAKE_WINDOW_MANAGER__
#define __SWAYIPC_FAKE_WINDOW_MANAGER__

#include <condition_variable>

#include "FrameCodec.hpp"
#include "ReceiveBuffer.hpp"
#include "SocketEndpoint.hpp"
#include "TestHeaders.hpp"

namespace swayipc {
/**
 * @brief Minimal IPC server listening on a real Unix socket.  Answers
 * requests with canned replies, acks subscriptions and lets the test push
 * events to every subscriber.
 */
class FakeWindowManager {
 public:
  FakeWindowManager() : listenFd(-1), stopped(false) {
    string pattern = GetTempDirectory() + string("swayipc_wm_XXXXXXXX");
    if (::mkdtemp(&pattern[0]) == NULL) {
      throw std::runtime_error("Could not create a socket directory");
    }
    directory = pattern;
    path = directory + "/sway-ipc.sock";

    listenFd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    FATAL_FAIL(listenFd);
    sockaddr_un local;
    memset(&local, 0, sizeof(local));
    local.sun_family = AF_UNIX;
    strncpy(local.sun_path, path.c_str(), sizeof(local.sun_path) - 1);
    FATAL_FAIL(::bind(listenFd, (sockaddr*)&local, sizeof(sockaddr_un)));
    FATAL_FAIL(::listen(listenFd, 16));

    acceptThread = thread([this]() { acceptLoop(); });
  }

  ~FakeWindowManager() {
    stopped = true;
    acceptThread.join();
    {
      lock_guard<mutex> guard(stateMutex);
      for (int fd : clientFds) {
        ::shutdown(fd, SHUT_RDWR);
      }
    }
    for (auto& t : clientThreads) {
      t.join();
    }
    for (int fd : clientFds) {
      ::close(fd);
    }
    ::close(listenFd);
    fs::remove_all(directory);
  }

  SocketEndpoint getEndpoint() const { return SocketEndpoint(path); }
  const string& getPath() const { return path; }

  /** @brief Sends an event frame to every subscribed connection. */
  void broadcast(uint32_t type, const string& payload) {
    lock_guard<mutex> guard(stateMutex);
    for (int fd : subscriberFds) {
      writeLocked(fd, type, payload);
    }
  }

  /** @brief Hangs up on every subscriber, as sway does when it exits. */
  void closeSubscribers() {
    lock_guard<mutex> guard(stateMutex);
    for (int fd : subscriberFds) {
      ::shutdown(fd, SHUT_RDWR);
    }
    subscriberFds.clear();
  }

  bool waitForSubscribers(size_t count, std::chrono::milliseconds timeout) {
    unique_lock<mutex> lock(stateMutex);
    return stateChanged.wait_for(lock, timeout, [this, count]() {
      return subscriberFds.size() >= count;
    });
  }

  bool waitForCommands(size_t count, std::chrono::milliseconds timeout) {
    unique_lock<mutex> lock(stateMutex);
    return stateChanged.wait_for(
        lock, timeout, [this, count]() { return commands.size() >= count; });
  }

  vector<string> getCommands() {
    lock_guard<mutex> guard(stateMutex);
    return commands;
  }

  vector<string> getSubscribePayloads() {
    lock_guard<mutex> guard(stateMutex);
    return subscribePayloads;
  }

 protected:
  void acceptLoop() {
    while (!stopped) {
      fd_set input;
      FD_ZERO(&input);
      FD_SET(listenFd, &input);
      timeval tv;
      tv.tv_sec = 0;
      tv.tv_usec = 100 * 1000;
      if (::select(listenFd + 1, &input, NULL, NULL, &tv) <= 0) {
        continue;
      }
      int clientFd = ::accept(listenFd, NULL, NULL);
      if (clientFd < 0) {
        continue;
      }
      lock_guard<mutex> guard(stateMutex);
      clientFds.push_back(clientFd);
      clientThreads.push_back(thread([this, clientFd]() { serve(clientFd); }));
    }
  }

  void serve(int fd) {
    ReceiveBuffer buffer;
    char buf[4096];
    while (true) {
      Frame request;
      while (!buffer.extractFrame(&request)) {
        ssize_t rc = ::read(fd, buf, sizeof(buf));
        if (rc <= 0) {
          return;
        }
        buffer.append(buf, rc);
      }

      lock_guard<mutex> guard(stateMutex);
      switch (request.getType()) {
        case SUBSCRIBE:
          subscribePayloads.push_back(request.getPayload());
          writeLocked(fd, SUBSCRIBE, "{\"success\":true}");
          subscriberFds.push_back(fd);
          break;
        case RUN_COMMAND:
          commands.push_back(request.getPayload());
          if (request.getPayload() == "bogus") {
            writeLocked(fd, RUN_COMMAND,
                        "[{\"success\":false,\"parse_error\":true,"
                        "\"error\":\"Unknown/invalid command 'bogus'\"}]");
          } else {
            writeLocked(fd, RUN_COMMAND, "[{\"success\":true}]");
          }
          break;
        case GET_VERSION:
          writeLocked(fd, GET_VERSION,
                      "{\"human_readable\":\"fake 1.0\",\"major\":1,"
                      "\"minor\":0,\"patch\":0}");
          break;
        default:
          writeLocked(fd, request.getType(), "[]");
          break;
      }
      stateChanged.notify_all();
    }
  }

  // Callers hold stateMutex so frames from different threads never
  // interleave.
  void writeLocked(int fd, uint32_t type, const string& payload) {
    string s = FrameCodec::encode(type, payload);
    size_t pos = 0;
    while (pos < s.length()) {
      ssize_t rc = ::send(fd, s.data() + pos, s.length() - pos, MSG_NOSIGNAL);
      if (rc <= 0) {
        LOG(INFO) << "Fake window manager lost a client";
        return;
      }
      pos += rc;
    }
  }

  string directory;
  string path;
  int listenFd;
  atomic<bool> stopped;
  thread acceptThread;

  mutex stateMutex;
  std::condition_variable stateChanged;
  vector<int> clientFds;
  vector<thread> clientThreads;
  vector<int> subscriberFds;
  vector<string> subscribePayloads;
  vector<string> commands;
};
}  // namespace swayipc

#endif  // __SWAYIPC_FAKE_WINDOW_MANAGER__
