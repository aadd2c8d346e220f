#include "SocketPath.hpp"

#include "IpcErrors.hpp"

namespace swayipc {

namespace {

bool IsAbsolutePath(const string& path) {
  return (!path.empty() && path[0] == '/');
}

optional<string> GetNonEmptyEnv(const char* name) {
  const char* value = ::getenv(name);
  if (value == NULL || value[0] == '\0') {
    return std::nullopt;
  }
  return string(value);
}

bool IsSocketFile(const string& path) {
  struct stat fileStat;
  if (::stat(path.c_str(), &fileStat) != 0) {
    return false;
  }
  return S_ISSOCK(fileStat.st_mode);
}

}  // namespace

SocketPath::SocketPath() = default;

void SocketPath::setPathOverride(const string& path) {
  if (path.empty()) {
    throw ConnectionError("Socket path override must not be empty");
  }
  pathOverride = path;
}

string SocketPath::getRuntimeDirectory() {
  // XDG basedir rules say a relative path must be ignored.
  auto runtimeDir = GetNonEmptyEnv("XDG_RUNTIME_DIR");
  if (runtimeDir && IsAbsolutePath(*runtimeDir)) {
    return *runtimeDir;
  }
  return string("/run/user/") + to_string(::getuid());
}

optional<SocketEndpoint> SocketPath::resolve() const {
  if (pathOverride) {
    return SocketEndpoint(pathOverride.value());
  }

  for (const char* envName : {SWAY_SOCKET_ENV, I3_SOCKET_ENV}) {
    auto fromEnv = GetNonEmptyEnv(envName);
    if (fromEnv) {
      VLOG(1) << "Using socket path from $" << envName << ": " << *fromEnv;
      return SocketEndpoint(*fromEnv);
    }
  }

  const string pattern = getRuntimeDirectory() + "/sway-ipc." +
                         to_string(::getuid()) + ".*.sock";
  glob_t globResult;
  memset(&globResult, 0, sizeof(globResult));
  optional<SocketEndpoint> found;
  int rc = ::glob(pattern.c_str(), 0, NULL, &globResult);
  if (rc == 0) {
    for (size_t i = 0; i < globResult.gl_pathc; i++) {
      string candidate(globResult.gl_pathv[i]);
      if (IsSocketFile(candidate)) {
        VLOG(1) << "Found default socket: " << candidate;
        found = SocketEndpoint(candidate);
        break;
      }
    }
  } else if (rc != GLOB_NOMATCH) {
    LOG(WARNING) << "Error searching for sockets matching " << pattern;
  }
  ::globfree(&globResult);
  return found;
}

SocketEndpoint SocketPath::resolveOrThrow() const {
  auto endpoint = resolve();
  if (!endpoint) {
    throw ConnectionError(
        string("No IPC socket found: set $") + SWAY_SOCKET_ENV + " or $" +
        I3_SOCKET_ENV + ", or pass an explicit path.  Is sway running?");
  }
  return *endpoint;
}

}  // namespace swayipc
