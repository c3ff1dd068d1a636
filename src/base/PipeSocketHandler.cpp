#include "PipeSocketHandler.hpp"

namespace sg {
namespace {
bool fillAddress(const string& path, sockaddr_un* address) {
  memset(address, 0, sizeof(sockaddr_un));
  address->sun_family = AF_UNIX;
  if (path.empty() || path.length() >= sizeof(address->sun_path)) {
    return false;
  }
  strncpy(address->sun_path, path.c_str(), sizeof(address->sun_path) - 1);
  return true;
}
}  // namespace

PipeSocketHandler::PipeSocketHandler() {}

int PipeSocketHandler::connect(const SocketEndpoint& endpoint) {
  sockaddr_un remote;
  if (!fillAddress(endpoint.name(), &remote)) {
    LOG(ERROR) << "Invalid socket path: " << endpoint.name();
    return -1;
  }
  int sockFd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(sockFd);
  initSocket(sockFd);
  return connectWithTimeout(sockFd, (sockaddr*)&remote, sizeof(remote),
                            endpoint);
}

set<int> PipeSocketHandler::listen(const SocketEndpoint& endpoint) {
  sockaddr_un local;
  if (!fillAddress(endpoint.name(), &local)) {
    throw std::runtime_error("Invalid socket path: " + endpoint.name());
  }
  {
    lock_guard<std::recursive_mutex> guard(globalMutex);
    if (listeners.find(listenerKey(endpoint)) != listeners.end()) {
      throw std::runtime_error("Already listening on " + endpoint.name());
    }
  }
  int sockFd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(sockFd);
  initServerSocket(sockFd);
  ::unlink(local.sun_path);
  bindAndListen(sockFd, (sockaddr*)&local, sizeof(local), endpoint);
  FATAL_FAIL(::chmod(local.sun_path, S_IRUSR | S_IWUSR));

  set<int> serverSockets = {sockFd};
  addListener(endpoint, serverSockets);
  LOG(INFO) << "Listening on " << endpoint.name();
  return serverSockets;
}

void PipeSocketHandler::stopListening(const SocketEndpoint& endpoint) {
  UnixSocketHandler::stopListening(endpoint);
  ::unlink(endpoint.name().c_str());
}

string PipeSocketHandler::listenerKey(const SocketEndpoint& endpoint) {
  return endpoint.name();
}
}  // namespace sg
