#include "TcpSocketHandler.hpp"

namespace sg {
namespace {
string resolveError(const SocketEndpoint& endpoint, int rc) {
  ostringstream oss;
  oss << "Could not resolve " << endpoint << ": " << gai_strerror(rc);
  return oss.str();
}
}  // namespace

TcpSocketHandler::TcpSocketHandler() {}

int TcpSocketHandler::connect(const SocketEndpoint& endpoint) {
  addrinfo hints;
  memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_V4MAPPED | AI_ADDRCONFIG;
  string portName = to_string(endpoint.port());

  addrinfo* results = NULL;
  int rc = getaddrinfo(endpoint.name().c_str(), portName.c_str(), &hints,
                       &results);
  if (rc != 0) {
    LOG(ERROR) << resolveError(endpoint, rc);
    return -1;
  }

  int sockFd = -1;
  for (addrinfo* p = results; p != NULL && sockFd < 0; p = p->ai_next) {
    int candidate = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
    if (candidate < 0) {
      LOG(INFO) << "Error creating socket: " << strerror(GetErrno());
      continue;
    }
    initSocket(candidate);
    sockFd = connectWithTimeout(candidate, p->ai_addr, p->ai_addrlen, endpoint);
  }
  freeaddrinfo(results);

  if (sockFd < 0) {
    LOG(ERROR) << "Could not connect to " << endpoint;
  }
  return sockFd;
}

set<int> TcpSocketHandler::listen(const SocketEndpoint& endpoint) {
  addrinfo hints;
  memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;
  string portName = to_string(endpoint.port());
  const char* hostName = endpoint.name().empty() ? NULL
                                                 : endpoint.name().c_str();

  addrinfo* results = NULL;
  int rc = getaddrinfo(hostName, portName.c_str(), &hints, &results);
  if (rc != 0) {
    throw std::runtime_error(resolveError(endpoint, rc));
  }

  set<int> serverSockets;
  try {
    for (addrinfo* p = results; p != NULL; p = p->ai_next) {
      int sockFd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
      if (sockFd < 0) {
        LOG(INFO) << "Skipping address family " << p->ai_family << ": "
                  << strerror(GetErrno());
        continue;
      }
      initServerSocket(sockFd);
      if (p->ai_family == AF_INET6) {
        // Keep v6 sockets off the v4 port; v4 gets its own socket.
        int v6Only = 1;
        FATAL_FAIL(setsockopt(sockFd, IPPROTO_IPV6, IPV6_V6ONLY, &v6Only,
                              sizeof(v6Only)));
      }
      bindAndListen(sockFd, p->ai_addr, p->ai_addrlen, endpoint);
      serverSockets.insert(sockFd);

      char host[NI_MAXHOST];
      if (getnameinfo(p->ai_addr, p->ai_addrlen, host, sizeof(host), NULL, 0,
                      NI_NUMERICHOST) == 0) {
        LOG(INFO) << "Listening on " << host << " port " << endpoint.port();
      }
    }
    if (serverSockets.empty()) {
      throw std::runtime_error("No usable address for " + endpoint.name());
    }
    addListener(endpoint, serverSockets);
  } catch (const std::runtime_error&) {
    for (int fd : serverSockets) {
      ::close(fd);
    }
    freeaddrinfo(results);
    throw;
  }
  freeaddrinfo(results);
  return serverSockets;
}

string TcpSocketHandler::listenerKey(const SocketEndpoint& endpoint) {
  return to_string(endpoint.port());
}

void TcpSocketHandler::initSocket(int fd) {
  UnixSocketHandler::initSocket(fd);
  int noDelay = 1;
  FATAL_FAIL_UNLESS_EINVAL(
      setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay)));
}
}  // namespace sg
