#ifndef __SG_HEADERS__
#define __SG_HEADERS__

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <paths.h>
#include <poll.h>
#include <signal.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/un.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <google/protobuf/message_lite.h>

#include "StepGate.pb.h"
#include "easylogging++.h"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

#ifndef SG_VERSION
#define SG_VERSION "unknown"
#endif

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

inline int GetErrno() { return errno; }

inline void SetErrno(int e) { errno = e; }

// Only for calls that cannot fail unless the process is broken.
#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

// Socket options may return EINVAL once the peer has already hung up.
#define FATAL_FAIL_UNLESS_EINVAL(X)        \
  if (((X) == -1) && GetErrno() != EINVAL) \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

namespace sg {
inline std::ostream &operator<<(std::ostream &os, const SocketEndpoint &se) {
  if (se.has_name()) {
    os << se.name();
  }
  if (se.has_port()) {
    os << ":" << se.port();
  }
  return os;
}

inline string GetTempDirectory() { return string(_PATH_TMP); }

/** @brief Logs a stack trace for exceptions that escape a thread. */
inline void HandleTerminate() {
  static std::atomic<bool> installed(false);
  if (installed.exchange(true)) {
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (!eptr) {
      STFATAL << "std::terminate called without an exception";
    }
    try {
      std::rethrow_exception(eptr);
    } catch (const std::exception &e) {
      STFATAL << "Uncaught exception: " << e.what();
    } catch (...) {
      STFATAL << "Uncaught non-standard exception";
    }
  });
}

inline void InterruptSignalHandler(int signum) {
  STERROR << "Got interrupt";
  CLOG(INFO, "stdout") << endl << "Interrupted, exiting." << endl;
  ::exit(signum);
}
}  // namespace sg

#endif  // __SG_HEADERS__
