#ifndef __SG_SERVER_CONFIG__
#define __SG_SERVER_CONFIG__

#include <cxxopts.hpp>

#include "Headers.hpp"
#include "StepSession.hpp"

namespace sg {
/**
 * @brief Everything stepserver needs to start. Defaults first, then the
 * optional INI file, then explicit command-line flags.
 */
struct ServerConfig {
  string host = "localhost";
  int port = 8080;
  SessionConfig session;
  int verbose = 0;
  bool silent = false;
  // default max log file size is 20MB
  string maxLogSize = "20971520";

  /**
   * @brief Overlays the values present in an INI file.
   *
   * Recognized keys: [Networking] host, port; [Validation]
   * timeout_threshold, idle_timeout (seconds), first_step; [Debug] verbose,
   * silent, logsize.
   * @throws std::runtime_error when the file cannot be loaded or a value is
   * malformed.
   */
  void loadIniFile(const string& path);

  /**
   * @brief Declares the flags that map onto config values (host, port,
   * timeout, idle_timeout, first_step, verbose).
   */
  static void addCommandLineOptions(cxxopts::Options* options);

  /**
   * @brief Overlays the flags that were given explicitly. Defaults declared
   * by addCommandLineOptions never replace values read from the INI file.
   * @throws std::runtime_error for an idle timeout that does not fit.
   */
  void applyCommandLine(const cxxopts::ParseResult& result);

  /** @brief Throws std::runtime_error when a value is out of range. */
  void validate() const;

  SocketEndpoint getEndpoint() const;
};
}  // namespace sg

#endif  // __SG_SERVER_CONFIG__
