#ifndef __SG_LOG_HANDLER__
#define __SG_LOG_HANDLER__

#include "Headers.hpp"

namespace sg {
/** @brief Where and how a process writes its log file. */
struct LogFileOptions {
  string directory;
  /** @brief File names are `<prefix>-<timestamp>[_<pid>].log`. */
  string prefix;
  bool toStdout = false;
  bool appendPid = false;
  /** @brief Size in bytes at which the file is rolled over. */
  string maxLogSize = "20971520";
};

/**
 * @brief easylogging++ setup shared by stepserver, stepclient and the tests.
 *
 * The "default" logger carries diagnostics; the "stdout" logger prints
 * user-facing messages without decoration.
 */
class LogHandler {
 public:
  /** @return The base configuration; callers adjust it and reconfigure. */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  static void setupStdoutLogger();

  /**
   * @brief Points the configuration at a freshly created log file.
   * @return The full path of the log file.
   * @throws std::runtime_error when the directory or file cannot be created.
   */
  static string setupLogFile(el::Configurations *conf,
                             const LogFileOptions &options);

  /**
   * @brief Applies -v and the silent flag to the configuration.
   */
  static void setVerbosity(el::Configurations *conf, int verboseLevel,
                           bool silent);

  /**
   * @brief Rollover callback: keeps the previous file as `<name>.1`.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  static string logFilename(const string &prefix, bool appendPid);
};
}  // namespace sg
#endif  // __SG_LOG_HANDLER__
