#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace sg {
el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations conf;
  conf.setToDefault();
  // %thread prints the name set with setThreadName
  conf.setGlobally(el::ConfigurationType::Format,
                   "[%level %datetime %thread %fbase:%line] %msg");
  conf.set(el::Level::Verbose, el::ConfigurationType::Format,
           "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  conf.setGlobally(el::ConfigurationType::Enabled, "true");
  conf.setGlobally(el::ConfigurationType::ToFile, "false");
  conf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  conf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  conf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  return conf;
}

void LogHandler::setupStdoutLogger() {
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(el::Loggers::getLogger("stdout"), stdoutConf);
}

string LogHandler::logFilename(const string &prefix, bool appendPid) {
  time_t now = time(NULL);
  tm timeinfo;
  localtime_r(&now, &timeinfo);
  char stamp[32];
  strftime(stamp, sizeof(stamp), "%Y-%m-%d_%H-%M-%S", &timeinfo);

  string filename = prefix + "-" + stamp;
  if (appendPid) {
    filename += "_" + to_string(getpid());
  }
  return filename + ".log";
}

string LogHandler::setupLogFile(el::Configurations *conf,
                                const LogFileOptions &options) {
  try {
    fs::create_directories(options.directory);
  } catch (const fs::filesystem_error &fse) {
    throw std::runtime_error(string("Cannot create log directory: ") +
                             fse.what());
  }
  string fullPath = options.directory + "/" +
                    logFilename(options.prefix, options.appendPid);
  int fd = ::open(fullPath.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  if (fd < 0) {
    throw std::runtime_error("Cannot create log file " + fullPath + ": " +
                             strerror(GetErrno()));
  }
  FATAL_FAIL(::close(fd));

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  conf->setGlobally(el::ConfigurationType::Filename, fullPath);
  conf->setGlobally(el::ConfigurationType::ToFile, "true");
  conf->setGlobally(el::ConfigurationType::MaxLogFileSize, options.maxLogSize);
  conf->setGlobally(el::ConfigurationType::ToStandardOutput,
                    options.toStdout ? "true" : "false");
  return fullPath;
}

void LogHandler::setVerbosity(el::Configurations *conf, int verboseLevel,
                              bool silent) {
  el::Loggers::setVerboseLevel(verboseLevel);
  if (silent) {
    conf->setGlobally(el::ConfigurationType::Enabled, "false");
  }
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // Runs while the file is closed: nothing may be logged here.
  string previous = string(filename) + ".1";
  if (::rename(filename, previous.c_str()) != 0) {
    ::remove(filename);
  }
}
}  // namespace sg
