#define CATCH_CONFIG_RUNNER

#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace sg;

namespace {
bool isListing(int argc, char **argv) {
  for (int a = 1; a < argc; a++) {
    string arg = argv[a];
    if (arg == "-l" || arg.rfind("--list", 0) == 0) {
      return true;
    }
  }
  return false;
}
}  // namespace

int main(int argc, char **argv) {
  bool listOnly = isListing(argc, argv);

  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();
  HandleTerminate();

  string logDirectoryPattern = GetTempDirectory() + string("sg_test_XXXXXXXX");
  string logDirectory = string(mkdtemp(&logDirectoryPattern[0]));
  LogFileOptions logOptions;
  logOptions.directory = logDirectory;
  logOptions.prefix = "stepgate-test";
  string logFile = LogHandler::setupLogFile(&defaultConf, logOptions);
  if (!listOnly) {
    CLOG(INFO, "stdout") << "Writing log to " << logFile << endl;
  }
  el::Loggers::reconfigureLogger("default", defaultConf);

  int result = Catch::Session().run(argc, argv);

  fs::remove_all(logDirectory);
  return result;
}
