#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace sg;

TEST_CASE("Log file names carry the prefix", "[LogHandler]") {
  string name = LogHandler::logFilename("stepserver", false);
  REQUIRE(name.rfind("stepserver-", 0) == 0);
  REQUIRE(name.substr(name.length() - 4) == ".log");

  string withPid = LogHandler::logFilename("stepserver", true);
  string pidSuffix = "_" + to_string(getpid()) + ".log";
  REQUIRE(withPid.substr(withPid.length() - pidSuffix.length()) == pidSuffix);
}

TEST_CASE("Log files are created in nested directories", "[LogHandler]") {
  string dirPattern = GetTempDirectory() + string("sg_log_XXXXXXXX");
  string baseDir = string(mkdtemp(&dirPattern[0]));

  el::Configurations conf;
  conf.setToDefault();
  LogFileOptions options;
  options.directory = baseDir + "/nested/logs";
  options.prefix = "unit";
  options.maxLogSize = "4096";

  string path = LogHandler::setupLogFile(&conf, options);
  REQUIRE(fs::exists(path));
  REQUIRE((fs::status(path).permissions() & fs::perms::group_read) ==
          fs::perms::none);
  REQUIRE(conf.get(el::Level::Global, el::ConfigurationType::Filename)
              ->value() == path);
  REQUIRE(conf.get(el::Level::Global, el::ConfigurationType::MaxLogFileSize)
              ->value() == "4096");

  fs::remove_all(baseDir);
}

TEST_CASE("Rollover keeps one previous file", "[LogHandler]") {
  string dirPattern = GetTempDirectory() + string("sg_log_XXXXXXXX");
  string baseDir = string(mkdtemp(&dirPattern[0]));
  string path = baseDir + "/rolled.log";
  {
    ofstream out(path);
    out << "old contents";
  }

  LogHandler::rolloutHandler(path.c_str(), 12);
  REQUIRE_FALSE(fs::exists(path));
  REQUIRE(fs::exists(path + ".1"));

  fs::remove_all(baseDir);
}
