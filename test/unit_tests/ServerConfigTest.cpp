#include "ServerConfig.hpp"
#include "TestHeaders.hpp"

using namespace sg;

namespace {
string writeConfig(const string& directory, const string& contents) {
  string path = directory + "/stepserver.cfg";
  ofstream out(path);
  out << contents;
  return path;
}

cxxopts::ParseResult parseFlags(cxxopts::Options* options,
                                vector<string> args) {
  ServerConfig::addCommandLineOptions(options);
  vector<char*> argvStorage;
  for (auto& arg : args) {
    argvStorage.push_back(&arg[0]);
  }
  int argc = int(argvStorage.size());
  char** argv = &argvStorage[0];
  return options->parse(argc, argv);
}
}  // namespace

TEST_CASE("ServerConfig defaults", "[ServerConfig]") {
  ServerConfig config;
  REQUIRE(config.host == "localhost");
  REQUIRE(config.port == 8080);
  REQUIRE(config.session.timeoutThreshold == 5.0);
  REQUIRE(config.session.idleTimeoutMs == 30000);
  REQUIRE(config.session.requiredFirstStep == ANY_FIRST_STEP);
  REQUIRE_NOTHROW(config.validate());

  SocketEndpoint endpoint = config.getEndpoint();
  REQUIRE(endpoint.name() == "localhost");
  REQUIRE(endpoint.port() == 8080);
}

TEST_CASE("ServerConfig reads INI files", "[ServerConfig]") {
  string dirPattern = GetTempDirectory() + string("sg_config_XXXXXXXX");
  string configDir = string(mkdtemp(&dirPattern[0]));
  ServerConfig config;

  SECTION("All keys") {
    string path = writeConfig(configDir,
                              "[Networking]\n"
                              "host = 0.0.0.0\n"
                              "port = 9090\n"
                              "[Validation]\n"
                              "timeout_threshold = 2.5\n"
                              "idle_timeout = 1.5\n"
                              "first_step = 1\n"
                              "[Debug]\n"
                              "verbose = 3\n"
                              "silent = 1\n"
                              "logsize = 1024\n");
    config.loadIniFile(path);
    REQUIRE(config.host == "0.0.0.0");
    REQUIRE(config.port == 9090);
    REQUIRE(config.session.timeoutThreshold == 2.5);
    REQUIRE(config.session.idleTimeoutMs == 1500);
    REQUIRE(config.session.requiredFirstStep == 1);
    REQUIRE(config.verbose == 3);
    REQUIRE(config.silent);
    REQUIRE(config.maxLogSize == "1024");
    REQUIRE_NOTHROW(config.validate());
  }

  SECTION("Missing keys keep their defaults") {
    string path = writeConfig(configDir, "[Networking]\nport = 7000\n");
    config.loadIniFile(path);
    REQUIRE(config.port == 7000);
    REQUIRE(config.host == "localhost");
    REQUIRE(config.session.timeoutThreshold == 5.0);
  }

  SECTION("Malformed values") {
    string path = writeConfig(configDir, "[Networking]\nport = eighty\n");
    REQUIRE_THROWS_AS(config.loadIniFile(path), std::runtime_error);

    path = writeConfig(configDir, "[Validation]\ntimeout_threshold = 5s\n");
    REQUIRE_THROWS_AS(config.loadIniFile(path), std::runtime_error);
  }

  SECTION("Values that do not fit") {
    string path =
        writeConfig(configDir, "[Networking]\nport = 4294975488\n");
    REQUIRE_THROWS_AS(config.loadIniFile(path), std::runtime_error);
    REQUIRE(config.port == 8080);

    path = writeConfig(configDir, "[Debug]\nverbose = 9999999999\n");
    REQUIRE_THROWS_AS(config.loadIniFile(path), std::runtime_error);

    path = writeConfig(configDir, "[Validation]\nidle_timeout = nan\n");
    REQUIRE_THROWS_AS(config.loadIniFile(path), std::runtime_error);

    path = writeConfig(configDir, "[Validation]\nidle_timeout = 1e300\n");
    REQUIRE_THROWS_AS(config.loadIniFile(path), std::runtime_error);

    path = writeConfig(configDir, "[Validation]\nidle_timeout = -2\n");
    REQUIRE_THROWS_AS(config.loadIniFile(path), std::runtime_error);
    REQUIRE(config.session.idleTimeoutMs == 30000);
  }

  SECTION("Missing file") {
    REQUIRE_THROWS_AS(config.loadIniFile(configDir + "/missing.cfg"),
                      std::runtime_error);
  }

  fs::remove_all(configDir);
}

TEST_CASE("Command line flags override the INI file", "[ServerConfig]") {
  string dirPattern = GetTempDirectory() + string("sg_config_XXXXXXXX");
  string configDir = string(mkdtemp(&dirPattern[0]));
  string path = writeConfig(configDir,
                            "[Networking]\n"
                            "host = 0.0.0.0\n"
                            "port = 9090\n"
                            "[Validation]\n"
                            "timeout_threshold = 2.5\n"
                            "idle_timeout = 4\n"
                            "first_step = 3\n"
                            "[Debug]\n"
                            "verbose = 2\n");
  ServerConfig config;
  config.loadIniFile(path);
  cxxopts::Options options("stepserver", "test");

  SECTION("Explicit flags win") {
    auto result = parseFlags(
        &options, {"stepserver", "--port", "9191", "--timeout", "7"});
    config.applyCommandLine(result);
    REQUIRE(config.port == 9191);
    REQUIRE(config.session.timeoutThreshold == 7.0);
    REQUIRE(config.host == "0.0.0.0");
    REQUIRE(config.session.idleTimeoutMs == 4000);
    REQUIRE(config.session.requiredFirstStep == 3);
    REQUIRE(config.verbose == 2);
    REQUIRE_NOTHROW(config.validate());
  }

  SECTION("Flag defaults leave the INI values alone") {
    auto result = parseFlags(&options, {"stepserver"});
    config.applyCommandLine(result);
    REQUIRE(config.host == "0.0.0.0");
    REQUIRE(config.port == 9090);
    REQUIRE(config.session.timeoutThreshold == 2.5);
    REQUIRE(config.session.idleTimeoutMs == 4000);
    REQUIRE(config.session.requiredFirstStep == 3);
    REQUIRE(config.verbose == 2);
  }

  SECTION("Idle timeout flag is converted to milliseconds") {
    auto result =
        parseFlags(&options, {"stepserver", "--idle_timeout", "0.25"});
    config.applyCommandLine(result);
    REQUIRE(config.session.idleTimeoutMs == 250);
    REQUIRE(config.port == 9090);
  }

  SECTION("Idle timeout flag that does not fit") {
    auto result =
        parseFlags(&options, {"stepserver", "--idle_timeout", "1e300"});
    REQUIRE_THROWS_AS(config.applyCommandLine(result), std::runtime_error);
  }

  fs::remove_all(configDir);
}

TEST_CASE("ServerConfig rejects out of range values", "[ServerConfig]") {
  ServerConfig config;

  SECTION("Port") {
    config.port = 0;
    REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
    config.port = 70000;
    REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
  }

  SECTION("Threshold") {
    config.session.timeoutThreshold = -1;
    REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
    config.session.timeoutThreshold = std::nan("");
    REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
    config.session.timeoutThreshold = std::numeric_limits<double>::infinity();
    REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
  }

  SECTION("Idle timeout") {
    config.session.idleTimeoutMs = 0;
    REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
  }

  SECTION("First step") {
    config.session.requiredFirstStep = -2;
    REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
    config.session.requiredFirstStep = 0;
    REQUIRE_NOTHROW(config.validate());
  }
}
