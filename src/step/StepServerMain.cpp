#include <cxxopts.hpp>

#include "LogHandler.hpp"
#include "ServerConfig.hpp"
#include "StepServer.hpp"
#include "TcpSocketHandler.hpp"

using namespace sg;

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  sg::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, sg::InterruptSignalHandler);

  cxxopts::Options options("stepserver",
                           "Validates ordered, rate-limited step sequences");
  ServerConfig config;
  string logDirectory = GetTempDirectory() + "stepserver";
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logdir", "Directory for log files",
         cxxopts::value<std::string>())  //
        ("logtostdout", "log to stdout")  //
        ;
    ServerConfig::addCommandLineOptions(&options);

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "stepserver version " << SG_VERSION << endl;
      exit(0);
    }

    if (result.count("cfgfile") && !result["cfgfile"].as<string>().empty()) {
      config.loadIniFile(result["cfgfile"].as<string>());
    }
    // Flags given on the command line win over the config file.
    config.applyCommandLine(result);
    if (result.count("logdir")) {
      logDirectory = result["logdir"].as<string>();
    }
    config.validate();

    LogHandler::setVerbosity(&defaultConf, config.verbose, config.silent);
    LogFileOptions logOptions;
    logOptions.directory = logDirectory;
    logOptions.prefix = "stepserver";
    logOptions.toStdout = result.count("logtostdout") > 0;
    logOptions.appendPid = true;
    logOptions.maxLogSize = config.maxLogSize;
    LogHandler::setupLogFile(&defaultConf, logOptions);
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error &re) {
    CLOG(INFO, "stdout") << "Invalid configuration: " << re.what() << endl;
    exit(1);
  }

  GOOGLE_PROTOBUF_VERIFY_VERSION;

  // Reconfigure default logger to apply settings above
  el::Loggers::reconfigureLogger("default", defaultConf);
  // set thread name
  el::Helpers::setThreadName("stepserver-main");
  // Install log rotation callback
  el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

  std::shared_ptr<SocketHandler> tcpSocketHandler(new TcpSocketHandler());
  try {
    StepServer server(tcpSocketHandler, config.getEndpoint(), config.session);
    CLOG(INFO, "stdout") << "Listening on " << config.getEndpoint()
                         << ". Timeout threshold: "
                         << config.session.timeoutThreshold << endl;
    server.run();
  } catch (const std::runtime_error &re) {
    LOG(ERROR) << "Server failed: " << re.what();
    CLOG(INFO, "stdout") << "Server failed: " << re.what() << endl;
    el::Helpers::uninstallPreRollOutCallback();
    return 1;
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
