#include <cxxopts.hpp>

#include "LogHandler.hpp"
#include "StepClient.hpp"
#include "StepFixture.hpp"
#include "TcpSocketHandler.hpp"

using namespace sg;

// Exit code when the fixture cannot be loaded.
const int FIXTURE_ERROR_EXIT_CODE = 3;

int main(int argc, char** argv) {
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  sg::HandleTerminate();
  ::signal(SIGINT, sg::InterruptSignalHandler);

  cxxopts::Options options("stepclient",
                           "Sends a fixture of steps to a stepserver");
  string fixturePath;
  SocketEndpoint serverEndpoint;
  try {
    options.add_options()         //
        ("h,help", "Print help")  //
        ("data",
         "Test data to send: 'success' for success_data.json, 'failure' for "
         "failure_data.json",
         cxxopts::value<string>()->default_value("success"))  //
        ("fixture_dir", "Directory holding the <data>_data.json fixtures",
         cxxopts::value<string>()->default_value("test_data"))  //
        ("fixture", "Explicit fixture file (overrides --data)",
         cxxopts::value<string>())  //
        ("host", "Server host",
         cxxopts::value<string>()->default_value("localhost"))  //
        ("port", "Server port",
         cxxopts::value<int>()->default_value("8080"))  //
        ("logtostdout", "log to stdout")                 //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }

    string dataSet = result["data"].as<string>();
    if (!isKnownDataSet(dataSet)) {
      CLOG(INFO, "stdout") << "Invalid --data '" << dataSet
                           << "', expected success or failure\n"
                           << endl;
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(1);
    }

    if (result.count("fixture")) {
      fixturePath = result["fixture"].as<string>();
    } else {
      fixturePath =
          fixturePathForDataSet(result["fixture_dir"].as<string>(), dataSet);
    }
    serverEndpoint.set_name(result["host"].as<string>());
    serverEndpoint.set_port(result["port"].as<int>());

    LogHandler::setVerbosity(&defaultConf, result["verbose"].as<int>(),
                             false);
    defaultConf.setGlobally(el::ConfigurationType::ToStandardOutput,
                            result.count("logtostdout") ? "true" : "false");
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  GOOGLE_PROTOBUF_VERIFY_VERSION;
  el::Loggers::reconfigureLogger("default", defaultConf);
  el::Helpers::setThreadName("stepclient-main");

  vector<FixtureStep> steps;
  try {
    steps = loadFixtureFile(fixturePath);
  } catch (const FixtureError& fe) {
    CLOG(INFO, "stdout") << "Fixture error: " << fe.what() << endl;
    return FIXTURE_ERROR_EXIT_CODE;
  }
  CLOG(INFO, "stdout") << "Loaded " << steps.size() << " steps from "
                       << fixturePath << endl;

  std::shared_ptr<SocketHandler> tcpSocketHandler(new TcpSocketHandler());
  StepClient client(tcpSocketHandler, serverEndpoint, steps);
  ClientResult clientResult = client.run();

  switch (clientResult.status) {
    case ClientStatus::SUCCESS:
      CLOG(INFO, "stdout") << "All " << clientResult.stepsAcknowledged
                           << " steps succeeded" << endl;
      break;
    case ClientStatus::REJECTED:
      CLOG(INFO, "stdout") << "Step " << clientResult.failedStepId << " - "
                           << describeResponseCode(clientResult.code) << " ("
                           << ResponseCode_Name(clientResult.code)
                           << "): " << clientResult.error << endl;
      break;
    case ClientStatus::CONNECTION_ERROR:
      CLOG(INFO, "stdout") << "Connection error: " << clientResult.error
                           << endl;
      break;
  }
  return clientResult.exitCode();
}
