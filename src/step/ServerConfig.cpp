#include "ServerConfig.hpp"

#include "SimpleIni.h"

namespace sg {
namespace {
int64_t parseInteger(const string& key, const char* value) {
  char* end = NULL;
  errno = 0;
  long long parsed = strtoll(value, &end, 10);
  if (end == value || *end != '\0' || errno == ERANGE) {
    throw std::runtime_error("Invalid integer for " + key + ": " + value);
  }
  return parsed;
}

double parseDouble(const string& key, const char* value) {
  char* end = NULL;
  errno = 0;
  double parsed = strtod(value, &end);
  if (end == value || *end != '\0' || errno == ERANGE) {
    throw std::runtime_error("Invalid number for " + key + ": " + value);
  }
  return parsed;
}

int parseInt(const string& key, const char* value) {
  int64_t parsed = parseInteger(key, value);
  if (parsed < std::numeric_limits<int>::min() ||
      parsed > std::numeric_limits<int>::max()) {
    throw std::runtime_error("Value out of range for " + key + ": " + value);
  }
  return int(parsed);
}

int64_t secondsToMs(const string& key, double seconds) {
  // Also rejects NaN.
  if (!(seconds >= 0 && seconds * 1000 < 9.2e18)) {
    throw std::runtime_error("Value out of range for " + key + ": " +
                             to_string(seconds));
  }
  return int64_t(seconds * 1000);
}
}  // namespace

void ServerConfig::loadIniFile(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }

  const char* hostString = ini.GetValue("Networking", "host", NULL);
  if (hostString) {
    host = string(hostString);
  }
  const char* portString = ini.GetValue("Networking", "port", NULL);
  if (portString) {
    port = parseInt("port", portString);
  }

  const char* threshold =
      ini.GetValue("Validation", "timeout_threshold", NULL);
  if (threshold) {
    session.timeoutThreshold = parseDouble("timeout_threshold", threshold);
  }
  const char* idleTimeout = ini.GetValue("Validation", "idle_timeout", NULL);
  if (idleTimeout) {
    session.idleTimeoutMs =
        secondsToMs("idle_timeout", parseDouble("idle_timeout", idleTimeout));
  }
  const char* firstStep = ini.GetValue("Validation", "first_step", NULL);
  if (firstStep) {
    session.requiredFirstStep = parseInteger("first_step", firstStep);
  }

  const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
  if (vlevel) {
    verbose = parseInt("verbose", vlevel);
  }
  const char* silentString = ini.GetValue("Debug", "silent", NULL);
  if (silentString) {
    silent = parseInteger("silent", silentString) != 0;
  }
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && parseInteger("logsize", logsize) > 0) {
    maxLogSize = string(logsize);
  }
}

void ServerConfig::addCommandLineOptions(cxxopts::Options* options) {
  options->add_options()  //
      ("host", "Host or IP to listen on",
       cxxopts::value<string>()->default_value("localhost"))  //
      ("port", "Port to listen on",
       cxxopts::value<int>()->default_value("8080"))  //
      ("timeout", "Minimum wait_seconds a step must carry",
       cxxopts::value<double>()->default_value("5"))  //
      ("idle_timeout", "Seconds a session may go without a complete frame",
       cxxopts::value<double>()->default_value("30"))  //
      ("first_step", "Required id of the first step (-1 for any)",
       cxxopts::value<int64_t>()->default_value("-1"))  //
      ("v,verbose", "Enable verbose logging",
       cxxopts::value<int>()->default_value("0"), "LEVEL")  //
      ;
}

void ServerConfig::applyCommandLine(const cxxopts::ParseResult& result) {
  if (result.count("host")) {
    host = result["host"].as<string>();
  }
  if (result.count("port")) {
    port = result["port"].as<int>();
  }
  if (result.count("timeout")) {
    session.timeoutThreshold = result["timeout"].as<double>();
  }
  if (result.count("idle_timeout")) {
    session.idleTimeoutMs =
        secondsToMs("idle_timeout", result["idle_timeout"].as<double>());
  }
  if (result.count("first_step")) {
    session.requiredFirstStep = result["first_step"].as<int64_t>();
  }
  if (result.count("verbose")) {
    verbose = result["verbose"].as<int>();
  }
}

void ServerConfig::validate() const {
  if (port <= 0 || port > 65535) {
    throw std::runtime_error("Port out of range: " + to_string(port));
  }
  if (!(session.timeoutThreshold >= 0) ||
      !std::isfinite(session.timeoutThreshold)) {
    throw std::runtime_error("Timeout threshold must be a finite value >= 0");
  }
  if (session.idleTimeoutMs <= 0) {
    throw std::runtime_error("Idle timeout must be positive");
  }
  if (session.requiredFirstStep < ANY_FIRST_STEP) {
    throw std::runtime_error("First step must be -1 (any) or >= 0");
  }
}

SocketEndpoint ServerConfig::getEndpoint() const {
  SocketEndpoint endpoint;
  endpoint.set_port(port);
  if (host.length()) {
    endpoint.set_name(host);
  }
  return endpoint;
}
}  // namespace sg
