#include <signal.h>
#include <unistd.h>
#include <thread>
#include <fstream>
#include <iostream>
#include <cstring>
#include <iterator>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <runbox/paths.h>
#include <runbox/utils.h>
#include <runbox/logger.h>
#include <runbox/cancel.h>
#include <runbox/engine.h>
#include <runbox/result_channel.h>
#include "server_io.h"

namespace {

bool to_serve = false;
ExecutionRequest request;
CancelToken cancel;

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string box_root = ini[""]["box_root"] | "";
  std::string runtime = ini[""]["runtime"] | "";
  std::string policy = ini[""]["syscall_policy"] | "";
  if (box_root.size()) kBoxRoot = box_root;
  if (runtime.size()) kRuntime = runtime;
  if (policy.size()) {
    auto mode = GetPolicyMode(policy);
    if (!mode) {
      spdlog::error("Unknown syscall_policy {}", policy);
      return false;
    }
    kPolicyMode = mode.value();
  }
  kDefaultTimeout = ini[""]["timeout_seconds"] | kDefaultTimeout;
  kDefaultMaxOutput = ini[""]["max_output_bytes"] | kDefaultMaxOutput;
  kProvisionTimeout = ini[""]["provision_timeout_seconds"] | kProvisionTimeout;
  kMemoryLimit = ini[""]["memory_limit_mib"] | kMemoryLimit;
  kFileSizeLimit = ini[""]["file_size_limit_mib"] | kFileSizeLimit;
  kMaxOpenFiles = ini[""]["max_open_files"] | kMaxOpenFiles;
  kMaxProcesses = ini[""]["max_processes"] | kMaxProcesses;
  kIndexUrl = ini[""]["index_url"] | kIndexUrl;
  kMaxParallel = ini[""]["parallel"] | kMaxParallel;
  kHost = ini[""]["host"] | kHost;
  kPort = ini[""]["port"] | kPort;
  return true;
}

bool CheckConfig() {
  if (kDefaultTimeout <= 0 || kDefaultMaxOutput <= 0 || kProvisionTimeout <= 0) {
    spdlog::error("timeout_seconds, max_output_bytes and provision_timeout_seconds must be positive");
    return false;
  }
  if (kDefaultTimeout > kMaxTimeoutSeconds || kProvisionTimeout > kMaxTimeoutSeconds) {
    spdlog::error("Timeouts must not exceed {} seconds", kMaxTimeoutSeconds);
    return false;
  }
  if (kMemoryLimit < 0 || kFileSizeLimit < 0 || kMaxOpenFiles < 0 || kMaxProcesses < 0) {
    spdlog::error("Resource limits must not be negative");
    return false;
  }
  if (kMaxParallel <= 0 || kPort <= 0 || kPort > 65535) {
    spdlog::error("Invalid parallel or port");
    return false;
  }
  return true;
}

bool ReadProgram(std::istream& in, std::string& code) {
  code.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return !in.bad();
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "runbox");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/runbox.conf"))
    .help("Path of configuration file (ignored if it does not exist)");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-e", "--eval")
    .help("Program text to run");
  parser.add_argument("-f", "--file")
    .help("Read the program from a file (default: stdin)");
  parser.add_argument("-d", "--dependency")
    .append()
    .help("Package to install before running; may be repeated");
  parser.add_argument("-t", "--timeout")
    .scan<'d', long>()
    .help("Execution timeout in seconds");
  parser.add_argument("-m", "--max-output")
    .scan<'d', long>()
    .help("Bytes of stdout/stderr kept per stream");
  parser.add_argument("--policy")
    .help("Syscall policy: strict, interpreter or none");
  parser.add_argument("--serve")
    .default_value(false)
    .implicit_value(true)
    .help("Run the HTTP service instead of a single program");
  parser.add_argument("--host")
    .help("Address of the HTTP service");
  parser.add_argument("--port")
    .scan<'d', int>()
    .help("Port of the HTTP service");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of requests served in parallel");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  fs::path config_file = parser.get<std::string>("--config");
  if (std::error_code ec; fs::exists(config_file, ec)) {
    if (!ParseConfig(config_file)) {
      spdlog::error("Failed to parse configuration file {}", std::string(config_file));
      exit(1);
    }
  } else if (parser.is_used("--config")) {
    spdlog::error("Configuration file {} does not exist", std::string(config_file));
    exit(1);
  }
  if (auto val = parser.present<long>("--timeout")) kDefaultTimeout = val.value();
  if (auto val = parser.present<long>("--max-output")) kDefaultMaxOutput = val.value();
  if (auto val = parser.present("--policy")) {
    auto mode = GetPolicyMode(val.value());
    if (!mode) {
      spdlog::error("Unknown policy {}", val.value());
      exit(1);
    }
    kPolicyMode = mode.value();
  }
  if (auto val = parser.present("--host")) kHost = val.value();
  if (auto val = parser.present<int>("--port")) kPort = val.value();
  if (auto val = parser.present<int>("--parallel")) kMaxParallel = val.value();
  if (!CheckConfig()) exit(1);

  to_serve = parser["--serve"] == true;
  if (to_serve) return;

  request = ExecutionRequest();
  if (auto deps = parser.present<std::vector<std::string>>("--dependency")) {
    request.extra_dependencies = deps.value();
  }
  if (auto code = parser.present("--eval")) {
    request.code = code.value();
  } else if (auto file = parser.present("--file")) {
    std::ifstream fin(file.value(), std::ios::binary);
    if (!fin || !ReadProgram(fin, request.code)) {
      spdlog::error("Failed to read {}", file.value());
      exit(1);
    }
  } else if (!ReadProgram(std::cin, request.code)) {
    spdlog::error("Failed to read the program from stdin");
    exit(1);
  }
}

// The first SIGINT/SIGTERM cancels the running request (or stops the server) so that
// teardown still runs; a second one exits immediately.
void WaitStopSignals(sigset_t signals) {
  for (int received = 0;; received++) {
    int sig;
    if (int err = sigwait(&signals, &sig)) {
      spdlog::error("sigwait failed: {}", strerror(err));
      return;
    }
    if (received) _exit(128 + sig);
    spdlog::warn("Received {}, stopping", strsignal(sig));
    if (to_serve) {
      StopServer();
    } else {
      cancel.Cancel();
    }
  }
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  ParseArgs(argc, argv);
  // blocked before any other thread exists so that only WaitStopSignals receives them
  sigset_t stop_signals;
  sigemptyset(&stop_signals);
  sigaddset(&stop_signals, SIGINT);
  sigaddset(&stop_signals, SIGTERM);
  if (int err = pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr)) {
    spdlog::error("pthread_sigmask failed: {}", strerror(err));
    return 1;
  }
  std::thread(WaitStopSignals, stop_signals).detach();
  InitEngine();
  if (to_serve) return ServerWorkLoop() ? 0 : 1;
  std::cout << DumpResponse(RunToResponse(request, {}, &cancel), 2) << std::endl;
}
