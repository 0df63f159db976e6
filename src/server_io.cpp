#include "server_io.h"

#include <atomic>
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <runbox/cancel.h>
#include <runbox/engine.h>
#include <runbox/utils.h>
#include <runbox/result_channel.h>
#include "http_utils.h"

std::string kHost = "localhost";
int kPort = 9624;
int kMaxParallel = 4;

namespace {

const char kJsonType[] = "application/json";

std::atomic<httplib::Server*> running_server = nullptr;
// shared by every request; cancelled once on shutdown
CancelToken shutdown;

void SendJson(httplib::Response& res, int status, const nlohmann::json& body) {
  res.status = status;
  res.set_content(DumpResponse(body) + "\n", kJsonType);
}

void HandleRun(const httplib::Request& req, httplib::Response& res) {
  nlohmann::json body = nlohmann::json::parse(req.body, nullptr, false);
  if (body.is_discarded()) {
    SendJson(res, 400, InvalidRequestResponse("request body is not valid JSON"));
    return;
  }
  std::string error;
  std::optional<ExecutionRequest> request = ParseRequest(body, &error);
  if (!request) {
    SendJson(res, 400, InvalidRequestResponse(error));
    return;
  }
  Reporter reporter;
  reporter.ReportEnvironmentCreated = [&](long id, const std::filesystem::path&) {
    spdlog::info("Request from {} runs in environment {}", req.remote_addr, id);
  };
  SendJson(res, 200, RunToResponse(*request, reporter, &shutdown));
}

void HandleStatus(const httplib::Request&, httplib::Response& res) {
  EngineStatus status = GetEngineStatus();
  nlohmann::json body = {
    {"sandbox", SandboxStrengthName(status.strength)},
    {"policy", PolicyModeName(status.mode)},
    {"runtime", kRuntime.string()},
    {"runtime_found", status.runtime_found},
  };
  if (!status.warning.empty()) body["warning"] = status.warning;
  SendJson(res, 200, body);
}

} // namespace

bool ServerWorkLoop() {
  httplib::Server svr;
  svr.new_task_queue = [] { return new httplib::ThreadPool(kMaxParallel); };
  svr.set_logger(http_utils::LogRequest);
  svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
    std::string what = "unknown error";
    try {
      std::rethrow_exception(ep);
    } catch (const std::exception& e) {
      what = e.what();
    }
    spdlog::error("Handler of {} {} threw: {}", req.method, req.path, what);
    SendJson(res, 500, InvalidRequestResponse("internal error: " + what));
  });
  svr.Post("/run", HandleRun);
  svr.Get("/status", HandleStatus);

  if (!svr.bind_to_port(kHost, kPort)) {
    spdlog::error("Failed to listen on {}:{}", kHost, kPort);
    return false;
  }
  spdlog::warn("Listening on {}:{} with {} workers", kHost, kPort, kMaxParallel);
  running_server = &svr;
  bool ret = svr.listen_after_bind() || shutdown.IsCancelled();
  running_server = nullptr;
  return ret;
}

void StopServer() {
  shutdown.Cancel();
  if (httplib::Server* svr = running_server.load()) svr->stop();
}
