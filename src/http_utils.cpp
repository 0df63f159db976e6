#include "http_utils.h"

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace http_utils {

std::string FormatOneParam(const httplib::Params& params) {
  if (params.empty()) return "(none)";
  return fmt::format("{}", params);
}
std::string FormatOneParam(const httplib::Headers& headers) {
  auto it = headers.find("User-Agent");
  return it == headers.end() ? "-" : it->second;
}

bool IsSuccess(int code) {
  return code >= 200 && code < 299;
}

void LogRequest(const httplib::Request& req, const httplib::Response& res) {
  if (IsSuccess(res.status)) {
    spdlog::info("{} {} {} params {} body {} bytes agent {}", req.remote_addr, req.method, req.path,
                 FormatOneParam(req.params), req.body.size(), FormatOneParam(req.headers));
  } else {
    spdlog::warn("{} {} {} -> {}", req.remote_addr, req.method, req.path, res.status);
  }
}

} // namespace http_utils
