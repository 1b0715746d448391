#include "http_utils.h"

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace http_utils {

std::string FormatOneParam(const httplib::Params& params) {
  return fmt::format("{}", params);
}

std::string FormatOneParam(const httplib::Headers& headers) {
  auto it = headers.find("Content-Type");
  return it == headers.end() ? "" : it->second;
}

bool IsSuccess(int code) {
  return code >= 200 && code < 299;
}

void LogRequest(const httplib::Request& req, const httplib::Response& res) {
  auto level = IsSuccess(res.status) ? spdlog::level::info : spdlog::level::warn;
  spdlog::log(level, "{} {} from {} status={} params={} content_type={} request_size={} response_size={}",
      req.method, req.path, req.remote_addr, res.status, FormatOneParam(req.params),
      FormatOneParam(req.headers), req.body.size(), res.body.size());
}

} // namespace http_utils
