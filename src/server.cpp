#include "server.h"

#include <fstream>
#include <sstream>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <coderun/sanitize.h>
#include "http_utils.h"

namespace {

constexpr char kJsonType[] = "application/json";

HttpReply Error(const std::string& msg) {
  return {400, {{"error", msg}}};
}

} // namespace

std::string HttpReply::Dump() const {
  // guest output is arbitrary bytes
  return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

size_t Utf8Length(const std::string& str) {
  size_t ret = 0;
  for (unsigned char c : str) {
    if ((c & 0xC0) != 0x80) ret++; // not a continuation byte
  }
  return ret;
}

HttpReply HandleRun(const std::string& body, Executor& executor, long max_code_size) {
  using nlohmann::json;
  json data = json::parse(body, nullptr, false);
  if (data.is_discarded() || !data.is_object() || !data.contains("code")) {
    return Error("Missing 'code' field");
  }
  const json& code = data["code"];
  if (!code.is_string()) return Error("'code' must be a string");
  const std::string& source = code.get_ref<const std::string&>();
  if (size_t len = Utf8Length(source); len > (size_t)max_code_size) {
    spdlog::info("Rejected code of {} characters", len);
    return Error(fmt::format("Code too long (max {} characters)", max_code_size));
  }
  ExecutionResult res = executor.Run(source);
  return {200, {{"output", ShortenTraceback(res.output)}, {"exit_code", res.exit_code}}};
}

bool ReadIndexPage(const fs::path& static_dir, std::string& html) {
  std::ifstream fin(static_dir / "index.html", std::ios::binary);
  if (!fin) return false;
  std::stringstream ss;
  ss << fin.rdbuf();
  html = ss.str();
  return true;
}

void RegisterRoutes(httplib::Server& svr, Executor& executor, const ServerConfig& config) {
  svr.Get("/", [static_dir = config.static_dir](const httplib::Request&, httplib::Response& res) {
    std::string html;
    if (!ReadIndexPage(static_dir, html)) {
      spdlog::warn("Cannot read {}", (static_dir / "index.html").c_str());
      res.status = 404;
      res.set_content("Not Found", "text/plain");
      return;
    }
    res.set_content(html, "text/html");
  });
  svr.Post("/run", [&executor, max_code_size = config.max_code_size](
      const httplib::Request& req, httplib::Response& res) {
    HttpReply reply = HandleRun(req.body, executor, max_code_size);
    res.status = reply.status;
    res.set_content(reply.Dump(), kJsonType);
  });
  svr.set_logger(http_utils::LogRequest);
}
