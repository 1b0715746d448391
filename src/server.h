#ifndef SERVER_H_
#define SERVER_H_

#include <string>

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <coderun/executor.h>

#include "config.h"

struct HttpReply {
  int status;
  nlohmann::json body;

  std::string Dump() const;
};

// number of Unicode code points in a UTF-8 string; invalid bytes count as one each
size_t Utf8Length(const std::string&);

// POST /run: validate the request, invoke the executor and shape its result
HttpReply HandleRun(const std::string& body, Executor&, long max_code_size);

// GET /: the bundled web page; false if it cannot be read
bool ReadIndexPage(const fs::path& static_dir, std::string& html);

void RegisterRoutes(httplib::Server&, Executor&, const ServerConfig&);

#endif  // SERVER_H_
