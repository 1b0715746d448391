#ifndef HTTP_UTILS_H_
#define HTTP_UTILS_H_

/// Log HTTP requests

#include <string>
#include <httplib.h>

namespace http_utils {

std::string FormatOneParam(const httplib::Params&);
std::string FormatOneParam(const httplib::Headers&);

bool IsSuccess(int code);

// to be used as httplib::Server logger
void LogRequest(const httplib::Request&, const httplib::Response&);

} // namespace http_utils

#endif  // HTTP_UTILS_H_
