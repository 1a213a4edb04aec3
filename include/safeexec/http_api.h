#ifndef INCLUDE_SAFEEXEC_HTTP_API_H_
#define INCLUDE_SAFEEXEC_HTTP_API_H_

#include <string>

#include <nlohmann/json.hpp>

#include "supervisor.h"

struct RunResponse {
  int status;
  nlohmann::json body;
};

// Handle the body of one POST /run request: {"code": "<string>"}.
// Request validation failures never reach the supervisor.
RunResponse HandleRunRequest(const Supervisor&, const std::string& body);

// Serialize a response body; invalid UTF-8 in captured output is replaced, never thrown on.
std::string DumpBody(const nlohmann::json&);

#endif  // INCLUDE_SAFEEXEC_HTTP_API_H_
