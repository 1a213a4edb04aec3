#include <safeexec/http_api.h>

#include <spdlog/spdlog.h>

RunResponse HandleRunRequest(const Supervisor& supervisor, const std::string& body) {
  nlohmann::json req;
  try {
    req = nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error& err) {
    spdlog::info("Rejected request body: {}", err.what());
    return {400, {{"error", "invalid JSON body"}}};
  }
  auto it = req.is_object() ? req.find("code") : req.end();
  if (it == req.end() || !it->is_string()) {
    return {400, {{"error", "code must be a string"}}};
  }
  ExecutionOutcome outcome = supervisor.Run(it->get<std::string>());
  return {OutcomeKindHttpStatus(outcome.Kind()), OutcomeToJson(outcome)};
}

std::string DumpBody(const nlohmann::json& body) {
  return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}
