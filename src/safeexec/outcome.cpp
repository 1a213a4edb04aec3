#include <safeexec/outcome.h>

#include <spdlog/spdlog.h>

namespace {

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;

inline std::string TrimNewlines(const std::string& str) {
  size_t end = str.find_last_not_of("\r\n");
  return end == std::string::npos ? "" : str.substr(0, end + 1);
}

inline std::string Trim(const std::string& str) {
  constexpr char kSpaces[] = " \t\r\n";
  size_t begin = str.find_first_not_of(kSpaces);
  if (begin == std::string::npos) return "";
  return str.substr(begin, str.find_last_not_of(kSpaces) - begin + 1);
}

} // namespace

#define X(...) X_RETURN_ARG2(OutcomeKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* OutcomeKindName, OutcomeKind, ENUM_OUTCOME_KIND_)
#undef X

#define X(...) X_RETURN_ARG3(OutcomeKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(int OutcomeKindHttpStatus, OutcomeKind, ENUM_OUTCOME_KIND_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3

ExecutionOutcome ExecutionOutcome::Success(std::string out) {
  return ExecutionOutcome(OutcomeKind::SUCCESS, "", std::move(out), "");
}

ExecutionOutcome ExecutionOutcome::Failure(
    OutcomeKind kind, std::string message, std::string out, std::string err) {
  if (kind == OutcomeKind::SUCCESS) {
    spdlog::warn("Failure outcome built with kind success: {}", message);
    kind = OutcomeKind::RUNTIME_ERROR;
  }
  return ExecutionOutcome(kind, std::move(message), std::move(out), std::move(err));
}

nlohmann::json OutcomeToJson(const ExecutionOutcome& outcome) {
  using nlohmann::json;
  if (outcome.IsSuccess()) {
    return {{"output", TrimNewlines(outcome.Stdout())}};
  }
  json ret{
    {"error", outcome.Message()},
    {"kind", OutcomeKindName(outcome.Kind())},
  };
  if (std::string out = Trim(outcome.Stdout()); !out.empty()) ret["output"] = out;
  if (std::string err = Trim(outcome.Stderr()); !err.empty()) ret["stderr"] = err;
  return ret;
}
