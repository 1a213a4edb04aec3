#ifndef INCLUDE_SAFEEXEC_OUTCOME_H_
#define INCLUDE_SAFEEXEC_OUTCOME_H_

#include <string>

#include <nlohmann/json.hpp>

// name, abbreviation, HTTP status
#define ENUM_OUTCOME_KIND_ \
  X(SUCCESS, "success", 200) \
  /* rejected before execution */ \
  X(TOO_LONG, "too_long", 400) \
  /* faults of the submitted code */ \
  X(TIMEOUT, "timeout", 408) \
  X(MEMORY_EXCEEDED, "memory_exceeded", 400) \
  X(NETWORK_DENIED, "network_denied", 400) \
  X(RUNTIME_ERROR, "runtime_error", 400) \
  /* faults of the sandbox itself */ \
  X(BACKEND_UNAVAILABLE, "backend_unavailable", 500)
enum class OutcomeKind {
#define X(name, abr, status) name,
  ENUM_OUTCOME_KIND_
#undef X
};

const char* OutcomeKindName(OutcomeKind);
int OutcomeKindHttpStatus(OutcomeKind);

class ExecutionOutcome {
  OutcomeKind kind_;
  std::string message_;
  std::string stdout_, stderr_;

  ExecutionOutcome(OutcomeKind kind, std::string&& message, std::string&& out, std::string&& err) :
      kind_(kind), message_(std::move(message)), stdout_(std::move(out)), stderr_(std::move(err)) {}
 public:
  static ExecutionOutcome Success(std::string out);
  // kind must not be SUCCESS
  static ExecutionOutcome Failure(OutcomeKind kind, std::string message,
                                  std::string out = "", std::string err = "");

  bool IsSuccess() const { return kind_ == OutcomeKind::SUCCESS; }
  OutcomeKind Kind() const { return kind_; }
  // empty on success
  const std::string& Message() const { return message_; }
  const std::string& Stdout() const { return stdout_; }
  const std::string& Stderr() const { return stderr_; }
};

// Response body of POST /run
nlohmann::json OutcomeToJson(const ExecutionOutcome&);

#endif  // INCLUDE_SAFEEXEC_OUTCOME_H_
