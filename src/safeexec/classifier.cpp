#include <safeexec/classifier.h>

#include <regex>

#include <fmt/core.h>

namespace {

// What a Python (or libc) client prints when the sandbox has no usable network:
// ENETUNREACH, ECONNREFUSED, EHOSTUNREACH, and resolver failures without /etc/resolv.conf or a route.
const std::regex kNetworkDenialRegex(
    "network is unreachable|"
    "connection refused|"
    "no route to host|"
    "temporary failure in name resolution|"
    "name or service not known|"
    "name resolution|"
    "nodename nor servname|"
    "getaddrinfo failed|"
    "errno -3\\]|"
    "errno 101\\]|"
    "errno 111\\]|"
    "errno 113\\]",
    std::regex::icase | std::regex::optimize);

inline std::string TrimmedOr(const std::string& str, std::string&& fallback) {
  size_t begin = str.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return std::move(fallback);
  return str.substr(begin, str.find_last_not_of(" \t\r\n") - begin + 1);
}

inline std::string TimeoutSeconds(long ms) {
  if (ms % 1000 == 0) return std::to_string(ms / 1000);
  return fmt::format("{:.3g}", ms / 1000.0);
}

} // namespace

bool MatchesNetworkDenial(const std::string& err) {
  return std::regex_search(err, kNetworkDenialRegex);
}

ExecutionOutcome Classify(const RawResult& raw) {
  std::string suffix = raw.output_truncated ? " (output truncated)" : "";
  if (raw.timed_out) {
    return ExecutionOutcome::Failure(
        OutcomeKind::TIMEOUT,
        fmt::format("Execution timed out after {} seconds", TimeoutSeconds(raw.timeout_ms)),
        raw.stdout_text, raw.stderr_text);
  }
  if (raw.backend_error) {
    return ExecutionOutcome::Failure(
        OutcomeKind::BACKEND_UNAVAILABLE,
        TrimmedOr(raw.backend_message, "sandbox backend failed"),
        raw.stdout_text, raw.stderr_text);
  }
  if (raw.oom_killed) {
    return ExecutionOutcome::Failure(
        OutcomeKind::MEMORY_EXCEEDED, "Memory limit exceeded" + suffix,
        raw.stdout_text, raw.stderr_text);
  }
  bool abnormal = raw.exit_code != 0 || raw.term_signal != 0;
  if (abnormal && MatchesNetworkDenial(raw.stderr_text)) {
    return ExecutionOutcome::Failure(
        OutcomeKind::NETWORK_DENIED, "Network access is disabled in the sandbox",
        raw.stdout_text, raw.stderr_text);
  }
  if (abnormal) {
    std::string fallback = raw.term_signal != 0
        ? fmt::format("process killed by signal {}", raw.term_signal)
        : fmt::format("process exited with code {}", raw.exit_code);
    return ExecutionOutcome::Failure(
        OutcomeKind::RUNTIME_ERROR, TrimmedOr(raw.stderr_text, std::move(fallback)) + suffix,
        raw.stdout_text, raw.stderr_text);
  }
  return ExecutionOutcome::Success(raw.stdout_text);
}
