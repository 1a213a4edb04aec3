#include <safeexec/classifier.h>
#include "utils.h"

namespace {

struct ClassifyParam {
  const char* name;
  RawResult raw;
  OutcomeKind kind;
  std::string message;
};

RawResult Raw(int exit_code, int term_signal = 0, const std::string& err = "") {
  RawResult ret;
  ret.exit_code = exit_code;
  ret.term_signal = term_signal;
  ret.stdout_text = "partial output\n";
  ret.stderr_text = err;
  ret.timeout_ms = 10'000;
  return ret;
}

RawResult TimedOut(long timeout_ms) {
  RawResult ret = Raw(-1, 9);
  ret.timed_out = true;
  ret.timeout_ms = timeout_ms;
  return ret;
}

RawResult Oom(bool also_timed_out = false) {
  RawResult ret = Raw(137);
  ret.oom_killed = true;
  ret.timed_out = also_timed_out;
  return ret;
}

RawResult BackendFault(const std::string& message) {
  RawResult ret = Raw(125, 0, "docker: Error response from daemon: something\n");
  ret.backend_error = true;
  ret.backend_message = message;
  return ret;
}

RawResult Truncated(RawResult ret) {
  ret.output_truncated = true;
  return ret;
}

std::string ParamName(const ::testing::TestParamInfo<ClassifyParam>& info) {
  return info.param.name;
}

} // namespace

class ClassifyTest : public testing::TestWithParam<ClassifyParam> {};
TEST_P(ClassifyTest, Kind) {
  auto& param = GetParam();
  ExecutionOutcome res = Classify(param.raw);
  EXPECT_EQ(res.Kind(), param.kind) << OutcomeKindName(res.Kind());
  EXPECT_EQ(res.Message(), param.message);
  if (param.kind != OutcomeKind::SUCCESS) {
    EXPECT_EQ(res.Stdout(), param.raw.stdout_text);
    EXPECT_EQ(res.Stderr(), param.raw.stderr_text);
  }
}
INSTANTIATE_TEST_SUITE_P(Outcomes, ClassifyTest,
    testing::Values(
      ClassifyParam{"success", Raw(0), OutcomeKind::SUCCESS, ""},
      ClassifyParam{"success_with_stderr", Raw(0, 0, "DeprecationWarning: x\n"), OutcomeKind::SUCCESS, ""},
      ClassifyParam{"timeout", TimedOut(10'000), OutcomeKind::TIMEOUT,
                    "Execution timed out after 10 seconds"},
      ClassifyParam{"timeout_fractional", TimedOut(2'500), OutcomeKind::TIMEOUT,
                    "Execution timed out after 2.5 seconds"},
      ClassifyParam{"timeout_wins_over_oom", Oom(true), OutcomeKind::TIMEOUT,
                    "Execution timed out after 10 seconds"},
      ClassifyParam{"oom", Oom(), OutcomeKind::MEMORY_EXCEEDED, "Memory limit exceeded"},
      ClassifyParam{"oom_truncated", Truncated(Oom()), OutcomeKind::MEMORY_EXCEEDED,
                    "Memory limit exceeded (output truncated)"},
      ClassifyParam{"backend_fault", BackendFault("docker: Error response from daemon: something"),
                    OutcomeKind::BACKEND_UNAVAILABLE, "docker: Error response from daemon: something"},
      ClassifyParam{"backend_fault_without_message", BackendFault(""),
                    OutcomeKind::BACKEND_UNAVAILABLE, "sandbox backend failed"},
      ClassifyParam{"network_unreachable",
                    Raw(1, 0, "OSError: [Errno 101] Network is unreachable\n"),
                    OutcomeKind::NETWORK_DENIED, "Network access is disabled in the sandbox"},
      ClassifyParam{"name_resolution",
                    Raw(1, 0, "socket.gaierror: [Errno -3] Temporary failure in name resolution\n"),
                    OutcomeKind::NETWORK_DENIED, "Network access is disabled in the sandbox"},
      ClassifyParam{"connection_refused",
                    Raw(1, 0, "ConnectionRefusedError: [Errno 111] Connection refused\n"),
                    OutcomeKind::NETWORK_DENIED, "Network access is disabled in the sandbox"},
      ClassifyParam{"runtime_error", Raw(1, 0, "Traceback\nZeroDivisionError: division by zero\n"),
                    OutcomeKind::RUNTIME_ERROR, "Traceback\nZeroDivisionError: division by zero"},
      ClassifyParam{"runtime_error_no_stderr", Raw(3), OutcomeKind::RUNTIME_ERROR,
                    "process exited with code 3"},
      ClassifyParam{"runtime_error_truncated", Truncated(Raw(3)), OutcomeKind::RUNTIME_ERROR,
                    "process exited with code 3 (output truncated)"},
      ClassifyParam{"signal", Raw(-1, 11), OutcomeKind::RUNTIME_ERROR, "process killed by signal 11"}
    ),
    ParamName);

TEST(NetworkDenialTest, NeedsAbnormalExit) {
  // a program that handles the error itself and exits cleanly succeeded
  RawResult raw = Raw(0, 0, "Network is unreachable, continuing offline\n");
  EXPECT_TRUE(Classify(raw).IsSuccess());
}

TEST(NetworkDenialTest, Signatures) {
  EXPECT_TRUE(MatchesNetworkDenial("urllib.error.URLError: <urlopen error [Errno -3] Temporary failure>"));
  EXPECT_TRUE(MatchesNetworkDenial("OSError: [Errno 113] No route to host"));
  EXPECT_TRUE(MatchesNetworkDenial("NETWORK IS UNREACHABLE"));
  EXPECT_FALSE(MatchesNetworkDenial("ValueError: invalid literal for int()"));
  EXPECT_FALSE(MatchesNetworkDenial(""));
}
