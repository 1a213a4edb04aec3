#include <safeexec/outcome.h>
#include <safeexec/supervisor.h>
#include "utils.h"

TEST(OutcomeTest, SuccessJson) {
  auto res = ExecutionOutcome::Success("4\n\n");
  EXPECT_EQ(OutcomeToJson(res), nlohmann::json({{"output", "4"}}));
  EXPECT_EQ(OutcomeKindHttpStatus(res.Kind()), 200);
}

TEST(OutcomeTest, SuccessKeepsLeadingWhitespace) {
  auto res = ExecutionOutcome::Success("  indented\n");
  EXPECT_EQ(OutcomeToJson(res)["output"], "  indented");
}

TEST(OutcomeTest, FailureJson) {
  auto res = ExecutionOutcome::Failure(OutcomeKind::RUNTIME_ERROR, "boom", " out \n", "Traceback\n");
  EXPECT_EQ(OutcomeToJson(res), nlohmann::json({
    {"error", "boom"},
    {"kind", "runtime_error"},
    {"output", "out"},
    {"stderr", "Traceback"},
  }));
}

TEST(OutcomeTest, FailureJsonOmitsEmptyStreams) {
  auto res = ExecutionOutcome::Failure(OutcomeKind::TOO_LONG, "code too long (max 5000)");
  EXPECT_EQ(OutcomeToJson(res), nlohmann::json({
    {"error", "code too long (max 5000)"},
    {"kind", "too_long"},
  }));
}

TEST(OutcomeTest, FailureNeverSuccess) {
  auto res = ExecutionOutcome::Failure(OutcomeKind::SUCCESS, "odd");
  EXPECT_FALSE(res.IsSuccess());
}

TEST(OutcomeTest, HttpStatus) {
  EXPECT_EQ(OutcomeKindHttpStatus(OutcomeKind::SUCCESS), 200);
  EXPECT_EQ(OutcomeKindHttpStatus(OutcomeKind::TOO_LONG), 400);
  EXPECT_EQ(OutcomeKindHttpStatus(OutcomeKind::TIMEOUT), 408);
  EXPECT_EQ(OutcomeKindHttpStatus(OutcomeKind::MEMORY_EXCEEDED), 400);
  EXPECT_EQ(OutcomeKindHttpStatus(OutcomeKind::NETWORK_DENIED), 400);
  EXPECT_EQ(OutcomeKindHttpStatus(OutcomeKind::RUNTIME_ERROR), 400);
  EXPECT_EQ(OutcomeKindHttpStatus(OutcomeKind::BACKEND_UNAVAILABLE), 500);
}

TEST(CodeLengthTest, CountsCodePoints) {
  EXPECT_EQ(CodeLength(""), 0u);
  EXPECT_EQ(CodeLength("print(1)"), 8u);
  EXPECT_EQ(CodeLength("\xc3\xa9"), 1u);               // U+00E9
  EXPECT_EQ(CodeLength("\xe4\xb8\xad\xe6\x96\x87"), 2u); // two CJK characters
  EXPECT_EQ(CodeLength("\xf0\x9f\x98\x80"), 1u);       // U+1F600
}
