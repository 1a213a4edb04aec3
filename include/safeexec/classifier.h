#ifndef INCLUDE_SAFEEXEC_CLASSIFIER_H_
#define INCLUDE_SAFEEXEC_CLASSIFIER_H_

#include <string>

#include "outcome.h"
#include "sandbox_process.h"

// Precedence (first match wins):
//   timed out > backend fault > out of memory > network denied > nonzero exit / signal > success
// Never fails; anything unrecognized becomes RUNTIME_ERROR.
ExecutionOutcome Classify(const RawResult&);

// connection refused / unreachable / name resolution failures
bool MatchesNetworkDenial(const std::string& err);

#endif  // INCLUDE_SAFEEXEC_CLASSIFIER_H_
