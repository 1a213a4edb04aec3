#ifndef INCLUDE_SAFEEXEC_SUPERVISOR_H_
#define INCLUDE_SAFEEXEC_SUPERVISOR_H_

#include <string>
#include <filesystem>

#include "policy.h"
#include "outcome.h"
#include "backend.h"

// Turns one code string into one bounded, cleaned-up execution.
// Run() may be called from any number of threads at once; the supervisor itself
// holds nothing but const references.
class Supervisor {
  const ResourceLimitPolicy& policy_;
  const IsolationBackend& backend_;
  const std::filesystem::path workspace_root_;

  RawResult Supervise_(SandboxProcess&) const;
 public:
  // policy and backend must outlive the supervisor
  Supervisor(const ResourceLimitPolicy& policy, const IsolationBackend& backend,
             std::filesystem::path workspace_root) :
      policy_(policy), backend_(backend), workspace_root_(std::move(workspace_root)) {}

  ExecutionOutcome Run(const std::string& code) const;

  const ResourceLimitPolicy& Policy() const { return policy_; }
};

// number of UTF-8 code points
size_t CodeLength(const std::string& code);

#endif  // INCLUDE_SAFEEXEC_SUPERVISOR_H_
