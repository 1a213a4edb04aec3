#include <safeexec/policy.h>

#include <fmt/core.h>

bool ValidatePolicy(const ResourceLimitPolicy& policy, std::string& err) {
  if (policy.timeout.count() <= 0) {
    err = fmt::format("timeout must be positive (got {} ms)", policy.timeout.count());
  } else if (policy.memory_bytes < 6L * 1024 * 1024) {
    // docker rejects --memory below 6 MiB
    err = fmt::format("memory limit too small (got {} bytes)", policy.memory_bytes);
  } else if (!(policy.cpu_share > 0)) {
    err = fmt::format("cpu share must be positive (got {})", policy.cpu_share);
  } else if (policy.max_processes <= 0) {
    err = fmt::format("process limit must be positive (got {})", policy.max_processes);
  } else if (policy.max_code_chars == 0) {
    err = "code length limit must be positive";
  } else if (policy.max_output_bytes == 0) {
    err = "output limit must be positive";
  } else {
    return true;
  }
  return false;
}
