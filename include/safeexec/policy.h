#ifndef INCLUDE_SAFEEXEC_POLICY_H_
#define INCLUDE_SAFEEXEC_POLICY_H_

#include <chrono>
#include <cstdint>
#include <string>

// Limits applied uniformly to every execution.
// Built once at startup (see config.h) and passed by const reference afterwards.
struct ResourceLimitPolicy {
  std::chrono::milliseconds timeout;
  int64_t memory_bytes;
  double cpu_share; // number of CPUs, may be fractional
  int max_processes;
  bool network_enabled;
  bool filesystem_writable;
  size_t max_code_chars; // counted in UTF-8 code points
  size_t max_output_bytes; // per stream

  ResourceLimitPolicy() :
      timeout(std::chrono::seconds(10)),
      memory_bytes(128L * 1024 * 1024),
      cpu_share(1.0),
      max_processes(64),
      network_enabled(false),
      filesystem_writable(false),
      max_code_chars(5000),
      max_output_bytes(1024 * 1024) {}
};

// return false and set err if any limit is unusable
bool ValidatePolicy(const ResourceLimitPolicy&, std::string& err);

#endif  // INCLUDE_SAFEEXEC_POLICY_H_
