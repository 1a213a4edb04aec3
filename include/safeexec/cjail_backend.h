#ifndef INCLUDE_SAFEEXEC_CJAIL_BACKEND_H_
#define INCLUDE_SAFEEXEC_CJAIL_BACKEND_H_

#include <mutex>
#include <memory>
#include <string>
#include <vector>
#include <filesystem>

#include "backend.h"

struct cjail_result;

struct CJailBackendOptions {
  // helper executable running cjail_exec; see src/safeexec/cjail_main.cpp
  std::filesystem::path helper;
  std::string interpreter;  // absolute path on the host
  // each live jail runs as its own uid (gid = uid) from [uid_base, uid_base + uid_count)
  int uid_base, uid_count;
  // host directories bind-mounted at the same path inside the jail
  std::vector<std::string> dirs;

  CJailBackendOptions();
};

// Uids and CPUs handed out to live jails.
// RLIMIT_NPROC counts per uid, so two jails sharing a uid would share one process budget.
class CJailPool {
  std::mutex mtx_;
  std::vector<int> uids_;
  std::vector<int> cpus_;     // free for exclusive pinning
  std::vector<int> all_cpus_;
 public:
  struct Lease {
    int uid;
    std::vector<int> cpus;
    bool exclusive;  // cpus are returned to the pool on release
  };

  CJailPool(int uid_base, int uid_count, std::vector<int> cpus);

  // Takes a free uid and cpu_count CPUs. When not enough CPUs are free the jail
  // shares the first cpu_count CPUs with others instead of running unpinned.
  // false if every uid is in use.
  bool Acquire(size_t cpu_count, Lease&);
  void Release(const Lease&);

  size_t FreeUids();
  size_t FreeCpus();
};

// CPUs this process may run on.
std::vector<int> AffinityCpus();

// Fill exit_code/term_signal/oom_killed/timed_out/backend_error from the helper's report.
// res is nullptr if the helper exited without writing one.
void ApplyCJailResult(const struct cjail_result* res, RawResult& raw);

// Runs the script in a chroot jail built inside the workspace.
// Requires root.
class CJailBackend : public IsolationBackend {
  CJailBackendOptions opt_;
  std::unique_ptr<CJailPool> pool_;
 public:
  explicit CJailBackend(const CJailBackendOptions& opt);

  const char* Name() const override { return "cjail"; }
  std::unique_ptr<SandboxProcess> Launch(
      const Workspace&, const ResourceLimitPolicy&, std::string& err) const override;
  bool Probe(std::string& err) const override;
};

#endif  // INCLUDE_SAFEEXEC_CJAIL_BACKEND_H_
