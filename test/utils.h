#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <atomic>
#include <string>
#include <filesystem>

#include <gtest/gtest.h>
#include <safeexec/backend.h>

namespace fs = std::filesystem;

// removed after all tests by the global environment
extern fs::path kTestRoot;

// A fresh, empty directory under kTestRoot.
fs::path TestDir(const std::string& name);

// Runs the workspace script as a plain shell script on the host, with no isolation.
// Exit code oom_exit_code plays the role of the backend's out-of-memory kill.
class HostBackend : public IsolationBackend {
  std::string shell_;
  int oom_exit_code_;
  mutable std::atomic_long launches_;
 public:
  explicit HostBackend(std::string shell = "/bin/sh", int oom_exit_code = -1) :
      shell_(std::move(shell)), oom_exit_code_(oom_exit_code), launches_(0) {}

  const char* Name() const override { return "host"; }
  std::unique_ptr<SandboxProcess> Launch(
      const Workspace&, const ResourceLimitPolicy&, std::string& err) const override;

  long Launches() const { return launches_; }
};

// false for zombies and nonexistent pids
bool IsProcessAlive(pid_t pid);

size_t CountEntries(const fs::path& dir);

#endif // TEST_UTILS_H_
