#ifndef SAFEEXEC_UTILS_H_
#define SAFEEXEC_UTILS_H_

#include <string>
#include <vector>
#include <utility>
#include <filesystem>

#include <sys/types.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

constexpr fs::perms kPermWorkspace =
    fs::perms::owner_all | fs::perms::group_exec | fs::perms::others_exec;
constexpr fs::perms kPermScript =
    fs::perms::owner_read | fs::perms::group_read | fs::perms::others_read;

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool WriteFile(const fs::path&, const std::string& content, fs::perms = fs::perms::unknown);

struct SpawnOptions {
  std::vector<std::string> argv; // argv[0] is looked up in PATH
  // (target fd in child, source fd in parent); every other fd >= the largest target is closed
  std::vector<std::pair<int, int>> fds;
  fs::path workdir; // empty = inherit
};

// fork + exec in a new process group.
// Returns the pid, or -1 with err set if the child could not be started (including exec failure).
pid_t Spawn(const SpawnOptions&, std::string& err);

// Run a short auxiliary command with its stdout+stderr captured, killing it after timeout_ms.
// Returns the exit code, or -1 if it could not be run or was killed.
int RunCommand(const std::vector<std::string>& argv, long timeout_ms, std::string* output = nullptr);

// pipe2(O_CLOEXEC) that never leaks into concurrently spawned children
bool MakePipe(int fds[2]);
bool SetNonBlocking(int fd);

#endif  // SAFEEXEC_UTILS_H_
