#include "utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <fstream>

#include <safeexec/workspace.h>
#include "safeexec/utils.h"

namespace {

class HostProcess : public SandboxProcess {
  int oom_exit_code_;
 public:
  HostProcess(pid_t pid, int stdout_fd, int stderr_fd, int oom_exit_code) :
      SandboxProcess(pid, stdout_fd, stderr_fd), oom_exit_code_(oom_exit_code) {}

  void Interpret(RawResult& raw) override {
    SandboxProcess::Interpret(raw);
    if (!raw.backend_error && oom_exit_code_ != -1 && raw.exit_code == oom_exit_code_) {
      raw.oom_killed = true;
    }
  }
};

} // namespace

fs::path TestDir(const std::string& name) {
  fs::path ret = kTestRoot / name;
  fs::remove_all(ret);
  fs::create_directories(ret);
  return ret;
}

std::unique_ptr<SandboxProcess> HostBackend::Launch(
    const Workspace& workspace, const ResourceLimitPolicy&, std::string& err) const {
  launches_++;
  int out[2], errp[2];
  if (!MakePipe(out)) {
    err = strerror(errno);
    return nullptr;
  }
  if (!MakePipe(errp)) {
    err = strerror(errno);
    close(out[0]), close(out[1]);
    return nullptr;
  }
  int null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
  SpawnOptions opt;
  opt.argv = {shell_, workspace.ScriptPath().string()};
  opt.fds = {{0, null_fd}, {1, out[1]}, {2, errp[1]}};
  opt.workdir = workspace.Path();
  pid_t pid = Spawn(opt, err);
  close(null_fd), close(out[1]), close(errp[1]);
  if (pid < 0) {
    close(out[0]), close(errp[0]);
    return nullptr;
  }
  auto proc = std::make_unique<HostProcess>(pid, out[0], errp[0], oom_exit_code_);
  proc->MarkRunning();
  return proc;
}

bool IsProcessAlive(pid_t pid) {
  std::ifstream fin("/proc/" + std::to_string(pid) + "/stat");
  if (!fin) return false;
  std::string stat;
  std::getline(fin, stat);
  // the state field follows the parenthesized command name
  size_t pos = stat.rfind(')');
  if (pos == std::string::npos || pos + 2 >= stat.size()) return false;
  return stat[pos + 2] != 'Z' && stat[pos + 2] != 'X';
}

size_t CountEntries(const fs::path& dir) {
  size_t ret = 0;
  for (auto& i : fs::directory_iterator(dir)) {
    (void)i;
    ret++;
  }
  return ret;
}
