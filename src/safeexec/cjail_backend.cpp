#include <safeexec/cjail_backend.h>

#include <fcntl.h>
#include <sched.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <algorithm>
#include <cmath>
#include <cstring>

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <safeexec/workspace.h>
#include "cjail_options.h"
#include "utils.h"

namespace {

const char kBoxDir[] = "root";

constexpr fs::perms kPermBoxDir =
    fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
    fs::perms::others_read | fs::perms::others_exec;
constexpr fs::perms kPermScratch = fs::perms::all | fs::perms::sticky_bit;

// Helper fd layout; 0 and 1 carry the control protocol.
constexpr int kHelperStdout = 3;
constexpr int kHelperStderr = 4;
constexpr int kHelperNull = 5;

// The base Terminate suffices: killing the helper's group reaches the jail's init,
// and the whole pid namespace dies with it.
class CJailProcess : public SandboxProcess {
  int result_fd_;
  CJailPool& pool_;
  CJailPool::Lease lease_;

  bool ReadResult_(struct cjail_result& res) {
    auto ptr = reinterpret_cast<uint8_t*>(&res);
    size_t size = sizeof(res);
    while (size) {
      ssize_t n = read(result_fd_, ptr, size);
      if (n < 0 && errno == EINTR) continue;
      if (n <= 0) return false;
      ptr += n, size -= n;
    }
    return true;
  }
 public:
  CJailProcess(pid_t pid, int stdout_fd, int stderr_fd, int result_fd,
               CJailPool& pool, CJailPool::Lease&& lease) :
      SandboxProcess(pid, stdout_fd, stderr_fd), result_fd_(result_fd),
      pool_(pool), lease_(std::move(lease)) {}
  ~CJailProcess() override {
    // the uid may only be reused once nothing of this jail is left
    if (!Reaped()) {
      Terminate(false);
      Reap();
    }
    close(result_fd_);
    pool_.Release(lease_);
  }

  void Interpret(RawResult& raw) override {
    SandboxProcess::Interpret(raw);
    if (raw.backend_error || raw.timed_out) return;
    struct cjail_result res = {};
    ApplyCJailResult(ReadResult_(res) ? &res : nullptr, raw);
    if (raw.backend_error) SetState(ProcessState::BACKEND_ERROR);
  }
};

// Lay out the jail root inside the workspace:
// mount points for the host directories and /app holding a link to the script.
bool PrepareBox(const Workspace& workspace, const ResourceLimitPolicy& policy,
                const std::vector<std::string>& dirs, const fs::path& box) {
  if (!CreateDirs(box, kPermBoxDir)) return false;
  for (auto& dir : dirs) {
    if (!CreateDirs(box / fs::path(dir).relative_path(), kPermBoxDir)) return false;
  }
  fs::path app = box / fs::path(kSandboxMountPoint).relative_path();
  if (!CreateDirs(app, kPermBoxDir)) return false;
  std::error_code ec;
  fs::create_hard_link(workspace.ScriptPath(), app / kScriptName, ec);
  if (ec) {
    spdlog::warn("Failed to link script into {}: {}", app.c_str(), ec.message());
    return false;
  }
  if (policy.filesystem_writable && !CreateDirs(box / "tmp", kPermScratch)) return false;
  return true;
}

} // namespace

CJailBackendOptions::CJailBackendOptions() :
    helper(fs::path(SAFEEXEC_DATA_DIR) / "safeexec-cjail"),
    interpreter("/usr/bin/python3"),
    uid_base(50000), uid_count(100),
    dirs{"/usr", "/lib", "/lib64", "/etc/alternatives", "/bin"} {}

CJailPool::CJailPool(int uid_base, int uid_count, std::vector<int> cpus) :
    all_cpus_(std::move(cpus)) {
  for (int i = uid_count - 1; i >= 0; i--) uids_.push_back(uid_base + i);
  cpus_.assign(all_cpus_.rbegin(), all_cpus_.rend());
}

bool CJailPool::Acquire(size_t cpu_count, Lease& lease) {
  std::lock_guard lck(mtx_);
  if (uids_.empty()) return false;
  lease.uid = uids_.back();
  uids_.pop_back();
  lease.cpus.clear();
  cpu_count = std::min(std::max(cpu_count, (size_t)1), all_cpus_.size());
  if (cpus_.size() >= cpu_count) {
    lease.cpus.assign(cpus_.end() - cpu_count, cpus_.end());
    cpus_.resize(cpus_.size() - cpu_count);
    lease.exclusive = true;
  } else {
    lease.cpus.assign(all_cpus_.begin(), all_cpus_.begin() + cpu_count);
    lease.exclusive = false;
  }
  return true;
}

void CJailPool::Release(const Lease& lease) {
  std::lock_guard lck(mtx_);
  uids_.push_back(lease.uid);
  if (lease.exclusive) cpus_.insert(cpus_.end(), lease.cpus.begin(), lease.cpus.end());
}

size_t CJailPool::FreeUids() {
  std::lock_guard lck(mtx_);
  return uids_.size();
}

size_t CJailPool::FreeCpus() {
  std::lock_guard lck(mtx_);
  return cpus_.size();
}

std::vector<int> AffinityCpus() {
  cpu_set_t set;
  CPU_ZERO(&set);
  if (sched_getaffinity(0, sizeof(set), &set) < 0) return {};
  std::vector<int> ret;
  for (int i = 0; i < CPU_SETSIZE; i++) {
    if (CPU_ISSET(i, &set)) ret.push_back(i);
  }
  return ret;
}

void ApplyCJailResult(const struct cjail_result* res, RawResult& raw) {
  if (raw.backend_error || raw.timed_out) return;
  if (!res) {
    raw.backend_error = true;
    raw.backend_message = fmt::format("cjail helper exited without a result (exit code {})", raw.exit_code);
    return;
  }
  if (res->timekill == -1) {
    raw.backend_error = true;
    raw.backend_message = fmt::format("cjail_exec failed: {}", strerror(res->oomkill));
    return;
  }
  if (res->info.si_code == CLD_EXITED) {
    raw.exit_code = res->info.si_status;
    raw.term_signal = 0;
  } else {
    raw.exit_code = -1;
    raw.term_signal = res->info.si_status;
  }
  raw.oom_killed = res->oomkill > 0;
  // cjail's own wall clock is only a backstop behind the supervisor's deadline
  if (res->timekill) raw.timed_out = true;
}

CJailBackend::CJailBackend(const CJailBackendOptions& opt) :
    opt_(opt), pool_(std::make_unique<CJailPool>(opt.uid_base, opt.uid_count, AffinityCpus())) {}

std::unique_ptr<SandboxProcess> CJailBackend::Launch(
    const Workspace& workspace, const ResourceLimitPolicy& policy, std::string& err) const {
  JailOptions opt;
  opt.boxdir = workspace.Path() / kBoxDir;
  // a bind mount of a missing host directory would fail the whole jail
  for (auto& dir : opt_.dirs) {
    std::error_code ec;
    if (fs::is_directory(dir, ec)) opt.dirs.push_back(dir);
  }
  if (!PrepareBox(workspace, policy, opt.dirs, opt.boxdir)) {
    err = "failed to prepare the jail root";
    return nullptr;
  }
  opt.command = {opt_.interpreter, fmt::format("{}/{}", kSandboxMountPoint, kScriptName)};
  opt.envs = {"PATH=/usr/local/bin:/usr/bin:/bin", "PYTHONDONTWRITEBYTECODE=1"};
  if (policy.filesystem_writable) opt.envs.push_back("TMPDIR=/tmp");
  opt.workdir = kSandboxMountPoint;
  opt.fd_input = kHelperNull;
  opt.fd_output = kHelperStdout;
  opt.fd_error = kHelperStderr;
  CJailPool::Lease lease;
  if (!pool_->Acquire((size_t)std::ceil(policy.cpu_share), lease)) {
    err = fmt::format("all {} jail uids are in use", opt_.uid_count);
    return nullptr;
  }
  opt.cpu_set = lease.cpus;
  opt.uid = opt.gid = lease.uid;
  opt.wall_time = (policy.timeout.count() + 1000) * 1000;
  opt.rss = policy.memory_bytes / 1024;
  opt.proc_num = policy.max_processes;
  opt.sharenet = policy.network_enabled;

  int ctl_in[2], ctl_out[2], out[2], errp[2];
  int null_fd = -1;
  std::vector<int> to_close;
  auto fail = [&](const char* what) {
    err = fmt::format("{}: {}", what, strerror(errno));
    for (int fd : to_close) close(fd);
    pool_->Release(lease);
    return nullptr;
  };
  for (int* p : {ctl_in, ctl_out, out, errp}) {
    if (!MakePipe(p)) return fail("pipe");
    to_close.insert(to_close.end(), {p[0], p[1]});
  }
  if ((null_fd = open("/dev/null", O_RDWR | O_CLOEXEC)) < 0) return fail("/dev/null");
  to_close.push_back(null_fd);

  SpawnOptions spawn;
  spawn.argv = {opt_.helper.string()};
  spawn.fds = {
    {0, ctl_in[0]}, {1, ctl_out[1]}, {2, null_fd},
    {kHelperStdout, out[1]}, {kHelperStderr, errp[1]}, {kHelperNull, null_fd},
  };
  spdlog::debug("Launching jail {} uid={} cpus={}: {}", opt.boxdir, opt.uid,
                fmt::join(opt.cpu_set, ","), fmt::join(opt.command, " "));
  pid_t pid = Spawn(spawn, err);
  for (int fd : {ctl_in[0], ctl_out[1], out[1], errp[1], null_fd}) close(fd);
  if (pid < 0) {
    for (int fd : {ctl_in[1], ctl_out[0], out[0], errp[0]}) close(fd);
    pool_->Release(lease);
    return nullptr;
  }
  // from here on the process object owns the read ends and the lease, and cleans up on failure
  auto proc = std::make_unique<CJailProcess>(pid, out[0], errp[0], ctl_out[0], *pool_, std::move(lease));
  auto vec = opt.Serialize();
  long size = vec.size();
  bool sent = write(ctl_in[1], &size, sizeof(size)) == (ssize_t)sizeof(size) &&
              write(ctl_in[1], vec.data(), vec.size()) == (ssize_t)vec.size();
  int saved_errno = errno;
  close(ctl_in[1]);
  if (!sent) {
    err = fmt::format("failed to send jail options to {}: {}", opt_.helper.c_str(), strerror(saved_errno));
    return nullptr;
  }
  proc->MarkRunning();
  return proc;
}

bool CJailBackend::Probe(std::string& err) const {
  if (geteuid() != 0) {
    err = "cjail requires root";
    return false;
  }
  if (access(opt_.helper.c_str(), X_OK) < 0) {
    err = fmt::format("{}: {}", opt_.helper.c_str(), strerror(errno));
    return false;
  }
  if (access(opt_.interpreter.c_str(), X_OK) < 0) {
    err = fmt::format("{}: {}", opt_.interpreter, strerror(errno));
    return false;
  }
  return true;
}
