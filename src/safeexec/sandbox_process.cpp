#include <safeexec/sandbox_process.h>

#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>

#include <spdlog/spdlog.h>

const char* ProcessStateName(ProcessState state) {
  switch (state) {
#define X(name) case ProcessState::name: return #name;
    ENUM_PROCESS_STATE_
#undef X
  }
  __builtin_unreachable();
}

SandboxProcess::SandboxProcess(pid_t pid, int stdout_fd, int stderr_fd) :
    pid_(pid), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd),
    wait_status_(0), reaped_(false), state_(ProcessState::STARTING) {}

SandboxProcess::~SandboxProcess() {
  if (!reaped_) {
    spdlog::warn("Sandbox process pid={} still running at teardown; killing", pid_);
    Terminate(false);
    Reap();
  }
  CloseStdout();
  CloseStderr();
}

void SandboxProcess::CloseStdout() {
  if (stdout_fd_ != -1) close(stdout_fd_);
  stdout_fd_ = -1;
}

void SandboxProcess::CloseStderr() {
  if (stderr_fd_ != -1) close(stderr_fd_);
  stderr_fd_ = -1;
}

void SandboxProcess::KillGroup_() {
  if (kill(-pid_, SIGKILL) < 0 && errno != ESRCH) {
    spdlog::warn("kill(-{}) failed: {}", pid_, strerror(errno));
  }
}

bool SandboxProcess::TryReap() {
  if (reaped_) return true;
  siginfo_t info = {};
  int ret;
  do {
    ret = waitid(P_PID, pid_, &info, WEXITED | WNOHANG | WNOWAIT);
  } while (ret < 0 && errno == EINTR);
  if (ret < 0) {
    spdlog::warn("waitid({}) failed: {}", pid_, strerror(errno));
    reaped_ = true;
    state_ = ProcessState::BACKEND_ERROR;
    return true;
  }
  if (info.si_pid == 0) return false;
  Reap();
  return true;
}

void SandboxProcess::Reap() {
  if (reaped_) return;
  siginfo_t info = {};
  int ret;
  do {
    ret = waitid(P_PID, pid_, &info, WEXITED | WNOWAIT);
  } while (ret < 0 && errno == EINTR);
  // While the leader is an unreaped zombie its pid (= process group id) cannot be reused,
  // so this only reaches stragglers of this sandbox.
  if (ret == 0) KillGroup_();
  pid_t waited;
  do {
    waited = waitpid(pid_, &wait_status_, 0);
  } while (waited < 0 && errno == EINTR);
  reaped_ = true;
  if (waited < 0) {
    spdlog::warn("waitpid({}) failed: {}", pid_, strerror(errno));
    state_ = ProcessState::BACKEND_ERROR;
    return;
  }
  if (state_ == ProcessState::STARTING || state_ == ProcessState::RUNNING) {
    state_ = ProcessState::COMPLETED;
  }
  spdlog::debug("Sandbox process pid={} reaped, status={:#x} state={}",
                pid_, wait_status_, ProcessStateName(state_));
}

void SandboxProcess::Terminate(bool timed_out) {
  if (reaped_) return;
  spdlog::debug("Terminating sandbox process group {} ({})", pid_, timed_out ? "timeout" : "cleanup");
  state_ = timed_out ? ProcessState::TIMED_OUT : ProcessState::KILLED;
  KillGroup_();
}

void SandboxProcess::Interpret(RawResult& raw) {
  if (state_ == ProcessState::BACKEND_ERROR) {
    raw.backend_error = true;
    raw.backend_message = "lost track of the sandbox process";
    return;
  }
  if (WIFEXITED(wait_status_)) {
    raw.exit_code = WEXITSTATUS(wait_status_);
    raw.term_signal = 0;
  } else if (WIFSIGNALED(wait_status_)) {
    raw.exit_code = -1;
    raw.term_signal = WTERMSIG(wait_status_);
  }
}
