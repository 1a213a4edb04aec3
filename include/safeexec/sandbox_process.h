#ifndef INCLUDE_SAFEEXEC_SANDBOX_PROCESS_H_
#define INCLUDE_SAFEEXEC_SANDBOX_PROCESS_H_

#include <string>
#include <sys/types.h>

#define ENUM_PROCESS_STATE_ \
  X(STARTING) \
  X(RUNNING) \
  X(COMPLETED) \
  X(TIMED_OUT) \
  X(KILLED) \
  X(BACKEND_ERROR)
enum class ProcessState {
#define X(name) name,
  ENUM_PROCESS_STATE_
#undef X
};

const char* ProcessStateName(ProcessState);

// Everything observed about one finished sandbox run, before classification.
struct RawResult {
  int exit_code;   // -1 if killed by a signal
  int term_signal; // 0 if exited normally
  bool timed_out;
  bool oom_killed; // set by the backend according to its own convention
  bool backend_error;
  std::string backend_message;
  std::string stdout_text, stderr_text;
  bool output_truncated;
  long elapsed_ms;
  long timeout_ms;

  RawResult() :
      exit_code(-1), term_signal(0),
      timed_out(false), oom_killed(false), backend_error(false),
      output_truncated(false),
      elapsed_ms(0), timeout_ms(0) {}
};

// The host-side handle of one sandboxed run.
// The child is the leader of its own process group; killing the group reaches every
// descendant on the host. Backends whose sandbox outlives the local child
// (e.g. a container) extend Terminate.
class SandboxProcess {
  pid_t pid_;
  int stdout_fd_, stderr_fd_;
  int wait_status_;
  bool reaped_;
  ProcessState state_;

  void KillGroup_();
 protected:
  void SetState(ProcessState state) { state_ = state; }
 public:
  // takes ownership of both fds
  SandboxProcess(pid_t pid, int stdout_fd, int stderr_fd);
  SandboxProcess(const SandboxProcess&) = delete;
  SandboxProcess& operator=(const SandboxProcess&) = delete;
  // kills and reaps the process group if still running
  virtual ~SandboxProcess();

  pid_t Pid() const { return pid_; }
  int StdoutFd() const { return stdout_fd_; }
  int StderrFd() const { return stderr_fd_; }
  void CloseStdout();
  void CloseStderr();
  ProcessState State() const { return state_; }
  // called by the backend once the sandbox has everything it needs to run
  void MarkRunning() {
    if (state_ == ProcessState::STARTING) state_ = ProcessState::RUNNING;
  }
  bool Reaped() const { return reaped_; }

  // Reaping also kills whatever is left in the process group.
  // non-blocking; true once the child has exited and been reaped
  bool TryReap();
  void Reap();

  // Kill the whole sandbox; no-op once reaped.
  virtual void Terminate(bool timed_out);

  // Fill exit_code/term_signal/oom_killed/backend_error from the reaped status.
  // Called once, after Reap() and after output has been drained.
  virtual void Interpret(RawResult&);

  int WaitStatus() const { return wait_status_; }
};

#endif  // INCLUDE_SAFEEXEC_SANDBOX_PROCESS_H_
