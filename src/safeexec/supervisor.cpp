#include <safeexec/supervisor.h>

#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <algorithm>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <safeexec/workspace.h>
#include <safeexec/classifier.h>
#include "utils.h"

namespace {

using Clock = std::chrono::steady_clock;

// upper bound of the delay between the child exiting and us noticing it
constexpr long kPollTickMs = 20;
// how long to keep reading after the child exited; every writer is dead by then
constexpr long kDrainGraceMs = 1000;

inline long MsUntil(Clock::time_point t) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(t - Clock::now()).count();
}

// Append whatever is readable without blocking. Returns false at EOF or on error.
bool Drain(int fd, std::string& buf, size_t max_bytes, bool& truncated) {
  char chunk[16384];
  while (true) {
    ssize_t n = read(fd, chunk, sizeof(chunk));
    if (n > 0) {
      size_t room = buf.size() < max_bytes ? max_bytes - buf.size() : 0;
      if ((size_t)n > room) truncated = true;
      buf.append(chunk, std::min((size_t)n, room));
      continue;
    }
    if (n == 0) return false;
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
    spdlog::warn("Reading sandbox output failed: {}", strerror(errno));
    return false;
  }
}

} // namespace

size_t CodeLength(const std::string& code) {
  return std::count_if(code.begin(), code.end(), [](char c) {
    return ((unsigned char)c & 0xC0) != 0x80;
  });
}

RawResult Supervisor::Supervise_(SandboxProcess& proc) const {
  RawResult raw;
  raw.timeout_ms = policy_.timeout.count();
  const size_t max_bytes = policy_.max_output_bytes;
  auto start = Clock::now();
  auto deadline = start + policy_.timeout;
  auto drain_deadline = Clock::time_point::max();

  if (!SetNonBlocking(proc.StdoutFd()) || !SetNonBlocking(proc.StderrFd())) {
    spdlog::warn("Failed to make sandbox output non-blocking: {}", strerror(errno));
  }
  auto read_streams = [&](int timeout_ms) {
    struct pollfd fds[2];
    int nfds = 0;
    if (proc.StdoutFd() != -1) fds[nfds++] = {proc.StdoutFd(), POLLIN, 0};
    if (proc.StderrFd() != -1) fds[nfds++] = {proc.StderrFd(), POLLIN, 0};
    int ret = poll(fds, nfds, timeout_ms);
    if (ret < 0 && errno != EINTR) {
      spdlog::warn("poll failed: {}", strerror(errno));
    }
    if (ret <= 0) return;
    for (int i = 0; i < nfds; i++) {
      if (!fds[i].revents) continue;
      bool is_stdout = fds[i].fd == proc.StdoutFd();
      std::string& buf = is_stdout ? raw.stdout_text : raw.stderr_text;
      if (!Drain(fds[i].fd, buf, max_bytes, raw.output_truncated)) {
        is_stdout ? proc.CloseStdout() : proc.CloseStderr();
      }
    }
  };

  // Race: the child exiting vs. the deadline, reading output all along.
  bool exited = false;
  while (true) {
    if (!exited && proc.TryReap()) {
      exited = true;
      drain_deadline = Clock::now() + std::chrono::milliseconds(kDrainGraceMs);
    }
    if (exited && proc.StdoutFd() == -1 && proc.StderrFd() == -1) break;
    if (!exited && Clock::now() >= deadline) {
      spdlog::info("Sandbox pid={} exceeded {} ms; terminating", proc.Pid(), raw.timeout_ms);
      raw.timed_out = true;
      proc.Terminate(true);
      proc.Reap();
      read_streams(0);
      break;
    }
    if (exited && Clock::now() >= drain_deadline) {
      spdlog::warn("Sandbox pid={} output still open {} ms after exit", proc.Pid(), kDrainGraceMs);
      break;
    }
    long wait_ms = exited ? MsUntil(drain_deadline) : std::min(kPollTickMs, MsUntil(deadline));
    read_streams((int)std::max(0L, wait_ms));
  }
  proc.CloseStdout();
  proc.CloseStderr();
  raw.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
  proc.Interpret(raw);
  if (raw.output_truncated) {
    spdlog::info("Sandbox pid={} output truncated to {} bytes per stream", proc.Pid(), max_bytes);
  }
  return raw;
}

ExecutionOutcome Supervisor::Run(const std::string& code) const {
  if (size_t length = CodeLength(code); length > policy_.max_code_chars) {
    spdlog::info("Rejected submission of {} characters (max {})", length, policy_.max_code_chars);
    return ExecutionOutcome::Failure(
        OutcomeKind::TOO_LONG, fmt::format("code too long (max {})", policy_.max_code_chars));
  }
  // declaration order matters: the process is destroyed (killed and reaped) before its workspace
  std::unique_ptr<Workspace> workspace = Workspace::Acquire(workspace_root_, code);
  if (!workspace) {
    return ExecutionOutcome::Failure(
        OutcomeKind::BACKEND_UNAVAILABLE, "failed to prepare the execution workspace");
  }
  std::string err;
  std::unique_ptr<SandboxProcess> proc = backend_.Launch(*workspace, policy_, err);
  if (!proc) {
    spdlog::warn("Backend {} failed to launch {}: {}", backend_.Name(), workspace->Path().c_str(), err);
    return ExecutionOutcome::Failure(
        OutcomeKind::BACKEND_UNAVAILABLE, fmt::format("{} backend unavailable: {}", backend_.Name(), err));
  }
  spdlog::debug("Workspace {} running as pid={}", workspace->Path().c_str(), proc->Pid());
  RawResult raw = Supervise_(*proc);
  ProcessState final_state = proc->State();
  proc.reset();

  ExecutionOutcome outcome = Classify(raw);
  spdlog::info("Execution finished: kind={} state={} exit_code={} signal={} elapsed={}ms",
               OutcomeKindName(outcome.Kind()), ProcessStateName(final_state),
               raw.exit_code, raw.term_signal, raw.elapsed_ms);
  return outcome;
}
