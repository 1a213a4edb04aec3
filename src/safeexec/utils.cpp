#include "utils.h"

#include <poll.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <chrono>
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <thread>

#include <spdlog/spdlog.h>

namespace {

#if __has_include(<linux/close_range.h>)
#include <linux/close_range.h>
int CloseFrom(int minfd) {
  return close_range(minfd, ~0U, 0);
}
#else
#include <dirent.h>
int CloseFrom(int minfd) {
  DIR *fddir = opendir("/proc/self/fd");
  if (!fddir) goto error;
  {
    int dfd = dirfd(fddir);
    for (struct dirent *dent; (dent = readdir(fddir));) {
      if (!strcmp(dent->d_name, ".") || !strcmp(dent->d_name, "..")) continue;
      int fd = strtol(dent->d_name, NULL, 10);
      if (fd >= minfd && fd != dfd) {
        if (close(fd) && errno != EBADF) goto error_dir;
      }
    }
  }
  closedir(fddir);
  return 0;

error_dir:
  closedir(fddir);
error:
  return -1;
}
#endif // has_include(<linux/close_range.h>)

// Runs in the forked child; only async-signal-safe calls from here on.
[[noreturn]] void ChildExec(
    char* const* argv, const std::vector<std::pair<int, int>>& fds,
    const char* workdir, int err_fd, int max_target) {
  auto die = [&err_fd]() {
    int e = errno;
    IGNORE_RETURN(write(err_fd, &e, sizeof(e)));
    _exit(127);
  };
  if (setpgid(0, 0) < 0) die();
  // undo what the server changed for itself
  signal(SIGPIPE, SIG_DFL);
  sigset_t empty;
  sigemptyset(&empty);
  if (sigprocmask(SIG_SETMASK, &empty, nullptr) < 0) die();
  // move everything above the target range first so that a source never gets clobbered
  int status_fd = fcntl(err_fd, F_DUPFD_CLOEXEC, max_target + 1);
  if (status_fd < 0) die();
  err_fd = status_fd;
  int moved[16];
  if (fds.size() > 16) {
    errno = EINVAL;
    die();
  }
  for (size_t i = 0; i < fds.size(); i++) {
    if ((moved[i] = fcntl(fds[i].second, F_DUPFD, max_target + 1)) < 0) die();
  }
  for (size_t i = 0; i < fds.size(); i++) {
    if (dup2(moved[i], fds[i].first) < 0) die();
  }
  if (dup2(status_fd, max_target) < 0) die();
  err_fd = max_target;
  if (fcntl(err_fd, F_SETFD, FD_CLOEXEC) < 0) die();
  if (CloseFrom(max_target + 1) < 0) die();
  if (workdir && chdir(workdir) < 0) die();
  execvp(argv[0], argv);
  die();
  __builtin_unreachable();
}

} // namespace

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
  return false;
}

bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms) {
  spdlog::debug("Write {} bytes to {}", content.size(), path.c_str());
  std::error_code ec;
  {
    std::ofstream fout(path, std::ios::binary);
    if (!fout || !fout.write(content.data(), content.size()) || !fout.flush()) {
      spdlog::warn("Failed writing {}", path.c_str());
      return false;
    }
  }
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) {
    spdlog::warn("Failed setting permissions of {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

bool MakePipe(int fds[2]) {
  if (pipe2(fds, O_CLOEXEC) < 0) {
    spdlog::warn("pipe2 failed: {}", strerror(errno));
    return false;
  }
  return true;
}

bool SetNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL);
  return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) >= 0;
}

pid_t Spawn(const SpawnOptions& opt, std::string& err) {
  if (opt.argv.empty()) {
    err = "empty command";
    return -1;
  }
  // everything the child needs is allocated before fork
  std::vector<char*> argv;
  for (auto& i : opt.argv) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);
  int max_target = 2;
  for (auto& i : opt.fds) max_target = std::max(max_target, i.first);
  max_target++;
  const char* workdir = opt.workdir.empty() ? nullptr : opt.workdir.c_str();

  int status_pipe[2];
  if (!MakePipe(status_pipe)) {
    err = std::string("pipe: ") + strerror(errno);
    return -1;
  }
  pid_t pid = fork();
  if (pid < 0) {
    err = std::string("fork: ") + strerror(errno);
    close(status_pipe[0]);
    close(status_pipe[1]);
    return -1;
  }
  if (pid == 0) {
    close(status_pipe[0]);
    ChildExec(argv.data(), opt.fds, workdir, status_pipe[1], max_target);
  }
  close(status_pipe[1]);
  // EOF means exec succeeded (the write end was close-on-exec)
  int child_errno = 0;
  ssize_t n;
  do {
    n = read(status_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  close(status_pipe[0]);
  if (n == sizeof(child_errno)) {
    waitpid(pid, nullptr, 0);
    err = opt.argv[0] + ": " + strerror(child_errno);
    spdlog::warn("Failed to start {}: {}", opt.argv[0], strerror(child_errno));
    return -1;
  }
  spdlog::debug("Spawned pid={} argv0={}", pid, opt.argv[0]);
  return pid;
}

int RunCommand(const std::vector<std::string>& argv, long timeout_ms, std::string* output) {
  int out[2];
  if (!MakePipe(out)) return -1;
  int null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (null_fd < 0) {
    close(out[0]);
    close(out[1]);
    return -1;
  }
  SpawnOptions opt;
  opt.argv = argv;
  opt.fds = {{0, null_fd}, {1, out[1]}, {2, out[1]}};
  std::string err;
  pid_t pid = Spawn(opt, err);
  close(null_fd);
  close(out[1]);
  if (pid < 0) {
    close(out[0]);
    return -1;
  }
  constexpr size_t kMaxCapture = 64 * 1024;
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  bool killed = false;
  char buf[4096];
  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    if (remaining <= 0) {
      kill(-pid, SIGKILL);
      killed = true;
      break;
    }
    struct pollfd pfd = {out[0], POLLIN, 0};
    int r = poll(&pfd, 1, (int)remaining);
    if (r < 0 && errno == EINTR) continue;
    if (r < 0) {
      spdlog::warn("poll on {} output failed: {}", argv[0], strerror(errno));
      kill(-pid, SIGKILL);
      killed = true;
      break;
    }
    if (r == 0) continue;
    ssize_t n = read(out[0], buf, sizeof(buf));
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break;
    if (output && output->size() < kMaxCapture) output->append(buf, n);
  }
  close(out[0]);
  int status = 0;
  pid_t waited;
  // EOF only means the output was closed; the command still gets the rest of its time to exit
  while (true) {
    waited = waitpid(pid, &status, killed ? 0 : WNOHANG);
    if (waited < 0 && errno == EINTR) continue;
    if (waited != 0) break;
    if (std::chrono::steady_clock::now() >= deadline) {
      kill(-pid, SIGKILL);
      killed = true;
    } else {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }
  if (waited < 0) return -1;
  if (killed) {
    spdlog::warn("{} did not finish in {} ms; killed", argv[0], timeout_ms);
    return -1;
  }
  return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}
