#include <safeexec/docker_backend.h>

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <safeexec/workspace.h>
#include "utils.h"

const char kSandboxMountPoint[] = "/app";

namespace {

constexpr std::chrono::milliseconds kRemoveRetryDelay(200);

class DockerProcess : public SandboxProcess {
  const DockerOptions& opt_;
  std::string container_;

  void RemoveContainer_() {
    for (int attempt = 0; attempt < 2; attempt++) {
      std::string output;
      int code = RunCommand({opt_.binary, "rm", "--force", container_}, opt_.kill_timeout_ms, &output);
      if (code == 0) return;
      // A CLI killed while its create request was in flight can leave the daemon
      // creating the container after this first removal.
      if (attempt == 0 && output.find("No such container") != std::string::npos) {
        std::this_thread::sleep_for(kRemoveRetryDelay);
        continue;
      }
      spdlog::debug("docker rm {} returned {}: {}", container_, code, output);
      return;
    }
  }
 public:
  DockerProcess(pid_t pid, int stdout_fd, int stderr_fd, const DockerOptions& opt, std::string&& container) :
      SandboxProcess(pid, stdout_fd, stderr_fd), opt_(opt), container_(std::move(container)) {}
  ~DockerProcess() override {
    // the base destructor can no longer reach our Terminate
    if (!Reaped()) Terminate(false);
  }

  // The container is not a descendant of the CLI; killing the CLI alone would leave it running.
  void Terminate(bool timed_out) override {
    if (Reaped()) return;
    SandboxProcess::Terminate(timed_out);
    RemoveContainer_();
  }

  void Interpret(RawResult& raw) override {
    SandboxProcess::Interpret(raw);
    if (raw.backend_error) return;
    if (IsDockerDaemonError(raw.exit_code, raw.stderr_text)) {
      size_t eol = raw.stderr_text.find('\n');
      raw.backend_error = true;
      raw.backend_message = raw.stderr_text.substr(0, eol);
      SetState(ProcessState::BACKEND_ERROR);
      return;
    }
    if (raw.exit_code == opt_.oom_exit_code) raw.oom_killed = true;
  }
};

inline std::string ContainerName(const Workspace& workspace) {
  // workspace names are unique per root; the pid separates servers using different roots
  return fmt::format("{}-{}", workspace.Path().filename().string(), getpid());
}

} // namespace

bool IsDockerDaemonError(int exit_code, const std::string& err) {
  if (exit_code == 0) return false;
  if (err.find("Cannot connect to the Docker daemon") != std::string::npos) return true;
  bool from_docker = err.rfind("docker: ", 0) == 0 ||
                     err.find("Error response from daemon") != std::string::npos;
  switch (exit_code) {
    // the error is from the docker daemon or CLI itself, not the contained command
    case 125: return from_docker || err.find("Unable to find image") != std::string::npos;
    // the contained command could not be invoked (126) or found (127)
    case 126:
    case 127: return from_docker;
    default: return false;
  }
}

std::vector<std::string> DockerBackend::BuildRunCommand(
    const Workspace& workspace, const ResourceLimitPolicy& policy, const std::string& container_name) const {
  std::string memory = std::to_string(policy.memory_bytes);
  std::vector<std::string> ret = {
    opt_.binary, "run", "--rm",
    "--name", container_name,
    "--pull", "never",
    "--network", policy.network_enabled ? "bridge" : "none",
    // equal memory and memory-swap: no swap, so the ceiling ends in an OOM kill
    "--memory", memory, "--memory-swap", memory,
    "--cpus", fmt::format("{}", policy.cpu_share),
    "--pids-limit", std::to_string(policy.max_processes),
    "--security-opt", "no-new-privileges:true",
    "--cap-drop", "ALL",
    "--user", opt_.user,
    "--volume", fmt::format("{}:{}:ro", workspace.Path().string(), kSandboxMountPoint),
  };
  if (!policy.filesystem_writable) ret.push_back("--read-only");
  ret.insert(ret.end(), {
    opt_.image,
    opt_.interpreter, fmt::format("{}/{}", kSandboxMountPoint, kScriptName),
  });
  return ret;
}

std::unique_ptr<SandboxProcess> DockerBackend::Launch(
    const Workspace& workspace, const ResourceLimitPolicy& policy, std::string& err) const {
  int out[2], errp[2];
  if (!MakePipe(out)) {
    err = std::string("pipe: ") + strerror(errno);
    return nullptr;
  }
  if (!MakePipe(errp)) {
    err = std::string("pipe: ") + strerror(errno);
    close(out[0]);
    close(out[1]);
    return nullptr;
  }
  int null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (null_fd < 0) {
    err = std::string("/dev/null: ") + strerror(errno);
    for (int fd : {out[0], out[1], errp[0], errp[1]}) close(fd);
    return nullptr;
  }

  std::string name = ContainerName(workspace);
  SpawnOptions opt;
  opt.argv = BuildRunCommand(workspace, policy, name);
  opt.fds = {{0, null_fd}, {1, out[1]}, {2, errp[1]}};
  spdlog::debug("Launching container {}: {}", name, fmt::join(opt.argv, " "));
  pid_t pid = Spawn(opt, err);
  close(null_fd);
  close(out[1]);
  close(errp[1]);
  if (pid < 0) {
    close(out[0]);
    close(errp[0]);
    return nullptr;
  }
  auto proc = std::make_unique<DockerProcess>(pid, out[0], errp[0], opt_, std::move(name));
  proc->MarkRunning();
  return proc;
}

bool DockerBackend::Probe(std::string& err) const {
  std::string output;
  if (RunCommand({opt_.binary, "version", "--format", "{{.Server.Version}}"}, 10'000, &output) != 0) {
    err = output.empty() ? fmt::format("cannot run {}", opt_.binary) : output;
    return false;
  }
  spdlog::info("Docker server version {}", output.substr(0, output.find('\n')));
  output.clear();
  if (RunCommand({opt_.binary, "image", "inspect", "--format", "{{.Id}}", opt_.image}, 10'000, &output) != 0) {
    err = fmt::format("image {} not available locally: {}", opt_.image, output);
    return false;
  }
  return true;
}
