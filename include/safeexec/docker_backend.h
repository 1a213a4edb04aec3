#ifndef INCLUDE_SAFEEXEC_DOCKER_BACKEND_H_
#define INCLUDE_SAFEEXEC_DOCKER_BACKEND_H_

#include <string>
#include <vector>

#include "backend.h"

struct DockerOptions {
  std::string binary;        // resolved through PATH
  std::string image;         // must provide the interpreter
  std::string interpreter;
  std::string user;          // uid:gid inside the container
  // `docker run` reports a container killed by the kernel OOM killer as 128+SIGKILL
  int oom_exit_code;
  long kill_timeout_ms;      // bound for `docker rm --force`

  DockerOptions() :
      binary("docker"),
      image("safe-python-runner:latest"),
      interpreter("python"),
      user("65534:65534"),
      oom_exit_code(137),
      kill_timeout_ms(5000) {}
};

class DockerBackend : public IsolationBackend {
  DockerOptions opt_;
 public:
  explicit DockerBackend(const DockerOptions& opt) : opt_(opt) {}

  const char* Name() const override { return "docker"; }
  std::unique_ptr<SandboxProcess> Launch(
      const Workspace&, const ResourceLimitPolicy&, std::string& err) const override;
  bool Probe(std::string& err) const override;

  std::vector<std::string> BuildRunCommand(
      const Workspace&, const ResourceLimitPolicy&, const std::string& container_name) const;
  const DockerOptions& Options() const { return opt_; }
};

// true if the stderr text of `docker run` shows that the CLI or daemon failed
// before the user program could start
bool IsDockerDaemonError(int exit_code, const std::string& err);

#endif  // INCLUDE_SAFEEXEC_DOCKER_BACKEND_H_
