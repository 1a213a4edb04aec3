#include <safeexec/config.h>

#include <fstream>

#include <fmt/core.h>
#include <tortellini.hh>
#include <spdlog/spdlog.h>

Config::Config() :
    workspace_root("/tmp/safeexec"),
    backend("docker") {}

bool ParseConfig(const fs::path& conf_path, Config& conf) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;

  std::string workspace_root = ini[""]["workspace_root"] | "";
  std::string lock_file = ini[""]["lock_file"] | "";
  if (workspace_root.size()) conf.workspace_root = workspace_root;
  if (lock_file.size()) conf.lock_file = lock_file;
  conf.backend = ini[""]["backend"] | conf.backend;

  auto& policy = conf.policy;
  policy.timeout = std::chrono::milliseconds(ini["policy"]["timeout_ms"] | (long)policy.timeout.count());
  policy.memory_bytes = (ini["policy"]["memory_mb"] | (long)(policy.memory_bytes >> 20)) << 20;
  policy.cpu_share = ini["policy"]["cpus"] | policy.cpu_share;
  policy.max_processes = ini["policy"]["pids_limit"] | policy.max_processes;
  policy.network_enabled = ini["policy"]["network"] | policy.network_enabled;
  policy.filesystem_writable = ini["policy"]["writable_fs"] | policy.filesystem_writable;
  long max_code_chars = ini["policy"]["max_code_chars"] | (long)policy.max_code_chars;
  long max_output_kb = ini["policy"]["max_output_kb"] | (long)(policy.max_output_bytes / 1024);
  // negative values would wrap around in the unsigned fields
  if (max_code_chars < 0 || max_output_kb < 0) {
    spdlog::error("Negative length limit in {}", conf_path.c_str());
    return false;
  }
  policy.max_code_chars = max_code_chars;
  policy.max_output_bytes = max_output_kb * 1024;

  auto& docker = conf.docker;
  docker.binary = ini["docker"]["binary"] | docker.binary;
  docker.image = ini["docker"]["image"] | docker.image;
  docker.interpreter = ini["docker"]["interpreter"] | docker.interpreter;
  docker.user = ini["docker"]["user"] | docker.user;
  docker.oom_exit_code = ini["docker"]["oom_exit_code"] | docker.oom_exit_code;
  docker.kill_timeout_ms = ini["docker"]["kill_timeout_ms"] | docker.kill_timeout_ms;

  auto& cjail = conf.cjail;
  std::string helper = ini["cjail"]["helper"] | "";
  if (helper.size()) cjail.helper = helper;
  cjail.interpreter = ini["cjail"]["interpreter"] | cjail.interpreter;
  cjail.uid_base = ini["cjail"]["uid_base"] | cjail.uid_base;
  cjail.uid_count = ini["cjail"]["uid_count"] | cjail.uid_count;

  auto& server = conf.server;
  server.host = ini["server"]["host"] | server.host;
  server.port = ini["server"]["port"] | server.port;
  server.threads = ini["server"]["threads"] | server.threads;
  long max_body_kb = ini["server"]["max_body_kb"] | (long)(server.max_body_bytes / 1024);
  if (max_body_kb < 0) {
    spdlog::error("Negative max_body_kb in {}", conf_path.c_str());
    return false;
  }
  server.max_body_bytes = max_body_kb * 1024;
  return true;
}

bool ValidateConfig(const Config& conf, std::string& err) {
  if (!ValidatePolicy(conf.policy, err)) return false;
  if (conf.backend != "docker" && conf.backend != "cjail") {
    err = fmt::format("unknown backend \"{}\"", conf.backend);
  } else if (!conf.workspace_root.is_absolute()) {
    err = fmt::format("workspace_root must be absolute (got \"{}\")", conf.workspace_root.c_str());
  } else if (conf.server.port <= 0 || conf.server.port > 65535) {
    err = fmt::format("invalid port {}", conf.server.port);
  } else if (conf.server.threads <= 0) {
    err = fmt::format("thread count must be positive (got {})", conf.server.threads);
  } else if (conf.server.max_body_bytes == 0) {
    err = "request body limit must be positive";
  } else if (conf.docker.kill_timeout_ms <= 0) {
    err = fmt::format("kill_timeout_ms must be positive (got {})", conf.docker.kill_timeout_ms);
  } else if (conf.cjail.uid_base <= 0 || conf.cjail.uid_count <= 0) {
    err = fmt::format("invalid jail uid range {}+{}", conf.cjail.uid_base, conf.cjail.uid_count);
  } else {
    return true;
  }
  return false;
}

std::unique_ptr<IsolationBackend> MakeBackend(const Config& conf) {
  if (conf.backend == "docker") return std::make_unique<DockerBackend>(conf.docker);
  if (conf.backend == "cjail") return std::make_unique<CJailBackend>(conf.cjail);
  return nullptr;
}
