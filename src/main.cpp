#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <iostream>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <safeexec/config.h>
#include <safeexec/logger.h>
#include <safeexec/workspace.h>
#include <safeexec/supervisor.h>
#include "safeexec/utils.h"
#include "server.h"

namespace {

bool to_lock = true;
Config conf;

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "safeexec-server");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/safeexec.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--port")
    .scan<'d', int>()
    .help("Port to listen on");
  parser.add_argument("--host")
    .help("Address to listen on");
  parser.add_argument("--backend")
    .help("Isolation backend: docker or cjail");
  parser.add_argument("--no-lock")
    .default_value(false)
    .implicit_value(true)
    .help("Not check for other running instances");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file, conf)) {
    spdlog::error("Failed to parse configuration file {}", std::string(config_file));
    exit(1);
  }
  if (auto val = parser.present<int>("--port")) {
    conf.server.port = val.value();
  }
  if (auto val = parser.present("--host")) {
    conf.server.host = val.value();
  }
  if (auto val = parser.present("--backend")) {
    conf.backend = val.value();
  }
  to_lock = parser["--no-lock"] == false;
  if (conf.lock_file.empty()) conf.lock_file = conf.workspace_root / "safeexec.lock";
}

bool LockFile(const fs::path& lock_file) {
  int fd = open(lock_file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) return false;
  struct flock lock{};
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = lock.l_len = 0;
  if (fcntl(fd, F_SETLK, &lock) < 0) return false;
  return true;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  // a sandbox closing its end early must not kill the server
  signal(SIGPIPE, SIG_IGN);
  ParseArgs(argc, argv);
  if (std::string err; !ValidateConfig(conf, err)) {
    spdlog::error("Invalid configuration: {}", err);
    return 1;
  }
  if (!CreateDirs(conf.workspace_root, kPermWorkspace)) {
    spdlog::error("Cannot create workspace root {}", conf.workspace_root.c_str());
    return 1;
  }
  if (to_lock) {
    if (!LockFile(conf.lock_file)) {
      spdlog::error("Another safeexec instance is running.");
      return 1;
    }
    // only safe while holding the lock: nobody else has live workspaces here
    if (size_t removed = SweepStaleWorkspaces(conf.workspace_root)) {
      spdlog::info("Removed {} stale workspaces from {}", removed, conf.workspace_root.c_str());
    }
  }

  std::unique_ptr<IsolationBackend> backend = MakeBackend(conf);
  if (std::string err; !backend->Probe(err)) {
    spdlog::warn("Backend {} is not usable yet: {}", backend->Name(), err);
  } else {
    spdlog::info("Using backend {}", backend->Name());
  }
  Supervisor supervisor(conf.policy, *backend, conf.workspace_root);
  return ServeForever(supervisor, conf.server) ? 0 : 1;
}
