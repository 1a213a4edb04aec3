#ifndef INCLUDE_SAFEEXEC_CONFIG_H_
#define INCLUDE_SAFEEXEC_CONFIG_H_

#include <memory>
#include <string>
#include <filesystem>

#include "policy.h"
#include "backend.h"
#include "docker_backend.h"
#include "cjail_backend.h"

namespace fs = std::filesystem;

struct ServerOptions {
  std::string host;
  int port;
  int threads;
  size_t max_body_bytes;

  ServerOptions() : host("0.0.0.0"), port(5000), threads(8), max_body_bytes(1024 * 1024) {}
};

struct Config {
  ResourceLimitPolicy policy;
  fs::path workspace_root;
  fs::path lock_file;
  std::string backend; // "docker" or "cjail"
  DockerOptions docker;
  CJailBackendOptions cjail;
  ServerOptions server;

  Config();
};

// Keys missing from the file keep their current value in conf.
// Returns false if the file cannot be read or a value is invalid.
bool ParseConfig(const fs::path& conf_path, Config& conf);
bool ValidateConfig(const Config& conf, std::string& err);

// nullptr if conf.backend names no known backend
std::unique_ptr<IsolationBackend> MakeBackend(const Config& conf);

#endif  // INCLUDE_SAFEEXEC_CONFIG_H_
