#include <safeexec/workspace.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <atomic>
#include <vector>

#include <spdlog/spdlog.h>
#include "utils.h"

const char kWorkspacePrefix[] = "safeexec-";
const char kScriptName[] = "script.py";

namespace {

std::atomic_long live_workspaces = 0;

} // namespace

Workspace::Workspace(fs::path&& path) : path_(std::move(path)) {
  ++live_workspaces;
}

Workspace::~Workspace() {
  --live_workspaces;
  // the script is read-only, but removing it only needs write access to the directory
  RemoveAll(path_);
}

long Workspace::LiveCount() {
  return live_workspaces;
}

std::unique_ptr<Workspace> Workspace::Acquire(const fs::path& root, const std::string& code) {
  std::string templ = (root / kWorkspacePrefix).string() + "XXXXXX";
  if (!mkdtemp(templ.data())) {
    spdlog::warn("Failed to create workspace under {}: {}", root.c_str(), strerror(errno));
    return nullptr;
  }
  // from here on the destructor owns the directory
  std::unique_ptr<Workspace> ret(new Workspace(fs::path(templ)));
  if (!WriteFile(ret->ScriptPath(), code, kPermScript)) return nullptr;
  std::error_code ec;
  fs::permissions(ret->Path(), kPermWorkspace, ec);
  if (ec) {
    spdlog::warn("Failed setting permissions of {}: {}", ret->Path().c_str(), ec.message());
    return nullptr;
  }
  spdlog::debug("Workspace {} acquired, {} bytes", ret->Path().c_str(), code.size());
  return ret;
}

size_t SweepStaleWorkspaces(const fs::path& root) {
  std::vector<fs::path> stale;
  std::error_code ec;
  for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
    std::string name = it->path().filename().string();
    std::error_code type_ec;
    if (name.rfind(kWorkspacePrefix, 0) != 0 || !it->is_directory(type_ec)) continue;
    stale.push_back(it->path());
  }
  if (ec) spdlog::warn("Failed scanning {}: {}", root.c_str(), ec.message());
  size_t count = 0;
  for (auto& path : stale) {
    spdlog::info("Removing stale workspace {}", path.c_str());
    if (RemoveAll(path)) count++;
  }
  return count;
}
