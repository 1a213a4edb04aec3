#ifndef INCLUDE_SAFEEXEC_WORKSPACE_H_
#define INCLUDE_SAFEEXEC_WORKSPACE_H_

#include <memory>
#include <string>
#include <filesystem>

namespace fs = std::filesystem;

extern const char kWorkspacePrefix[]; // "safeexec-"
extern const char kScriptName[];      // "script.py"

// A single-use staging directory holding one submitted script.
// The directory is removed when the object is destroyed.
class Workspace {
  fs::path path_;

  explicit Workspace(fs::path&& path);
 public:
  Workspace(const Workspace&) = delete;
  Workspace& operator=(const Workspace&) = delete;
  ~Workspace();

  // Create <root>/safeexec-XXXXXX (mode 0711) holding the code as script.py (mode 0444).
  // Returns nullptr on failure; nothing is left on disk in that case.
  static std::unique_ptr<Workspace> Acquire(const fs::path& root, const std::string& code);

  const fs::path& Path() const { return path_; }
  fs::path ScriptPath() const { return path_ / kScriptName; }

  // number of workspaces currently alive in this process
  static long LiveCount();
};

// Remove workspaces left behind by a previous instance that did not shut down cleanly.
// Only call this while holding the instance lock.
size_t SweepStaleWorkspaces(const fs::path& root);

#endif  // INCLUDE_SAFEEXEC_WORKSPACE_H_
