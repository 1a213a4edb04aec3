#ifndef INCLUDE_SAFEEXEC_BACKEND_H_
#define INCLUDE_SAFEEXEC_BACKEND_H_

#include <memory>
#include <string>

#include "policy.h"
#include "sandbox_process.h"

class Workspace;

extern const char kSandboxMountPoint[]; // "/app"

class IsolationBackend {
 public:
  virtual ~IsolationBackend() = default;

  virtual const char* Name() const = 0;

  // Start the workspace script under the policy.
  // Returns nullptr and sets err if the isolation primitive cannot be reached;
  // this never reflects a fault of the submitted code.
  // Must be safe to call from several threads at once.
  virtual std::unique_ptr<SandboxProcess> Launch(
      const Workspace&, const ResourceLimitPolicy&, std::string& err) const = 0;

  // Startup availability check; only logged.
  virtual bool Probe(std::string& err) const { return true; }
};

#endif  // INCLUDE_SAFEEXEC_BACKEND_H_
