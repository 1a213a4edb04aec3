#ifndef SAFEEXEC_CJAIL_OPTIONS_H_
#define SAFEEXEC_CJAIL_OPTIONS_H_

#include <string>
#include <vector>
#include <cstdint>

#include <cjail/cjail.h>

class JailOptions;
// Owns every buffer a cjail_ctx points into.
class CJailCtxClass {
 private:
  std::vector<const char*> argv_buf_;
  std::vector<const char*> env_buf_;
  std::vector<struct jail_mount_ctx> mnt_buf_;
  struct jail_mount_list* mnt_list_;
  cpu_set_t cpu_set_;
  struct cjail_ctx ctx_;
 public:
  CJailCtxClass() : mnt_list_(mnt_list_new()) {}
  CJailCtxClass(const CJailCtxClass&) = delete;
  ~CJailCtxClass() {
    mnt_list_free(mnt_list_);
  }
  struct cjail_ctx& GetCtx() { return ctx_; }
  const struct cjail_ctx& GetCtx() const { return ctx_; }

  friend class JailOptions;
};

// Everything the helper needs to run one jail.
// Passed from the server to safeexec-cjail over a pipe.
class JailOptions {
  using Int = long; // serialize
 public:
  std::string boxdir; // absolute on the host
  std::vector<std::string> command;
  std::vector<std::string> envs;
  std::string workdir; // inside box
  int fd_input, fd_output, fd_error; // fds of the helper, -1 for inherit
  std::vector<int> cpu_set;
  int uid, gid;
  long wall_time; // us
  long rss; // KiB
  int proc_num;
  bool sharenet;
  // host directories bind-mounted read-only at the same path inside the box
  std::vector<std::string> dirs;

  JailOptions() :
      fd_input(-1), fd_output(-1), fd_error(-1),
      uid(65534), gid(65534),
      wall_time(0),
      rss(0),
      proc_num(0),
      sharenet(false) {}
  // returns false on a malformed buffer
  bool Deserialize(const std::vector<uint8_t>& serial);

  // platform dependent, only intended for same machine
  std::vector<uint8_t> Serialize() const;
  // The result points into this object; do not modify it while the context is in use.
  void ToCJailCtx(CJailCtxClass& ret) const;
};

#endif  // SAFEEXEC_CJAIL_OPTIONS_H_
