#include "cjail_options.h"

#include <unistd.h>
#include <sys/mount.h>
#include <cstring>

bool JailOptions::Deserialize(const std::vector<uint8_t>& vec) {
  size_t cur = 0;
  bool ok = true;
  auto ReadInt = [&]() -> Int {
    if (vec.size() - cur < sizeof(Int)) {
      ok = false;
      return 0;
    }
    Int r;
    memcpy(&r, vec.data() + cur, sizeof(Int));
    cur += sizeof(Int);
    return r;
  };
  auto ReadString = [&]() {
    Int size = ReadInt();
    if (size < 0 || vec.size() - cur < (size_t)size) {
      ok = false;
      return std::string();
    }
    std::string str(size, '\0');
    memcpy(str.data(), vec.data() + cur, size);
    cur += size;
    return str;
  };
  // every list length is bounded by the remaining buffer, so a bad length cannot allocate wildly
  auto ReadLength = [&]() -> size_t {
    Int size = ReadInt();
    if (size < 0 || (size_t)size > vec.size() - cur) {
      ok = false;
      return 0;
    }
    return size;
  };
  boxdir = ReadString();
  command.resize(ReadLength());
  for (auto& i : command) i = ReadString();
  envs.resize(ReadLength());
  for (auto& i : envs) i = ReadString();
  workdir = ReadString();
  fd_input = ReadInt();
  fd_output = ReadInt();
  fd_error = ReadInt();
  cpu_set.resize(ReadLength());
  for (auto& i : cpu_set) i = ReadInt();
  uid = ReadInt();
  gid = ReadInt();
  wall_time = ReadInt();
  rss = ReadInt();
  proc_num = ReadInt();
  sharenet = ReadInt();
  dirs.resize(ReadLength());
  for (auto& i : dirs) i = ReadString();
  return ok && cur == vec.size() && !command.empty();
}

std::vector<uint8_t> JailOptions::Serialize() const {
  std::vector<uint8_t> ret;
  auto PushInt = [&](Int r) {
    size_t cur = ret.size();
    ret.resize(cur + sizeof(Int));
    memcpy(ret.data() + cur, &r, sizeof(Int));
  };
  auto PushString = [&](const std::string& str) {
    PushInt(str.size());
    ret.insert(ret.end(), str.begin(), str.end());
  };
  PushString(boxdir);
  PushInt(command.size());
  for (auto& i : command) PushString(i);
  PushInt(envs.size());
  for (auto& i : envs) PushString(i);
  PushString(workdir);
  PushInt(fd_input);
  PushInt(fd_output);
  PushInt(fd_error);
  PushInt(cpu_set.size());
  for (auto& i : cpu_set) PushInt(i);
  PushInt(uid);
  PushInt(gid);
  PushInt(wall_time);
  PushInt(rss);
  PushInt(proc_num);
  PushInt(sharenet);
  PushInt(dirs.size());
  for (auto& i : dirs) PushString(i);
  return ret;
}

void JailOptions::ToCJailCtx(CJailCtxClass& ret) const {
  struct cjail_ctx& ctx = ret.ctx_;
  cjail_ctx_init(&ctx);
  // default: preservefd
  if (fd_input != -1) ctx.fd_input = fd_input;
  if (fd_output != -1) ctx.fd_output = fd_output;
  if (fd_error != -1) ctx.fd_error = fd_error;
  ctx.sharenet = sharenet;
  for (auto& i : command) ret.argv_buf_.push_back(i.data());
  ret.argv_buf_.push_back(nullptr);
  ctx.argv = const_cast<char* const*>(ret.argv_buf_.data());
  for (auto& i : envs) ret.env_buf_.push_back(i.data());
  ret.env_buf_.push_back(nullptr);
  ctx.environ = const_cast<char* const*>(ret.env_buf_.data());
  ctx.chroot = const_cast<char*>(boxdir.data());
  ctx.working_dir = const_cast<char*>(workdir.data());
  // default: cgroup_root
  if (cpu_set.empty()) {
    ctx.cpuset = nullptr;
  } else {
    CPU_ZERO(&ret.cpu_set_);
    for (auto& i : cpu_set) CPU_SET(i, &ret.cpu_set_);
    ctx.cpuset = &ret.cpu_set_;
  }
  ctx.uid = uid;
  ctx.gid = gid;
  ctx.rlim_core = 0; // no core dump
  ctx.rlim_proc = proc_num;
  ctx.cg_rss = rss;
  ctx.lim_time.tv_sec = wall_time / 1'000'000;
  ctx.lim_time.tv_usec = wall_time % 1'000'000;
  // default: seccomp_cfg
  // mnt_list_add keeps pointers into mnt_buf_, so it must not reallocate
  ret.mnt_buf_.reserve(dirs.size());
  for (auto& i : dirs) {
    ret.mnt_buf_.emplace_back();
    struct jail_mount_ctx& mnt_ctx = ret.mnt_buf_.back();
    mnt_ctx.type = const_cast<char*>("bind");
    mnt_ctx.source = mnt_ctx.target = const_cast<char*>(i.data());
    mnt_ctx.fstype = mnt_ctx.data = nullptr;
    mnt_ctx.flags = MS_RDONLY;
    mnt_list_add(ret.mnt_list_, &mnt_ctx);
  }
  ctx.mount_cfg = ret.mnt_list_;
}
