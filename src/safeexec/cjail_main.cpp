// safeexec-cjail: runs one jail on behalf of the server.
// fd 0: serialized JailOptions preceded by its length; fd 1: receives the struct cjail_result.
// The user program's streams are whatever fds the options name.
#include <errno.h>
#include <unistd.h>

#include "cjail_options.h"

namespace {

constexpr long kMaxOptionsSize = 1L << 20;

bool ReadAll(int fd, void* buf, size_t size) {
  auto ptr = static_cast<uint8_t*>(buf);
  while (size) {
    ssize_t n = read(fd, ptr, size);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    ptr += n, size -= n;
  }
  return true;
}

bool WriteAll(int fd, const void* buf, size_t size) {
  auto ptr = static_cast<const uint8_t*>(buf);
  while (size) {
    ssize_t n = write(fd, ptr, size);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    ptr += n, size -= n;
  }
  return true;
}

struct cjail_result JailExec(const JailOptions& opt) {
  CJailCtxClass ctx;
  opt.ToCJailCtx(ctx);
  struct cjail_result ret = {};
  if (cjail_exec(&ctx.GetCtx(), &ret) < 0) {
    ret.oomkill = errno;
    ret.timekill = -1;
  }
  return ret;
}

} // namespace

int main() {
  long sz = 0;
  if (!ReadAll(0, &sz, sizeof(sz)) || sz <= 0 || sz > kMaxOptionsSize) return 1;
  std::vector<uint8_t> buf(sz);
  if (!ReadAll(0, buf.data(), sz)) return 1;
  close(0);
  JailOptions opt;
  struct cjail_result res = {};
  if (opt.Deserialize(buf)) {
    res = JailExec(opt);
  } else {
    res.oomkill = EINVAL;
    res.timekill = -1;
  }
  if (!WriteAll(1, &res, sizeof(res))) return 1;
}
