#include <errno.h>
#include <unistd.h>

#include "sandbox.h"

// sandbox-exec: reads one serialized SandboxOptions from stdin, runs it in a cjail
// jail and writes the raw cjail_result to stdout. Needs root.

namespace {

bool ReadFull(int fd, void* buf, size_t len) {
  char* ptr = (char*)buf;
  while (len) {
    ssize_t ret = read(fd, ptr, len);
    if (ret < 0 && errno == EINTR) continue;
    if (ret <= 0) return false;
    ptr += ret;
    len -= ret;
  }
  return true;
}

constexpr long kMaxMessageSize = 1L << 24;

} // namespace

int main() {
  long sz = 0;
  if (!ReadFull(0, &sz, sizeof(sz)) || sz <= 0 || sz > kMaxMessageSize) return 1;
  std::vector<uint8_t> buf(sz);
  if (!ReadFull(0, buf.data(), sz)) return 1;
  SandboxOptions opt;
  if (!SandboxOptions::Parse(buf, opt)) return 1;

  JailContext jail;
  opt.ToCJailCtx(jail);
  struct cjail_result res = {};
  if (cjail_exec(&jail.Get(), &res) < 0) {
    // same convention as a failed spawn on the host side
    res.oomkill = errno;
    res.timekill = -1;
  }
  if (write(1, &res, sizeof(res)) < 0) return 1;
  return 0;
}
