#ifndef DATAJAIL_SANDBOX_H_
#define DATAJAIL_SANDBOX_H_

#include <string>
#include <vector>
#include <cstdint>

#include <cjail/cjail.h>

class SandboxOptions;

// Owns everything a cjail_ctx points into; filled by SandboxOptions::ToCJailCtx
class JailContext {
  std::vector<const char*> argv_;
  std::vector<const char*> envp_;
  std::vector<struct jail_mount_ctx> mounts_;
  struct jail_mount_list* mount_list_;
  struct cjail_ctx ctx_;
 public:
  JailContext() : mount_list_(mnt_list_new()) {}
  ~JailContext() { mnt_list_free(mount_list_); }
  JailContext(const JailContext&) = delete;
  JailContext& operator=(const JailContext&) = delete;

  struct cjail_ctx& Get() { return ctx_; }
  const struct cjail_ctx& Get() const { return ctx_; }
  size_t MountCount() const { return mounts_.size(); }

  friend class SandboxOptions;
};

// Everything the sandbox-exec helper needs to run one jailed program
class SandboxOptions {
 public:
  std::string boxdir; // chroot
  std::vector<std::string> command;
  std::vector<std::string> envs; // the complete environment; nothing is inherited
  std::string workdir; // inside the box
  int fd_input, fd_output, fd_error; // -1 to keep the helper's own
  int uid, gid;
  long wall_time, cpu_time; // us
  long rss, vss; // KiB
  int proc_num;
  int file_num;
  long fsize; // KiB
  std::vector<std::string> dirs; // bind mounted read-only at the same path inside the box

  SandboxOptions() :
      fd_input(-1), fd_output(-1), fd_error(-1),
      uid(65534), gid(65534),
      wall_time(0), cpu_time(0),
      rss(0), vss(0),
      proc_num(0),
      file_num(0),
      fsize(0) {}

  // CBOR message passed from the host to the helper over a pipe
  std::vector<uint8_t> Serialize() const;
  // false if msg is not a complete message
  static bool Parse(const std::vector<uint8_t>& msg, SandboxOptions&);

  // drop directories that do not exist on this machine
  void FilterDirs();
  // ctx points into this object; do not modify it while ctx is in use
  void ToCJailCtx(JailContext& ctx) const;
};

#endif  // DATAJAIL_SANDBOX_H_
