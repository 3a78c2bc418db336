#include "sandbox.h"

#include <sys/mount.h>
#include <algorithm>
#include <filesystem>

#include <nlohmann/json.hpp>

namespace {

const char kBindMount[] = "bind";

inline struct timeval ToTimeval(long us) {
  return {us / 1'000'000, us % 1'000'000};
}

} // namespace

std::vector<uint8_t> SandboxOptions::Serialize() const {
  nlohmann::json msg = {
    {"boxdir", boxdir},
    {"command", command},
    {"envs", envs},
    {"workdir", workdir},
    {"fd", {fd_input, fd_output, fd_error}},
    {"uid", uid},
    {"gid", gid},
    {"wall_time", wall_time},
    {"cpu_time", cpu_time},
    {"rss", rss},
    {"vss", vss},
    {"proc_num", proc_num},
    {"file_num", file_num},
    {"fsize", fsize},
    {"dirs", dirs},
  };
  return nlohmann::json::to_cbor(msg);
}

bool SandboxOptions::Parse(const std::vector<uint8_t>& vec, SandboxOptions& opt) {
  try {
    nlohmann::json msg = nlohmann::json::from_cbor(vec);
    msg.at("boxdir").get_to(opt.boxdir);
    msg.at("command").get_to(opt.command);
    msg.at("envs").get_to(opt.envs);
    msg.at("workdir").get_to(opt.workdir);
    auto& fd = msg.at("fd");
    fd.at(0).get_to(opt.fd_input);
    fd.at(1).get_to(opt.fd_output);
    fd.at(2).get_to(opt.fd_error);
    msg.at("uid").get_to(opt.uid);
    msg.at("gid").get_to(opt.gid);
    msg.at("wall_time").get_to(opt.wall_time);
    msg.at("cpu_time").get_to(opt.cpu_time);
    msg.at("rss").get_to(opt.rss);
    msg.at("vss").get_to(opt.vss);
    msg.at("proc_num").get_to(opt.proc_num);
    msg.at("file_num").get_to(opt.file_num);
    msg.at("fsize").get_to(opt.fsize);
    msg.at("dirs").get_to(opt.dirs);
  } catch (nlohmann::json::exception&) {
    return false;
  }
  return !opt.command.empty();
}

void SandboxOptions::FilterDirs() {
  dirs.erase(std::remove_if(dirs.begin(), dirs.end(), [](const std::string& dir) {
    std::error_code ec;
    return !std::filesystem::is_directory(dir, ec);
  }), dirs.end());
}

void SandboxOptions::ToCJailCtx(JailContext& jail) const {
  struct cjail_ctx& ctx = jail.ctx_;
  cjail_ctx_init(&ctx);
  if (fd_input != -1) ctx.fd_input = fd_input;
  if (fd_output != -1) ctx.fd_output = fd_output;
  if (fd_error != -1) ctx.fd_error = fd_error;

  jail.argv_.clear();
  for (auto& i : command) jail.argv_.push_back(i.c_str());
  jail.argv_.push_back(nullptr);
  ctx.argv = const_cast<char* const*>(jail.argv_.data());
  jail.envp_.clear();
  for (auto& i : envs) jail.envp_.push_back(i.c_str());
  jail.envp_.push_back(nullptr);
  ctx.environ = const_cast<char* const*>(jail.envp_.data());

  ctx.chroot = const_cast<char*>(boxdir.c_str());
  ctx.working_dir = const_cast<char*>(workdir.c_str());
  ctx.cpuset = nullptr;
  ctx.uid = uid;
  ctx.gid = gid;
  // resource limits; no stack limit, no core dumps
  ctx.rlim_as = vss;
  ctx.rlim_core = 0;
  ctx.rlim_nofile = file_num;
  ctx.rlim_fsize = fsize;
  ctx.rlim_proc = proc_num;
  ctx.cg_rss = rss;
  ctx.lim_time = ToTimeval(wall_time);
  ctx.lim_cputime = ToTimeval(cpu_time);

  // mount_list keeps pointers into mounts_
  jail.mounts_.assign(dirs.size(), {});
  for (size_t i = 0; i < dirs.size(); i++) {
    struct jail_mount_ctx& mnt = jail.mounts_[i];
    mnt.type = const_cast<char*>(kBindMount);
    mnt.source = mnt.target = const_cast<char*>(dirs[i].c_str());
    mnt.fstype = mnt.data = nullptr;
    mnt.flags = MS_RDONLY;
    mnt_list_add(jail.mount_list_, &mnt);
  }
  ctx.mount_cfg = jail.mount_list_;
}
