#include "config.h"

#include <fstream>

#include <tortellini.hh>
#include <datajail/paths.h>

bool ParseConfig(const fs::path& conf_path, SandboxConfig& config) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string box_root = ini[""]["box_root"] | "";
  std::string uploads_root = ini[""]["uploads_root"] | "";
  // docker needs absolute paths for bind mounts
  if (box_root.size()) kBoxRoot = fs::absolute(box_root);
  if (uploads_root.size()) kUploadsRoot = uploads_root;
  config.backend = ini[""]["backend"] | config.backend;

  ResourceLimits& lim = config.limits;
  lim.timeout_seconds = ini["limits"]["timeout_seconds"] | lim.timeout_seconds;
  lim.memory_limit_bytes = (ini["limits"]["memory_limit_mb"] | (lim.memory_limit_bytes >> 20)) << 20;
  lim.cpu_limit = ini["limits"]["cpu_limit"] | lim.cpu_limit;
  lim.max_output_file_bytes = (ini["limits"]["max_output_file_mb"] | (lim.max_output_file_bytes >> 20)) << 20;
  lim.max_processes = ini["limits"]["max_processes"] | lim.max_processes;

  config.image = ini["container"]["image"] | config.image;
  std::string dockerfile = ini["container"]["dockerfile"] | "";
  if (dockerfile.size()) config.dockerfile = dockerfile;

  config.python = ini["process"]["python"] | config.python;
  config.syntax_check = ini["process"]["syntax_check"] | config.syntax_check;
  config.uid_base = ini["process"]["uid_base"] | config.uid_base;
  config.uid_count = ini["process"]["uid_count"] | config.uid_count;
  std::string bind_dirs = ini["process"]["bind_dirs"] | "";
  for (size_t pos = 0; pos < bind_dirs.size();) {
    size_t next = bind_dirs.find(',', pos);
    if (next == std::string::npos) next = bind_dirs.size();
    std::string dir = bind_dirs.substr(pos, next - pos);
    if (dir.size()) config.bind_dirs.push_back(dir);
    pos = next + 1;
  }
  return lim.Valid() && config.uid_base > 0 && config.uid_count > 0;
}
