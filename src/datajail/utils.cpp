#include "utils.h"

#include <unistd.h>
#include <sys/resource.h>
#include <atomic>
#include <cctype>
#include <cstring>
#include <fstream>

#include <spdlog/spdlog.h>

namespace {

std::atomic_long execution_id_seq = 0;

} // namespace

#if __has_include(<linux/close_range.h>)
#include <linux/close_range.h>
int CloseFrom(int minfd) {
  return close_range(minfd, ~0U, 0);
}
#else
int CloseFrom(int minfd) {
  struct rlimit lim;
  if (getrlimit(RLIMIT_NOFILE, &lim) < 0) return -1;
  int maxfd = lim.rlim_cur == RLIM_INFINITY ? 65536 : (int)lim.rlim_cur;
  for (int fd = minfd; fd < maxfd; fd++) close(fd);
  return 0;
}
#endif // has_include(<linux/close_range.h>)

long GetUniqueExecutionId() {
  return ++execution_id_seq;
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;

#define X(...) X_RETURN_ARG3(FailureKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* FailureKindToDesc, FailureKind, ENUM_FAILURE_KIND_)
#undef X

#define X(...) X_RETURN_ARG2(FailureKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* FailureKindToAbr, FailureKind, ENUM_FAILURE_KIND_)
#undef X

#define X(...) X_RETURN_ARG2(BackendType, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* BackendTypeName, BackendType, ENUM_BACKEND_TYPE_)
#undef X

#define X(...) X_RETURN_ARG1(DataFormat, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* DataFormatName, DataFormat, ENUM_DATA_FORMAT_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3

static const char* kCapturedTypeTable[] = {
#define X(name, typname) typname,
  ENUM_CAPTURED_TYPE_
#undef X
};

const char* CapturedTypeName(CapturedType type) {
  return kCapturedTypeTable[(int)type];
}

bool GetCapturedType(const std::string& str, CapturedType& type) {
  for (size_t i = 0; i < sizeof(kCapturedTypeTable) / sizeof(kCapturedTypeTable[0]); i++) {
    if (str == kCapturedTypeTable[i]) {
      type = (CapturedType)i;
      return true;
    }
  }
  return false;
}

DataFormat GetDataFormat(const fs::path& path) {
  std::string ext = path.extension();
  for (auto& i : ext) i = std::tolower((unsigned char)i);
  if (ext == ".csv") return DataFormat::CSV;
  if (ext == ".xlsx" || ext == ".xls") return DataFormat::EXCEL;
  return DataFormat::UNSUPPORTED;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool Copy(const fs::path& from, const fs::path& to, fs::perms perms) {
  spdlog::debug("Copy file {} -> {}", from.c_str(), to.c_str());
  std::error_code ec;
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(to, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed copying {} -> {}: {}", from.c_str(), to.c_str(), strerror(ec.value()));
  return false;
}

bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms) {
  spdlog::debug("Write file {}, size {}", path.c_str(), content.size());
  {
    std::ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (!fout || !fout.write(content.data(), content.size())) {
      spdlog::warn("Failed writing {}", path.c_str());
      return false;
    }
  }
  if (perms == fs::perms::unknown) return true;
  std::error_code ec;
  fs::permissions(path, perms, ec);
  if (ec) {
    spdlog::warn("Failed setting permissions of {}: {}", path.c_str(), strerror(ec.value()));
    return false;
  }
  return true;
}

std::string ReadFileTruncated(const fs::path& path, size_t max_len) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) return "";
  size_t total_length = fs::file_size(path, ec);
  if (ec) return "";
  std::string ret(std::min(total_length, max_len), '\0');
  std::ifstream fin(path, std::ios::binary);
  fin.read(ret.data(), ret.size());
  ret.resize(fin.gcount());
  if (total_length > max_len) {
    ret += "\n[Output truncated after " + std::to_string(max_len) + " bytes]";
  }
  return ret;
}
