#ifndef DATAJAIL_UTILS_H_
#define DATAJAIL_UTILS_H_

#include <string>
#include <filesystem>

#include <datajail/utils.h>

namespace fs = std::filesystem;

constexpr fs::perms kPerm644 =
    fs::perms::owner_read | fs::perms::owner_write |
    fs::perms::group_read | fs::perms::others_read;
constexpr fs::perms kPerm755 =
    fs::perms::owner_all |
    fs::perms::group_read | fs::perms::group_exec |
    fs::perms::others_read | fs::perms::others_exec;

#define ENUM_DATA_FORMAT_ \
  X(UNSUPPORTED) \
  X(CSV) \
  X(EXCEL)
enum class DataFormat {
#define X(name) name,
  ENUM_DATA_FORMAT_
#undef X
};
const char* DataFormatName(DataFormat);
// by extension, case-insensitive
DataFormat GetDataFormat(const fs::path&);

// captured stdout/stderr per execution
constexpr size_t kMaxStreamBytes = 1 << 20;

// close every fd >= minfd; only async-signal-safe calls, usable after fork()
int CloseFrom(int minfd);

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
// resolves symlinks
bool Copy(const fs::path& from, const fs::path& to, fs::perms = fs::perms::unknown);
bool WriteFile(const fs::path&, const std::string& content, fs::perms = fs::perms::unknown);
// read at most max_len bytes; a marker is appended if the file is longer
std::string ReadFileTruncated(const fs::path&, size_t max_len);

#endif  // DATAJAIL_UTILS_H_
