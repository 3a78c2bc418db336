#ifndef INCLUDE_DATAJAIL_PATHS_H_
#define INCLUDE_DATAJAIL_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

extern fs::path kBoxRoot;
// shared & read-only across executions; bound data files must resolve inside it
extern fs::path kUploadsRoot;

namespace internal {

// does not meant to be publicly used; only for testing
extern fs::path kDataDir;

} // internal

#endif  // INCLUDE_DATAJAIL_PATHS_H_
