#ifndef DATAJAIL_CONFIG_H_
#define DATAJAIL_CONFIG_H_

#include <filesystem>

#include <datajail/execution.h>

// Also sets kBoxRoot and kUploadsRoot. Keys absent from the file keep their current value.
bool ParseConfig(const std::filesystem::path& conf_path, SandboxConfig& config);

#endif  // DATAJAIL_CONFIG_H_
