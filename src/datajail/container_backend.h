#ifndef DATAJAIL_CONTAINER_BACKEND_H_
#define DATAJAIL_CONTAINER_BACKEND_H_

#include <string>
#include <vector>

#include <datajail/backend.h>

// One ephemeral Docker container per execution: no network, read-only root, all
// capabilities dropped, and only the output directory writable.
class ContainerBackend : public Backend {
  std::string image_;
  double cpu_limit_;
 public:
  explicit ContainerBackend(const SandboxConfig&);
  BackendType Type() const override { return BackendType::CONTAINER; }
  WrapOptions Layout() const override;
  RawExecutionResult Run(const std::string& program, const Workspace&, const ResourceLimits&) const override;

  // exposed for testing
  std::vector<std::string> RunCommand(const std::string& name, const Workspace&, const ResourceLimits&) const;
};

// environment handed to the docker client
std::vector<std::string> DockerClientEnv();

#endif  // DATAJAIL_CONTAINER_BACKEND_H_
