#ifndef DATAJAIL_SANDBOX_EXEC_H_
#define DATAJAIL_SANDBOX_EXEC_H_

#include "sandbox.h"

// Kept apart from sandbox.h so that the sandbox-exec helper does not depend on spdlog.

// Runs the jail in the sandbox-exec helper. The helper is killed if it has not reported
// within opt.wall_time plus a grace period.
// On failure of the helper itself, timekill is -1 and oomkill holds errno.
struct cjail_result SandboxExec(const SandboxOptions& opt);

#endif  // DATAJAIL_SANDBOX_EXEC_H_
