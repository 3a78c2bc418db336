#include "paths.h"

#include <unistd.h>

#include <fmt/format.h>

fs::path kBoxRoot = "/tmp/datajail_box";
fs::path kUploadsRoot = "uploads";

namespace internal {
fs::path kDataDir = fs::path(DATAJAIL_DATA_DIR);
} // internal

const char kWorkdirRelative[] = "workdir";
fs::path Workdir(fs::path&& path) {
  path /= kWorkdirRelative;
  return path;
}

const char kContainerWorkspace[] = "/sandbox/workspace";
const char kContainerOutput[] = "/sandbox/output";
const char kResultFileName[] = "result.json";

namespace {

inline fs::path BoxOrRoot(long id, bool inside_box) {
  return inside_box ? fs::path("/") : WorkspacePath(id);
}

} // namespace

// pid prefix keeps concurrent host processes sharing one box root apart
fs::path WorkspacePath(long id) {
  return kBoxRoot / fmt::format("{}-{:06d}", getpid(), id);
}
fs::path WorkspaceProgram(long id, bool inside_box) {
  return Workdir(BoxOrRoot(id, inside_box)) / "program.py";
}
fs::path WorkspaceDataDir(long id, bool inside_box) {
  return Workdir(BoxOrRoot(id, inside_box)) / "data";
}
fs::path WorkspaceOutputDir(long id, bool inside_box) {
  return Workdir(BoxOrRoot(id, inside_box)) / "output";
}
fs::path WorkspaceResultFile(long id, bool inside_box) {
  return WorkspaceOutputDir(id, inside_box) / kResultFileName;
}
fs::path WorkspaceTmpDir(long id, bool inside_box) {
  return Workdir(BoxOrRoot(id, inside_box)) / "tmp";
}
fs::path WorkspaceStdout(long id) {
  return WorkspacePath(id) / "stdout";
}
fs::path WorkspaceStderr(long id) {
  return WorkspacePath(id) / "stderr";
}

fs::path SandboxExecPath() {
  return internal::kDataDir / "sandbox-exec";
}
