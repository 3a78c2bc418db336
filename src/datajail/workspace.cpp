#include <datajail/workspace.h>

#include <spdlog/spdlog.h>
#include "paths.h"
#include "utils.h"

Workspace::Workspace(long id) : id_(id), valid_(false) {
  fs::path root = WorkspacePath(id_);
  std::error_code ec;
  if (fs::exists(root, ec)) {
    // stale box of an earlier process that reused our pid
    spdlog::warn("Workspace {} already exists; removing", root.c_str());
    if (!RemoveAll(root)) return;
  }
  // the jailed program only needs to traverse the box and write into output & tmp
  valid_ = CreateDirs(kBoxRoot) &&
           CreateDirs(root, kPerm755) &&
           CreateDirs(Workdir(), kPerm755) &&
           CreateDirs(DataDir(), kPerm755) &&
           CreateDirs(OutputDir(), fs::perms::all) &&
           CreateDirs(TmpDir(), fs::perms::all);
  if (valid_) {
    spdlog::debug("Workspace created: id={} path={}", id_, root.c_str());
  } else {
    spdlog::warn("Failed creating workspace: id={} path={}", id_, root.c_str());
  }
}

Workspace::~Workspace() {
  RemoveAll(Root());
}

fs::path Workspace::Root() const { return WorkspacePath(id_); }
fs::path Workspace::Workdir() const { return ::Workdir(WorkspacePath(id_)); }
fs::path Workspace::Program() const { return WorkspaceProgram(id_); }
fs::path Workspace::DataDir() const { return WorkspaceDataDir(id_); }
fs::path Workspace::OutputDir() const { return WorkspaceOutputDir(id_); }
fs::path Workspace::ResultFile() const { return WorkspaceResultFile(id_); }
fs::path Workspace::TmpDir() const { return WorkspaceTmpDir(id_); }
fs::path Workspace::Stdout() const { return WorkspaceStdout(id_); }
fs::path Workspace::Stderr() const { return WorkspaceStderr(id_); }
