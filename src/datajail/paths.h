#ifndef DATAJAIL_PATHS_H_
#define DATAJAIL_PATHS_H_

#include <datajail/paths.h>

extern const char kWorkdirRelative[];
fs::path Workdir(fs::path&&);

// if inside_box = true, id is not used (callers pass -1) and the path is the one
// seen by a program jailed at WorkspacePath(id)
fs::path WorkspacePath(long id);
fs::path WorkspaceProgram(long id, bool inside_box = false);
fs::path WorkspaceDataDir(long id, bool inside_box = false);
fs::path WorkspaceOutputDir(long id, bool inside_box = false);
fs::path WorkspaceResultFile(long id, bool inside_box = false);
fs::path WorkspaceTmpDir(long id, bool inside_box = false);
fs::path WorkspaceStdout(long id);
fs::path WorkspaceStderr(long id);

// mount points inside the sandbox container
extern const char kContainerWorkspace[];
extern const char kContainerOutput[];

fs::path SandboxExecPath();

extern const char kResultFileName[];

#endif  // DATAJAIL_PATHS_H_
