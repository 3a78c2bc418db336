#ifndef INCLUDE_DATAJAIL_WORKSPACE_H_
#define INCLUDE_DATAJAIL_WORKSPACE_H_

#include <filesystem>

// Ephemeral directory exclusively owned by one execution:
//   <box>/workdir/program.py
//   <box>/workdir/data/        copies of the bound data files
//   <box>/workdir/output/      result envelope & plots (the only place the program may write)
//   <box>/workdir/tmp/         HOME / TMPDIR of the restricted process backend
//   <box>/stdout, <box>/stderr
// The whole box is removed by the destructor, on every exit path.
class Workspace {
  long id_;
  bool valid_;
 public:
  explicit Workspace(long id);
  ~Workspace();
  Workspace(const Workspace&) = delete;
  Workspace& operator=(const Workspace&) = delete;

  bool Valid() const { return valid_; }
  long Id() const { return id_; }

  std::filesystem::path Root() const;
  std::filesystem::path Workdir() const;
  std::filesystem::path Program() const;
  std::filesystem::path DataDir() const;
  std::filesystem::path OutputDir() const;
  std::filesystem::path ResultFile() const;
  std::filesystem::path TmpDir() const;
  std::filesystem::path Stdout() const;
  std::filesystem::path Stderr() const;
};

#endif  // INCLUDE_DATAJAIL_WORKSPACE_H_
