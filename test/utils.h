#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <map>
#include <memory>
#include <string>
#include <functional>
#include <filesystem>

#include <gtest/gtest.h>
#include <datajail/backend.h>
#include <datajail/workspace.h>

// Records what the executor hands to the backend and plays back a canned result
class FakeBackend : public Backend {
 public:
  struct Record {
    int calls = 0;
    std::string program;
    std::filesystem::path root;
    std::map<std::string, std::string> data_files; // file name -> content at run time
  };
  std::shared_ptr<Record> record;
  RawExecutionResult result;
  // called with the live workspace, e.g. to write a result envelope
  std::function<void(const Workspace&)> action;
  BackendType type;

  FakeBackend() : record(std::make_shared<Record>()), type(BackendType::PROCESS) {}
  BackendType Type() const override { return type; }
  WrapOptions Layout() const override;
  RawExecutionResult Run(const std::string& program, const Workspace&, const ResourceLimits&) const override;
};

void WriteText(const std::filesystem::path&, const std::string&);
std::string ReadText(const std::filesystem::path&);

// number of entries in kBoxRoot
size_t CountWorkspaces();

bool IsRoot();
// python3 with pandas, numpy and matplotlib
bool HasPythonStack();
bool HasDocker();

#endif // TEST_UTILS_H_
