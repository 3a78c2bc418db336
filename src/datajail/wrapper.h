#ifndef DATAJAIL_WRAPPER_H_
#define DATAJAIL_WRAPPER_H_

#include <map>
#include <string>

#include <datajail/backend.h>

constexpr int kMaxCapturedRows = 1000;
constexpr int kMaxCollectionBytes = 10000;
constexpr int kMaxPlots = 5;

// Quote any string as a Python string literal
std::string PythonLiteral(const std::string&);

// bindings: dataset name -> data file path as seen by the program.
// Bindings with an unsupported extension are left out.
std::string WrapCode(const std::string& code, const std::map<std::string, std::string>& bindings,
                     const WrapOptions& opt);

#endif  // DATAJAIL_WRAPPER_H_
