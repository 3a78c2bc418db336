#ifndef DATAJAIL_VALIDATOR_H_
#define DATAJAIL_VALIDATOR_H_

#include <map>
#include <string>
#include <filesystem>

// Fast rejection only; the sandbox is the security boundary.
// If interpreter is non-empty, the code is additionally compiled (never run) by it.
// Returns false with the reason in error.
bool ValidateCode(const std::string& code, std::string& error, const std::string& interpreter = "");

// Lexical part of the syntax check: strings, brackets, indentation.
bool CheckSyntax(const std::string& code, std::string& error);

bool IsValidBindingName(const std::string& name);

// Resolves every binding under uploads_root into resolved (name -> absolute path).
// Invalid names and paths escaping the root are errors; bindings whose file does not
// exist are left out with a warning.
bool ValidateBindings(const std::map<std::string, std::string>& bindings,
                      const std::filesystem::path& uploads_root,
                      std::map<std::string, std::filesystem::path>& resolved,
                      std::string& error);

#endif  // DATAJAIL_VALIDATOR_H_
