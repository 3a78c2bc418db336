#include "validator.h"

#include <set>
#include <vector>
#include <cctype>
#include <algorithm>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "process.h"

namespace fs = std::filesystem;

namespace {

const char* const kForbiddenPatterns[] = {
  // modules
  "import os", "import subprocess", "import sys", "import socket",
  "from os", "from subprocess", "from sys", "from socket",
  "__import__",
  // dynamic evaluation & I/O
  "eval(", "exec(", "compile(", "open(", "file(", "input(", "raw_input(",
  // introspection
  "globals(", "locals(", "vars(", "dir(",
  "getattr(", "setattr(", "delattr(", "hasattr(",
  "__dict__", "__class__", "__base__", "__subclasses__", "__mro__",
  "__code__", "__closure__", "__func__", "__self__", "__module__",
  "__builtins__", "__globals__",
};

const std::set<std::string> kPythonKeywords = {
  "False", "None", "True", "and", "as", "assert", "async", "await", "break",
  "class", "continue", "def", "del", "elif", "else", "except", "finally", "for",
  "from", "global", "if", "import", "in", "is", "lambda", "nonlocal", "not", "or",
  "pass", "raise", "return", "try", "while", "with", "yield",
};

// names the generated program defines before user code runs
const std::set<std::string> kReservedNames = {"pd", "np", "plt", "matplotlib"};

constexpr long kCompileTimeoutMs = 10'000;
constexpr long kCompileMemory = 512L * 1024 * 1024;
constexpr int kCompileSyntaxErrorCode = 3;

const char kCompileScript[] =
    "import sys\n"
    "try:\n"
    "    compile(sys.stdin.read(), '<user_code>', 'exec')\n"
    "except (SyntaxError, ValueError) as e:\n"
    "    line = getattr(e, 'lineno', None)\n"
    "    print(e.msg if isinstance(e, SyntaxError) else str(e), end='')\n"
    "    if line: print(f' (line {line})', end='')\n"
    "    sys.exit(3)\n";

// strict RFC 3629: no overlong forms, surrogates or truncated sequences
bool IsValidUtf8(const std::string& str) {
  try {
    nlohmann::json(str).dump();
  } catch (nlohmann::json::type_error&) {
    return false;
  }
  return true;
}

std::string ToLower(std::string str) {
  for (auto& i : str) i = std::tolower((unsigned char)i);
  return str;
}

inline bool IsClosing(char c) { return c == ')' || c == ']' || c == '}'; }
inline char Opening(char c) { return c == ')' ? '(' : c == ']' ? '[' : '{'; }

class Scanner {
  const std::string& code_;
  size_t pos_;
  int line_;
  std::vector<std::pair<char, int>> brackets_; // (bracket, line)
  std::vector<int> indents_;
  bool expect_indent_; // the previous logical line ended with ':'
  bool continuation_; // backslash at the end of the previous physical line
  std::string error_;

  bool Fail(const std::string& reason, int line) {
    error_ = fmt::format("Syntax error: {} (line {})", reason, line);
    return false;
  }
  bool AtLineStart() const {
    return brackets_.empty() && !continuation_;
  }

  // pos_ at the first character of the line; consumes the indentation
  bool Indentation(bool& blank) {
    int col = 0;
    while (pos_ < code_.size() && (code_[pos_] == ' ' || code_[pos_] == '\t' || code_[pos_] == '\f')) {
      col = code_[pos_] == '\t' ? (col / 8 + 1) * 8 : code_[pos_] == ' ' ? col + 1 : 0;
      pos_++;
    }
    blank = pos_ >= code_.size() || code_[pos_] == '\n' || code_[pos_] == '#' ||
            (code_[pos_] == '\r');
    if (blank) return true;
    if (col > indents_.back()) {
      if (!expect_indent_) return Fail("unexpected indent", line_);
      indents_.push_back(col);
    } else {
      if (expect_indent_) return Fail("expected an indented block", line_);
      while (col < indents_.back()) indents_.pop_back();
      if (col != indents_.back()) {
        return Fail("unindent does not match any outer indentation level", line_);
      }
    }
    expect_indent_ = false;
    return true;
  }

  bool String() {
    char quote = code_[pos_];
    int start_line = line_;
    bool triple = code_.compare(pos_, 3, std::string(3, quote)) == 0;
    pos_ += triple ? 3 : 1;
    while (pos_ < code_.size()) {
      char c = code_[pos_];
      if (c == '\\') {
        if (pos_ + 1 < code_.size() && code_[pos_ + 1] == '\n') line_++;
        pos_ += 2;
        continue;
      }
      if (c == '\n') {
        if (!triple) return Fail("unterminated string literal", start_line);
        line_++;
      } else if (c == quote) {
        if (!triple) {
          pos_++;
          return true;
        }
        if (code_.compare(pos_, 3, std::string(3, quote)) == 0) {
          pos_ += 3;
          return true;
        }
      }
      pos_++;
    }
    return Fail(triple ? "unterminated triple-quoted string literal" : "unterminated string literal",
                start_line);
  }

 public:
  explicit Scanner(const std::string& code) :
      code_(code), pos_(0), line_(1), indents_{0}, expect_indent_(false), continuation_(false) {}

  const std::string& Error() const { return error_; }

  bool Run() {
    bool line_start = true;
    char last = 0; // last significant character of the logical line
    while (pos_ < code_.size()) {
      if (line_start) {
        line_start = false;
        if (AtLineStart()) {
          bool blank;
          if (!Indentation(blank)) return false;
        }
        continuation_ = false;
        continue;
      }
      char c = code_[pos_];
      if (c == '\n') {
        if (AtLineStart() && last) {
          expect_indent_ = last == ':';
          last = 0;
        }
        line_++;
        pos_++;
        line_start = true;
      } else if (c == '#') {
        while (pos_ < code_.size() && code_[pos_] != '\n') pos_++;
      } else if (c == '\\') {
        size_t next = pos_ + 1;
        if (next < code_.size() && code_[next] == '\r') next++;
        if (next < code_.size() && code_[next] != '\n') {
          return Fail("unexpected character after line continuation character", line_);
        }
        continuation_ = true;
        pos_ = next;
      } else if (c == '\'' || c == '"') {
        if (!String()) return false;
        last = c;
      } else if (c == '(' || c == '[' || c == '{') {
        brackets_.emplace_back(c, line_);
        pos_++;
        last = c;
      } else if (IsClosing(c)) {
        if (brackets_.empty()) return Fail(fmt::format("unmatched '{}'", c), line_);
        if (brackets_.back().first != Opening(c)) {
          return Fail(fmt::format("closing parenthesis '{}' does not match opening parenthesis '{}'",
                                  c, brackets_.back().first), line_);
        }
        brackets_.pop_back();
        pos_++;
        last = c;
      } else {
        if (!std::isspace((unsigned char)c)) last = c;
        pos_++;
      }
    }
    if (continuation_) return Fail("unexpected EOF while parsing", line_);
    if (!brackets_.empty()) {
      return Fail(fmt::format("'{}' was never closed", brackets_.back().first), brackets_.back().second);
    }
    if (last == ':' || (expect_indent_ && !last)) {
      return Fail("expected an indented block", line_);
    }
    return true;
  }
};

// false only if the interpreter reported a syntax error
bool InterpreterCompile(const std::string& code, const std::string& interpreter, std::string& error) {
  ProcessOptions opt;
  opt.envs = {"PATH=/usr/local/bin:/usr/bin:/bin", "PYTHONDONTWRITEBYTECODE=1", "PYTHONIOENCODING=utf-8"};
  opt.input = code;
  opt.timeout_ms = kCompileTimeoutMs;
  opt.max_output = 4096;
  opt.rlim_as = kCompileMemory;
  opt.rlim_cpu = kCompileTimeoutMs / 1000;
  ProcessResult res = RunProcess({interpreter, "-I", "-c", kCompileScript}, opt);
  if (!res.started || res.timed_out || (res.exit_code != 0 && res.exit_code != kCompileSyntaxErrorCode)) {
    spdlog::warn("Syntax check by {} unavailable: started={} timed_out={} exit_code={} stderr={}",
                 interpreter, res.started, res.timed_out, res.exit_code, res.error);
    return true;
  }
  if (res.exit_code == kCompileSyntaxErrorCode) {
    error = "Syntax error: " + res.output;
    return false;
  }
  return true;
}

} // namespace

bool CheckSyntax(const std::string& code, std::string& error) {
  Scanner scanner(code);
  if (scanner.Run()) return true;
  error = scanner.Error();
  return false;
}

bool ValidateCode(const std::string& code, std::string& error, const std::string& interpreter) {
  if (!IsValidUtf8(code)) {
    error = "Code is not valid UTF-8";
    spdlog::info("Code rejected: reason=\"{}\"", error);
    return false;
  }
  std::string code_lower = ToLower(code);
  for (const char* pattern : kForbiddenPatterns) {
    if (code_lower.find(ToLower(pattern)) != std::string::npos) {
      error = fmt::format("Forbidden pattern detected: {}", pattern);
      spdlog::info("Code rejected: reason=\"{}\"", error);
      return false;
    }
  }
  if (!CheckSyntax(code, error) ||
      (!interpreter.empty() && !InterpreterCompile(code, interpreter, error))) {
    spdlog::info("Code rejected: reason=\"{}\"", error);
    return false;
  }
  return true;
}

bool IsValidBindingName(const std::string& name) {
  if (name.empty() || !std::isalpha((unsigned char)name[0])) return false;
  for (char c : name) {
    if (!std::isalnum((unsigned char)c) && c != '_') return false;
  }
  return !kPythonKeywords.count(name) && !kReservedNames.count(name);
}

bool ValidateBindings(const std::map<std::string, std::string>& bindings,
                      const fs::path& uploads_root,
                      std::map<std::string, fs::path>& resolved,
                      std::string& error) {
  std::error_code ec;
  fs::path root = fs::weakly_canonical(fs::absolute(uploads_root, ec), ec);
  if (ec) {
    error = fmt::format("Uploads root {} is not accessible", uploads_root.c_str());
    return false;
  }
  for (auto& [name, path] : bindings) {
    if (!IsValidBindingName(name)) {
      error = fmt::format("Invalid dataset name: {}", name);
      return false;
    }
    fs::path file = fs::path(path).is_absolute() ? fs::path(path) : root / path;
    file = fs::weakly_canonical(file, ec);
    fs::path rel = ec ? fs::path() : file.lexically_relative(root);
    if (rel.empty() || *rel.begin() == ".." || rel == ".") {
      error = fmt::format("Dataset {} is outside the uploads directory", name);
      return false;
    }
    if (!fs::is_regular_file(file, ec)) {
      spdlog::warn("Dataset not found, skipping binding: name={} path={}", name, file.c_str());
      continue;
    }
    resolved[name] = file;
  }
  return true;
}
