#include <gtest/gtest.h>
#include "../src/datajail/process.h"
#include "../src/datajail/wrapper.h"
#include "utils.h"

namespace {

WrapOptions Options(bool harden) {
  WrapOptions opt;
  opt.data_dir = "/sandbox/workspace/data";
  opt.output_dir = "/sandbox/output";
  opt.harden = harden;
  return opt;
}

// ast.parse only; nothing is executed
bool PythonParses(const std::string& program, std::string& error) {
  ProcessOptions opt;
  opt.envs = {"PATH=/usr/local/bin:/usr/bin:/bin"};
  opt.input = program;
  opt.timeout_ms = 10'000;
  auto res = RunProcess({"python3", "-c", "import ast, sys; ast.parse(sys.stdin.read())"}, opt);
  error = res.error;
  return res.started && res.exit_code == 0;
}

} // namespace

TEST(PythonLiteral, Escaping) {
  EXPECT_EQ(PythonLiteral("abc"), "\"abc\"");
  EXPECT_EQ(PythonLiteral("a\"b\\c\nd"), "\"a\\\"b\\\\c\\nd\"");
  EXPECT_EQ(PythonLiteral("tab\there\x01"), "\"tab\\there\\u0001\"");
}

TEST(PythonLiteral, NonAsciiStaysUtf8) {
  EXPECT_EQ(PythonLiteral("\xc3\xa9"), "\"\xc3\xa9\"");
  // 4-byte sequences must not become surrogate pair escapes
  std::string literal = PythonLiteral("label = \"\xF0\x9F\x93\x8A total\"\n");
  EXPECT_EQ(literal, "\"label = \\\"\xF0\x9F\x93\x8A total\\\"\\n\"");
  EXPECT_EQ(literal.find("\\ud83d"), std::string::npos);
}

TEST(PythonLiteral, PythonReadsBackSameCode) {
  if (!HasPythonStack()) GTEST_SKIP() << "python3 not available";
  std::string code = "title = '\xF0\x9F\x93\x8A Umsatz \xE2\x82\xAC'\nprint(title, '\xc3\xa9')\n";
  ProcessOptions opt;
  opt.envs = {"PATH=/usr/local/bin:/usr/bin:/bin"};
  opt.input = PythonLiteral(code);
  opt.timeout_ms = 10'000;
  auto res = RunProcess({"python3", "-c",
      "import sys\n"
      "s = eval(sys.stdin.buffer.read().decode('utf-8'))\n"
      "compile(s, '<user_code>', 'exec')\n"
      "sys.stdout.buffer.write(s.encode('utf-8'))\n"}, opt);
  ASSERT_TRUE(res.started);
  EXPECT_EQ(res.exit_code, 0) << res.error;
  EXPECT_EQ(res.output, code);
}

TEST(WrapCode, EmbedsCodeAsLiteral) {
  std::string code = "x = 5\nprint(\"\"\"quotes ''' \"\"\")\n";
  std::string program = WrapCode(code, {}, Options(false));
  EXPECT_NE(program.find("exec(compile(" + PythonLiteral(code) + ", '<user_code>', 'exec'), __ns)"),
            std::string::npos);
  EXPECT_NE(program.find("__OUTPUT_DIR = \"/sandbox/output\""), std::string::npos);
  EXPECT_NE(program.find("except Exception as __e:"), std::string::npos);
  EXPECT_NE(program.find("__sys.exit(1)"), std::string::npos);
}

TEST(WrapCode, DataLoadingByExtension) {
  std::string program = WrapCode("x = 1", {
    {"orders", "/sandbox/workspace/data/orders.csv"},
    {"sheet", "/sandbox/workspace/data/sheet.XLSX"},
    {"legacy", "/sandbox/workspace/data/legacy.xls"},
    {"notes", "/sandbox/workspace/data/notes.txt"},
  }, Options(false));
  EXPECT_NE(program.find("__ns[\"orders\"] = __pd.read_csv(\"/sandbox/workspace/data/orders.csv\")"),
            std::string::npos);
  EXPECT_NE(program.find("__ns[\"sheet\"] = __pd.read_excel(\"/sandbox/workspace/data/sheet.XLSX\")"),
            std::string::npos);
  EXPECT_NE(program.find("__ns[\"legacy\"] = __pd.read_excel("), std::string::npos);
  EXPECT_EQ(program.find("notes"), std::string::npos);
}

TEST(WrapCode, HardeningOnlyWhenRequested) {
  std::string plain = WrapCode("x = 1", {}, Options(false));
  std::string hardened = WrapCode("x = 1", {}, Options(true));
  EXPECT_EQ(plain.find("__safe_builtins"), std::string::npos);
  EXPECT_NE(hardened.find("__ns['__builtins__'] = __safe_builtins"), std::string::npos);
  EXPECT_NE(hardened.find("__sys.modules.pop(__name, None)"), std::string::npos);
  // hardening precedes the library imports
  EXPECT_LT(hardened.find("__safe_builtins"), hardened.find("import pandas as __pd"));
}

TEST(WrapCode, GeneratedProgramParses) {
  if (!HasPythonStack()) GTEST_SKIP() << "python3 not available";
  for (bool harden : {false, true}) {
    std::string error;
    std::string program = WrapCode("if True:\n    x = '\\n'\n", {{"orders", "/d/orders.csv"}}, Options(harden));
    EXPECT_TRUE(PythonParses(program, error)) << "harden=" << harden << "\n" << error;
  }
}
