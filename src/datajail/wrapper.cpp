#include "wrapper.h"

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "paths.h"
#include "utils.h"

namespace {

const char kPrologue[] = R"(# generated by datajail
import sys as __sys
import os as __os
import json as __json
import math as __math
import types as __types
import traceback as __traceback
import builtins as __builtins_module
)";

const char kHardening[] = R"(
for __name in ('subprocess', 'socket', 'ftplib', 'telnetlib', 'ssl', 'select', 'selectors',
               'asyncio', 'threading', 'multiprocessing', 'ctypes', 'cffi', 'mmap', 'pickle',
               'shelve', 'marshal', 'importlib', 'zipimport', 'pkgutil', 'inspect', 'dis',
               'webbrowser', 'antigravity', 'this', 'pip', 'setuptools'):
    __sys.modules.pop(__name, None)

__ALLOWED_MODULES = frozenset((
    'pandas', 'numpy', 'matplotlib', 'math', 'statistics', 'datetime', 'collections',
    'itertools', 'functools', 're', 'json', 'decimal', 'fractions', 'random', 'string',
    'calendar'))

def __guarded_import(name, globals=None, locals=None, fromlist=(), level=0):
    if level != 0 or name.split('.')[0] not in __ALLOWED_MODULES:
        raise ImportError("import of '%s' is not allowed" % name)
    return __builtins_module.__import__(name, globals, locals, fromlist, level)

__safe_builtins = {__name: getattr(__builtins_module, __name) for __name in (
    'abs', 'all', 'any', 'ascii', 'bin', 'bool', 'bytearray', 'bytes', 'callable', 'chr',
    'classmethod', 'complex', 'dict', 'divmod', 'enumerate', 'filter', 'float', 'format',
    'frozenset', 'hash', 'hex', 'int', 'isinstance', 'issubclass', 'iter', 'len', 'list',
    'map', 'max', 'min', 'next', 'object', 'oct', 'ord', 'pow', 'print', 'property', 'range',
    'repr', 'reversed', 'round', 'set', 'slice', 'sorted', 'staticmethod', 'str', 'sum',
    'super', 'tuple', 'type', 'zip', 'False', 'None', 'True', 'NotImplemented', 'Ellipsis',
    '__build_class__', 'BaseException', 'Exception', 'ArithmeticError', 'AssertionError',
    'AttributeError', 'IndexError', 'KeyError', 'LookupError', 'NameError',
    'NotImplementedError', 'OverflowError', 'RuntimeError', 'StopIteration', 'TypeError',
    'ValueError', 'ZeroDivisionError', 'ImportError')}
__safe_builtins['__import__'] = __guarded_import
)";

const char kLibraries[] = R"(
import matplotlib as __matplotlib
__matplotlib.use('Agg')
import matplotlib.pyplot as __plt
import numpy as __np
import pandas as __pd
)";

const char kCapture[] = R"(
def __finite(value):
    return value if __math.isfinite(value) else None

def __capture(value):
    if isinstance(value, __pd.DataFrame):
        return {'type': 'dataframe',
                'data': __json.loads(value.head(__MAX_ROWS).to_json(
                    orient='records', date_format='iso', default_handler=str)),
                'columns': [str(c) for c in value.columns],
                'shape': list(value.shape)}
    if isinstance(value, __pd.Series):
        return {'type': 'series',
                'data': __json.loads(value.head(__MAX_ROWS).to_json(
                    date_format='iso', default_handler=str)),
                'name': None if value.name is None else str(value.name)}
    if isinstance(value, (bool, __np.bool_)):
        return {'type': 'bool', 'data': bool(value)}
    if isinstance(value, (int, __np.integer)):
        return {'type': 'int', 'data': int(value)}
    if isinstance(value, (float, __np.floating)):
        return {'type': 'float', 'data': __finite(float(value))}
    if isinstance(value, str):
        return {'type': 'str', 'data': value}
    if isinstance(value, (list, dict)):
        text = __json.dumps(value, default=str, allow_nan=False)
        if len(text) < __MAX_COLLECTION:
            return {'type': 'list' if isinstance(value, list) else 'dict',
                    'data': __json.loads(text)}
    return None

def __save_plots():
    names = []
    for i, num in enumerate(__plt.get_fignums()[:__MAX_PLOTS]):
        name = 'plot_%d.png' % i
        __plt.figure(num).savefig(__os.path.join(__OUTPUT_DIR, name), dpi=150, bbox_inches='tight')
        names.append(name)
    __plt.close('all')
    return names

def __write_envelope(envelope):
    tmp = __RESULT_FILE + '.tmp'
    with open(tmp, 'w') as f:
        __json.dump(envelope, f, allow_nan=False, default=str)
    __os.replace(tmp, __RESULT_FILE)
)";

const char kCollect[] = R"(
    __result = {}
    for __name, __value in list(__ns.items()):
        if (__name.startswith('_') or __name in __LIBRARY_NAMES or
                isinstance(__value, __types.ModuleType)):
            continue
        try:
            __captured = __capture(__value)
        except Exception:
            __captured = None
        if __captured is not None:
            __result[__name] = __captured
    __plots = __save_plots()
    if __plots:
        __result['__plots'] = {'type': 'plots', 'data': __plots}
    __write_envelope(__result)
except Exception as __e:
    __write_envelope({'__error': {
        'error': '%s: %s' % (type(__e).__name__, __e),
        'traceback': __traceback.format_exc()}})
    __sys.exit(1)
)";

} // namespace

std::string PythonLiteral(const std::string& str) {
  // A JSON string is also a valid Python literal, as long as non-ASCII text stays raw
  // UTF-8 (Python does not join escaped surrogate pairs). Code is validated UTF-8.
  return nlohmann::json(str).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string WrapCode(const std::string& code, const std::map<std::string, std::string>& bindings,
                     const WrapOptions& opt) {
  std::string ret = kPrologue;
  ret += "\n__OUTPUT_DIR = " + PythonLiteral(opt.output_dir) + "\n";
  ret += "__RESULT_FILE = __os.path.join(__OUTPUT_DIR, " + PythonLiteral(kResultFileName) + ")\n";
  ret += "__MAX_ROWS = " + std::to_string(kMaxCapturedRows) + "\n";
  ret += "__MAX_COLLECTION = " + std::to_string(kMaxCollectionBytes) + "\n";
  ret += "__MAX_PLOTS = " + std::to_string(kMaxPlots) + "\n";
  ret += "__LIBRARY_NAMES = ('pd', 'np', 'plt', 'matplotlib')\n";
  if (opt.harden) ret += kHardening;
  ret += kLibraries;
  ret += kCapture;
  ret += "\n__ns = {'__name__': '__main__', 'pd': __pd, 'np': __np, 'plt': __plt, "
         "'matplotlib': __matplotlib}\n";
  if (opt.harden) ret += "__ns['__builtins__'] = __safe_builtins\n";
  ret += "\ntry:\n";
  for (auto& [name, path] : bindings) {
    DataFormat format = GetDataFormat(path);
    const char* reader = nullptr;
    switch (format) {
      case DataFormat::CSV: reader = "read_csv"; break;
      case DataFormat::EXCEL: reader = "read_excel"; break;
      case DataFormat::UNSUPPORTED: break;
    }
    if (!reader) {
      spdlog::debug("Binding skipped: name={} path={} format={}", name, path, DataFormatName(format));
      continue;
    }
    ret += fmt::format("    __ns[{}] = __pd.{}({})\n", PythonLiteral(name), reader, PythonLiteral(path));
  }
  ret += "    exec(compile(" + PythonLiteral(code) + ", '<user_code>', 'exec'), __ns)\n";
  ret += kCollect;
  return ret;
}
