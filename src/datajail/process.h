#ifndef DATAJAIL_PROCESS_H_
#define DATAJAIL_PROCESS_H_

#include <string>
#include <vector>

struct ProcessOptions {
  std::vector<std::string> envs; // the complete environment; nothing is inherited
  std::string input; // written to stdin, which is then closed
  long timeout_ms; // wall clock; 0 for no limit
  size_t max_output; // per stream; the rest is drained and dropped
  // 0 for unchanged
  long rlim_as, rlim_cpu, rlim_fsize, rlim_proc; // bytes, seconds, bytes, count
  bool no_core;

  ProcessOptions() :
      timeout_ms(0), max_output(1 << 20),
      rlim_as(0), rlim_cpu(0), rlim_fsize(0), rlim_proc(0),
      no_core(true) {}
};

struct ProcessResult {
  bool started; // false if fork/exec failed; exit_code is then meaningless
  bool timed_out; // killed because of timeout_ms
  int exit_code; // 128 + signal if killed by a signal, as a shell reports it
  int signal;
  std::string output, error;
  bool output_truncated, error_truncated;

  ProcessResult() :
      started(false), timed_out(false), exit_code(-1), signal(0),
      output_truncated(false), error_truncated(false) {}
};

// Runs argv[0] (looked up in PATH of the host if it has no slash) in its own process
// group; the whole group is SIGKILLed on timeout. Always reaps the child before returning.
ProcessResult RunProcess(const std::vector<std::string>& argv, const ProcessOptions& = ProcessOptions());

#endif  // DATAJAIL_PROCESS_H_
