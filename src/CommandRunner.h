#pragma once

#include <string>
#include <vector>

struct CommandResult {
  int         exit_code = -1;
  std::string out;
  std::string err;
  bool        timed_out = false;
  bool        not_found = false;  // executable could not be started
};

// Runs an external tool to completion. run() is true only when the process
// started and exited on its own within the timeout.
class CommandRunner {
public:
  virtual ~CommandRunner() = default;

  virtual bool run(const std::vector<std::string>& argv,
                   long timeout_ms,
                   CommandResult& out) = 0;
};

// fork/execvp with stdout/stderr captured through pipes. A process still
// running at the deadline is killed.
class PosixCommandRunner : public CommandRunner {
public:
  bool run(const std::vector<std::string>& argv,
           long timeout_ms,
           CommandResult& out) override;
};
