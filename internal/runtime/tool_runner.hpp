#pragma once

#include <memory>
#include <string>
#include <vector>

namespace pano::runtime {

struct CommandResult {
  int         exit_code = 0;
  std::string output;

  explicit operator bool() const {
    return exit_code == 0;
  }
};

/*
  Blocking invocation of external programs.

  Implementations:
    ShellToolRunner → /bin/sh via popen/system
    tests           → recording fakes
*/
class ToolRunner {
 public:
  virtual ~ToolRunner() = default;

  // Runs argv to completion and captures its stdout.
  virtual CommandResult Run(const std::vector<std::string>& argv) = 0;

  // Runs argv attached to the terminal (e.g. the Hugin GUI). Returns the exit code.
  virtual int RunInteractive(const std::vector<std::string>& argv) = 0;
};

using ToolRunnerPtr = std::shared_ptr<ToolRunner>;

class ShellToolRunner final : public ToolRunner {
 public:
  CommandResult Run(const std::vector<std::string>& argv) override;
  int           RunInteractive(const std::vector<std::string>& argv) override;
};

std::string ShellQuote(const std::string& arg);
std::string JoinCommand(const std::vector<std::string>& argv);

// Throws util::ExternalToolFailure naming argv[0] when result is non-zero.
void ThrowIfToolFailed(const CommandResult& result, const std::vector<std::string>& argv);

} // namespace pano::runtime
