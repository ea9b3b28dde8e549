#include "tool_runner.hpp"

#include <sys/wait.h>

#include <array>
#include <cstdio>
#include <cstdlib>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace pano::runtime {

using pano::observability::IntField;
using pano::observability::StringField;

namespace {

int DecodeWaitStatus(int status) {
  if (status == -1) {
    return -1;
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  // killed by a signal
  return 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
}

std::string ToolName(const std::vector<std::string>& argv) {
  return argv.empty() ? std::string("<empty>") : argv.front();
}

} // namespace

std::string ShellQuote(const std::string& arg) {
  std::string out;
  out.reserve(arg.size() + 2);
  out.push_back('\'');
  for (char c : arg) {
    if (c == '\'')
      out += "'\\''";
    else
      out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

std::string JoinCommand(const std::vector<std::string>& argv) {
  std::string cmd;
  for (const auto& arg : argv) {
    if (!cmd.empty()) cmd.push_back(' ');
    cmd += ShellQuote(arg);
  }
  return cmd;
}

CommandResult ShellToolRunner::Run(const std::vector<std::string>& argv) {
  if (argv.empty()) {
    throw pano::util::InvalidArgument("empty command");
  }

  const auto cmd = JoinCommand(argv);
  PANO_LOG_DEBUG("Running command", {StringField("cmd", cmd)});

  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) {
    throw pano::util::ExternalToolFailure(argv.front(), -1, "failed to start " + argv.front());
  }

  CommandResult         result;
  std::array<char, 4096> buffer{};
  std::size_t           n = 0;
  while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
    result.output.append(buffer.data(), n);
  }

  result.exit_code = DecodeWaitStatus(pclose(pipe));
  if (!result) {
    PANO_LOG_WARN("Command failed", {StringField("tool", argv.front()), IntField("exit_code", result.exit_code)});
  }
  return result;
}

int ShellToolRunner::RunInteractive(const std::vector<std::string>& argv) {
  if (argv.empty()) {
    throw pano::util::InvalidArgument("empty command");
  }

  const auto cmd = JoinCommand(argv);
  PANO_LOG_INFO("Running interactive command", {StringField("cmd", cmd)});
  return DecodeWaitStatus(std::system(cmd.c_str()));
}

void ThrowIfToolFailed(const CommandResult& result, const std::vector<std::string>& argv) {
  if (result) {
    return;
  }

  throw pano::util::ExternalToolFailure(ToolName(argv), result.exit_code,
                                        ToolName(argv) + " exited with code " + std::to_string(result.exit_code));
}

} // namespace pano::runtime
