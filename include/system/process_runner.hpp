#pragma once

#include "util/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace coldstash {

struct CommandSpec {
    std::string program; // looked up in PATH
    std::vector<std::string> args;
    std::optional<std::string> input; // written to stdin, then closed
};

struct CommandOutput {
    int exit_code = -1; // 128 + signal when killed
    std::string out;
    std::string err;

    bool Succeeded() const { return exit_code == 0; }
};

// Seam for tools driven as subprocesses (aws, globus).
class ICommandRunner {
  public:
    virtual ~ICommandRunner() = default;
    // Fails only when the program could not be run at all; a non-zero exit
    // status is reported through `out`.
    virtual Result Run(const CommandSpec& spec, CommandOutput& out) = 0;
};

class ProcessRunner final : public ICommandRunner {
  public:
    Result Run(const CommandSpec& spec, CommandOutput& out) override;
};

// "prog arg1 'arg two'" for log lines.
std::string DescribeCommand(const CommandSpec& spec);

} // namespace coldstash
