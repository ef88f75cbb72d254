#pragma once

#include "coldstash/transfer_agent.hpp"
#include "system/process_runner.hpp"

#include <memory>
#include <string>
#include <vector>

namespace coldstash {

// ITransferAgent driving the `globus` command line client.
class CliTransferAgent final : public ITransferAgent {
  public:
    explicit CliTransferAgent(std::shared_ptr<ICommandRunner> runner, std::string cli = "globus")
        : runner_(std::move(runner)), cli_(std::move(cli)) {}

    Result LoginActive() override;
    Result PathExists(const std::string& endpoint, const std::string& path, bool& exists) override;
    Result CreateDirectory(const std::string& endpoint, const std::string& path) override;
    Result SubmitTransfer(const std::string& source,
                          const std::string& destination,
                          bool verify_checksum,
                          std::string& task_id) override;
    Result WaitForTask(const std::string& task_id) override;
    Result TaskStatus(const std::string& task_id, TaskInfo& out) override;

  private:
    Result Run(std::vector<std::string> args, CommandOutput& out);

    std::shared_ptr<ICommandRunner> runner_;
    std::string cli_;
};

} // namespace coldstash
