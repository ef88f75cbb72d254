#include "coldstash/cli_transfer_agent.hpp"

#include "util/logger.hpp"

#include <nlohmann/json.hpp>

namespace coldstash {

using json = nlohmann::json;

namespace {

std::string FirstLine(const std::string& s) {
    const auto nl = s.find('\n');
    return nl == std::string::npos ? s : s.substr(0, nl);
}

std::string Address(const std::string& endpoint, const std::string& path) {
    return endpoint + ":" + path;
}

} // namespace

Result CliTransferAgent::Run(std::vector<std::string> args, CommandOutput& out) {
    CommandSpec spec{.program = cli_, .args = std::move(args), .input = std::nullopt};
    auto r = runner_->Run(spec, out);
    if (!r.is_ok()) return Result::Fail(ErrorCode::BackendUnavailable, r.msg);
    return Result::Ok();
}

Result CliTransferAgent::LoginActive() {
    CommandOutput out;
    auto r = Run({"whoami", "-F", "json"}, out);
    if (!r.is_ok()) return r;
    if (!out.Succeeded()) {
        return Result::Fail(ErrorCode::BackendUnavailable,
                            "not logged in to the transfer service (" + FirstLine(out.err) + ")");
    }
    return Result::Ok();
}

Result CliTransferAgent::PathExists(const std::string& endpoint, const std::string& path, bool& exists) {
    CommandOutput out;
    auto r = Run({"ls", Address(endpoint, path)}, out);
    if (!r.is_ok()) return r;
    exists = out.Succeeded();
    return Result::Ok();
}

Result CliTransferAgent::CreateDirectory(const std::string& endpoint, const std::string& path) {
    CommandOutput out;
    auto r = Run({"mkdir", Address(endpoint, path)}, out);
    if (!r.is_ok()) return r;
    if (!out.Succeeded()) {
        return Result::Fail(ErrorCode::TransferFailed,
                            "cannot create " + Address(endpoint, path) + ": " + FirstLine(out.err));
    }
    return Result::Ok();
}

Result CliTransferAgent::SubmitTransfer(const std::string& source,
                                        const std::string& destination,
                                        bool verify_checksum,
                                        std::string& task_id) {
    std::vector<std::string> args = {"transfer", "-F", "json", "--notify", "failed",
                                     "-s", "checksum", "--preserve-timestamp"};
    if (verify_checksum) args.push_back("--verify-checksum");
    args.push_back(source);
    args.push_back(destination);

    CommandOutput out;
    auto r = Run(std::move(args), out);
    if (!r.is_ok()) return r;
    if (!out.Succeeded()) {
        return Result::Fail(ErrorCode::TransferFailed,
                            "could not initiate transfer " + source + " -> " + destination + ": " +
                                FirstLine(out.err));
    }

    try {
        const auto j = json::parse(out.out);
        task_id = j.at("task_id").get<std::string>();
    } catch (const json::exception& e) {
        return Result::Fail(ErrorCode::TransferFailed, std::string("unexpected transfer response: ") + e.what());
    }
    return Result::Ok();
}

Result CliTransferAgent::WaitForTask(const std::string& task_id) {
    CommandOutput out;
    auto r = Run({"task", "wait", task_id}, out);
    if (!r.is_ok()) return r;
    // `task wait` exits non-zero for failed tasks; TaskStatus reports why.
    if (!out.Succeeded()) LogWarn("task wait %s exited with %d", task_id.c_str(), out.exit_code);
    return Result::Ok();
}

Result CliTransferAgent::TaskStatus(const std::string& task_id, TaskInfo& out) {
    CommandOutput res;
    auto r = Run({"task", "show", "-F", "json", task_id}, res);
    if (!r.is_ok()) return r;
    if (!res.Succeeded()) {
        return Result::Fail(ErrorCode::TransferFailed, "task show " + task_id + ": " + FirstLine(res.err));
    }

    try {
        const auto j = json::parse(res.out);
        out.id = j.value("task_id", task_id);
        out.status = j.at("status").get<std::string>();
        out.nice_status = j.contains("nice_status") && j["nice_status"].is_string()
                              ? j["nice_status"].get<std::string>()
                              : std::string();
    } catch (const json::exception& e) {
        return Result::Fail(ErrorCode::TransferFailed, std::string("unexpected task response: ") + e.what());
    }
    return Result::Ok();
}

} // namespace coldstash
