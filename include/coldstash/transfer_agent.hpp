#pragma once

#include "util/result.hpp"

#include <string>

namespace coldstash {

struct TaskInfo {
    std::string id;
    std::string status; // "SUCCEEDED", "FAILED", "ACTIVE", ...
    std::string nice_status;
};

inline constexpr const char* kTaskSucceeded = "SUCCEEDED";

// Checksum-verifying bulk transfer service addressed by "<endpoint>:<path>".
class ITransferAgent {
  public:
    virtual ~ITransferAgent() = default;

    virtual Result LoginActive() = 0;
    virtual Result PathExists(const std::string& endpoint, const std::string& path, bool& exists) = 0;
    virtual Result CreateDirectory(const std::string& endpoint, const std::string& path) = 0;
    virtual Result SubmitTransfer(const std::string& source,
                                  const std::string& destination,
                                  bool verify_checksum,
                                  std::string& task_id) = 0;
    virtual Result WaitForTask(const std::string& task_id) = 0;
    virtual Result TaskStatus(const std::string& task_id, TaskInfo& out) = 0;
};

} // namespace coldstash
