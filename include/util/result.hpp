#pragma once
#include <string>
#include <utility>

namespace coldstash {

enum class ErrorCode : int {
    None = 0,
    Io,
    InvalidInputPath,
    EmptyFileSet,
    SizeLimitExceeded,
    DuplicateArchiveExists,
    IntegrityMismatchBuildTime,
    IntegrityMismatchTransferTime,
    IntegrityMismatchRestoreTime,
    BackendUnavailable,
    ObjectAlreadyExists,
    TransferFailed,
    RestoreUnsupported,
    RestoreTimeout,
    InvalidManifest,
    InvalidConfig,
    IndexError,
    Cancelled,
};

const char* ErrorCodeName(ErrorCode code);

struct Result {
    bool ok{true};
    ErrorCode code{ErrorCode::None};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorCode c, std::string m) {
        return {.ok = false, .code = c, .err = 0, .msg = std::move(m)};
    }
    // errno-style failure from the I/O layer
    static Result Fail(int e, std::string m) {
        return {.ok = false, .code = ErrorCode::Io, .err = e, .msg = std::move(m)};
    }
};

} // namespace coldstash
