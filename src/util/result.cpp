#include "util/result.hpp"

namespace coldstash {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::Io: return "Io";
        case ErrorCode::InvalidInputPath: return "InvalidInputPath";
        case ErrorCode::EmptyFileSet: return "EmptyFileSet";
        case ErrorCode::SizeLimitExceeded: return "SizeLimitExceeded";
        case ErrorCode::DuplicateArchiveExists: return "DuplicateArchiveExists";
        case ErrorCode::IntegrityMismatchBuildTime: return "IntegrityMismatch(BuildTime)";
        case ErrorCode::IntegrityMismatchTransferTime: return "IntegrityMismatch(TransferTime)";
        case ErrorCode::IntegrityMismatchRestoreTime: return "IntegrityMismatch(RestoreTime)";
        case ErrorCode::BackendUnavailable: return "BackendUnavailable";
        case ErrorCode::ObjectAlreadyExists: return "ObjectAlreadyExists";
        case ErrorCode::TransferFailed: return "TransferFailed";
        case ErrorCode::RestoreUnsupported: return "RestoreUnsupported";
        case ErrorCode::RestoreTimeout: return "RestoreTimeout";
        case ErrorCode::InvalidManifest: return "InvalidManifest";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
        case ErrorCode::IndexError: return "IndexError";
        case ErrorCode::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

} // namespace coldstash
