
#include "dirmirror/error.h"

namespace dirmirror {

std::string Error::to_string() const {
    if (message_.empty()) {
        switch (code_) {
            case ErrorCode::Success: return "Success";
            case ErrorCode::PathNotContained: return "Path is not under the watch root";
            case ErrorCode::MetadataReadFailure: return "Failed to read metadata";
            case ErrorCode::FilesystemWriteFailure: return "Filesystem write failed";
            case ErrorCode::UnsupportedEntryKind: return "Unsupported entry kind";
            case ErrorCode::NotificationSourceError: return "Notification source error";
            case ErrorCode::InvalidConfig: return "Invalid configuration";
            case ErrorCode::SetupFailure: return "Setup failed";
            case ErrorCode::PeerIdMismatch: return "Peer ID mismatch";
            case ErrorCode::IoError: return "I/O error";
            case ErrorCode::DecodeError: return "Decode error";
            default: return "Unknown error";
        }
    }
    return message_;
}

}
