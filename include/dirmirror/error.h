
#ifndef DIRMIRROR_ERROR_H
#define DIRMIRROR_ERROR_H

#include <string>

namespace dirmirror {

enum class ErrorCode {
    Success = 0,
    PathNotContained,
    MetadataReadFailure,
    FilesystemWriteFailure,
    UnsupportedEntryKind,
    NotificationSourceError,
    InvalidConfig,
    SetupFailure,
    PeerIdMismatch,
    IoError,
    DecodeError,
    Unknown
};

class Error {
public:
    Error() : code_(ErrorCode::Success) {}
    explicit Error(ErrorCode code, std::string message = "")
        : code_(code), message_(std::move(message)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    bool ok() const { return code_ == ErrorCode::Success; }

    std::string to_string() const;

private:
    ErrorCode code_;
    std::string message_;
};

}

#endif
