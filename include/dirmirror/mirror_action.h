
#ifndef DIRMIRROR_MIRROR_ACTION_H
#define DIRMIRROR_MIRROR_ACTION_H

#include <cstdint>
#include <string>
#include <variant>
#include <sys/types.h>

#include "dirmirror/error.h"

namespace dirmirror {
namespace action {

enum class CopyReason : uint8_t {
    Created,
    Modified
};

struct CopyFile {
    std::string source;
    std::string destination;
    CopyReason reason = CopyReason::Modified;
};

struct CreateDir {
    std::string source;
    std::string destination;
    mode_t permissions = 0755;
};

struct CreateSymlink {
    std::string source;
    std::string destination;
    std::string target;
};

struct RemoveEntry {
    std::string source;
    std::string destination;
};

struct RenameEntry {
    std::string source_from;
    std::string source_to;
    std::string destination_from;
    std::string destination_to;
};

struct SyncMetadata {
    std::string source;
    std::string destination;
};

struct Ignore {
    std::string source;
};

struct Unsupported {
    std::string reason;
    std::string source;
};

// Classification could not resolve the event (path outside the watch root,
// vanished source, ...). Executes as a reported no-op.
struct Unresolved {
    std::string source;
    Error error;
};

} // namespace action

/**
 * The concrete operation one ChangeEvent turns into.
 * Built by EventClassifier, consumed by fs::MirrorExecutor, never stored.
 */
using MirrorAction = std::variant<
    action::CopyFile,
    action::CreateDir,
    action::CreateSymlink,
    action::RemoveEntry,
    action::RenameEntry,
    action::SyncMetadata,
    action::Ignore,
    action::Unsupported,
    action::Unresolved>;

const char* action_name(const MirrorAction& mirror_action);

// One status line for the operator, e.g. "Created[file]: /watch/a.txt".
std::string describe(const MirrorAction& mirror_action);

bool mutates_destination(const MirrorAction& mirror_action);

} // namespace dirmirror

#endif /* DIRMIRROR_MIRROR_ACTION_H */
