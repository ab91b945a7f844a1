
#include "dirmirror/event_classifier.h"
#include "dirmirror/metadata.h"

#include <utility>

namespace dirmirror {

using events::ChangeEvent;
using events::EventKind;
using events::ModifyKind;
using events::RenameMode;

EventClassifier::EventClassifier(MirrorRoots roots)
    : roots_(std::move(roots)) {}

MirrorAction EventClassifier::classify(const ChangeEvent& event) const {
    if (event.paths.empty()) {
        return action::Unsupported{"malformed", ""};
    }
    const std::string& path = event.paths[0];

    switch (event.kind) {
        case EventKind::Remove: {
            auto mirrored = remap(roots_, path);
            if (!mirrored.ok()) {
                return action::Unresolved{path, mirrored.error()};
            }
            return action::RemoveEntry{path, mirrored.value()};
        }

        case EventKind::Modify:
            return classifyModify(event);

        case EventKind::Create:
            return classifyCreate(path);

        case EventKind::Access:
            return action::Ignore{path};

        case EventKind::Other:
            return action::Unsupported{"other", path};

        case EventKind::Unrecognized:
        default:
            return action::Unsupported{"unrecognized", path};
    }
}

MirrorAction EventClassifier::classifyModify(const ChangeEvent& event) const {
    const std::string& path = event.paths[0];

    switch (event.modify_kind) {
        case ModifyKind::Name:
            if (event.rename_mode != RenameMode::Both) {
                // an unpaired half carries no destination to move to
                return action::Ignore{path};
            }
            if (event.paths.size() < 2) {
                return action::Unsupported{"malformed", path};
            }
            return classifyRename(event.paths[0], event.paths[1]);

        case ModifyKind::Metadata: {
            auto mirrored = remap(roots_, path);
            if (!mirrored.ok()) {
                return action::Unresolved{path, mirrored.error()};
            }
            return action::SyncMetadata{path, mirrored.value()};
        }

        case ModifyKind::Data: {
            auto mirrored = remap(roots_, path);
            if (!mirrored.ok()) {
                return action::Unresolved{path, mirrored.error()};
            }
            return action::CopyFile{path, mirrored.value(), action::CopyReason::Modified};
        }

        case ModifyKind::Other:
        default:
            return action::Unsupported{"modify-other", path};
    }
}

MirrorAction EventClassifier::classifyRename(const std::string& from, const std::string& to) const {
    auto mirrored_from = remap(roots_, from);
    if (!mirrored_from.ok()) {
        return action::Unresolved{from, mirrored_from.error()};
    }

    auto mirrored_to = remap(roots_, to);
    if (!mirrored_to.ok()) {
        return action::Unresolved{to, mirrored_to.error()};
    }

    return action::RenameEntry{from, to, mirrored_from.value(), mirrored_to.value()};
}

MirrorAction EventClassifier::classifyCreate(const std::string& path) const {
    auto mirrored = remap(roots_, path);
    if (!mirrored.ok()) {
        return action::Unresolved{path, mirrored.error()};
    }

    auto metadata = read_portable_metadata(path);
    if (!metadata.ok()) {
        return action::Unresolved{path, metadata.error()};
    }

    switch (classify_entry(metadata.value())) {
        case EntryKind::Symlink: {
            auto target = read_link_target(path);
            if (!target.ok()) {
                return action::Unresolved{path, target.error()};
            }
            return action::CreateSymlink{path, mirrored.value(), remap_link_target(roots_, target.value())};
        }

        case EntryKind::Directory:
            return action::CreateDir{path, mirrored.value(), metadata.value().permissions};

        case EntryKind::HardlinkedFile:
            return action::Unsupported{"hardlink", path};

        case EntryKind::RegularFile:
            return action::CopyFile{path, mirrored.value(), action::CopyReason::Created};

        case EntryKind::Other:
        default:
            return action::Unsupported{"create-other", path};
    }
}

} // namespace dirmirror
