
#include "dirmirror/mirror_action.h"

#include <sstream>

namespace dirmirror {

namespace {
    struct NameVisitor {
        const char* operator()(const action::CopyFile&) const { return "CopyFile"; }
        const char* operator()(const action::CreateDir&) const { return "CreateDir"; }
        const char* operator()(const action::CreateSymlink&) const { return "CreateSymlink"; }
        const char* operator()(const action::RemoveEntry&) const { return "RemoveEntry"; }
        const char* operator()(const action::RenameEntry&) const { return "RenameEntry"; }
        const char* operator()(const action::SyncMetadata&) const { return "SyncMetadata"; }
        const char* operator()(const action::Ignore&) const { return "Ignore"; }
        const char* operator()(const action::Unsupported&) const { return "Unsupported"; }
        const char* operator()(const action::Unresolved&) const { return "Unresolved"; }
    };

    struct DescribeVisitor {
        std::ostringstream& oss;

        void operator()(const action::CopyFile& a) const {
            oss << (a.reason == action::CopyReason::Created ? "Created[file]: " : "Modified[file]: ")
                << a.source;
        }
        void operator()(const action::CreateDir& a) const {
            oss << "Created[dir]: " << a.source;
        }
        void operator()(const action::CreateSymlink& a) const {
            oss << "Created[symlink]: " << a.source << " -> " << a.target;
        }
        void operator()(const action::RemoveEntry& a) const {
            oss << "Deleted: " << a.source;
        }
        void operator()(const action::RenameEntry& a) const {
            oss << "Renamed: " << a.source_from << " -> " << a.source_to;
        }
        void operator()(const action::SyncMetadata& a) const {
            oss << "Modify[metadata]: " << a.source;
        }
        void operator()(const action::Ignore& a) const {
            oss << "Ignored: " << a.source;
        }
        void operator()(const action::Unsupported& a) const {
            oss << "Unsupported[" << a.reason << "]: " << a.source;
        }
        void operator()(const action::Unresolved& a) const {
            oss << "Unresolved: " << a.source << " (" << a.error.to_string() << ")";
        }
    };
}

const char* action_name(const MirrorAction& mirror_action) {
    return std::visit(NameVisitor{}, mirror_action);
}

std::string describe(const MirrorAction& mirror_action) {
    std::ostringstream oss;
    std::visit(DescribeVisitor{oss}, mirror_action);
    return oss.str();
}

bool mutates_destination(const MirrorAction& mirror_action) {
    return !std::holds_alternative<action::Ignore>(mirror_action) &&
           !std::holds_alternative<action::Unsupported>(mirror_action) &&
           !std::holds_alternative<action::Unresolved>(mirror_action);
}

} // namespace dirmirror
