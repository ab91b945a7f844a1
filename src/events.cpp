#include "dirmirror/events.h"

#include <sstream>
#include <utility>

namespace dirmirror {
namespace events {

static ChangeEvent singlePathEvent(EventKind kind, std::string path) {
    ChangeEvent event;
    event.kind = kind;
    event.paths.push_back(std::move(path));
    return event;
}

ChangeEvent ChangeEvent::created(std::string path) {
    return singlePathEvent(EventKind::Create, std::move(path));
}

ChangeEvent ChangeEvent::removed(std::string path) {
    return singlePathEvent(EventKind::Remove, std::move(path));
}

ChangeEvent ChangeEvent::dataModified(std::string path) {
    ChangeEvent event = singlePathEvent(EventKind::Modify, std::move(path));
    event.modify_kind = ModifyKind::Data;
    return event;
}

ChangeEvent ChangeEvent::metadataModified(std::string path) {
    ChangeEvent event = singlePathEvent(EventKind::Modify, std::move(path));
    event.modify_kind = ModifyKind::Metadata;
    return event;
}

ChangeEvent ChangeEvent::renamed(std::string old_path, std::string new_path) {
    ChangeEvent event;
    event.kind = EventKind::Modify;
    event.modify_kind = ModifyKind::Name;
    event.rename_mode = RenameMode::Both;
    event.paths.push_back(std::move(old_path));
    event.paths.push_back(std::move(new_path));
    return event;
}

ChangeEvent ChangeEvent::accessed(std::string path) {
    return singlePathEvent(EventKind::Access, std::move(path));
}

std::string ChangeEvent::to_string() const {
    std::ostringstream oss;
    oss << "ChangeEvent{kind=" << kindName(kind);
    if (kind == EventKind::Modify) {
        oss << "/" << modifyKindName(modify_kind);
        if (modify_kind == ModifyKind::Name) {
            oss << "/" << renameModeName(rename_mode);
        }
    }
    oss << ", paths=[";
    for (size_t i = 0; i < paths.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << "\"" << paths[i] << "\"";
    }
    oss << "]}";
    return oss.str();
}

const char* kindName(EventKind kind) {
    switch (kind) {
        case EventKind::Create: return "Create";
        case EventKind::Modify: return "Modify";
        case EventKind::Remove: return "Remove";
        case EventKind::Access: return "Access";
        case EventKind::Other: return "Other";
        case EventKind::Unrecognized: return "Unrecognized";
        default: return "Unknown";
    }
}

const char* modifyKindName(ModifyKind kind) {
    switch (kind) {
        case ModifyKind::Data: return "Data";
        case ModifyKind::Metadata: return "Metadata";
        case ModifyKind::Name: return "Name";
        case ModifyKind::Other: return "Other";
        default: return "Unknown";
    }
}

const char* renameModeName(RenameMode mode) {
    switch (mode) {
        case RenameMode::Both: return "Both";
        case RenameMode::From: return "From";
        case RenameMode::To: return "To";
        default: return "Unknown";
    }
}

};
}
