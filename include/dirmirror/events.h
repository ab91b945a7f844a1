
#ifndef DIRMIRROR_EVENTS_H
#define DIRMIRROR_EVENTS_H

#include <string>
#include <vector>

namespace dirmirror {
namespace events {

    enum class EventKind {
        Create,
        Modify,
        Remove,
        Access,
        Other,
        Unrecognized,
    };

    enum class ModifyKind {
        Data,
        Metadata,
        Name,
        Other,
    };

    // Which half of a rename the event describes. Both carries (old, new).
    enum class RenameMode {
        Both,
        From,
        To,
    };

    struct ChangeEvent {
        EventKind kind = EventKind::Unrecognized;
        ModifyKind modify_kind = ModifyKind::Other;
        RenameMode rename_mode = RenameMode::Both;
        std::vector<std::string> paths;

        static ChangeEvent created(std::string path);
        static ChangeEvent removed(std::string path);
        static ChangeEvent dataModified(std::string path);
        static ChangeEvent metadataModified(std::string path);
        static ChangeEvent renamed(std::string old_path, std::string new_path);
        static ChangeEvent accessed(std::string path);

        std::string to_string() const;
    };

    const char* kindName(EventKind kind);
    const char* modifyKindName(ModifyKind kind);
    const char* renameModeName(RenameMode mode);

};
}

#endif
