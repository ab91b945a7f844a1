
#ifndef DIRMIRROR_FS_EXECUTOR_H
#define DIRMIRROR_FS_EXECUTOR_H

#include <string>

#include "dirmirror/mirror_action.h"
#include "dirmirror/path_remapper.h"
#include "dirmirror/result.h"

namespace dirmirror {
namespace fs {

    /**
     * Applies MirrorActions to the output tree.
     *
     * Every failure is logged where the filesystem call fails and returned as
     * an Error; nothing is thrown. Destinations outside the output root are
     * refused before any call is made.
     */
    class MirrorExecutor {
    public:
        explicit MirrorExecutor(MirrorRoots roots);

        Result<void> execute(const MirrorAction& mirror_action);

        Result<void> copyFile(const action::CopyFile& op);
        Result<void> createDirectory(const action::CreateDir& op);
        Result<void> createSymlink(const action::CreateSymlink& op);
        Result<void> removeEntry(const action::RemoveEntry& op);
        Result<void> renameEntry(const action::RenameEntry& op);
        Result<void> syncMetadata(const action::SyncMetadata& op);
        Result<void> reportUnsupported(const action::Unsupported& op);
        Result<void> reportUnresolved(const action::Unresolved& op);
        Result<void> ignore(const action::Ignore& op);

    private:
        Result<void> deleteFile(const std::string& path);
        Result<void> deleteDirectory(const std::string& path);
        Result<void> ensureParentDirectory(const std::string& path);
        Result<void> checkDestination(const std::string& path) const;

        MirrorRoots roots;
    };

};
}

#endif /* DIRMIRROR_FS_EXECUTOR_H */
