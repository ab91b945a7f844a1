
#ifndef DIRMIRROR_METADATA_H
#define DIRMIRROR_METADATA_H

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <sys/types.h>

#include "dirmirror/result.h"

namespace dirmirror {

enum class EntryType : uint8_t {
    Regular,
    Directory,
    Symlink,
    Other
};

/**
 * What a freshly created entry turned out to be.
 * HardlinkedFile is a regular file whose link count is above one.
 */
enum class EntryKind : uint8_t {
    Symlink,
    Directory,
    RegularFile,
    HardlinkedFile,
    Other
};

struct OwnerInfo {
    uid_t uid;
    gid_t gid;
};

struct PortableMetadata {
    EntryType type = EntryType::Other;
    mode_t permissions = 0;
    struct timespec atime {};
    struct timespec mtime {};
    std::optional<OwnerInfo> owner;
    uint64_t link_count = 0;
    uint64_t size = 0;
};

/**
 * Read the metadata of path itself. Symlinks are never followed.
 * @return metadata, or ErrorCode::MetadataReadFailure
 */
Result<PortableMetadata> read_portable_metadata(const std::string& path);

EntryKind classify_entry(const PortableMetadata& metadata);

/**
 * read_portable_metadata() followed by classify_entry().
 */
Result<EntryKind> stat_entry_kind(const std::string& path);

Result<std::string> read_link_target(const std::string& path);

// Each apply_* call touches one property of path and reports
// ErrorCode::FilesystemWriteFailure on its own, so callers can keep going.
Result<void> apply_permissions(const std::string& path, const PortableMetadata& metadata);
Result<void> apply_timestamps(const std::string& path, const PortableMetadata& metadata);
Result<void> apply_ownership(const std::string& path, const PortableMetadata& metadata);

const char* entry_kind_name(EntryKind kind);

} // namespace dirmirror

#endif /* DIRMIRROR_METADATA_H */
