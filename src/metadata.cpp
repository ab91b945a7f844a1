
#include "dirmirror/metadata.h"

#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <vector>

namespace dirmirror {

namespace {
    EntryType entry_type_from_mode(mode_t mode) {
        if (S_ISLNK(mode)) return EntryType::Symlink;
        if (S_ISDIR(mode)) return EntryType::Directory;
        if (S_ISREG(mode)) return EntryType::Regular;
        return EntryType::Other;
    }

    Error write_failure(const char* what, const std::string& path, int err) {
        return Error(ErrorCode::FilesystemWriteFailure,
                     std::string("Failed to set ") + what + " for \"" + path + "\": " + std::strerror(err));
    }
}

Result<PortableMetadata> read_portable_metadata(const std::string& path) {
    struct stat st;
    if (::lstat(path.c_str(), &st) != 0) {
        int err = errno;
        return Error(ErrorCode::MetadataReadFailure,
                     "Failed to read metadata for \"" + path + "\": " + std::strerror(err));
    }

    PortableMetadata metadata;
    metadata.type = entry_type_from_mode(st.st_mode);
    metadata.permissions = st.st_mode & 07777;
    metadata.atime = st.st_atim;
    metadata.mtime = st.st_mtim;
    metadata.owner = OwnerInfo{st.st_uid, st.st_gid};
    metadata.link_count = static_cast<uint64_t>(st.st_nlink);
    metadata.size = static_cast<uint64_t>(st.st_size);
    return metadata;
}

EntryKind classify_entry(const PortableMetadata& metadata) {
    switch (metadata.type) {
        case EntryType::Symlink:
            return EntryKind::Symlink;
        case EntryType::Directory:
            return EntryKind::Directory;
        case EntryType::Regular:
            return metadata.link_count > 1 ? EntryKind::HardlinkedFile : EntryKind::RegularFile;
        default:
            return EntryKind::Other;
    }
}

Result<EntryKind> stat_entry_kind(const std::string& path) {
    auto metadata = read_portable_metadata(path);
    if (!metadata.ok()) {
        return metadata.error();
    }
    return classify_entry(metadata.value());
}

Result<std::string> read_link_target(const std::string& path) {
    std::vector<char> buffer(256);
    while (true) {
        ssize_t len = ::readlink(path.c_str(), buffer.data(), buffer.size());
        if (len < 0) {
            int err = errno;
            return Error(ErrorCode::MetadataReadFailure,
                         "Failed to read symlink \"" + path + "\": " + std::strerror(err));
        }
        if (static_cast<size_t>(len) < buffer.size()) {
            return std::string(buffer.data(), static_cast<size_t>(len));
        }
        // possibly truncated, retry with a larger buffer
        buffer.resize(buffer.size() * 2);
    }
}

Result<void> apply_permissions(const std::string& path, const PortableMetadata& metadata) {
    if (metadata.type == EntryType::Symlink) {
        // Linux has no lchmod, link permissions are always 0777
        spdlog::debug("Skipping permissions for symlink: {}", path);
        return Result<void>();
    }

    if (::chmod(path.c_str(), metadata.permissions) != 0) {
        return write_failure("permissions", path, errno);
    }
    return Result<void>();
}

Result<void> apply_timestamps(const std::string& path, const PortableMetadata& metadata) {
    const struct timespec times[2] = {metadata.atime, metadata.mtime};
    if (::utimensat(AT_FDCWD, path.c_str(), times, AT_SYMLINK_NOFOLLOW) != 0) {
        return write_failure("timestamps", path, errno);
    }
    return Result<void>();
}

Result<void> apply_ownership(const std::string& path, const PortableMetadata& metadata) {
    if (!metadata.owner) {
        spdlog::debug("Ownership not available, skipping owner/group for: {}", path);
        return Result<void>();
    }

    if (::lchown(path.c_str(), metadata.owner->uid, metadata.owner->gid) != 0) {
        return write_failure("owner/group", path, errno);
    }
    return Result<void>();
}

const char* entry_kind_name(EntryKind kind) {
    switch (kind) {
        case EntryKind::Symlink: return "symlink";
        case EntryKind::Directory: return "dir";
        case EntryKind::RegularFile: return "file";
        case EntryKind::HardlinkedFile: return "hardlink";
        case EntryKind::Other: return "other";
        default: return "unknown";
    }
}

} // namespace dirmirror
