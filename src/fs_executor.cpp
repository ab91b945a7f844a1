
#include "dirmirror/fs_executor.h"
#include "dirmirror/metadata.h"

#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <dirent.h>
#include <cerrno>
#include <cstring>
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>

namespace dirmirror {
namespace fs {

namespace {
    constexpr size_t COPY_BUFFER_SIZE = 64 * 1024;
    constexpr mode_t PARENT_DIR_MODE = 0755;

    class FileDescriptor {
    public:
        explicit FileDescriptor(int fd) : fd_(fd) {}
        ~FileDescriptor() { if (fd_ >= 0) ::close(fd_); }

        FileDescriptor(const FileDescriptor&) = delete;
        FileDescriptor& operator=(const FileDescriptor&) = delete;

        int get() const { return fd_; }
        bool valid() const { return fd_ >= 0; }

    private:
        int fd_;
    };

    Error writeFailure(const std::string& what, int err) {
        return Error(ErrorCode::FilesystemWriteFailure, what + ": " + std::strerror(err));
    }

    bool writeAll(int fd, const char* data, size_t size) {
        while (size > 0) {
            ssize_t written = ::write(fd, data, size);
            if (written < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            data += written;
            size -= static_cast<size_t>(written);
        }
        return true;
    }

    struct ExecuteVisitor {
        MirrorExecutor& executor;

        Result<void> operator()(const action::CopyFile& op) const { return executor.copyFile(op); }
        Result<void> operator()(const action::CreateDir& op) const { return executor.createDirectory(op); }
        Result<void> operator()(const action::CreateSymlink& op) const { return executor.createSymlink(op); }
        Result<void> operator()(const action::RemoveEntry& op) const { return executor.removeEntry(op); }
        Result<void> operator()(const action::RenameEntry& op) const { return executor.renameEntry(op); }
        Result<void> operator()(const action::SyncMetadata& op) const { return executor.syncMetadata(op); }
        Result<void> operator()(const action::Ignore& op) const { return executor.ignore(op); }
        Result<void> operator()(const action::Unsupported& op) const { return executor.reportUnsupported(op); }
        Result<void> operator()(const action::Unresolved& op) const { return executor.reportUnresolved(op); }
    };
}

MirrorExecutor::MirrorExecutor(MirrorRoots roots_)
    : roots(std::move(roots_)) {
    if (roots.output_root.size() > 1 && roots.output_root.back() == '/') {
        roots.output_root.pop_back();
    }
}

Result<void> MirrorExecutor::execute(const MirrorAction& mirror_action) {
    return std::visit(ExecuteVisitor{*this}, mirror_action);
}

Result<void> MirrorExecutor::checkDestination(const std::string& path) const {
    if (!is_under(roots.output_root, path)) {
        spdlog::error("Refusing to write outside output root {}: {}", roots.output_root, path);
        return Error(ErrorCode::PathNotContained,
                     "Destination \"" + path + "\" is outside output root \"" + roots.output_root + "\"");
    }
    return Result<void>();
}

Result<void> MirrorExecutor::ensureParentDirectory(const std::string& path) {
    size_t last_slash = path.find_last_of('/');
    if (last_slash == std::string::npos || last_slash == 0) {
        return Result<void>();
    }

    std::string parent = path.substr(0, last_slash);

    // the output root itself is never (re)created from here
    if (parent.size() <= roots.output_root.size()) {
        return Result<void>();
    }

    struct stat st;
    if (::lstat(parent.c_str(), &st) == 0) {
        return Result<void>();
    }

    auto result = ensureParentDirectory(parent);
    if (!result.ok()) {
        return result;
    }

    if (::mkdir(parent.c_str(), PARENT_DIR_MODE) != 0 && errno != EEXIST) {
        int err = errno;
        spdlog::error("Failed to create parent directory: {}\n\t{}", parent, std::strerror(err));
        return writeFailure("Failed to create parent directory \"" + parent + "\"", err);
    }

    spdlog::debug("Created parent directory: {}", parent);
    return Result<void>();
}

Result<void> MirrorExecutor::copyFile(const action::CopyFile& op) {
    auto contained = checkDestination(op.destination);
    if (!contained.ok()) {
        return contained;
    }

    auto parent = ensureParentDirectory(op.destination);
    if (!parent.ok()) {
        spdlog::error("Failed to create parent dirs for {}: {}", op.destination, parent.error().to_string());
        return parent;
    }

    // O_NONBLOCK so a fifo cannot stall the loop before the type check below
    FileDescriptor src(::open(op.source.c_str(), O_RDONLY | O_CLOEXEC | O_NONBLOCK));
    if (!src.valid()) {
        int err = errno;
        spdlog::error("Failed to copy file {} -> {}: cannot open source\n\t{}",
                      op.source, op.destination, std::strerror(err));
        return writeFailure("Failed to open \"" + op.source + "\" for copy", err);
    }

    struct stat src_st;
    if (::fstat(src.get(), &src_st) != 0) {
        int err = errno;
        spdlog::error("Failed to read metadata for {}: {}", op.source, std::strerror(err));
        return Error(ErrorCode::MetadataReadFailure,
                     "Failed to read metadata for \"" + op.source + "\": " + std::strerror(err));
    }
    if (!S_ISREG(src_st.st_mode)) {
        spdlog::error("Failed to copy file {} -> {}: source is not a regular file", op.source, op.destination);
        return Error(ErrorCode::FilesystemWriteFailure,
                     "Refusing to copy \"" + op.source + "\": not a regular file");
    }
    const mode_t permissions = src_st.st_mode & 07777;

    const int dst_flags = O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC | O_NOFOLLOW;
    int dst_fd = ::open(op.destination.c_str(), dst_flags, permissions);
    if (dst_fd < 0 && errno == ELOOP) {
        // a stale symlink sits where the file goes, replace it instead of writing through it
        if (::unlink(op.destination.c_str()) == 0) {
            dst_fd = ::open(op.destination.c_str(), dst_flags, permissions);
        }
    }
    FileDescriptor dst(dst_fd);
    if (!dst.valid()) {
        int err = errno;
        spdlog::error("Failed to copy file {} -> {}: cannot open destination\n\t{}",
                      op.source, op.destination, std::strerror(err));
        return writeFailure("Failed to open \"" + op.destination + "\" for writing", err);
    }

    std::vector<char> buffer(COPY_BUFFER_SIZE);
    uint64_t copied = 0;
    while (true) {
        ssize_t len = ::read(src.get(), buffer.data(), buffer.size());
        if (len < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            spdlog::error("Failed to copy file {} -> {}: read failed after {} bytes\n\t{}",
                          op.source, op.destination, copied, std::strerror(err));
            return writeFailure("Failed to read \"" + op.source + "\"", err);
        }
        if (len == 0) {
            break;
        }
        if (!writeAll(dst.get(), buffer.data(), static_cast<size_t>(len))) {
            int err = errno;
            spdlog::error("Failed to copy file {} -> {}: write failed after {} bytes\n\t{}",
                          op.source, op.destination, copied, std::strerror(err));
            return writeFailure("Failed to write \"" + op.destination + "\"", err);
        }
        copied += static_cast<uint64_t>(len);
    }

    if (::fchmod(dst.get(), permissions) != 0) {
        int err = errno;
        spdlog::error("Failed to set permissions for {}: {}", op.destination, std::strerror(err));
        return writeFailure("Failed to set permissions for \"" + op.destination + "\"", err);
    }

    spdlog::debug("Copied {} -> {} ({} bytes)", op.source, op.destination, copied);
    return Result<void>();
}

Result<void> MirrorExecutor::createDirectory(const action::CreateDir& op) {
    auto contained = checkDestination(op.destination);
    if (!contained.ok()) {
        return contained;
    }

    if (::mkdir(op.destination.c_str(), op.permissions) != 0) {
        int err = errno;
        spdlog::error("Failed to create dir {}: {}", op.destination, std::strerror(err));
        return writeFailure("Failed to create directory \"" + op.destination + "\"", err);
    }

    // mkdir(2) is subject to the umask
    if (::chmod(op.destination.c_str(), op.permissions) != 0) {
        int err = errno;
        spdlog::error("Failed to set permissions for {}: {}", op.destination, std::strerror(err));
        return writeFailure("Failed to set permissions for \"" + op.destination + "\"", err);
    }

    spdlog::debug("Created directory: {}", op.destination);
    return Result<void>();
}

Result<void> MirrorExecutor::createSymlink(const action::CreateSymlink& op) {
    auto contained = checkDestination(op.destination);
    if (!contained.ok()) {
        return contained;
    }

    if (::symlink(op.target.c_str(), op.destination.c_str()) != 0) {
        int err = errno;
        spdlog::error("Failed to create symlink {} -> {}: {}", op.destination, op.target, std::strerror(err));
        return writeFailure("Failed to create symlink \"" + op.destination + "\" -> \"" + op.target + "\"", err);
    }

    spdlog::debug("Created symlink: {} -> {}", op.destination, op.target);
    return Result<void>();
}

Result<void> MirrorExecutor::deleteFile(const std::string& path) {
    if (::unlink(path.c_str()) != 0) {
        if (errno == ENOENT) {
            spdlog::debug("File already deleted: {}", path);
            return Result<void>();
        }
        int err = errno;
        spdlog::error("Failed to delete {}: {}", path, std::strerror(err));
        return writeFailure("Failed to delete \"" + path + "\"", err);
    }

    spdlog::debug("Deleted file: {}", path);
    return Result<void>();
}

Result<void> MirrorExecutor::deleteDirectory(const std::string& path) {
    Result<void> first_failure;

    DIR* dir = ::opendir(path.c_str());
    if (dir) {
        struct dirent* entry;
        while ((entry = ::readdir(dir)) != nullptr) {
            if (std::strcmp(entry->d_name, ".") == 0 || std::strcmp(entry->d_name, "..") == 0) {
                continue;
            }

            std::string full_path = path + "/" + entry->d_name;

            struct stat st;
            if (::lstat(full_path.c_str(), &st) != 0) {
                int err = errno;
                if (err != ENOENT) {
                    spdlog::error("Failed to read metadata for {} while deleting {}: {}",
                                  full_path, path, std::strerror(err));
                    if (first_failure.ok()) {
                        first_failure = Error(ErrorCode::MetadataReadFailure,
                                              "Failed to read metadata for \"" + full_path + "\": " + std::strerror(err));
                    }
                }
                continue;
            }

            auto result = S_ISDIR(st.st_mode) ? deleteDirectory(full_path) : deleteFile(full_path);
            if (!result.ok() && first_failure.ok()) {
                first_failure = result;
            }
        }
        ::closedir(dir);
    }

    if (::rmdir(path.c_str()) != 0) {
        if (errno == ENOENT) {
            spdlog::debug("Directory already deleted: {}", path);
            return first_failure;
        }
        int err = errno;
        spdlog::error("Failed to delete {}: {}", path, std::strerror(err));
        return first_failure.ok() ? Result<void>(writeFailure("Failed to delete directory \"" + path + "\"", err))
                                  : first_failure;
    }

    spdlog::debug("Deleted directory: {}", path);
    return first_failure;
}

Result<void> MirrorExecutor::removeEntry(const action::RemoveEntry& op) {
    auto contained = checkDestination(op.destination);
    if (!contained.ok()) {
        return contained;
    }

    if (op.destination == roots.output_root) {
        spdlog::error("Refusing to delete the output root itself: {}", op.destination);
        return Error(ErrorCode::FilesystemWriteFailure, "Refusing to delete output root \"" + op.destination + "\"");
    }

    struct stat st;
    if (::lstat(op.destination.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
        return deleteDirectory(op.destination);
    }
    return deleteFile(op.destination);
}

Result<void> MirrorExecutor::renameEntry(const action::RenameEntry& op) {
    auto from_contained = checkDestination(op.destination_from);
    if (!from_contained.ok()) {
        return from_contained;
    }
    auto to_contained = checkDestination(op.destination_to);
    if (!to_contained.ok()) {
        return to_contained;
    }

    auto parent = ensureParentDirectory(op.destination_to);
    if (!parent.ok()) {
        return parent;
    }

    if (::rename(op.destination_from.c_str(), op.destination_to.c_str()) != 0) {
        int err = errno;
        spdlog::error("Failed to rename {} -> {} (source {} -> {}): {}",
                      op.destination_from, op.destination_to, op.source_from, op.source_to, std::strerror(err));
        return writeFailure("Failed to rename \"" + op.destination_from + "\" -> \"" + op.destination_to +
                            "\" (source \"" + op.source_from + "\")", err);
    }

    spdlog::debug("Moved: {} -> {}", op.destination_from, op.destination_to);
    return Result<void>();
}

Result<void> MirrorExecutor::syncMetadata(const action::SyncMetadata& op) {
    auto contained = checkDestination(op.destination);
    if (!contained.ok()) {
        return contained;
    }

    auto metadata = read_portable_metadata(op.source);
    if (!metadata.ok()) {
        spdlog::error("Failed to sync metadata {} -> {}: {}", op.source, op.destination, metadata.error().to_string());
        return metadata.error();
    }

    std::vector<std::string> failures;

    // chown(2) clears set-user-ID and set-group-ID, so ownership goes before the mode
    auto ownership = apply_ownership(op.destination, metadata.value());
    if (!ownership.ok()) {
        spdlog::error("Failed to sync owner/group {} -> {}: {}", op.source, op.destination, ownership.error().to_string());
        failures.push_back("owner/group");
    }

    auto permissions = apply_permissions(op.destination, metadata.value());
    if (!permissions.ok()) {
        spdlog::error("Failed to sync permissions {} -> {}: {}", op.source, op.destination, permissions.error().to_string());
        failures.push_back("permissions");
    }

    auto timestamps = apply_timestamps(op.destination, metadata.value());
    if (!timestamps.ok()) {
        spdlog::error("Failed to sync timestamps {} -> {}: {}", op.source, op.destination, timestamps.error().to_string());
        failures.push_back("timestamps");
    }

    if (!failures.empty()) {
        std::string message = "Failed to sync";
        for (size_t i = 0; i < failures.size(); ++i) {
            message += (i == 0 ? " " : ", ") + failures[i];
        }
        return Error(ErrorCode::FilesystemWriteFailure,
                     message + " for \"" + op.destination + "\" from \"" + op.source + "\"");
    }

    return Result<void>();
}

Result<void> MirrorExecutor::reportUnsupported(const action::Unsupported& op) {
    spdlog::warn("Unsupported[{}]: {}", op.reason, op.source);
    return Result<void>();
}

Result<void> MirrorExecutor::reportUnresolved(const action::Unresolved& op) {
    spdlog::error("Skipping {}: {}", op.source, op.error.to_string());
    return op.error;
}

Result<void> MirrorExecutor::ignore(const action::Ignore& op) {
    spdlog::debug("Ignored: {}", op.source);
    return Result<void>();
}

};
}
