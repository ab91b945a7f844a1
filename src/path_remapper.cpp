
#include "dirmirror/path_remapper.h"

#include <sys/stat.h>
#include <climits>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace dirmirror {

namespace {
    std::string strip_trailing_slash(std::string path) {
        while (path.size() > 1 && path.back() == '/') {
            path.pop_back();
        }
        return path;
    }

    Result<std::string> canonical_directory(const std::string& path, const char* role) {
        char resolved[PATH_MAX];
        if (::realpath(path.c_str(), resolved) == nullptr) {
            int err = errno;
            return Error(ErrorCode::SetupFailure,
                         std::string("Cannot resolve ") + role + " '" + path + "': " + std::strerror(err));
        }

        struct stat st;
        if (::stat(resolved, &st) != 0 || !S_ISDIR(st.st_mode)) {
            return Error(ErrorCode::SetupFailure,
                         std::string(role) + " '" + resolved + "' is not a directory");
        }
        return std::string(resolved);
    }
}

bool is_under(const std::string& root, const std::string& path) {
    if (path.compare(0, root.size(), root) != 0) {
        return false;
    }
    if (path.size() == root.size()) {
        return true;
    }
    // "/" is the only canonical root that already ends with a separator
    return root.back() == '/' || path[root.size()] == '/';
}

Result<std::string> remap(const MirrorRoots& roots, const std::string& path) {
    if (path.empty() || path[0] != '/' || roots.watch_root.empty() || !is_under(roots.watch_root, path)) {
        return Error(ErrorCode::PathNotContained,
                     "Path \"" + path + "\" is not under watch root \"" + roots.watch_root + "\"");
    }

    std::string relative = path.substr(roots.watch_root.size());
    while (!relative.empty() && relative[0] == '/') {
        relative.erase(0, 1);
    }

    if (relative.empty()) {
        return roots.output_root;
    }
    if (roots.output_root.back() == '/') {
        return roots.output_root + relative;
    }
    return roots.output_root + "/" + relative;
}

std::string remap_link_target(const MirrorRoots& roots, const std::string& target) {
    auto mirrored = remap(roots, target);
    return mirrored.ok() ? mirrored.value() : target;
}

Result<MirrorRoots> canonicalize_roots(const std::string& watch_root, const std::string& output_root) {
    auto watch = canonical_directory(strip_trailing_slash(watch_root), "watch root");
    if (!watch.ok()) {
        return watch.error();
    }
    auto output = canonical_directory(strip_trailing_slash(output_root), "output root");
    if (!output.ok()) {
        return output.error();
    }

    MirrorRoots roots;
    roots.watch_root = watch.value();
    roots.output_root = output.value();
    return roots;
}

} // namespace dirmirror
