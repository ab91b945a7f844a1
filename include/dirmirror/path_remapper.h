
#ifndef DIRMIRROR_PATH_REMAPPER_H
#define DIRMIRROR_PATH_REMAPPER_H

#include <string>

#include "dirmirror/result.h"

namespace dirmirror {

/**
 * The two canonical directories everything is relative to.
 * Built once at startup and passed by reference to every component.
 */
struct MirrorRoots {
    std::string watch_root;
    std::string output_root;
};

/**
 * Resolve the destination counterpart of a source path.
 *
 * @param roots watch/output roots, both canonical and without a trailing slash
 * @param path absolute source path
 * @return output_root joined with the part of path below watch_root, or
 *         ErrorCode::PathNotContained when path is not under watch_root
 */
Result<std::string> remap(const MirrorRoots& roots, const std::string& path);

/**
 * Resolve a symlink target for the mirror. Absolute targets inside the watch
 * root are remapped, anything else (relative or outside) is kept verbatim.
 */
std::string remap_link_target(const MirrorRoots& roots, const std::string& target);

bool is_under(const std::string& root, const std::string& path);

/**
 * realpath(3) both roots and check that they are directories.
 */
Result<MirrorRoots> canonicalize_roots(const std::string& watch_root, const std::string& output_root);

} // namespace dirmirror

#endif /* DIRMIRROR_PATH_REMAPPER_H */
