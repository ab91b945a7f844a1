
#ifndef DIRMIRROR_EVENT_CLASSIFIER_H
#define DIRMIRROR_EVENT_CLASSIFIER_H

#include "dirmirror/events.h"
#include "dirmirror/mirror_action.h"
#include "dirmirror/path_remapper.h"

namespace dirmirror {

/**
 * Turns a raw ChangeEvent into the MirrorAction to replay on the output tree.
 *
 * Classification only reads: it remaps paths and, for Create events, lstat()s
 * and readlink()s the source entry. Anything that cannot be resolved becomes
 * action::Unresolved instead of an error.
 */
class EventClassifier {
public:
    explicit EventClassifier(MirrorRoots roots);

    MirrorAction classify(const events::ChangeEvent& event) const;

    const MirrorRoots& roots() const { return roots_; }

private:
    MirrorAction classifyCreate(const std::string& path) const;
    MirrorAction classifyModify(const events::ChangeEvent& event) const;
    MirrorAction classifyRename(const std::string& from, const std::string& to) const;

    MirrorRoots roots_;
};

} // namespace dirmirror

#endif /* DIRMIRROR_EVENT_CLASSIFIER_H */
