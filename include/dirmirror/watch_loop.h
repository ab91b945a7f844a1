
#ifndef DIRMIRROR_WATCH_LOOP_H
#define DIRMIRROR_WATCH_LOOP_H

#include <cstddef>

#include "dirmirror/event_channel.h"
#include "dirmirror/event_classifier.h"
#include "dirmirror/fs_executor.h"
#include "dirmirror/path_remapper.h"

namespace dirmirror {

struct WatchStats {
    size_t events = 0;
    size_t source_errors = 0;
    size_t applied = 0;
    size_t failed = 0;
    size_t skipped = 0;
};

/**
 * Pulls events off the channel one at a time and mirrors each of them before
 * looking at the next one. Returns when the channel is closed and drained.
 */
class WatchLoop {
public:
    WatchLoop(const MirrorRoots& roots, EventChannel& channel);

    WatchStats run();

    // Classify and execute a single event, updating stats.
    void handle(const events::ChangeEvent& event);

    const WatchStats& stats() const { return stats_; }

private:
    EventChannel& channel_;
    EventClassifier classifier_;
    fs::MirrorExecutor executor_;
    WatchStats stats_;
};

} // namespace dirmirror

#endif /* DIRMIRROR_WATCH_LOOP_H */
