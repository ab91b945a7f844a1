
#ifndef DIRMIRROR_FS_WATCHER_H
#define DIRMIRROR_FS_WATCHER_H

#include <string>
#include <map>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <sys/inotify.h>

#include "dirmirror/event_channel.h"
#include "dirmirror/events.h"
#include "dirmirror/result.h"

namespace dirmirror {
namespace fs {

    struct WatcherOptions {
        // how long an IN_MOVED_FROM waits for its IN_MOVED_TO before it is
        // reported as a removal
        std::chrono::milliseconds move_pair_timeout{500};
        // report the contents of directories that appear after their watch
        // could be registered (mkdir -p, moved-in trees)
        bool report_existing_entries = true;
    };

    /**
     * Recursive inotify watch on one directory tree.
     *
     * Events are pushed to the channel in the order inotify delivers them.
     * The channel is closed when the watcher stops, hits a fatal read error,
     * or the watch root itself goes away.
     */
    class Watcher {
    public:
        Watcher(const std::string& watch_dir, EventChannel& channel_, WatcherOptions options_ = WatcherOptions());
        ~Watcher();

        Watcher(const Watcher&) = delete;
        Watcher& operator=(const Watcher&) = delete;

        Result<void> start();
        void stop();
        bool isRunning() const { return running; };

        size_t watchCount() const;

    private:
        void watchLoop();

        bool addWatch(const std::string& path);
        void removeWatchesUnder(const std::string& path);
        void renameWatches(const std::string& old_path, const std::string& new_path);
        void forgetWatch(int wd);
        void reportContents(const std::string& dir_path);

        void handleEvent(const struct inotify_event* event);
        void flushPendingMoves();
        void expirePendingMoves();
        void emit(events::ChangeEvent event);

        std::string getPathFromWD(int wd) const;

        std::map<int, std::string> wd_to_path;
        std::map<std::string, int> path_to_wd;
        mutable std::mutex watch_map_mutex;

        EventChannel& channel;
        WatcherOptions options;

        int inotify_fd;
        int root_wd;
        std::string root_watch_dir;
        std::atomic<bool> running;
        std::thread watch_thread;

        struct MoveContext {
            std::string from_path;
            uint32_t cookie;
            bool is_dir;
            std::chrono::steady_clock::time_point time;
        };

        // only touched by the watch thread
        std::map<uint32_t, MoveContext> pending_moves;
    };

};
}

#endif /* DIRMIRROR_FS_WATCHER_H*/
