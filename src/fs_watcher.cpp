#include "dirmirror/fs_watcher.h"

#include <poll.h>
#include <cerrno>
#include <cstring>
#include <vector>
#include <unistd.h>
#include <dirent.h>
#include <sys/stat.h>
#include <utility>

#include <spdlog/spdlog.h>

namespace dirmirror {
namespace fs {

static const uint32_t WATCH_MASK = IN_CREATE | IN_DELETE | IN_MODIFY | IN_ATTRIB |
                                   IN_MOVED_FROM | IN_MOVED_TO |
                                   IN_DELETE_SELF | IN_MOVE_SELF |
                                   IN_ONLYDIR | IN_DONT_FOLLOW;

static const int POLL_INTERVAL_MS = 100;

static bool isDirectory(const std::string& path) {
    struct stat st;
    return (lstat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode));
}

static void listEntries(const std::string& path, std::vector<std::string>& entries) {
    DIR* dir = opendir(path.c_str());
    if (!dir) return;

    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0) {
            continue;
        }
        entries.push_back(path + "/" + entry->d_name);
    }

    closedir(dir);
}

static bool isSameOrBelow(const std::string& root, const std::string& path) {
    return path == root || (path.size() > root.size() &&
                            path.compare(0, root.size(), root) == 0 &&
                            path[root.size()] == '/');
}

Watcher::Watcher(const std::string& watch_dir, EventChannel& channel_, WatcherOptions options_)
    : channel(channel_), options(options_), inotify_fd(-1), root_wd(-1),
      root_watch_dir(watch_dir), running(false) {
    while (root_watch_dir.size() > 1 && root_watch_dir.back() == '/') {
        root_watch_dir.pop_back();
    }
}

Watcher::~Watcher() {
    stop();
}

Result<void> Watcher::start() {
    if (running) {
        spdlog::error("Filesystem Watcher is already running");
        return Error(ErrorCode::SetupFailure, "Watcher is already running");
    }

    inotify_fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd < 0) {
        int err = errno;
        spdlog::error("Filesystem Watcher could not acquire a inotify FD");
        return Error(ErrorCode::SetupFailure, std::string("inotify_init1 failed: ") + strerror(err));
    }

    if (!addWatch(root_watch_dir)) {
        close(inotify_fd);
        inotify_fd = -1;
        return Error(ErrorCode::SetupFailure, "Failed to watch " + root_watch_dir);
    }

    {
        std::lock_guard<std::mutex> lock(watch_map_mutex);
        auto it = path_to_wd.find(root_watch_dir);
        root_wd = (it != path_to_wd.end()) ? it->second : -1;
    }

    running = true;
    watch_thread = std::thread(&Watcher::watchLoop, this);

    spdlog::info("Filesystem Watcher started listening on: {} ({} directories)", root_watch_dir, watchCount());
    return Result<void>();
}

void Watcher::stop() {
    bool was_running = running.exchange(false);
    if (watch_thread.joinable()) watch_thread.join();

    if (inotify_fd >= 0) {
        std::lock_guard<std::mutex> lock(watch_map_mutex);
        for (const auto& pair : wd_to_path) {
            inotify_rm_watch(inotify_fd, pair.first);
        }
        close(inotify_fd);
        inotify_fd = -1;
        wd_to_path.clear();
        path_to_wd.clear();
    }

    channel.close();

    if (was_running) {
        spdlog::info("Filesystem Watcher stopped");
    }
}

size_t Watcher::watchCount() const {
    std::lock_guard<std::mutex> lock(watch_map_mutex);
    return wd_to_path.size();
}

bool Watcher::addWatch(const std::string& path) {
    int wd = inotify_add_watch(inotify_fd, path.c_str(), WATCH_MASK);
    if (wd < 0) {
        spdlog::error("Failed to add watch for {}\n\t{}", path, strerror(errno));
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(watch_map_mutex);
        auto previous = wd_to_path.find(wd);
        if (previous != wd_to_path.end()) {
            path_to_wd.erase(previous->second);
        }
        wd_to_path[wd] = path;
        path_to_wd[path] = wd;
    }

    std::vector<std::string> entries;
    listEntries(path, entries);
    for (const auto& entry : entries) {
        if (isDirectory(entry)) {
            // a subdirectory that cannot be watched is reported but does not
            // stop the rest of the tree
            addWatch(entry);
        }
    }

    return true;
}

void Watcher::forgetWatch(int wd) {
    std::lock_guard<std::mutex> lock(watch_map_mutex);

    auto it = wd_to_path.find(wd);
    if (it != wd_to_path.end()) {
        path_to_wd.erase(it->second);
        wd_to_path.erase(it);
    }
}

void Watcher::removeWatchesUnder(const std::string& path) {
    std::lock_guard<std::mutex> lock(watch_map_mutex);

    for (auto it = path_to_wd.begin(); it != path_to_wd.end();) {
        if (isSameOrBelow(path, it->first)) {
            inotify_rm_watch(inotify_fd, it->second);
            wd_to_path.erase(it->second);
            it = path_to_wd.erase(it);
        } else {
            ++it;
        }
    }
}

void Watcher::renameWatches(const std::string& old_path, const std::string& new_path) {
    std::lock_guard<std::mutex> lock(watch_map_mutex);

    std::vector<std::pair<std::string, int>> moved;
    for (auto it = path_to_wd.begin(); it != path_to_wd.end();) {
        if (isSameOrBelow(old_path, it->first)) {
            moved.emplace_back(new_path + it->first.substr(old_path.size()), it->second);
            it = path_to_wd.erase(it);
        } else {
            ++it;
        }
    }

    for (const auto& entry : moved) {
        path_to_wd[entry.first] = entry.second;
        wd_to_path[entry.second] = entry.first;
    }
}

std::string Watcher::getPathFromWD(int wd) const {
    std::lock_guard<std::mutex> lock(watch_map_mutex);
    auto it = wd_to_path.find(wd);
    return (it != wd_to_path.end()) ? it->second : "";
}

void Watcher::reportContents(const std::string& dir_path) {
    std::vector<std::string> entries;
    listEntries(dir_path, entries);

    for (const auto& entry : entries) {
        emit(events::ChangeEvent::created(entry));
        if (isDirectory(entry)) {
            reportContents(entry);
        }
    }
}

void Watcher::emit(events::ChangeEvent event) {
    spdlog::debug("[FS EVENT] {}", event.to_string());
    channel.send(std::move(event));
}

void Watcher::flushPendingMoves() {
    // the other half never arrived: the entry left the watched tree
    for (auto& pair : pending_moves) {
        if (pair.second.is_dir) {
            removeWatchesUnder(pair.second.from_path);
        }
        emit(events::ChangeEvent::removed(pair.second.from_path));
    }
    pending_moves.clear();
}

void Watcher::expirePendingMoves() {
    if (pending_moves.empty()) {
        return;
    }

    auto now = std::chrono::steady_clock::now();
    bool expired = false;
    for (const auto& pair : pending_moves) {
        if (now - pair.second.time >= options.move_pair_timeout) {
            expired = true;
            break;
        }
    }

    // flush all of them so removals keep their relative order
    if (expired) {
        flushPendingMoves();
    }
}

void Watcher::watchLoop() {
    const size_t BUF_SIZE = 4096;
    char buffer[BUF_SIZE] __attribute__((aligned(__alignof__(struct inotify_event))));

    struct pollfd pfd;
    pfd.fd = inotify_fd;
    pfd.events = POLLIN;

    while (running) {
        int poll_result = poll(&pfd, 1, POLL_INTERVAL_MS);

        if (poll_result < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("Filesystem Watcher: poll() error\n\t{}", strerror(errno));
            break;
        }

        if (pfd.revents & POLLIN) {
            ssize_t len = read(inotify_fd, buffer, BUF_SIZE);

            if (len < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                    continue;
                }
                int err = errno;
                spdlog::error("Filesystem Watcher: Error reading inotify events\n\t{}", strerror(err));
                channel.sendError(Error(ErrorCode::NotificationSourceError,
                                        std::string("Error reading inotify events: ") + strerror(err)));
                break;
            }

            const struct inotify_event* event;
            for (char* ptr = buffer; ptr < buffer + len; ptr += sizeof(struct inotify_event) + event->len) {
                event = reinterpret_cast<const struct inotify_event*>(ptr);
                handleEvent(event);
                if (!running) break;
            }
        }

        expirePendingMoves();
    }

    running = false;
    channel.close();
}

void Watcher::handleEvent(const struct inotify_event* event) {
    if (event->mask & IN_Q_OVERFLOW) {
        flushPendingMoves();
        spdlog::warn("Filesystem Watcher: inotify queue overflowed, events were lost");
        channel.sendError(Error(ErrorCode::NotificationSourceError, "inotify event queue overflowed, events were lost"));
        return;
    }

    // a rename pair is only valid while nothing else happened in between
    bool pairs_pending_move = (event->mask & IN_MOVED_TO) && pending_moves.count(event->cookie) > 0;
    if (!pairs_pending_move) {
        flushPendingMoves();
    }

    if (event->wd == root_wd && (event->mask & (IN_DELETE_SELF | IN_MOVE_SELF | IN_IGNORED))) {
        spdlog::error("Filesystem Watcher: watch root {} was removed or moved", root_watch_dir);
        running = false;
        return;
    }

    if (event->mask & IN_IGNORED) {
        forgetWatch(event->wd);
        return;
    }

    if (event->len == 0) {
        // self events of subdirectories, the parent reports them by name
        return;
    }

    std::string dir_path = getPathFromWD(event->wd);
    if (dir_path.empty()) {
        return;
    }

    std::string full_path = dir_path + "/" + event->name;
    bool is_dir = (event->mask & IN_ISDIR) != 0;

    if (event->mask & IN_CREATE) {
        emit(events::ChangeEvent::created(full_path));
        if (is_dir && addWatch(full_path) && options.report_existing_entries) {
            reportContents(full_path);
        }
    } else if (event->mask & IN_DELETE) {
        emit(events::ChangeEvent::removed(full_path));
    } else if (event->mask & IN_MODIFY) {
        emit(events::ChangeEvent::dataModified(full_path));
    } else if (event->mask & IN_ATTRIB) {
        emit(events::ChangeEvent::metadataModified(full_path));
    } else if (event->mask & IN_MOVED_FROM) {
        pending_moves[event->cookie] = {
            full_path,
            event->cookie,
            is_dir,
            std::chrono::steady_clock::now()
        };
    } else if (event->mask & IN_MOVED_TO) {
        auto it = pending_moves.find(event->cookie);
        if (it != pending_moves.end()) {
            std::string from_path = it->second.from_path;
            pending_moves.erase(it);
            if (is_dir) {
                renameWatches(from_path, full_path);
            }
            emit(events::ChangeEvent::renamed(from_path, full_path));
        } else {
            // moved in from outside the observed tree
            emit(events::ChangeEvent::created(full_path));
            if (is_dir && addWatch(full_path) && options.report_existing_entries) {
                reportContents(full_path);
            }
        }
    }
}

};
}
