
#ifndef DIRMIRROR_EVENT_CHANNEL_H
#define DIRMIRROR_EVENT_CHANNEL_H

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

#include "dirmirror/events.h"
#include "dirmirror/result.h"

namespace dirmirror {

/**
 * Ordered hand-off between the notification source and the watch loop.
 *
 * Each item is either a ChangeEvent or a source-level Error. receive() blocks
 * until an item is available and returns std::nullopt once the channel is
 * closed and drained.
 */
class EventChannel {
public:
    using Item = Result<events::ChangeEvent>;

    EventChannel() = default;

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    bool send(events::ChangeEvent event);
    bool sendError(Error error);

    void close();
    bool isClosed() const;

    std::optional<Item> receive();
    std::optional<Item> tryReceive();

    size_t pending() const;

private:
    bool push(Item item);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Item> queue_;
    bool closed_ = false;
};

} // namespace dirmirror

#endif /* DIRMIRROR_EVENT_CHANNEL_H */
