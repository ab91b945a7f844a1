
#include "dirmirror/event_channel.h"

#include <spdlog/spdlog.h>
#include <utility>

namespace dirmirror {

bool EventChannel::push(Item item) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(item));
    }
    cv_.notify_one();
    return true;
}

bool EventChannel::send(events::ChangeEvent event) {
    if (!push(Item(std::move(event)))) {
        spdlog::debug("Dropping event sent after channel close");
        return false;
    }
    return true;
}

bool EventChannel::sendError(Error error) {
    return push(Item(std::move(error)));
}

void EventChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool EventChannel::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::optional<EventChannel::Item> EventChannel::receive() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !queue_.empty() || closed_; });

    if (queue_.empty()) {
        return std::nullopt;
    }

    Item item = std::move(queue_.front());
    queue_.pop_front();
    return item;
}

std::optional<EventChannel::Item> EventChannel::tryReceive() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }

    Item item = std::move(queue_.front());
    queue_.pop_front();
    return item;
}

size_t EventChannel::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace dirmirror
