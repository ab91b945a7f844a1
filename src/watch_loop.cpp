
#include "dirmirror/watch_loop.h"

#include <spdlog/spdlog.h>

namespace dirmirror {

WatchLoop::WatchLoop(const MirrorRoots& roots, EventChannel& channel)
    : channel_(channel), classifier_(roots), executor_(roots) {}

void WatchLoop::handle(const events::ChangeEvent& event) {
    ++stats_.events;
    spdlog::debug("Handling {}", event.to_string());

    MirrorAction mirror_action = classifier_.classify(event);
    if (std::holds_alternative<action::Ignore>(mirror_action)) {
        spdlog::debug("{}", describe(mirror_action));
    } else {
        spdlog::info("{}", describe(mirror_action));
    }

    auto result = executor_.execute(mirror_action);
    if (!result.ok()) {
        ++stats_.failed;
        return;
    }

    if (mutates_destination(mirror_action)) {
        ++stats_.applied;
    } else {
        ++stats_.skipped;
    }
}

WatchStats WatchLoop::run() {
    while (auto item = channel_.receive()) {
        if (!item->ok()) {
            ++stats_.source_errors;
            spdlog::error("Watch error: {}", item->error().to_string());
            continue;
        }
        handle(item->value());
    }

    spdlog::info("Event source closed after {} events ({} applied, {} failed, {} skipped, {} watch errors)",
                 stats_.events, stats_.applied, stats_.failed, stats_.skipped, stats_.source_errors);
    return stats_;
}

} // namespace dirmirror
