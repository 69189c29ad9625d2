#include <windowspace/app/Windows.hpp>
#include <windowspace/log/TaggedLogger.hpp>

#include <optional>
#include <utility>

namespace WS {

auto Windows::open(LoopTarget& target,
                   WindowAttributes const& attributes,
                   std::shared_ptr<EventSink> sink,
                   OpenedWindow const& opened) -> Expected<std::shared_ptr<PlatformWindow>> {
    if (attributes.parent) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!entries_.contains(*attributes.parent)) {
            ws_log("Windows::open rejected unknown parent " + to_string(*attributes.parent), "Registry", "Error");
            return std::unexpected(Error{Error::Code::InvalidParent,
                                         "parent " + to_string(*attributes.parent) + " is not open"});
        }
    }

    auto created = target.createWindow(attributes);
    if (!created) {
        ws_log("Windows::open platform failure: " + describeError(created.error()), "Registry", "Error");
        return std::unexpected(created.error());
    }

    auto window = *created;
    auto id     = window->id();
    opened.set(window);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.insert_or_assign(id, Entry{opened, window, std::move(sink)});
    }
    ws_log("Windows::open registered " + to_string(id), "Registry");
    return window;
}

auto Windows::send(WindowId id, WindowEvent event) -> SendStatus {
    std::shared_ptr<EventSink> sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return SendStatus::NotFound;
        }
        sink = it->second.sink;
    }

    auto status = sink->trySendEvent(std::move(event));
    switch (status) {
    case SendStatus::Delivered:
    case SendStatus::NotFound:
        break;
    case SendStatus::Dropped: {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++dropped_;
        }
        ws_log("Dropping event for " + to_string(id) + ": mailbox full", "Mailbox", "Warning");
        break;
    }
    case SendStatus::Disconnected:
        ws_log("Mailbox of " + to_string(id) + " disconnected; removing window", "Mailbox");
        this->removeIfSink(id, sink.get());
        break;
    }
    return status;
}

auto Windows::broadcast(WindowEvent const& event) -> std::size_t {
    std::size_t delivered = 0;
    for (auto id : this->ids()) {
        if (this->send(id, event) == SendStatus::Delivered) {
            ++delivered;
        }
    }
    return delivered;
}

auto Windows::close(WindowId id) -> bool {
    std::optional<Entry> removed;
    bool                 shutdown = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it != entries_.end()) {
            removed = std::move(it->second);
            entries_.erase(it);
            ws_log("Windows::close removed " + to_string(id), "Registry");
        }
        shutdown = this->shouldShutdownLocked();
    }
    if (removed) {
        removed->opened.clear();
        removed->sink->disconnect();
    }
    // The platform window may be destroyed here, outside the lock.
    removed.reset();
    return shutdown;
}

auto Windows::preventShutdown() -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    ++guards_;
    ws_log("Shutdown guard acquired; count=" + std::to_string(guards_), "Registry");
}

auto Windows::allowShutdown() -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    if (guards_ == 0) {
        ws_log("Shutdown guard released without a matching acquire", "Registry", "Warning");
    } else {
        --guards_;
    }
    ws_log("Shutdown guard released; count=" + std::to_string(guards_), "Registry");
    return this->shouldShutdownLocked();
}

auto Windows::shouldShutdown() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return this->shouldShutdownLocked();
}

auto Windows::closeAll() -> std::size_t {
    phmap::flat_hash_map<WindowId, Entry> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed.swap(entries_);
    }
    for (auto& [id, entry] : removed) {
        entry.opened.clear();
        auto status = entry.sink->trySendEvent(Event::Destroyed{});
        entry.sink->disconnect();
        ws_log("Windows::closeAll notified " + to_string(id) + ": " + sendStatusToString(status), "Registry");
    }
    return removed.size();
}

auto Windows::get(WindowId id) const -> std::shared_ptr<PlatformWindow> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second.window;
}

auto Windows::contains(WindowId id) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.contains(id);
}

auto Windows::ids() const -> std::vector<WindowId> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<WindowId> result;
    result.reserve(entries_.size());
    for (auto const& [id, _] : entries_) {
        result.push_back(id);
    }
    return result;
}

auto Windows::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

auto Windows::empty() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.empty();
}

auto Windows::guardCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return guards_;
}

auto Windows::droppedEvents() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

auto Windows::shouldShutdownLocked() const -> bool {
    return entries_.empty() && guards_ == 0;
}

auto Windows::removeIfSink(WindowId id, EventSink const* sink) -> void {
    std::optional<Entry> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it != entries_.end() && it->second.sink.get() == sink) {
            removed = std::move(it->second);
            entries_.erase(it);
        }
    }
    if (removed) {
        removed->opened.clear();
        removed->sink->disconnect();
    }
}

} // namespace WS
