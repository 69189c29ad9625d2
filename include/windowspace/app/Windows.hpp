#pragma once

#include <windowspace/app/EventSink.hpp>
#include <windowspace/app/OpenedWindow.hpp>
#include <windowspace/core/Error.hpp>
#include <windowspace/platform/Platform.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace WS {

/**
 * Windows — registry of open windows and the shutdown guard counter.
 *
 * The map goes from platform window id to the window's platform object and
 * its mailbox. Removing an entry is the single signal that a window no longer
 * exists. The application may terminate iff the map is empty and no shutdown
 * guard is held.
 *
 * Thread-safety
 * -------------
 * Every member is safe to call from any thread. The internal mutex only covers
 * map and counter updates; platform calls and mailbox sends happen outside it.
 * The guard counter is only changed by the dispatcher thread.
 */
class Windows {
public:
    Windows() = default;

    Windows(Windows const&)                    = delete;
    auto operator=(Windows const&) -> Windows& = delete;

    // Creates the platform window, registers it with `sink` and publishes it
    // through `opened`.
    auto open(LoopTarget& target,
              WindowAttributes const& attributes,
              std::shared_ptr<EventSink> sink,
              OpenedWindow const& opened) -> Expected<std::shared_ptr<PlatformWindow>>;

    // Non-blocking delivery. A full mailbox drops the event; a disconnected one
    // removes the window.
    auto send(WindowId id, WindowEvent event) -> SendStatus;
    // Sends a copy of `event` to every window; returns how many accepted it.
    auto broadcast(WindowEvent const& event) -> std::size_t;

    // Removes the window and disconnects its mailbox. Returns true when the
    // application should now shut down.
    auto close(WindowId id) -> bool;
    auto preventShutdown() -> void;
    // Returns true when the application should now shut down.
    auto allowShutdown() -> bool;
    [[nodiscard]] auto shouldShutdown() const -> bool;

    // Removes every window, delivers Destroyed to each mailbox and disconnects
    // it.
    auto closeAll() -> std::size_t;

    [[nodiscard]] auto get(WindowId id) const -> std::shared_ptr<PlatformWindow>;
    [[nodiscard]] auto contains(WindowId id) const -> bool;
    [[nodiscard]] auto ids() const -> std::vector<WindowId>;
    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto empty() const -> bool;
    [[nodiscard]] auto guardCount() const -> std::size_t;
    // Events dropped because a mailbox was full, across all windows.
    [[nodiscard]] auto droppedEvents() const -> std::size_t;

private:
    struct Entry {
        OpenedWindow                    opened;
        std::shared_ptr<PlatformWindow> window;
        std::shared_ptr<EventSink>      sink;
    };

    auto shouldShutdownLocked() const -> bool;
    auto removeIfSink(WindowId id, EventSink const* sink) -> void;

    mutable std::mutex                        mutex_;
    phmap::flat_hash_map<WindowId, Entry>     entries_;
    std::size_t                               guards_  = 0;
    std::size_t                               dropped_ = 0;
};

} // namespace WS
