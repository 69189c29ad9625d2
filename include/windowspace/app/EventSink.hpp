#pragma once

#include <windowspace/platform/WindowEvent.hpp>

namespace WS {

enum class SendStatus {
    Delivered,
    // The mailbox was full; the event was discarded.
    Dropped,
    // The window's worker is gone.
    Disconnected,
    NotFound,
};

[[nodiscard]] inline auto sendStatusToString(SendStatus status) -> char const* {
    switch (status) {
    case SendStatus::Delivered:
        return "delivered";
    case SendStatus::Dropped:
        return "dropped";
    case SendStatus::Disconnected:
        return "disconnected";
    case SendStatus::NotFound:
        return "not_found";
    }
    return "unknown";
}

/**
 * Destination for platform events of one window. Neither call may block.
 */
struct EventSink {
    virtual ~EventSink() = default;

    virtual auto trySendEvent(WindowEvent event) -> SendStatus = 0;
    // Called once the registry has removed the window. Later sends fail with
    // Disconnected; the receiving worker stops after draining.
    virtual auto disconnect() -> void = 0;
};

} // namespace WS
