#pragma once

#include <windowspace/app/OpenedWindow.hpp>
#include <windowspace/window/Mailbox.hpp>

#include <expected>
#include <memory>
#include <optional>

namespace WS {

/**
 * Handle to an open window, safe to copy and use from any thread. It never
 * keeps the window alive: once the registry has removed the window, send()
 * hands messages back and id()/platformWindow() resolve to nothing.
 */
template <typename U>
class Window {
public:
    Window(OpenedWindow opened, std::weak_ptr<MailboxSink<U>> sink)
        : opened_(std::move(opened)), sink_(std::move(sink)) {}

    // Non-blocking. Returns the message when the window is gone or its mailbox
    // is full.
    auto send(U message) const -> std::expected<void, U> {
        auto sink = sink_.lock();
        if (!sink) {
            return std::unexpected(std::move(message));
        }
        return sink->trySendUser(std::move(message));
    }

    [[nodiscard]] auto id() const -> std::optional<WindowId> {
        return opened_.id();
    }

    [[nodiscard]] auto platformWindow() const -> std::shared_ptr<PlatformWindow> {
        return opened_.get();
    }

    auto operator==(Window const& other) const -> bool {
        return opened_ == other.opened_;
    }

private:
    OpenedWindow                  opened_;
    std::weak_ptr<MailboxSink<U>> sink_;
};

} // namespace WS
