#pragma once

#include <windowspace/app/Application.hpp>
#include <windowspace/core/Channel.hpp>
#include <windowspace/window/Mailbox.hpp>
#include <windowspace/window/RunningWindow.hpp>
#include <windowspace/window/Window.hpp>

#include <memory>
#include <optional>
#include <utility>

namespace WS {

/**
 * Collects the attributes of a window that will run behavior `B`, then opens
 * it from any Application: a PendingApp (buffered until the loop starts), an
 * ExecutingApp (direct), a RunningWindow or an App (round trip).
 */
template <Behavior B>
class WindowBuilder {
public:
    using AppMessage = typename B::AppMessage;
    using Context    = typename B::Context;
    using Handle     = Window<typename AppMessage::Window>;

    WindowBuilder(Application<AppMessage>& owner, Context context)
        : owner_(owner), context_(std::move(context)) {}

    [[nodiscard]] auto attributes() -> WindowAttributes& { return attributes_; }
    auto operator->() -> WindowAttributes* { return &attributes_; }

    auto title(std::string title) -> WindowBuilder& {
        attributes_.title = std::move(title);
        return *this;
    }

    auto innerSize(WindowSize size) -> WindowBuilder& {
        attributes_.inner_size = size;
        return *this;
    }

    auto parent(WindowId parent) -> WindowBuilder& {
        attributes_.parent = parent;
        return *this;
    }

    // std::nullopt when the application has already shut down.
    auto open() && -> Expected<std::optional<Handle>> {
        using U = typename AppMessage::Window;

        auto app                   = owner_.app();
        auto [sender, receiver]    = makeChannel<WindowMessage<U>>(app.options().mailbox_capacity);
        auto sink                  = std::make_shared<MailboxSink<U>>(std::move(sender));

        std::optional<bool> showAfterInit;
        if (attributes_.delay_visible && attributes_.visible) {
            attributes_.visible = false;
            showAfterInit       = attributes_.active;
        }

        // std::function needs a copyable callable; the receiver and context
        // move out exactly once when the spawner runs.
        struct Pending {
            ChannelReceiver<WindowMessage<U>> receiver;
            Context                           context;
        };
        auto pending = std::make_shared<std::optional<Pending>>(Pending{std::move(receiver), std::move(context_)});

        OpenedWindow                  opened;
        std::weak_ptr<MailboxSink<U>> weakSink = sink;
        WindowSpawner spawner = [pending, weakSink, app, showAfterInit](OpenedWindow const& created) {
            if (!*pending) {
                return;
            }
            auto taken = std::move(**pending);
            pending->reset();
            RunningWindow<AppMessage> running(created.get(),
                                              created,
                                              weakSink,
                                              std::move(taken.receiver),
                                              app,
                                              showAfterInit);
            RunningWindow<AppMessage>::template spawn<B>(std::move(running), std::move(taken.context));
        };

        auto status = owner_.openWindow(std::move(attributes_), sink, opened, std::move(spawner));
        if (!status) {
            return std::unexpected(status.error());
        }
        if (*status == OpenStatus::Unavailable) {
            return std::optional<Handle>{};
        }
        return std::optional<Handle>{Handle{opened, sink}};
    }

private:
    Application<AppMessage>& owner_;
    Context                  context_;
    WindowAttributes         attributes_;
};

// Starts describing a window running behavior `B`, opened from `owner`.
template <Behavior B>
auto buildWindow(Application<typename B::AppMessage>& owner, typename B::Context context = {}) -> WindowBuilder<B> {
    return WindowBuilder<B>(owner, std::move(context));
}

// Opens a window with default attributes.
template <Behavior B>
auto openWindow(Application<typename B::AppMessage>& owner, typename B::Context context = {})
        -> Expected<std::optional<Window<typename B::AppMessage::Window>>> {
    return buildWindow<B>(owner, std::move(context)).open();
}

} // namespace WS
