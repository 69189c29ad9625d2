#pragma once

#include <windowspace/app/EventSink.hpp>
#include <windowspace/core/Channel.hpp>
#include <windowspace/platform/WindowEvent.hpp>

#include <expected>
#include <variant>

namespace WS {

template <typename U>
struct UserMessage {
    U message;
};

// One entry of a window mailbox: a user-level message or a platform event.
template <typename U>
struct WindowMessage {
    std::variant<UserMessage<U>, WindowEvent> payload;
};

/**
 * Producer side of a window mailbox. The registry holds it as an EventSink;
 * Window handles hold it weakly to deliver user messages. Neither path ever
 * blocks: a full mailbox rejects the message.
 */
template <typename U>
class MailboxSink final : public EventSink {
public:
    explicit MailboxSink(ChannelSender<WindowMessage<U>> sender)
        : sender_(std::move(sender)) {}

    auto trySendEvent(WindowEvent event) -> SendStatus override {
        auto sent = sender_.trySend(WindowMessage<U>{std::move(event)});
        if (sent) {
            return SendStatus::Delivered;
        }
        return sent.error().kind == TrySendError<WindowMessage<U>>::Kind::Full ? SendStatus::Dropped
                                                                               : SendStatus::Disconnected;
    }

    // Hands the message back when the mailbox is full or its worker is gone.
    auto trySendUser(U message) -> std::expected<void, U> {
        auto sent = sender_.trySend(WindowMessage<U>{UserMessage<U>{std::move(message)}});
        if (sent) {
            return {};
        }
        return std::unexpected(std::move(std::get<UserMessage<U>>(sent.error().value.payload).message));
    }

    auto disconnect() -> void override {
        sender_.close();
    }

    [[nodiscard]] auto capacity() const -> std::size_t {
        return sender_.capacity();
    }

private:
    ChannelSender<WindowMessage<U>> sender_;
};

} // namespace WS
