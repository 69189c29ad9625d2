#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <expected>
#include <memory>
#include <mutex>
#include <utility>

namespace WS {

enum class ReceiveError {
    Empty,
    Timeout,
    Disconnected,
};

template <typename T>
struct TrySendError {
    enum class Kind {
        Full,
        Disconnected,
    };

    Kind kind;
    T    value;
};

namespace Detail {

template <typename T>
struct ChannelState {
    explicit ChannelState(std::size_t capacity)
        : capacity(capacity == 0 ? 1 : capacity) {}

    std::mutex              mutex;
    std::condition_variable notEmpty;
    std::deque<T>           queue;
    std::size_t const       capacity;
    std::size_t             senders       = 1;
    bool                    receiverAlive = true;
    bool                    closed        = false;
};

} // namespace Detail

template <typename T>
class ChannelReceiver;

/**
 * Producer side of a bounded channel. Copies share the channel; the receiver
 * observes Disconnected once every sender is gone or one of them called
 * close(), and the queue is drained.
 */
template <typename T>
class ChannelSender {
public:
    ChannelSender(ChannelSender const& other)
        : state_(other.state_) {
        if (state_) {
            std::lock_guard<std::mutex> lock(state_->mutex);
            ++state_->senders;
        }
    }

    ChannelSender(ChannelSender&& other) noexcept
        : state_(std::move(other.state_)) {}

    auto operator=(ChannelSender const& other) -> ChannelSender& {
        if (this != &other) {
            ChannelSender copy(other);
            std::swap(state_, copy.state_);
        }
        return *this;
    }

    auto operator=(ChannelSender&& other) noexcept -> ChannelSender& {
        if (this != &other) {
            this->release();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    ~ChannelSender() {
        this->release();
    }

    // Never blocks. On failure the value is handed back with the reason.
    auto trySend(T value) -> std::expected<void, TrySendError<T>> {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (!state_->receiverAlive || state_->closed) {
                return std::unexpected(TrySendError<T>{TrySendError<T>::Kind::Disconnected, std::move(value)});
            }
            if (state_->queue.size() >= state_->capacity) {
                return std::unexpected(TrySendError<T>{TrySendError<T>::Kind::Full, std::move(value)});
            }
            state_->queue.push_back(std::move(value));
        }
        state_->notEmpty.notify_one();
        return {};
    }

    // Disconnects the channel for every sender. Queued values stay receivable.
    auto close() -> void {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->closed = true;
        }
        state_->notEmpty.notify_all();
    }

    [[nodiscard]] auto capacity() const -> std::size_t {
        return state_->capacity;
    }

private:
    template <typename U>
    friend auto makeChannel(std::size_t capacity) -> std::pair<ChannelSender<U>, ChannelReceiver<U>>;

    explicit ChannelSender(std::shared_ptr<Detail::ChannelState<T>> state)
        : state_(std::move(state)) {}

    auto release() -> void {
        if (!state_) {
            return;
        }
        bool last = false;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            last = --state_->senders == 0;
        }
        if (last) {
            state_->notEmpty.notify_all();
        }
        state_.reset();
    }

    std::shared_ptr<Detail::ChannelState<T>> state_;
};

/**
 * Consumer side of a bounded channel. Move-only; destroying it disconnects
 * every sender and discards anything still queued.
 */
template <typename T>
class ChannelReceiver {
public:
    ChannelReceiver(ChannelReceiver const&)                    = delete;
    auto operator=(ChannelReceiver const&) -> ChannelReceiver& = delete;

    ChannelReceiver(ChannelReceiver&& other) noexcept
        : state_(std::move(other.state_)) {}

    auto operator=(ChannelReceiver&& other) noexcept -> ChannelReceiver& {
        if (this != &other) {
            this->close();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    ~ChannelReceiver() {
        this->close();
    }

    auto tryReceive() -> std::expected<T, ReceiveError> {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return this->popLocked(lock, ReceiveError::Empty);
    }

    auto receiveFor(std::chrono::steady_clock::duration timeout) -> std::expected<T, ReceiveError> {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->notEmpty.wait_for(lock, timeout, [this] {
            return !state_->queue.empty() || state_->senders == 0 || state_->closed;
        });
        return this->popLocked(lock, ReceiveError::Timeout);
    }

    auto receive() -> std::expected<T, ReceiveError> {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->notEmpty.wait(lock, [this] {
            return !state_->queue.empty() || state_->senders == 0 || state_->closed;
        });
        return this->popLocked(lock, ReceiveError::Disconnected);
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->queue.size();
    }

private:
    template <typename U>
    friend auto makeChannel(std::size_t capacity) -> std::pair<ChannelSender<U>, ChannelReceiver<U>>;

    explicit ChannelReceiver(std::shared_ptr<Detail::ChannelState<T>> state)
        : state_(std::move(state)) {}

    auto popLocked(std::unique_lock<std::mutex>& lock, ReceiveError whenEmpty) -> std::expected<T, ReceiveError> {
        if (state_->queue.empty()) {
            bool const disconnected = state_->senders == 0 || state_->closed;
            return std::unexpected(disconnected ? ReceiveError::Disconnected : whenEmpty);
        }
        T value = std::move(state_->queue.front());
        state_->queue.pop_front();
        lock.unlock();
        return value;
    }

    auto close() -> void {
        if (!state_) {
            return;
        }
        std::deque<T> discarded;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->receiverAlive = false;
            discarded.swap(state_->queue);
        }
        state_.reset();
    }

    std::shared_ptr<Detail::ChannelState<T>> state_;
};

template <typename T>
auto makeChannel(std::size_t capacity) -> std::pair<ChannelSender<T>, ChannelReceiver<T>> {
    auto state = std::make_shared<Detail::ChannelState<T>>(capacity);
    return {ChannelSender<T>(state), ChannelReceiver<T>(state)};
}

} // namespace WS
