#pragma once

#include <windowspace/app/EventSink.hpp>
#include <windowspace/app/Message.hpp>
#include <windowspace/app/OpenedWindow.hpp>
#include <windowspace/core/AppOptions.hpp>
#include <windowspace/core/Channel.hpp>
#include <windowspace/core/Error.hpp>
#include <windowspace/log/TaggedLogger.hpp>
#include <windowspace/platform/Platform.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <variant>

namespace WS {

// Starts the worker of a window once the dispatcher has created it.
using WindowSpawner = std::function<void(OpenedWindow const&)>;

namespace Loop {

struct OpenWindow {
    WindowAttributes                   attributes;
    std::shared_ptr<EventSink>         sink;
    OpenedWindow                       opened;
    WindowSpawner                      spawner;
    ChannelSender<Expected<WindowId>>  reply;
};

// The worker of `id` finished normally or after an initialization error.
struct CloseWindow {
    WindowId id;
};

// A behavior callback of `id` threw; `fault` holds the exception.
struct WindowPanic {
    WindowId           id;
    std::exception_ptr fault;
};

struct PreventShutdown {};
struct AllowShutdown {};

template <Message M>
struct User {
    M                                     message;
    ChannelSender<typename M::Response>   reply;
};

template <Message M>
struct AppError {
    typename M::Error error;
};

} // namespace Loop

// Requests handled by the dispatcher thread, in the order they were posted.
template <Message M>
using LoopMessage = std::variant<Loop::OpenWindow,
                                 Loop::CloseWindow,
                                 Loop::WindowPanic,
                                 Loop::PreventShutdown,
                                 Loop::AllowShutdown,
                                 Loop::User<M>,
                                 Loop::AppError<M>>;

/**
 * LoopRequests — shared between the dispatcher and every App handle.
 *
 * Requests posted while the loop is Pending are held until it starts. Once the
 * loop has Stopped, post() fails and anything still queued is dropped, which
 * disconnects the reply channels of blocked round trips.
 *
 * Also counts live worker threads so PendingApp::run can wait for them after
 * the loop exits.
 */
template <Message M>
class LoopRequests {
public:
    enum class State {
        Pending,
        Running,
        Stopped,
    };

    LoopRequests(std::shared_ptr<LoopProxy> proxy, AppOptions options)
        : proxy_(std::move(proxy)), options_(std::move(options)) {}

    LoopRequests(LoopRequests const&)                    = delete;
    auto operator=(LoopRequests const&) -> LoopRequests& = delete;

    // Returns false when the loop has stopped; the message is discarded.
    auto post(LoopMessage<M> message) -> bool {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == State::Stopped) {
                return false;
            }
            queue_.push_back(std::move(message));
            if (state_ == State::Pending) {
                return true;
            }
        }
        if (!proxy_->wake()) {
            ws_log("LoopRequests::post could not wake the loop", "Dispatcher", "Warning");
        }
        return true;
    }

    auto drain() -> std::deque<LoopMessage<M>> {
        std::deque<LoopMessage<M>> drained;
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(queue_);
        return drained;
    }

    auto markRunning() -> void {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Pending) {
            state_ = State::Running;
        }
    }

    // Moves to Stopped and hands back whatever was still queued.
    auto stop() -> std::deque<LoopMessage<M>> {
        std::deque<LoopMessage<M>> dropped;
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = State::Stopped;
        dropped.swap(queue_);
        return dropped;
    }

    [[nodiscard]] auto state() const -> State {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    [[nodiscard]] auto isRunning() const -> bool {
        return this->state() == State::Running;
    }

    [[nodiscard]] auto options() const -> AppOptions const& {
        return options_;
    }

    auto workerStarted() -> void {
        std::lock_guard<std::mutex> lock(workersMutex_);
        ++liveWorkers_;
    }

    auto workerFinished() -> void {
        {
            std::lock_guard<std::mutex> lock(workersMutex_);
            --liveWorkers_;
        }
        workersCv_.notify_all();
    }

    // Returns false when workers were still running after `timeout`.
    auto waitForWorkers(std::chrono::milliseconds timeout) -> bool {
        std::unique_lock<std::mutex> lock(workersMutex_);
        return workersCv_.wait_for(lock, timeout, [this] { return liveWorkers_ == 0; });
    }

    [[nodiscard]] auto liveWorkers() const -> std::size_t {
        std::lock_guard<std::mutex> lock(workersMutex_);
        return liveWorkers_;
    }

private:
    std::shared_ptr<LoopProxy>  proxy_;
    AppOptions const            options_;

    mutable std::mutex          mutex_;
    std::deque<LoopMessage<M>>  queue_;
    State                       state_ = State::Pending;

    mutable std::mutex          workersMutex_;
    std::condition_variable     workersCv_;
    std::size_t                 liveWorkers_ = 0;
};

} // namespace WS
