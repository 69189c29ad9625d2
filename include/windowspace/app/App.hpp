#pragma once

#include <windowspace/app/Application.hpp>
#include <windowspace/app/LoopMessage.hpp>
#include <windowspace/core/Channel.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <utility>

namespace WS {

/**
 * Keeps the application running while no window is open. Copies share one
 * guard; the guard is released when the last copy is destroyed.
 */
class ShutdownGuard {
public:
    ShutdownGuard() = default;
    explicit ShutdownGuard(std::function<void()> release)
        : state_(std::make_shared<Releaser>(std::move(release))) {}

    [[nodiscard]] auto active() const -> bool { return state_ != nullptr; }

    // Releases this copy early.
    auto reset() -> void { state_.reset(); }

private:
    struct Releaser {
        explicit Releaser(std::function<void()> fn)
            : release(std::move(fn)) {}
        ~Releaser() {
            if (release) {
                release();
            }
        }
        Releaser(Releaser const&)                    = delete;
        auto operator=(Releaser const&) -> Releaser& = delete;

        std::function<void()> release;
    };

    std::shared_ptr<Releaser> state_;
};

/**
 * App — cheap, copyable handle to the running application, usable from any
 * thread. Every operation is a request to the dispatcher; the blocking ones
 * return std::nullopt instead of waiting when the loop is not running.
 */
template <Message M>
class App final : public Application<M> {
public:
    using Response = typename M::Response;
    using Error    = typename M::Error;

    explicit App(std::shared_ptr<LoopRequests<M>> requests)
        : requests_(std::move(requests)) {}

    // Blocks until the application callback has answered. std::nullopt when the
    // loop is not running or stopped before answering.
    auto send(M message) const -> std::optional<Response> {
        if (!requests_->isRunning()) {
            return std::nullopt;
        }
        auto [reply, response] = makeChannel<Response>(1);
        if (!requests_->post(Loop::User<M>{std::move(message), std::move(reply)})) {
            return std::nullopt;
        }
        auto answer = response.receive();
        if (!answer) {
            return std::nullopt;
        }
        return std::move(*answer);
    }

    // Hands `error` to the application's error callback. False once stopped.
    auto sendError(Error error) const -> bool {
        return requests_->post(Loop::AppError<M>{std::move(error)});
    }

    // The returned guard is inert when the application has already stopped.
    [[nodiscard]] auto preventShutdown() const -> ShutdownGuard {
        if (!requests_->post(Loop::PreventShutdown{})) {
            return ShutdownGuard{};
        }
        return ShutdownGuard{[requests = requests_] { requests->post(Loop::AllowShutdown{}); }};
    }

    [[nodiscard]] auto isRunning() const -> bool {
        return requests_->isRunning();
    }

    [[nodiscard]] auto options() const -> AppOptions const& {
        return requests_->options();
    }

    auto app() const -> App<M> override {
        return *this;
    }

    auto openWindow(WindowAttributes attributes,
                    std::shared_ptr<EventSink> sink,
                    OpenedWindow opened,
                    WindowSpawner spawner) -> Expected<OpenStatus> override {
        if (!requests_->isRunning()) {
            return OpenStatus::Unavailable;
        }
        auto [reply, response] = makeChannel<Expected<WindowId>>(1);
        Loop::OpenWindow request{std::move(attributes), std::move(sink), std::move(opened), std::move(spawner), std::move(reply)};
        if (!requests_->post(std::move(request))) {
            return OpenStatus::Unavailable;
        }
        auto answer = response.receive();
        if (!answer) {
            return OpenStatus::Unavailable;
        }
        if (!*answer) {
            return std::unexpected(answer->error());
        }
        return OpenStatus::Opened;
    }

    // Dispatcher plumbing; used by the worker and the window builder.
    [[nodiscard]] auto requests() const -> std::shared_ptr<LoopRequests<M>> const& {
        return requests_;
    }

private:
    std::shared_ptr<LoopRequests<M>> requests_;
};

} // namespace WS
