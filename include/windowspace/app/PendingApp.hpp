#pragma once

#include <windowspace/app/App.hpp>
#include <windowspace/app/Application.hpp>
#include <windowspace/app/ExecutingApp.hpp>
#include <windowspace/app/LoopMessage.hpp>
#include <windowspace/app/Windows.hpp>
#include <windowspace/core/AppOptions.hpp>
#include <windowspace/log/TaggedLogger.hpp>
#include <windowspace/platform/Platform.hpp>

#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace WS {

/**
 * PendingApp — an application whose loop has not started yet.
 *
 * Windows opened before run() are buffered and created once the platform
 * reports the loop active. run() turns the calling thread into the
 * dispatcher: it drives the platform loop, routes platform events to window
 * mailboxes and serves the requests posted through App handles and window
 * workers. It returns once the last window closed with no shutdown guard held,
 * after waiting (bounded by AppOptions::worker_exit_timeout) for the worker
 * threads to finish.
 *
 * Exit status
 * -----------
 * - AppOptions::exit_code_success when the last window closed normally or the
 *   last shutdown guard was released.
 * - AppOptions::exit_code_fault when the close that emptied the registry came
 *   from a window whose behavior threw.
 */
template <Message M>
class PendingApp final : public Application<M> {
public:
    using Response      = typename M::Response;
    using Error         = typename M::Error;
    using Callback      = std::function<Response(M, ExecutingApp<M>&)>;
    using ErrorCallback = std::function<void(Error, ExecutingApp<M>&)>;
    using FaultCallback = std::function<void(WindowId, std::exception_ptr)>;

    explicit PendingApp(Platform& platform, AppOptions options = {})
        : platform_(platform),
          requests_(std::make_shared<LoopRequests<M>>(platform.proxy(), std::move(options))) {}

    PendingApp(Platform& platform, Callback callback, AppOptions options = {})
        : PendingApp(platform, std::move(options)) {
        callback_ = std::move(callback);
    }

    PendingApp(PendingApp const&)                    = delete;
    auto operator=(PendingApp const&) -> PendingApp& = delete;

    static auto create(Platform& platform, AppOptions options = {}) -> Expected<std::unique_ptr<PendingApp>> {
        if (auto invalid = ValidateAppOptions(options)) {
            return std::unexpected(Error{Error::Code::InvalidConfiguration, *invalid});
        }
        return std::make_unique<PendingApp>(platform, std::move(options));
    }

    // Answers App<M>::send. Without one, senders receive std::nullopt.
    auto onEvent(Callback callback) -> PendingApp& {
        callback_ = std::move(callback);
        return *this;
    }

    // Receives App<M>::sendError and window initialization failures.
    auto onError(ErrorCallback callback) -> PendingApp& {
        errorCallback_ = std::move(callback);
        return *this;
    }

    // Observes exceptions that escaped a window's behavior.
    auto onWindowFault(FaultCallback callback) -> PendingApp& {
        faultCallback_ = std::move(callback);
        return *this;
    }

    auto app() const -> App<M> override { return App<M>{requests_}; }

    auto openWindow(WindowAttributes attributes,
                    std::shared_ptr<EventSink> sink,
                    OpenedWindow opened,
                    WindowSpawner spawner) -> Expected<OpenStatus> override {
        {
            std::lock_guard<std::mutex> lock(pendingMutex_);
            if (requests_->state() == LoopRequests<M>::State::Pending) {
                pending_.push_back(
                        PendingWindow{std::move(attributes), std::move(sink), std::move(opened), std::move(spawner)});
                return OpenStatus::Deferred;
            }
        }
        return this->app().openWindow(std::move(attributes), std::move(sink), std::move(opened), std::move(spawner));
    }

    [[nodiscard]] auto windows() const -> Windows const& { return windows_; }
    [[nodiscard]] auto options() const -> AppOptions const& { return requests_->options(); }

    // Runs the application on the calling thread. May only be called once.
    auto run() -> int {
        auto const& options = requests_->options();
        if (ran_) {
            ws_log("PendingApp::run called more than once", "Dispatcher", "Error");
            return options.exit_code_fault;
        }
        ran_ = true;
        if (options.logging_enabled) {
            set_logging_enabled(true);
        }
        set_thread_name("Dispatcher");

        Dispatcher dispatcher{*this};
        int const  code = platform_.run(dispatcher);

        if (!requests_->waitForWorkers(options.worker_exit_timeout)) {
            ws_log("Workers still running after " + std::to_string(options.worker_exit_timeout.count()) + "ms: "
                           + std::to_string(requests_->liveWorkers()),
                   "Dispatcher", "Warning");
        }
        ws_log("PendingApp::run finished with " + std::to_string(code), "Dispatcher");
        return code;
    }

private:
    struct PendingWindow {
        WindowAttributes           attributes;
        std::shared_ptr<EventSink> sink;
        OpenedWindow               opened;
        WindowSpawner              spawner;
    };

    class Dispatcher final : public LoopHandler {
    public:
        explicit Dispatcher(PendingApp& owner)
            : owner_(owner) {}

        auto resumed(LoopTarget& target) -> void override {
            if (resumed_) {
                return;
            }
            resumed_ = true;
            std::vector<PendingWindow> pending;
            {
                // Openers that lose this race go through the request queue.
                std::lock_guard<std::mutex> lock(owner_.pendingMutex_);
                owner_.requests_->markRunning();
                pending = std::exchange(owner_.pending_, {});
            }
            for (auto& window : pending) {
                auto created = owner_.windows_.open(target, window.attributes, std::move(window.sink), window.opened);
                if (!created) {
                    ws_log("Buffered window failed to open: " + describeError(created.error()), "Dispatcher", "Error");
                    continue;
                }
                window.spawner(window.opened);
            }
            this->process(target, owner_.requests_->drain());

            if (!exitRequested_ && owner_.windows_.shouldShutdown()) {
                ws_log("No window open after start", "Dispatcher");
                this->exit(target, owner_.options().exit_code_success);
            }
        }

        auto windowEvent(LoopTarget& target, WindowId id, WindowEvent event) -> void override {
            if (std::holds_alternative<Event::Destroyed>(event)) {
                ws_log(to_string(id) + " destroyed by the platform", "Dispatcher");
                if (owner_.windows_.close(id) && !exitRequested_) {
                    this->exit(target, owner_.options().exit_code_success);
                }
                return;
            }
            if (owner_.windows_.send(id, std::move(event)) == SendStatus::NotFound) {
                ws_log("Event for unknown " + to_string(id), "Dispatcher", "Trace");
            }
        }

        auto redrawRequested(LoopTarget& /*target*/, WindowId id) -> void override {
            if (owner_.windows_.send(id, Event::RedrawRequested{}) == SendStatus::NotFound) {
                ws_log("Redraw for unknown " + to_string(id), "Dispatcher", "Trace");
            }
        }

        auto wakeUp(LoopTarget& target) -> void override {
            this->process(target, owner_.requests_->drain());
        }

        auto systemThemeChanged(LoopTarget& /*target*/, Theme theme) -> void override {
            auto delivered = owner_.windows_.broadcast(Event::ThemeChanged{theme});
            ws_log("Theme change delivered to " + std::to_string(delivered) + " windows", "Dispatcher");
        }

        auto exiting(LoopTarget& /*target*/) -> void override {
            // Dropping the queue disconnects the reply channels of blocked callers.
            auto dropped = owner_.requests_->stop();
            if (!dropped.empty()) {
                ws_log("Dropping " + std::to_string(dropped.size()) + " requests at exit", "Dispatcher");
            }
            dropped.clear();
            auto closed = owner_.windows_.closeAll();
            ws_log("Loop exiting; destroyed " + std::to_string(closed) + " windows", "Dispatcher");
        }

    private:
        auto exit(LoopTarget& target, int code) -> void {
            exitRequested_ = true;
            ws_log("Exiting loop with " + std::to_string(code), "Dispatcher");
            target.exit(code);
        }

        auto process(LoopTarget& target, std::deque<LoopMessage<M>> messages) -> void {
            for (auto& message : messages) {
                if (exitRequested_) {
                    break;
                }
                std::visit([&](auto& request) { this->handle(target, request); }, message);
            }
        }

        auto handle(LoopTarget& target, Loop::OpenWindow& request) -> void {
            auto created = owner_.windows_.open(target, request.attributes, std::move(request.sink), request.opened);
            if (!created) {
                if (!request.reply.trySend(std::unexpected(created.error()))) {
                    ws_log("Open requester went away", "Dispatcher");
                }
                return;
            }
            if (!request.reply.trySend((*created)->id())) {
                ws_log("Open requester went away before " + to_string((*created)->id()) + " opened", "Dispatcher");
            }
            request.spawner(request.opened);
        }

        auto handle(LoopTarget& target, Loop::CloseWindow& request) -> void {
            if (owner_.windows_.close(request.id)) {
                this->exit(target, owner_.options().exit_code_success);
            }
        }

        auto handle(LoopTarget& target, Loop::WindowPanic& request) -> void {
            ws_log(to_string(request.id) + " panicked: " + describeException(request.fault), "Dispatcher", "Error");
            if (owner_.faultCallback_) {
                owner_.faultCallback_(request.id, request.fault);
            }
            if (owner_.windows_.close(request.id)) {
                this->exit(target, owner_.options().exit_code_fault);
            }
        }

        auto handle(LoopTarget& /*target*/, Loop::PreventShutdown& /*request*/) -> void {
            owner_.windows_.preventShutdown();
        }

        auto handle(LoopTarget& target, Loop::AllowShutdown& /*request*/) -> void {
            if (owner_.windows_.allowShutdown()) {
                this->exit(target, owner_.options().exit_code_success);
            }
        }

        auto handle(LoopTarget& target, Loop::User<M>& request) -> void {
            if (!owner_.callback_) {
                ws_log("No application callback; dropping message", "Dispatcher", "Warning");
                return;
            }
            ExecutingApp<M> executing(owner_.windows_, target, owner_.app());
            auto            response = owner_.callback_(std::move(request.message), executing);
            if (!request.reply.trySend(std::move(response))) {
                ws_log("Sender went away before the response was ready", "Dispatcher");
            }
        }

        auto handle(LoopTarget& target, Loop::AppError<M>& request) -> void {
            if (!owner_.errorCallback_) {
                ws_log("No error callback; dropping application error", "Dispatcher", "Warning");
                return;
            }
            ExecutingApp<M> executing(owner_.windows_, target, owner_.app());
            owner_.errorCallback_(std::move(request.error), executing);
        }

        PendingApp& owner_;
        bool        resumed_       = false;
        bool        exitRequested_ = false;
    };

    Platform&                        platform_;
    std::shared_ptr<LoopRequests<M>> requests_;
    Windows                          windows_;
    std::mutex                       pendingMutex_;
    std::vector<PendingWindow>       pending_;
    Callback                         callback_;
    ErrorCallback                    errorCallback_;
    FaultCallback                    faultCallback_;
    bool                             ran_ = false;
};

} // namespace WS
