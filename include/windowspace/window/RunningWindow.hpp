#pragma once

#include <windowspace/app/App.hpp>
#include <windowspace/app/Application.hpp>
#include <windowspace/log/TaggedLogger.hpp>
#include <windowspace/window/Mailbox.hpp>
#include <windowspace/window/RedrawSchedule.hpp>
#include <windowspace/window/Window.hpp>
#include <windowspace/window/WindowBehavior.hpp>
#include <windowspace/window/WindowState.hpp>

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace WS {

struct WindowClosed {};

template <typename E>
struct WindowInitError {
    E error;
};

struct WindowFault {
    std::exception_ptr fault;
};

// How a window worker finished.
template <typename E>
using WindowOutcome = std::variant<WindowClosed, WindowInitError<E>, WindowFault>;

/**
 * RunningWindow — the worker-side view of one open window.
 *
 * Owned by the window's worker thread and handed to every behavior callback.
 * It mirrors the platform window's attributes (updated before the callback for
 * the corresponding event runs), owns the redraw schedule and the receiving
 * end of the mailbox, and can open further windows or talk to the
 * application through App<M>. The mailbox's sending end belongs to the
 * registry; the worker only holds it weakly.
 */
template <Message M>
class RunningWindow final : public Application<M> {
public:
    using WindowMessageType = typename M::Window;
    using Error             = typename M::Error;

    RunningWindow(std::shared_ptr<PlatformWindow>                window,
                  OpenedWindow                                   opened,
                  std::weak_ptr<MailboxSink<WindowMessageType>>   sink,
                  ChannelReceiver<WindowMessage<WindowMessageType>> receiver,
                  App<M>                                         app,
                  std::optional<bool>                            showAfterInit)
        : window_(std::move(window)),
          id_(window_->id()),
          opened_(std::move(opened)),
          sink_(std::move(sink)),
          receiver_(std::move(receiver)),
          app_(std::move(app)),
          state_(WindowState::fromWindow(*window_)),
          showAfterInit_(showAfterInit) {}

    RunningWindow(RunningWindow&&) noexcept            = default;
    auto operator=(RunningWindow&&) -> RunningWindow& = delete;

    // Starts the worker thread for `window` running behavior `B`.
    template <Behavior B>
    static auto spawn(RunningWindow window, typename B::Context context) -> void {
        auto requests = window.app_.requests();
        auto id       = window.id_;
        requests->workerStarted();
        try {
            std::thread worker([window = std::move(window), context = std::move(context)]() mutable {
                RunningWindow::workerMain<B>(std::move(window), std::move(context));
            });
            worker.detach();
        } catch (std::system_error const& e) {
            ws_log("Failed to start worker for " + to_string(id) + ": " + e.what(), "Worker", "Error");
            requests->workerFinished();
            if (!requests->post(Loop::CloseWindow{id})) {
                ws_log("Loop already stopped while closing " + to_string(id), "Worker");
            }
        }
    }

    // Runs behavior `B` on the calling thread until the window closes.
    template <Behavior B>
    auto run(typename B::Context context) -> WindowOutcome<Error> {
        try {
            auto initialized = B::initialize(*this, std::move(context));
            if (!initialized) {
                return WindowInitError<Error>{std::move(initialized.error())};
            }
            B& behavior = *initialized;

            // Hidden until the behavior has drawn once.
            if (showAfterInit_) {
                redraw_.clear();
                state_.setSizes(window_->innerSize(), window_->outerSize());
                behavior.redraw(*this);
                window_->setVisible(true);
                if (*showAfterInit_) {
                    window_->focusWindow();
                }
                // The state was captured while the window was still hidden.
                state_.apply(Event::Occluded{false}, *window_);
                state_.apply(Event::Focused{window_->hasFocus()}, *window_);
            }

            behavior.initialized(*this);

            while (!closing_) {
                if (!this->processUntilRedraw(behavior)) {
                    break;
                }
                redraw_.clear();
                // Resized events may have been dropped on a full mailbox.
                state_.setSizes(window_->innerSize(), window_->outerSize());
                behavior.redraw(*this);
            }
            ws_log(to_string(id_) + " worker leaving", "Worker");
            return WindowClosed{};
        } catch (...) {
            return WindowFault{std::current_exception()};
        }
    }

    [[nodiscard]] auto id() const -> WindowId { return id_; }
    [[nodiscard]] auto window() const -> PlatformWindow& { return *window_; }
    [[nodiscard]] auto handle() const -> Window<WindowMessageType> {
        return Window<WindowMessageType>{opened_, sink_};
    }

    auto app() const -> App<M> override { return app_; }

    // Round trip through the dispatcher; blocks until the window exists.
    auto openWindow(WindowAttributes attributes,
                    std::shared_ptr<EventSink> sink,
                    OpenedWindow opened,
                    WindowSpawner spawner) -> Expected<OpenStatus> override {
        return app_.openWindow(std::move(attributes), std::move(sink), std::move(opened), std::move(spawner));
    }

    [[nodiscard]] auto innerSize() const -> WindowSize { return state_.innerSize(); }
    [[nodiscard]] auto outerSize() const -> WindowSize { return state_.outerSize(); }
    [[nodiscard]] auto innerPosition() const -> WindowPosition { return state_.innerPosition(); }
    [[nodiscard]] auto outerPosition() const -> WindowPosition { return state_.outerPosition(); }
    [[nodiscard]] auto cursorPosition() const -> std::optional<CursorPosition> { return state_.cursorPosition(); }
    [[nodiscard]] auto scale() const -> double { return state_.scale(); }
    [[nodiscard]] auto occluded() const -> bool { return state_.occluded(); }
    [[nodiscard]] auto focused() const -> bool { return state_.focused(); }
    [[nodiscard]] auto theme() const -> Theme { return state_.theme(); }
    [[nodiscard]] auto modifiers() const -> Modifiers { return state_.modifiers(); }
    [[nodiscard]] auto pressedKeys() const -> std::vector<PhysicalKey> { return state_.pressedKeys(); }
    [[nodiscard]] auto keyPressed(PhysicalKey key) const -> bool { return state_.keyPressed(key); }
    [[nodiscard]] auto pressedMouseButtons() const -> std::vector<MouseButton> { return state_.pressedMouseButtons(); }
    [[nodiscard]] auto mouseButtonPressed(MouseButton button) const -> bool { return state_.mouseButtonPressed(button); }

    [[nodiscard]] auto title() const -> std::string { return window_->title(); }
    auto setTitle(std::string const& title) -> void { window_->setTitle(title); }
    auto setMinInnerSize(std::optional<WindowSize> size) -> void { window_->setMinInnerSize(size); }
    auto setMaxInnerSize(std::optional<WindowSize> size) -> void { window_->setMaxInnerSize(size); }
    auto setOuterPosition(WindowPosition position) -> void { window_->setOuterPosition(position); }

    // When the platform applies the size right away the cached sizes follow;
    // otherwise a Resized event arrives later.
    auto requestInnerSize(WindowSize size) -> void {
        if (auto applied = window_->requestInnerSize(size)) {
            state_.setSizes(*applied, window_->outerSize());
        }
    }

    auto setNeedsRedraw() -> void { redraw_.setNeedsRedraw(); }
    auto redrawAt(RedrawClock::time_point instant) -> void { redraw_.redrawAt(instant); }
    auto redrawIn(RedrawClock::duration duration) -> void { redraw_.redrawIn(duration); }
    [[nodiscard]] auto redrawTarget() const -> std::optional<RedrawTarget> { return redraw_.target(); }

    // The worker stops once the current callback returns. No further redraw
    // happens.
    auto close() -> void { closing_ = true; }
    [[nodiscard]] auto closing() const -> bool { return closing_; }

private:
    template <Behavior B>
    static auto workerMain(RunningWindow window, typename B::Context context) -> void {
        auto requests = window.app_.requests();
        auto id       = window.id_;
        set_thread_name("Window " + std::to_string(id.value));
        {
            RunningWindow running = std::move(window);
            auto          outcome = running.template run<B>(std::move(context));
            auto report = [&](LoopMessage<M> message) {
                if (!requests->post(std::move(message))) {
                    ws_log("Loop stopped before " + to_string(id) + " could report", "Worker");
                }
            };
            std::visit(
                [&](auto& result) {
                    using T = std::decay_t<decltype(result)>;
                    if constexpr (std::is_same_v<T, WindowClosed>) {
                        report(Loop::CloseWindow{id});
                    } else if constexpr (std::is_same_v<T, WindowFault>) {
                        ws_log(to_string(id) + " faulted: " + describeException(result.fault), "Worker", "Error");
                        report(Loop::WindowPanic{id, result.fault});
                    } else {
                        ws_log(to_string(id) + " failed to initialize", "Worker", "Error");
                        report(Loop::AppError<M>{std::move(result.error)});
                        report(Loop::CloseWindow{id});
                    }
                },
                outcome);
        }
        requests->workerFinished();
    }

    // Returns false when the worker should stop.
    template <Behavior B>
    auto processUntilRedraw(B& behavior) -> bool {
        while (true) {
            auto const wait = redraw_.wait();
            std::expected<WindowMessage<WindowMessageType>, ReceiveError> message =
                    std::unexpected(ReceiveError::Empty);
            switch (wait.mode) {
            case RedrawWait::Mode::Poll:
                message = receiver_.tryReceive();
                break;
            case RedrawWait::Mode::Timed:
                message = receiver_.receiveFor(wait.remaining);
                break;
            case RedrawWait::Mode::Indefinite:
                message = receiver_.receive();
                break;
            }
            if (!message) {
                return message.error() != ReceiveError::Disconnected;
            }

            auto const step = this->handleMessage(std::move(*message), behavior);
            if (step == Step::Stop || closing_) {
                return false;
            }
            if (step == Step::Redraw) {
                return true;
            }
        }
    }

    enum class Step {
        Continue,
        Redraw,
        Stop,
    };

    template <Behavior B>
    auto handleMessage(WindowMessage<WindowMessageType> message, B& behavior) -> Step {
        if (auto* user = std::get_if<UserMessage<WindowMessageType>>(&message.payload)) {
            behavior.event(*this, std::move(user->message));
            return Step::Continue;
        }
        auto& event = std::get<WindowEvent>(message.payload);
        if (std::holds_alternative<Event::Destroyed>(event)) {
            ws_log(to_string(id_) + " destroyed by the platform", "Worker");
            return Step::Stop;
        }
        if (std::holds_alternative<Event::RedrawRequested>(event)) {
            redraw_.setNeedsRedraw();
            return Step::Redraw;
        }
        if (std::holds_alternative<Event::CloseRequested>(event)) {
            if (behavior.closeRequested(*this)) {
                this->close();
            }
            return Step::Continue;
        }

        auto const update = state_.apply(event, *window_);
        if (update.notify) {
            this->dispatch(event, behavior);
        }
        if (update.resized) {
            behavior.resized(*this);
        }
        return Step::Continue;
    }

    template <Behavior B>
    auto dispatch(WindowEvent const& event, B& behavior) -> void {
        std::visit(
            [&](auto const& ev) {
                using T = std::decay_t<decltype(ev)>;
                if constexpr (std::is_same_v<T, Event::Resized>) {
                    behavior.resized(*this);
                } else if constexpr (std::is_same_v<T, Event::Moved>) {
                    behavior.moved(*this);
                } else if constexpr (std::is_same_v<T, Event::Focused>) {
                    behavior.focusChanged(*this);
                } else if constexpr (std::is_same_v<T, Event::Occluded>) {
                    behavior.occlusionChanged(*this);
                } else if constexpr (std::is_same_v<T, Event::ScaleFactorChanged>) {
                    behavior.scaleFactorChanged(*this);
                } else if constexpr (std::is_same_v<T, Event::ThemeChanged>) {
                    behavior.themeChanged(*this);
                } else if constexpr (std::is_same_v<T, Event::ModifiersChanged>) {
                    behavior.modifiersChanged(*this);
                } else if constexpr (std::is_same_v<T, Event::DroppedFile>) {
                    behavior.droppedFile(*this, ev);
                } else if constexpr (std::is_same_v<T, Event::HoveredFile>) {
                    behavior.hoveredFile(*this, ev);
                } else if constexpr (std::is_same_v<T, Event::HoveredFileCancelled>) {
                    behavior.hoveredFileCancelled(*this);
                } else if constexpr (std::is_same_v<T, Event::KeyboardInput>) {
                    behavior.keyboardInput(*this, ev);
                } else if constexpr (std::is_same_v<T, Event::ImeInput>) {
                    behavior.ime(*this, ev);
                } else if constexpr (std::is_same_v<T, Event::CursorMoved>) {
                    behavior.cursorMoved(*this, ev);
                } else if constexpr (std::is_same_v<T, Event::CursorEntered>) {
                    behavior.cursorEntered(*this, ev);
                } else if constexpr (std::is_same_v<T, Event::CursorLeft>) {
                    behavior.cursorLeft(*this, ev);
                } else if constexpr (std::is_same_v<T, Event::MouseWheel>) {
                    behavior.mouseWheel(*this, ev);
                } else if constexpr (std::is_same_v<T, Event::MouseInput>) {
                    behavior.mouseInput(*this, ev);
                } else if constexpr (std::is_same_v<T, Event::TouchpadPressure>) {
                    behavior.touchpadPressure(*this, ev);
                } else if constexpr (std::is_same_v<T, Event::AxisMotion>) {
                    behavior.axisMotion(*this, ev);
                } else if constexpr (std::is_same_v<T, Event::TouchInput>) {
                    behavior.touch(*this, ev);
                } else if constexpr (std::is_same_v<T, Event::PinchGesture>) {
                    behavior.pinchGesture(*this, ev);
                } else if constexpr (std::is_same_v<T, Event::PanGesture>) {
                    behavior.panGesture(*this, ev);
                } else if constexpr (std::is_same_v<T, Event::DoubleTapGesture>) {
                    behavior.doubleTapGesture(*this, ev);
                } else if constexpr (std::is_same_v<T, Event::RotationGesture>) {
                    behavior.rotationGesture(*this, ev);
                } else if constexpr (std::is_same_v<T, Event::ActivationTokenDone>) {
                    behavior.activationTokenDone(*this, ev);
                }
                // RedrawRequested, CloseRequested and Destroyed are handled
                // before the state update.
            },
            event);
    }

    std::shared_ptr<PlatformWindow>                    window_;
    WindowId                                           id_;
    OpenedWindow                                       opened_;
    std::weak_ptr<MailboxSink<WindowMessageType>>      sink_;
    ChannelReceiver<WindowMessage<WindowMessageType>>  receiver_;
    App<M>                                             app_;
    WindowState                                        state_;
    RedrawSchedule                                     redraw_;
    std::optional<bool>                                showAfterInit_;
    bool                                               closing_ = false;
};

} // namespace WS
