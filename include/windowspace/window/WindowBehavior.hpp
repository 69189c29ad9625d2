#pragma once

#include <windowspace/app/Message.hpp>
#include <windowspace/platform/WindowEvent.hpp>

#include <concepts>
#include <expected>

namespace WS {

template <Message M>
class RunningWindow;

/**
 * WindowBehavior — per-window application logic, run on the window's worker.
 *
 * A behavior type derives from WindowBehavior<M> and provides
 *
 *   using Context = ...;
 *   static auto initialize(RunningWindow<M>& window, Context context)
 *       -> std::expected<Behavior, typename M::Error>;
 *   auto redraw(RunningWindow<M>& window) -> void override;
 *
 * Every other callback defaults to doing nothing. Callbacks that report a
 * change of window attributes take no arguments: the new values are already
 * visible through the RunningWindow when they run.
 *
 * The behavior is destroyed on the worker thread before the dispatcher learns
 * that the window closed. An exception escaping any callback faults the
 * window; it is never rethrown on another thread.
 */
template <Message M>
class WindowBehavior {
public:
    using AppMessage = M;

    virtual ~WindowBehavior() = default;

    virtual auto redraw(RunningWindow<M>& window) -> void = 0;

    // Called once after initialize(). When visibility was delayed the window
    // has been redrawn once and shown by then.
    virtual auto initialized(RunningWindow<M>& /*window*/) -> void {}
    // Return false to keep the window open.
    virtual auto closeRequested(RunningWindow<M>& /*window*/) -> bool { return true; }
    virtual auto event(RunningWindow<M>& /*window*/, typename M::Window /*message*/) -> void {}

    virtual auto resized(RunningWindow<M>& /*window*/) -> void {}
    virtual auto moved(RunningWindow<M>& /*window*/) -> void {}
    virtual auto focusChanged(RunningWindow<M>& /*window*/) -> void {}
    virtual auto occlusionChanged(RunningWindow<M>& /*window*/) -> void {}
    virtual auto scaleFactorChanged(RunningWindow<M>& /*window*/) -> void {}
    virtual auto themeChanged(RunningWindow<M>& /*window*/) -> void {}
    virtual auto modifiersChanged(RunningWindow<M>& /*window*/) -> void {}

    virtual auto droppedFile(RunningWindow<M>& /*window*/, Event::DroppedFile const& /*event*/) -> void {}
    virtual auto hoveredFile(RunningWindow<M>& /*window*/, Event::HoveredFile const& /*event*/) -> void {}
    virtual auto hoveredFileCancelled(RunningWindow<M>& /*window*/) -> void {}
    virtual auto keyboardInput(RunningWindow<M>& /*window*/, Event::KeyboardInput const& /*event*/) -> void {}
    virtual auto ime(RunningWindow<M>& /*window*/, Event::ImeInput const& /*event*/) -> void {}
    virtual auto cursorMoved(RunningWindow<M>& /*window*/, Event::CursorMoved const& /*event*/) -> void {}
    virtual auto cursorEntered(RunningWindow<M>& /*window*/, Event::CursorEntered const& /*event*/) -> void {}
    virtual auto cursorLeft(RunningWindow<M>& /*window*/, Event::CursorLeft const& /*event*/) -> void {}
    virtual auto mouseWheel(RunningWindow<M>& /*window*/, Event::MouseWheel const& /*event*/) -> void {}
    virtual auto mouseInput(RunningWindow<M>& /*window*/, Event::MouseInput const& /*event*/) -> void {}
    virtual auto touchpadPressure(RunningWindow<M>& /*window*/, Event::TouchpadPressure const& /*event*/) -> void {}
    virtual auto axisMotion(RunningWindow<M>& /*window*/, Event::AxisMotion const& /*event*/) -> void {}
    virtual auto touch(RunningWindow<M>& /*window*/, Event::TouchInput const& /*event*/) -> void {}
    virtual auto pinchGesture(RunningWindow<M>& /*window*/, Event::PinchGesture const& /*event*/) -> void {}
    virtual auto panGesture(RunningWindow<M>& /*window*/, Event::PanGesture const& /*event*/) -> void {}
    virtual auto doubleTapGesture(RunningWindow<M>& /*window*/, Event::DoubleTapGesture const& /*event*/) -> void {}
    virtual auto rotationGesture(RunningWindow<M>& /*window*/, Event::RotationGesture const& /*event*/) -> void {}
    virtual auto activationTokenDone(RunningWindow<M>& /*window*/, Event::ActivationTokenDone const& /*event*/) -> void {}
};

template <typename B>
concept Behavior = requires {
    typename B::AppMessage;
    typename B::Context;
} && std::derived_from<B, WindowBehavior<typename B::AppMessage>> && std::movable<B>
  && requires(RunningWindow<typename B::AppMessage>& window, typename B::Context context) {
         { B::initialize(window, std::move(context)) }
             -> std::same_as<std::expected<B, typename B::AppMessage::Error>>;
     };

} // namespace WS
