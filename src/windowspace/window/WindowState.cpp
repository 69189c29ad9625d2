#include <windowspace/window/WindowState.hpp>

#include <type_traits>

namespace WS {

auto WindowState::fromWindow(PlatformWindow const& window) -> WindowState {
    WindowState state;
    state.innerSize_     = window.innerSize();
    state.outerSize_     = window.outerSize();
    state.innerPosition_ = window.innerPosition().value_or(WindowPosition{});
    state.outerPosition_ = window.outerPosition().value_or(WindowPosition{});
    state.scale_         = window.scaleFactor();
    state.occluded_      = !window.isVisible().value_or(true);
    state.focused_       = window.hasFocus();
    state.theme_         = window.theme().value_or(Theme::Dark);
    return state;
}

auto WindowState::setSizes(WindowSize inner, WindowSize outer) -> void {
    innerSize_ = inner;
    outerSize_ = outer;
}

auto WindowState::apply(WindowEvent const& event, PlatformWindow const& window) -> StateUpdate {
    return std::visit(
        [&](auto const& ev) -> StateUpdate {
            using T = std::decay_t<decltype(ev)>;
            if constexpr (std::is_same_v<T, Event::Resized>) {
                auto const newOuter          = window.outerSize();
                bool const outerSizeChanged  = newOuter != outerSize_;
                outerSize_                   = newOuter;
                if (outerSizeChanged || innerSize_ != ev.size) {
                    innerSize_ = ev.size;
                    return StateUpdate{true, false};
                }
                return StateUpdate{false, false};
            } else if constexpr (std::is_same_v<T, Event::Moved>) {
                auto const newInner = window.innerPosition().value_or(WindowPosition{});
                if (outerPosition_ != ev.position || innerPosition_ != newInner) {
                    outerPosition_ = ev.position;
                    innerPosition_ = newInner;
                    return StateUpdate{true, false};
                }
                return StateUpdate{false, false};
            } else if constexpr (std::is_same_v<T, Event::ScaleFactorChanged>) {
                // Sizes and scale are refreshed together before any callback runs.
                auto const newInner = window.innerSize();
                auto const newOuter = window.outerSize();
                bool const resized  = newInner != innerSize_ || newOuter != outerSize_;
                scale_              = ev.scale_factor;
                innerSize_          = newInner;
                outerSize_          = newOuter;
                return StateUpdate{true, resized};
            } else if constexpr (std::is_same_v<T, Event::Focused>) {
                focused_ = ev.focused;
            } else if constexpr (std::is_same_v<T, Event::Occluded>) {
                occluded_ = ev.occluded;
            } else if constexpr (std::is_same_v<T, Event::ThemeChanged>) {
                theme_ = ev.theme;
            } else if constexpr (std::is_same_v<T, Event::ModifiersChanged>) {
                modifiers_ = ev.modifiers;
            } else if constexpr (std::is_same_v<T, Event::KeyboardInput>) {
                if (ev.event.state == ElementState::Pressed) {
                    keys_.insert(ev.event.physical_key);
                } else {
                    keys_.erase(ev.event.physical_key);
                }
            } else if constexpr (std::is_same_v<T, Event::MouseInput>) {
                if (ev.state == ElementState::Pressed) {
                    mouseButtons_.insert(ev.button);
                } else {
                    mouseButtons_.erase(ev.button);
                }
            } else if constexpr (std::is_same_v<T, Event::CursorMoved>) {
                cursorPosition_ = ev.position;
            } else if constexpr (std::is_same_v<T, Event::CursorLeft>) {
                cursorPosition_.reset();
            }
            return StateUpdate{};
        },
        event);
}

auto WindowState::pressedKeys() const -> std::vector<PhysicalKey> {
    return std::vector<PhysicalKey>(keys_.begin(), keys_.end());
}

auto WindowState::pressedMouseButtons() const -> std::vector<MouseButton> {
    return std::vector<MouseButton>(mouseButtons_.begin(), mouseButtons_.end());
}

} // namespace WS
