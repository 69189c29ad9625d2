#pragma once

#include <windowspace/platform/Input.hpp>
#include <windowspace/platform/Platform.hpp>
#include <windowspace/platform/WindowEvent.hpp>

#include <parallel_hashmap/phmap.h>

#include <optional>
#include <vector>

namespace WS {

// Which behavior callbacks a platform event should trigger after the cached
// state has been updated.
struct StateUpdate {
    bool notify  = true;
    // Set when a scale factor change also changed the window's sizes.
    bool resized = false;
};

/**
 * Worker-side mirror of a platform window's attributes. Owned and mutated by
 * the window's worker thread only; apply() runs before the behavior callback
 * for the event so callbacks always observe the updated values.
 */
class WindowState {
public:
    using KeySet    = phmap::flat_hash_set<PhysicalKey>;
    using ButtonSet = phmap::flat_hash_set<MouseButton>;

    WindowState() = default;

    static auto fromWindow(PlatformWindow const& window) -> WindowState;

    auto apply(WindowEvent const& event, PlatformWindow const& window) -> StateUpdate;

    // Refreshes the sizes after a synchronous resize request was honored.
    auto setSizes(WindowSize inner, WindowSize outer) -> void;

    [[nodiscard]] auto innerSize() const -> WindowSize { return innerSize_; }
    [[nodiscard]] auto outerSize() const -> WindowSize { return outerSize_; }
    [[nodiscard]] auto innerPosition() const -> WindowPosition { return innerPosition_; }
    [[nodiscard]] auto outerPosition() const -> WindowPosition { return outerPosition_; }
    [[nodiscard]] auto cursorPosition() const -> std::optional<CursorPosition> { return cursorPosition_; }
    [[nodiscard]] auto scale() const -> double { return scale_; }
    [[nodiscard]] auto occluded() const -> bool { return occluded_; }
    [[nodiscard]] auto focused() const -> bool { return focused_; }
    [[nodiscard]] auto theme() const -> Theme { return theme_; }
    [[nodiscard]] auto modifiers() const -> Modifiers { return modifiers_; }

    [[nodiscard]] auto pressedKeys() const -> std::vector<PhysicalKey>;
    [[nodiscard]] auto keyPressed(PhysicalKey key) const -> bool { return keys_.contains(key); }
    [[nodiscard]] auto pressedMouseButtons() const -> std::vector<MouseButton>;
    [[nodiscard]] auto mouseButtonPressed(MouseButton button) const -> bool { return mouseButtons_.contains(button); }

private:
    WindowSize                    innerSize_;
    WindowSize                    outerSize_;
    WindowPosition                innerPosition_;
    WindowPosition                outerPosition_;
    std::optional<CursorPosition> cursorPosition_;
    KeySet                        keys_;
    ButtonSet                     mouseButtons_;
    double                        scale_    = 1.0;
    bool                          occluded_ = false;
    bool                          focused_  = false;
    Theme                         theme_    = Theme::Dark;
    Modifiers                     modifiers_;
};

} // namespace WS
