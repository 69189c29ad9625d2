#pragma once

#include <windowspace/platform/Geometry.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace WS {

enum class WindowLevel {
    AlwaysOnBottom,
    Normal,
    AlwaysOnTop,
};

enum class Fullscreen {
    Borderless,
    Exclusive,
};

struct WindowButtons {
    enum Flag : std::uint8_t {
        Close    = 1u << 0,
        Minimize = 1u << 1,
        Maximize = 1u << 2,
    };

    std::uint8_t bits = Close | Minimize | Maximize;

    auto operator<=>(WindowButtons const&) const = default;
};

struct WindowAttributes {
    std::optional<WindowSize>     inner_size;
    std::optional<WindowSize>     min_inner_size;
    std::optional<WindowSize>     max_inner_size;
    std::optional<WindowPosition> position;
    bool                          resizable = true;
    WindowButtons                 enabled_buttons;
    std::string                   title = "windowspace window";
    std::optional<Fullscreen>     fullscreen;
    bool                          maximized   = false;
    bool                          visible     = true;
    bool                          transparent = false;
    bool                          decorations = true;
    bool                          has_icon    = false;
    std::optional<Theme>          preferred_theme;
    std::optional<WindowSize>     resize_increments;
    bool                          content_protected = false;
    WindowLevel                   window_level      = WindowLevel::Normal;
    bool                          active            = true;
    // Hold back `visible` until the behavior has initialized and drawn once.
    bool                          delay_visible = true;
    std::optional<std::string>    app_name;
    std::optional<WindowId>       parent;
};

} // namespace WS
