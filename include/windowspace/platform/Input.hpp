#pragma once

#include <windowspace/platform/Geometry.hpp>

#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace WS {

enum class ElementState {
    Pressed,
    Released,
};

enum class TouchPhase {
    Started,
    Moved,
    Ended,
    Cancelled,
};

// Opaque per-device identifier forwarded from the platform.
struct DeviceId {
    std::uint64_t value = 0;

    auto operator<=>(DeviceId const&) const = default;
};

// Scan-code level key identity, independent of keyboard layout.
struct PhysicalKey {
    std::uint32_t code = 0;

    auto operator<=>(PhysicalKey const&) const = default;
};

struct MouseButton {
    enum class Kind : std::uint8_t {
        Left,
        Right,
        Middle,
        Back,
        Forward,
        Other,
    };

    Kind          kind  = Kind::Left;
    std::uint16_t other = 0;

    auto operator<=>(MouseButton const&) const = default;

    static constexpr auto left() -> MouseButton { return MouseButton{Kind::Left, 0}; }
    static constexpr auto right() -> MouseButton { return MouseButton{Kind::Right, 0}; }
    static constexpr auto middle() -> MouseButton { return MouseButton{Kind::Middle, 0}; }
};

struct Modifiers {
    enum Flag : std::uint32_t {
        Shift   = 1u << 0,
        Control = 1u << 1,
        Alt     = 1u << 2,
        Super   = 1u << 3,
    };

    std::uint32_t bits = 0;

    auto operator<=>(Modifiers const&) const = default;

    [[nodiscard]] auto shift() const -> bool { return (bits & Shift) != 0; }
    [[nodiscard]] auto control() const -> bool { return (bits & Control) != 0; }
    [[nodiscard]] auto alt() const -> bool { return (bits & Alt) != 0; }
    [[nodiscard]] auto super() const -> bool { return (bits & Super) != 0; }
};

struct KeyEvent {
    PhysicalKey                physical_key;
    std::optional<std::string> text;
    ElementState               state  = ElementState::Pressed;
    bool                       repeat = false;
};

struct LineDelta {
    float x = 0.0f;
    float y = 0.0f;
};

using ScrollDelta = std::variant<LineDelta, PhysicalPosition<double>>;

struct Touch {
    DeviceId                 device_id;
    TouchPhase               phase = TouchPhase::Started;
    PhysicalPosition<double> location;
    std::optional<double>    force;
    std::uint64_t            id = 0;
};

namespace ImeEvent {
struct Enabled {};
struct Preedit {
    std::string                                      text;
    std::optional<std::pair<std::size_t, std::size_t>> cursor;
};
struct Commit {
    std::string text;
};
struct Disabled {};
} // namespace ImeEvent

using Ime = std::variant<ImeEvent::Enabled, ImeEvent::Preedit, ImeEvent::Commit, ImeEvent::Disabled>;

} // namespace WS

template <>
struct std::hash<WS::PhysicalKey> {
    auto operator()(WS::PhysicalKey const& key) const noexcept -> std::size_t {
        return std::hash<std::uint32_t>{}(key.code);
    }
};

template <>
struct std::hash<WS::MouseButton> {
    auto operator()(WS::MouseButton const& button) const noexcept -> std::size_t {
        return std::hash<std::uint32_t>{}((static_cast<std::uint32_t>(button.kind) << 16) | button.other);
    }
};
