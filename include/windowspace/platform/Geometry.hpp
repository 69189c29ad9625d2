#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <string>

namespace WS {

// Identifier assigned by the platform when a window is created.
struct WindowId {
    std::uint64_t value = 0;

    auto operator<=>(WindowId const&) const = default;
};

[[nodiscard]] inline auto to_string(WindowId id) -> std::string {
    return "Window(" + std::to_string(id.value) + ")";
}

template <typename T>
struct PhysicalSize {
    T width{};
    T height{};

    auto operator<=>(PhysicalSize const&) const = default;
};

template <typename T>
struct PhysicalPosition {
    T x{};
    T y{};

    auto operator<=>(PhysicalPosition const&) const = default;
};

using WindowSize     = PhysicalSize<std::uint32_t>;
using WindowPosition = PhysicalPosition<std::int32_t>;
using CursorPosition = PhysicalPosition<double>;

enum class Theme {
    Light,
    Dark,
};

struct MonitorInfo {
    std::string    name;
    WindowPosition position;
    WindowSize     size;
    double         scale_factor = 1.0;
    std::uint32_t  refresh_rate_millihertz = 0;
};

} // namespace WS

template <>
struct std::hash<WS::WindowId> {
    auto operator()(WS::WindowId const& id) const noexcept -> std::size_t {
        return std::hash<std::uint64_t>{}(id.value);
    }
};
