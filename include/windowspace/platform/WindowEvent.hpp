#pragma once

#include <windowspace/platform/Geometry.hpp>
#include <windowspace/platform/Input.hpp>

#include <filesystem>
#include <string>
#include <variant>

namespace WS {

// Events the platform reports for a single window.
namespace Event {

struct RedrawRequested {};
struct Resized {
    WindowSize size;
};
struct Moved {
    WindowPosition position;
};
struct CloseRequested {};
struct Destroyed {};
struct DroppedFile {
    std::filesystem::path path;
};
struct HoveredFile {
    std::filesystem::path path;
};
struct HoveredFileCancelled {};
struct Focused {
    bool focused = false;
};
struct KeyboardInput {
    DeviceId device_id;
    KeyEvent event;
    bool     is_synthetic = false;
};
struct ModifiersChanged {
    Modifiers modifiers;
};
struct ImeInput {
    Ime ime;
};
struct CursorMoved {
    DeviceId       device_id;
    CursorPosition position;
};
struct CursorEntered {
    DeviceId device_id;
};
struct CursorLeft {
    DeviceId device_id;
};
struct MouseWheel {
    DeviceId    device_id;
    ScrollDelta delta;
    TouchPhase  phase = TouchPhase::Moved;
};
struct MouseInput {
    DeviceId     device_id;
    ElementState state = ElementState::Pressed;
    MouseButton  button;
};
struct TouchpadPressure {
    DeviceId     device_id;
    float        pressure = 0.0f;
    std::int64_t stage    = 0;
};
struct AxisMotion {
    DeviceId      device_id;
    std::uint32_t axis  = 0;
    double        value = 0.0;
};
struct TouchInput {
    Touch touch;
};
struct ScaleFactorChanged {
    double scale_factor = 1.0;
};
struct ThemeChanged {
    Theme theme = Theme::Dark;
};
struct Occluded {
    bool occluded = false;
};
struct PinchGesture {
    DeviceId   device_id;
    double     delta = 0.0;
    TouchPhase phase = TouchPhase::Moved;
};
struct PanGesture {
    DeviceId                device_id;
    PhysicalPosition<float> delta;
    TouchPhase              phase = TouchPhase::Moved;
};
struct DoubleTapGesture {
    DeviceId device_id;
};
struct RotationGesture {
    DeviceId   device_id;
    float      delta = 0.0f;
    TouchPhase phase = TouchPhase::Moved;
};
struct ActivationTokenDone {
    std::uint64_t serial = 0;
    std::string   token;
};

} // namespace Event

using WindowEvent = std::variant<Event::RedrawRequested,
                                 Event::Resized,
                                 Event::Moved,
                                 Event::CloseRequested,
                                 Event::Destroyed,
                                 Event::DroppedFile,
                                 Event::HoveredFile,
                                 Event::HoveredFileCancelled,
                                 Event::Focused,
                                 Event::KeyboardInput,
                                 Event::ModifiersChanged,
                                 Event::ImeInput,
                                 Event::CursorMoved,
                                 Event::CursorEntered,
                                 Event::CursorLeft,
                                 Event::MouseWheel,
                                 Event::MouseInput,
                                 Event::TouchpadPressure,
                                 Event::AxisMotion,
                                 Event::TouchInput,
                                 Event::ScaleFactorChanged,
                                 Event::ThemeChanged,
                                 Event::Occluded,
                                 Event::PinchGesture,
                                 Event::PanGesture,
                                 Event::DoubleTapGesture,
                                 Event::RotationGesture,
                                 Event::ActivationTokenDone>;

} // namespace WS
