#pragma once

#include <windowspace/core/Error.hpp>
#include <windowspace/platform/Geometry.hpp>
#include <windowspace/platform/WindowAttributes.hpp>
#include <windowspace/platform/WindowEvent.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace WS {

/**
 * PlatformWindow — a native window owned by the platform service.
 *
 * Contract
 * --------
 * - Instances are shared between the registry, the window's worker thread and
 *   any Window handle. Queries and mutation requests may come from any of those
 *   threads; implementations must be internally synchronized.
 * - The native window is destroyed when the last reference is released.
 */
struct PlatformWindow {
    virtual ~PlatformWindow() = default;

    virtual auto id() const -> WindowId = 0;

    virtual auto title() const -> std::string            = 0;
    virtual auto setTitle(std::string const& title) -> void = 0;

    virtual auto isVisible() const -> std::optional<bool> = 0;
    virtual auto setVisible(bool visible) -> void         = 0;
    virtual auto hasFocus() const -> bool                 = 0;
    virtual auto focusWindow() -> void                    = 0;

    virtual auto innerSize() const -> WindowSize                                         = 0;
    virtual auto outerSize() const -> WindowSize                                         = 0;
    // Returns the applied size when the platform resized synchronously.
    virtual auto requestInnerSize(WindowSize size) -> std::optional<WindowSize>          = 0;
    virtual auto setMinInnerSize(std::optional<WindowSize> size) -> void                 = 0;
    virtual auto setMaxInnerSize(std::optional<WindowSize> size) -> void                 = 0;
    virtual auto innerPosition() const -> std::optional<WindowPosition>                  = 0;
    virtual auto outerPosition() const -> std::optional<WindowPosition>                  = 0;
    virtual auto setOuterPosition(WindowPosition position) -> void                       = 0;

    virtual auto scaleFactor() const -> double              = 0;
    virtual auto theme() const -> std::optional<Theme>      = 0;
    virtual auto setTheme(std::optional<Theme> theme) -> void = 0;

    virtual auto setDecorations(bool decorations) -> void                 = 0;
    virtual auto setResizable(bool resizable) -> void                     = 0;
    virtual auto setFullscreen(std::optional<Fullscreen> fullscreen) -> void = 0;
    virtual auto setContentProtected(bool enabled) -> void                = 0;
    virtual auto setWindowLevel(WindowLevel level) -> void                = 0;

    // Asks the platform to deliver a redraw notification for this window.
    virtual auto requestRedraw() -> void = 0;
};

/**
 * Capabilities of an active platform loop. Only valid on the loop thread while
 * a LoopHandler callback is running (or, for backends without that
 * restriction, whenever the backend documents it).
 */
struct LoopTarget {
    virtual ~LoopTarget() = default;

    virtual auto createWindow(WindowAttributes const& attributes) -> Expected<std::shared_ptr<PlatformWindow>> = 0;
    virtual auto monitors() const -> std::vector<MonitorInfo>                                                  = 0;
    virtual auto primaryMonitor() const -> std::optional<MonitorInfo>                                          = 0;
    // Stops the loop after the current callback returns; run() yields `code`.
    virtual auto exit(int code) -> void = 0;
};

/**
 * Receiver of platform loop notifications. Every callback runs on the thread
 * that called Platform::run.
 */
struct LoopHandler {
    virtual ~LoopHandler() = default;

    // The loop became active; window creation and monitor queries are available.
    virtual auto resumed(LoopTarget& target) -> void                                          = 0;
    virtual auto windowEvent(LoopTarget& target, WindowId id, WindowEvent event) -> void      = 0;
    virtual auto redrawRequested(LoopTarget& target, WindowId id) -> void                     = 0;
    // A LoopProxy::wake() call was delivered.
    virtual auto wakeUp(LoopTarget& target) -> void                                           = 0;
    virtual auto systemThemeChanged(LoopTarget& target, Theme theme) -> void                  = 0;
    virtual auto exiting(LoopTarget& target) -> void                                          = 0;
};

// Thread-safe handle used to wake the loop from other threads.
struct LoopProxy {
    virtual ~LoopProxy() = default;

    // Returns false once the loop has stopped.
    virtual auto wake() -> bool = 0;
};

struct Platform {
    virtual ~Platform() = default;

    // Drives the loop on the calling thread until LoopTarget::exit is called.
    virtual auto run(LoopHandler& handler) -> int        = 0;
    virtual auto proxy() -> std::shared_ptr<LoopProxy>   = 0;
};

} // namespace WS
