#pragma once

#include <windowspace/platform/Platform.hpp>

#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace WS {

class HeadlessPlatform;

/**
 * In-memory window used by HeadlessPlatform. Attribute changes made through the
 * simulate* helpers on HeadlessPlatform update the window first and then queue
 * the matching event, the same order a native backend reports them in.
 */
class HeadlessWindow final : public PlatformWindow {
public:
    // Height added to the inner size by decorations.
    static constexpr std::uint32_t kTitleBarHeight = 30;

    // Loop state shared with HeadlessPlatform and its proxies.
    struct Shared;

    ~HeadlessWindow() override;

    auto id() const -> WindowId override;

    auto title() const -> std::string override;
    auto setTitle(std::string const& title) -> void override;

    auto isVisible() const -> std::optional<bool> override;
    auto setVisible(bool visible) -> void override;
    auto hasFocus() const -> bool override;
    auto focusWindow() -> void override;

    auto innerSize() const -> WindowSize override;
    auto outerSize() const -> WindowSize override;
    auto requestInnerSize(WindowSize size) -> std::optional<WindowSize> override;
    auto setMinInnerSize(std::optional<WindowSize> size) -> void override;
    auto setMaxInnerSize(std::optional<WindowSize> size) -> void override;
    auto innerPosition() const -> std::optional<WindowPosition> override;
    auto outerPosition() const -> std::optional<WindowPosition> override;
    auto setOuterPosition(WindowPosition position) -> void override;

    auto scaleFactor() const -> double override;
    auto theme() const -> std::optional<Theme> override;
    auto setTheme(std::optional<Theme> theme) -> void override;

    auto setDecorations(bool decorations) -> void override;
    auto setResizable(bool resizable) -> void override;
    auto setFullscreen(std::optional<Fullscreen> fullscreen) -> void override;
    auto setContentProtected(bool enabled) -> void override;
    auto setWindowLevel(WindowLevel level) -> void override;

    auto requestRedraw() -> void override;

    auto decorations() const -> bool;
    auto resizable() const -> bool;
    auto fullscreen() const -> std::optional<Fullscreen>;
    auto contentProtected() const -> bool;
    auto windowLevel() const -> WindowLevel;
    auto minInnerSize() const -> std::optional<WindowSize>;
    auto maxInnerSize() const -> std::optional<WindowSize>;
    auto parent() const -> std::optional<WindowId>;
    auto redrawRequests() const -> std::size_t;

private:
    friend class HeadlessPlatform;

    HeadlessWindow(std::shared_ptr<Shared> shared, WindowId id, WindowAttributes const& attributes);

    auto clampToLimits(WindowSize size) const -> WindowSize;
    auto setInnerSizeLocked(WindowSize size) -> void;
    auto setOuterPositionLocked(WindowPosition position) -> void;

    std::shared_ptr<Shared>       shared_;
    WindowId                      id_;
    mutable std::mutex            mutex_;
    std::string                   title_;
    bool                          visible_;
    bool                          focused_ = false;
    WindowSize                    innerSize_;
    WindowSize                    outerSize_;
    WindowPosition                outerPosition_;
    WindowPosition                innerPosition_;
    double                        scale_ = 1.0;
    std::optional<Theme>          theme_;
    bool                          decorations_;
    bool                          resizable_;
    std::optional<Fullscreen>     fullscreen_;
    bool                          contentProtected_;
    WindowLevel                   level_;
    std::optional<WindowSize>     minInnerSize_;
    std::optional<WindowSize>     maxInnerSize_;
    std::optional<WindowId>       parent_;
    std::size_t                   redrawRequests_ = 0;
};

/**
 * HeadlessPlatform — deterministic platform backend without a display server.
 *
 * - run() drives a single-threaded loop on the calling thread: it reports
 *   `resumed`, then delivers queued items in FIFO order until exit() is called.
 * - createWindow() may be called from any thread; window ids start at 1 and are
 *   never reused.
 * - The simulate* helpers are thread-safe and queue platform events the same
 *   way a native backend would deliver them.
 */
class HeadlessPlatform final : public Platform, public LoopTarget {
public:
    HeadlessPlatform();
    ~HeadlessPlatform() override;

    HeadlessPlatform(HeadlessPlatform const&)                    = delete;
    auto operator=(HeadlessPlatform const&) -> HeadlessPlatform& = delete;

    auto run(LoopHandler& handler) -> int override;
    auto proxy() -> std::shared_ptr<LoopProxy> override;

    auto createWindow(WindowAttributes const& attributes) -> Expected<std::shared_ptr<PlatformWindow>> override;
    auto monitors() const -> std::vector<MonitorInfo> override;
    auto primaryMonitor() const -> std::optional<MonitorInfo> override;
    auto exit(int code) -> void override;

    // Posts an exit request that the loop honors in FIFO order.
    auto requestExit(int code) -> void;
    auto setMonitors(std::vector<MonitorInfo> monitors) -> void;
    // The next createWindow call fails with PlatformError carrying `message`.
    auto failNextCreate(std::string message) -> void;

    auto window(WindowId id) const -> std::shared_ptr<HeadlessWindow>;
    auto createdWindows() const -> std::vector<WindowId>;
    auto isRunning() const -> bool;

    auto simulateEvent(WindowId id, WindowEvent event) -> void;
    auto simulateResize(WindowId id, WindowSize size) -> void;
    auto simulateMove(WindowId id, WindowPosition outerPosition) -> void;
    auto simulateScaleFactor(WindowId id, double scale) -> void;
    auto simulateFocus(WindowId id, bool focused) -> void;
    auto simulateOcclusion(WindowId id, bool occluded) -> void;
    auto simulateTheme(WindowId id, Theme theme) -> void;
    auto simulateCloseRequest(WindowId id) -> void;
    auto simulateRedraw(WindowId id) -> void;
    auto simulateSystemTheme(Theme theme) -> void;

private:
    friend class HeadlessWindow;

    std::shared_ptr<HeadlessWindow::Shared> shared_;
};

} // namespace WS
