#pragma once

#include <windowspace/WindowSpace.hpp>

#include <atomic>
#include <chrono>
#include <expected>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace WS::Test {

using namespace std::chrono_literals;

inline auto waitUntil(std::function<bool()> const& predicate, std::chrono::milliseconds timeout = 5s) -> bool {
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

// Application message used by the scenario tests: App::send doubles `value`.
struct Ping {
    int value = 0;

    using Window   = std::string;
    using Response = int;
    using Error    = std::string;
};

// Observations made by a TrackedBehavior on its worker thread.
struct Tracker {
    std::atomic<bool>        initialized{false};
    std::atomic<bool>        allowClose{true};
    std::atomic<int>         redraws{0};
    std::atomic<int>         closeRequests{0};
    std::atomic<int>         resizes{0};
    std::atomic<int>         scaleChanges{0};
    std::atomic<int>         themeChanges{0};
    std::atomic<bool>        holding{false};
    std::atomic<bool>        released{false};
    std::atomic<std::uint64_t> id{0};

    std::mutex                      mutex;
    std::vector<std::string>        messages;
    std::optional<bool>             visibleDuringInit;
    std::optional<bool>             visibleAtInitialized;
    bool                            focusedAtInitialized = false;
    bool                            occludedAtInitialized = true;
    int                             redrawsAtInitialized  = 0;
    // Cached value observed in the callback next to the platform's value.
    std::vector<std::pair<WindowSize, WindowSize>> resizeObservations;
    std::optional<WindowSize>       lastRedrawSize;
    std::optional<double>           lastScale;
    std::optional<Theme>            lastTheme;
    std::optional<std::string>      initError;
    std::shared_ptr<PlatformWindow> platformWindow;
    std::shared_ptr<Tracker>        child;
    std::optional<bool>             childOpened;

    auto windowId() const -> WindowId { return WindowId{id.load()}; }

    auto received() -> std::vector<std::string> {
        std::lock_guard<std::mutex> lock(mutex);
        return messages;
    }
};

/**
 * Test behavior driven through its mailbox:
 *   "close"  closes the window
 *   "throw"  throws from the callback
 *   "spawn"  opens a child window from the worker
 *   "tick"   schedules a redraw in 5ms
 *   "hold"   blocks the worker until `released` is set
 * Every other message is recorded.
 */
class TrackedBehavior : public WindowBehavior<Ping> {
public:
    using Context = std::shared_ptr<Tracker>;

    explicit TrackedBehavior(std::shared_ptr<Tracker> tracker)
        : tracker_(std::move(tracker)) {}

    static auto initialize(RunningWindow<Ping>& window, Context tracker) -> std::expected<TrackedBehavior, std::string> {
        tracker->id = window.id().value;
        {
            std::lock_guard<std::mutex> lock(tracker->mutex);
            tracker->visibleDuringInit = window.window().isVisible();
            tracker->platformWindow    = window.handle().platformWindow();
            if (tracker->initError) {
                return std::unexpected(*tracker->initError);
            }
        }
        return TrackedBehavior{std::move(tracker)};
    }

    auto redraw(RunningWindow<Ping>& window) -> void override {
        {
            std::lock_guard<std::mutex> lock(tracker_->mutex);
            tracker_->lastRedrawSize = window.innerSize();
        }
        ++tracker_->redraws;
    }

    auto initialized(RunningWindow<Ping>& window) -> void override {
        {
            std::lock_guard<std::mutex> lock(tracker_->mutex);
            tracker_->visibleAtInitialized  = window.window().isVisible();
            tracker_->focusedAtInitialized  = window.focused();
            tracker_->occludedAtInitialized = window.occluded();
            tracker_->redrawsAtInitialized  = tracker_->redraws.load();
        }
        tracker_->initialized = true;
    }

    auto closeRequested(RunningWindow<Ping>&) -> bool override {
        ++tracker_->closeRequests;
        return tracker_->allowClose.load();
    }

    auto event(RunningWindow<Ping>& window, std::string message) -> void override {
        if (message == "close") {
            window.close();
        } else if (message == "throw") {
            throw std::runtime_error("behavior failure");
        } else if (message == "spawn") {
            auto child  = std::make_shared<Tracker>();
            auto opened = openWindow<TrackedBehavior>(window, child);
            std::lock_guard<std::mutex> lock(tracker_->mutex);
            tracker_->child       = child;
            tracker_->childOpened = opened.has_value() && opened->has_value();
        } else if (message == "tick") {
            window.redrawIn(5ms);
        } else if (message == "hold") {
            tracker_->holding = true;
            if (!waitUntil([this] { return tracker_->released.load(); })) {
                throw std::runtime_error("held worker never released");
            }
        }
        std::lock_guard<std::mutex> lock(tracker_->mutex);
        tracker_->messages.push_back(std::move(message));
    }

    auto resized(RunningWindow<Ping>& window) -> void override {
        {
            std::lock_guard<std::mutex> lock(tracker_->mutex);
            tracker_->resizeObservations.emplace_back(window.innerSize(), window.window().innerSize());
        }
        ++tracker_->resizes;
    }

    auto scaleFactorChanged(RunningWindow<Ping>& window) -> void override {
        {
            std::lock_guard<std::mutex> lock(tracker_->mutex);
            tracker_->lastScale = window.scale();
        }
        ++tracker_->scaleChanges;
    }

    auto themeChanged(RunningWindow<Ping>& window) -> void override {
        {
            std::lock_guard<std::mutex> lock(tracker_->mutex);
            tracker_->lastTheme = window.theme();
        }
        ++tracker_->themeChanges;
    }

private:
    std::shared_ptr<Tracker> tracker_;
};

// Runs `app` on its own thread; the returned future yields the exit status.
template <Message M>
auto runAsync(PendingApp<M>& app) -> std::future<int> {
    return std::async(std::launch::async, [&app] { return app.run(); });
}

inline auto finishes(std::future<int>& exit, std::chrono::milliseconds timeout = 5s) -> bool {
    return exit.wait_for(timeout) == std::future_status::ready;
}

} // namespace WS::Test
