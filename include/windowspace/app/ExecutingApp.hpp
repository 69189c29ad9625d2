#pragma once

#include <windowspace/app/App.hpp>
#include <windowspace/app/Application.hpp>
#include <windowspace/app/Windows.hpp>
#include <windowspace/log/TaggedLogger.hpp>

#include <memory>
#include <optional>
#include <vector>

namespace WS {

/**
 * The application as seen from the dispatcher thread, handed to the
 * application callbacks. Opening a window here needs no round trip: the
 * platform window is created before openWindow() returns.
 *
 * Only valid for the duration of the callback it was passed to.
 */
template <Message M>
class ExecutingApp final : public Application<M> {
public:
    ExecutingApp(Windows& windows, LoopTarget& target, App<M> app)
        : windows_(windows), target_(target), app_(std::move(app)) {}

    auto app() const -> App<M> override { return app_; }

    auto openWindow(WindowAttributes attributes,
                    std::shared_ptr<EventSink> sink,
                    OpenedWindow opened,
                    WindowSpawner spawner) -> Expected<OpenStatus> override {
        auto created = windows_.open(target_, attributes, std::move(sink), opened);
        if (!created) {
            return std::unexpected(created.error());
        }
        spawner(opened);
        return OpenStatus::Opened;
    }

    [[nodiscard]] auto windows() const -> std::vector<WindowId> { return windows_.ids(); }
    [[nodiscard]] auto window(WindowId id) const -> std::shared_ptr<PlatformWindow> { return windows_.get(id); }
    [[nodiscard]] auto monitors() const -> std::vector<MonitorInfo> { return target_.monitors(); }
    [[nodiscard]] auto primaryMonitor() const -> std::optional<MonitorInfo> { return target_.primaryMonitor(); }

private:
    Windows&    windows_;
    LoopTarget& target_;
    App<M>      app_;
};

} // namespace WS
