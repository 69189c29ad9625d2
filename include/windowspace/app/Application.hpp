#pragma once

#include <windowspace/app/EventSink.hpp>
#include <windowspace/app/LoopMessage.hpp>
#include <windowspace/app/Message.hpp>
#include <windowspace/app/OpenedWindow.hpp>
#include <windowspace/core/Error.hpp>

#include <memory>

namespace WS {

template <Message M>
class App;

enum class OpenStatus {
    Opened,      // the platform window exists and its worker was started
    Deferred,    // buffered until the loop starts
    Unavailable, // the application has shut down
};

/**
 * Application — anything a window can be opened from.
 *
 * Contract
 * --------
 * - openWindow() registers `sink` for the new window, publishes the platform
 *   window through `opened` and calls `spawner` exactly once after the window
 *   exists. When the window cannot be created the spawner is never called.
 * - Implementations differ in where the work happens: PendingApp buffers
 *   until the loop starts, ExecutingApp opens directly on the dispatcher
 *   thread, App and RunningWindow round trip through the dispatcher.
 */
template <Message M>
struct Application {
    virtual ~Application() = default;

    virtual auto app() const -> App<M> = 0;
    virtual auto openWindow(WindowAttributes attributes,
                            std::shared_ptr<EventSink> sink,
                            OpenedWindow opened,
                            WindowSpawner spawner) -> Expected<OpenStatus> = 0;
};

} // namespace WS
