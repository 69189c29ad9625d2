#pragma once

#include <windowspace/app/App.hpp>
#include <windowspace/app/Application.hpp>
#include <windowspace/app/ExecutingApp.hpp>
#include <windowspace/app/Message.hpp>
#include <windowspace/app/PendingApp.hpp>
#include <windowspace/app/Windows.hpp>
#include <windowspace/core/AppOptions.hpp>
#include <windowspace/core/Error.hpp>
#include <windowspace/log/TaggedLogger.hpp>
#include <windowspace/platform/HeadlessPlatform.hpp>
#include <windowspace/platform/Platform.hpp>
#include <windowspace/window/RunningWindow.hpp>
#include <windowspace/window/Window.hpp>
#include <windowspace/window/WindowBehavior.hpp>
#include <windowspace/window/WindowBuilder.hpp>

namespace WS {

// Opens one window running behavior `B` and runs the application until it
// closes.
template <Behavior B>
auto runWindow(Platform& platform, typename B::Context context = {}, AppOptions options = {}) -> Expected<int> {
    auto app = PendingApp<typename B::AppMessage>::create(platform, std::move(options));
    if (!app) {
        return std::unexpected(app.error());
    }
    auto opened = openWindow<B>(**app, std::move(context));
    if (!opened) {
        return std::unexpected(opened.error());
    }
    return (*app)->run();
}

} // namespace WS
