#include <windowspace/WindowSpace.hpp>

#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>

using namespace WS;
using namespace std::chrono_literals;

namespace {

// Counter shared between the application callback and the windows.
struct Counter {
    int value = 0;

    using Window   = std::string;
    using Response = int;
    using Error    = std::string;
};

class CounterWindow : public WindowBehavior<Counter> {
public:
    using Context = std::string;

    explicit CounterWindow(std::string label)
        : label_(std::move(label)) {}

    static auto initialize(RunningWindow<Counter>& window, std::string label)
            -> std::expected<CounterWindow, std::string> {
        if (label.empty()) {
            return std::unexpected(std::string{"window label must not be empty"});
        }
        window.setTitle(label);
        return CounterWindow{std::move(label)};
    }

    auto redraw(RunningWindow<Counter>& window) -> void override {
        ++frames_;
        std::cout << label_ << ": frame " << frames_ << " at " << window.innerSize().width << "x"
                  << window.innerSize().height << " scale " << window.scale() << '\n';
    }

    auto initialized(RunningWindow<Counter>& window) -> void override {
        auto total = window.app().send(Counter{1});
        std::cout << label_ << ": ready, " << total.value_or(-1) << " windows counted\n";
    }

    auto event(RunningWindow<Counter>& window, std::string message) -> void override {
        std::cout << label_ << ": message '" << message << "'\n";
        if (message == "tick") {
            window.redrawIn(10ms);
        } else if (message == "quit") {
            window.close();
        }
    }

    auto resized(RunningWindow<Counter>&) -> void override {
        std::cout << label_ << ": resized\n";
    }

    auto themeChanged(RunningWindow<Counter>& window) -> void override {
        std::cout << label_ << ": theme " << (window.theme() == Theme::Dark ? "dark" : "light") << '\n';
    }

private:
    std::string label_;
    int         frames_ = 0;
};

auto loadOptions(int argc, char** argv) -> Expected<AppOptions> {
    AppOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--config" && i + 1 < argc) {
            std::ifstream file(argv[++i]);
            if (!file) {
                return std::unexpected(Error{Error::Code::InvalidConfiguration, "cannot read " + std::string{argv[i]}});
            }
            std::stringstream text;
            text << file.rdbuf();
            auto loaded = LoadAppOptionsJson(text.str(), options);
            if (!loaded) {
                return std::unexpected(loaded.error());
            }
            options = std::move(*loaded);
        } else if (arg == "--log") {
            options.logging_enabled = true;
        }
    }
    if (auto applied = ApplyAppEnvOverrides(options); !applied) {
        return std::unexpected(applied.error());
    }
    return options;
}

} // namespace

auto main(int argc, char** argv) -> int {
    auto options = loadOptions(argc, argv);
    if (!options) {
        std::cerr << "headless_demo: " << describeError(options.error()) << '\n';
        return 2;
    }

    HeadlessPlatform platform;
    auto             created = PendingApp<Counter>::create(platform, *options);
    if (!created) {
        std::cerr << "headless_demo: " << describeError(created.error()) << '\n';
        return 2;
    }
    auto& app = **created;

    std::atomic<int> counted{0};
    app.onEvent([&](Counter counter, ExecutingApp<Counter>&) { return counted += counter.value; });
    app.onError([](std::string error, ExecutingApp<Counter>&) { std::cerr << "window error: " << error << '\n'; });

    auto builder = buildWindow<CounterWindow>(app, "first");
    builder.innerSize(WindowSize{640, 480});
    auto first  = std::move(builder).open();
    auto second = openWindow<CounterWindow>(app, "second");
    if (!first || !second || !*first || !*second) {
        std::cerr << "headless_demo: could not open the windows\n";
        return 2;
    }

    // Plays the part of the user and the window system.
    std::thread driver([&, a = **first, b = **second] {
        auto const deadline = std::chrono::steady_clock::now() + 5s;
        while (!a.id() || !b.id() || counted.load() < 2) {
            if (std::chrono::steady_clock::now() > deadline) {
                std::cerr << "headless_demo: windows never became ready\n";
                platform.requestExit(3);
                return;
            }
            std::this_thread::sleep_for(1ms);
        }
        platform.simulateResize(*a.id(), WindowSize{800, 600});
        platform.simulateScaleFactor(*b.id(), 2.0);
        platform.simulateSystemTheme(Theme::Light);
        if (!a.send("tick") || !b.send("tick")) {
            std::cerr << "headless_demo: mailbox refused a message\n";
        }
        std::this_thread::sleep_for(50ms);
        if (!a.send("quit")) {
            std::cerr << "headless_demo: first window already gone\n";
        }
        platform.simulateCloseRequest(*b.id());
    });

    int const code = app.run();
    driver.join();
    std::cout << "headless_demo finished with " << code << '\n';
    return code;
}
