#include <windowspace/platform/HeadlessPlatform.hpp>
#include <windowspace/window/WindowState.hpp>

#include <doctest/doctest.h>

using namespace WS;

TEST_SUITE("window.state") {
    TEST_CASE("Cached attributes follow platform events") {
        HeadlessPlatform platform;
        WindowAttributes attributes;
        attributes.inner_size = WindowSize{640, 480};
        attributes.position   = WindowPosition{10, 20};
        auto created          = platform.createWindow(attributes);
        REQUIRE(created);
        auto  window   = *created;
        auto  headless = platform.window(window->id());
        REQUIRE(headless);

        auto state = WindowState::fromWindow(*window);
        CHECK(state.innerSize() == WindowSize{640, 480});
        CHECK(state.outerSize() == WindowSize{640, 480 + HeadlessWindow::kTitleBarHeight});
        CHECK(state.outerPosition() == WindowPosition{10, 20});
        CHECK(state.innerPosition() == WindowPosition{10, 20 + static_cast<int>(HeadlessWindow::kTitleBarHeight)});
        CHECK_FALSE(state.occluded());
        CHECK(state.scale() == doctest::Approx(1.0));

        SUBCASE("resize") {
            platform.simulateResize(window->id(), WindowSize{800, 600});
            auto update = state.apply(Event::Resized{WindowSize{800, 600}}, *window);
            CHECK(update.notify);
            CHECK(state.innerSize() == window->innerSize());
            CHECK(state.outerSize() == window->outerSize());

            auto repeat = state.apply(Event::Resized{WindowSize{800, 600}}, *window);
            CHECK_FALSE(repeat.notify);
        }

        SUBCASE("move") {
            platform.simulateMove(window->id(), WindowPosition{100, 200});
            auto update = state.apply(Event::Moved{WindowPosition{100, 200}}, *window);
            CHECK(update.notify);
            CHECK(state.outerPosition() == WindowPosition{100, 200});
            CHECK(state.innerPosition() == *window->innerPosition());
            CHECK_FALSE(state.apply(Event::Moved{WindowPosition{100, 200}}, *window).notify);
        }

        SUBCASE("scale factor refreshes sizes before callbacks") {
            platform.simulateScaleFactor(window->id(), 2.0);
            auto update = state.apply(Event::ScaleFactorChanged{2.0}, *window);
            CHECK(update.notify);
            CHECK(update.resized);
            CHECK(state.scale() == doctest::Approx(2.0));
            CHECK(state.innerSize() == WindowSize{1280, 960});
            CHECK(state.outerSize() == window->outerSize());
        }

        SUBCASE("scale factor without size change") {
            auto update = state.apply(Event::ScaleFactorChanged{1.0}, *window);
            CHECK(update.notify);
            CHECK_FALSE(update.resized);
        }

        SUBCASE("focus, occlusion, theme and modifiers") {
            state.apply(Event::Focused{true}, *window);
            CHECK(state.focused());
            state.apply(Event::Occluded{true}, *window);
            CHECK(state.occluded());
            state.apply(Event::ThemeChanged{Theme::Light}, *window);
            CHECK(state.theme() == Theme::Light);
            state.apply(Event::ModifiersChanged{Modifiers{Modifiers::Shift | Modifiers::Alt}}, *window);
            CHECK(state.modifiers().shift());
            CHECK(state.modifiers().alt());
            CHECK_FALSE(state.modifiers().control());
        }

        SUBCASE("pressed keys and buttons") {
            auto press = [&](std::uint32_t code, ElementState s) {
                state.apply(Event::KeyboardInput{DeviceId{1}, KeyEvent{PhysicalKey{code}, std::nullopt, s, false}, false},
                            *window);
            };
            press(30, ElementState::Pressed);
            press(31, ElementState::Pressed);
            CHECK(state.keyPressed(PhysicalKey{30}));
            CHECK(state.pressedKeys().size() == 2);
            press(30, ElementState::Released);
            CHECK_FALSE(state.keyPressed(PhysicalKey{30}));
            CHECK(state.pressedKeys().size() == 1);

            state.apply(Event::MouseInput{DeviceId{1}, ElementState::Pressed, MouseButton::left()}, *window);
            CHECK(state.mouseButtonPressed(MouseButton::left()));
            CHECK_FALSE(state.mouseButtonPressed(MouseButton::right()));
            state.apply(Event::MouseInput{DeviceId{1}, ElementState::Released, MouseButton::left()}, *window);
            CHECK(state.pressedMouseButtons().empty());
        }

        SUBCASE("cursor tracking") {
            CHECK_FALSE(state.cursorPosition().has_value());
            state.apply(Event::CursorMoved{DeviceId{1}, CursorPosition{3.5, 4.5}}, *window);
            REQUIRE(state.cursorPosition());
            CHECK(state.cursorPosition()->x == doctest::Approx(3.5));
            state.apply(Event::CursorLeft{DeviceId{1}}, *window);
            CHECK_FALSE(state.cursorPosition().has_value());
        }
    }

    TEST_CASE("Hidden window starts occluded") {
        HeadlessPlatform platform;
        WindowAttributes attributes;
        attributes.visible = false;
        auto created       = platform.createWindow(attributes);
        REQUIRE(created);
        CHECK(WindowState::fromWindow(**created).occluded());
    }
}
