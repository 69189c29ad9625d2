#include <windowspace/window/RedrawSchedule.hpp>

#include <doctest/doctest.h>

using namespace WS;
using namespace std::chrono_literals;

TEST_SUITE("window.redraw_schedule") {
    TEST_CASE("Redraw target merging") {
        RedrawSchedule schedule;
        auto const     now = RedrawClock::now();
        CHECK_FALSE(schedule.target().has_value());

        SUBCASE("sooner instant wins") {
            schedule.redrawAt(now + 50ms);
            schedule.redrawAt(now + 10ms);
            REQUIRE(schedule.target());
            CHECK(*schedule.target() == RedrawTarget::scheduled(now + 10ms));
        }

        SUBCASE("later instant never replaces an earlier one") {
            schedule.redrawAt(now + 10ms);
            schedule.redrawAt(now + 50ms);
            CHECK(*schedule.target() == RedrawTarget::scheduled(now + 10ms));
        }

        SUBCASE("immediate is never replaced by an instant") {
            schedule.setNeedsRedraw();
            schedule.redrawAt(now);
            schedule.redrawAt(now + 1s);
            CHECK(*schedule.target() == RedrawTarget::immediate());
        }

        SUBCASE("immediate replaces a scheduled instant") {
            schedule.redrawAt(now + 1s);
            schedule.setNeedsRedraw();
            CHECK(*schedule.target() == RedrawTarget::immediate());
        }

        SUBCASE("repeating a request is idempotent") {
            schedule.redrawAt(now + 20ms);
            auto const once = schedule.target();
            schedule.redrawAt(now + 20ms);
            CHECK(schedule.target() == once);

            schedule.setNeedsRedraw();
            schedule.setNeedsRedraw();
            CHECK(*schedule.target() == RedrawTarget::immediate());
        }

        SUBCASE("clear resets") {
            schedule.setNeedsRedraw();
            schedule.clear();
            CHECK_FALSE(schedule.target().has_value());
            schedule.redrawAt(now + 5s);
            CHECK(*schedule.target() == RedrawTarget::scheduled(now + 5s));
        }
    }

    TEST_CASE("Wait modes") {
        RedrawSchedule schedule;
        auto const     now = RedrawClock::now();

        CHECK(schedule.wait(now).mode == RedrawWait::Mode::Indefinite);

        schedule.redrawAt(now + 30ms);
        auto timed = schedule.wait(now);
        CHECK(timed.mode == RedrawWait::Mode::Timed);
        CHECK(timed.remaining == 30ms);

        CHECK(schedule.wait(now + 30ms).mode == RedrawWait::Mode::Poll);
        CHECK(schedule.wait(now + 1s).mode == RedrawWait::Mode::Poll);

        schedule.setNeedsRedraw();
        CHECK(schedule.wait(now).mode == RedrawWait::Mode::Poll);
    }

    TEST_CASE("redrawIn is relative to now") {
        RedrawSchedule schedule;
        auto const     before = RedrawClock::now();
        schedule.redrawIn(100ms);
        auto const after = RedrawClock::now();
        REQUIRE(schedule.target());
        CHECK(schedule.target()->kind == RedrawTarget::Kind::Scheduled);
        CHECK(schedule.target()->at >= before + 100ms);
        CHECK(schedule.target()->at <= after + 100ms);
    }
}
