#include <windowspace/app/Windows.hpp>
#include <windowspace/platform/HeadlessPlatform.hpp>
#include <windowspace/window/Mailbox.hpp>

#include <doctest/doctest.h>

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>

using namespace WS;

namespace {

struct Mailbox {
    std::shared_ptr<MailboxSink<std::string>>         sink;
    std::optional<ChannelReceiver<WindowMessage<std::string>>> receiver;
};

auto makeMailbox(std::size_t capacity) -> Mailbox {
    auto [sender, receiver] = makeChannel<WindowMessage<std::string>>(capacity);
    return Mailbox{std::make_shared<MailboxSink<std::string>>(std::move(sender)), std::move(receiver)};
}

auto isEvent(WindowMessage<std::string> const& message) -> bool {
    return std::holds_alternative<WindowEvent>(message.payload);
}

} // namespace

TEST_SUITE("app.windows") {
    TEST_CASE("Open, send and close") {
        HeadlessPlatform platform;
        Windows          windows;
        auto             mailbox = makeMailbox(8);
        OpenedWindow     opened;

        auto created = windows.open(platform, WindowAttributes{}, mailbox.sink, opened);
        REQUIRE(created);
        auto id = (*created)->id();
        CHECK(opened.id() == id);
        CHECK(windows.contains(id));
        CHECK(windows.size() == 1);
        CHECK(windows.get(id) == *created);

        CHECK(windows.send(id, Event::Focused{true}) == SendStatus::Delivered);
        auto received = mailbox.receiver->tryReceive();
        REQUIRE(received);
        CHECK(isEvent(*received));

        CHECK(windows.close(id));
        CHECK_FALSE(windows.contains(id));
        CHECK_FALSE(opened.id().has_value());
        CHECK(opened.get() == nullptr);

        SUBCASE("closed identifiers stay absent") {
            CHECK(windows.send(id, Event::Focused{false}) == SendStatus::NotFound);
            CHECK(windows.get(id) == nullptr);
            // Closing again changes nothing; the registry is still empty.
            CHECK(windows.close(id));
            auto ids = windows.ids();
            CHECK(ids.empty());
        }
    }

    TEST_CASE("Shutdown eligibility") {
        HeadlessPlatform platform;
        Windows          windows;
        auto             first  = makeMailbox(4);
        auto             second = makeMailbox(4);

        CHECK(windows.shouldShutdown());

        auto a = windows.open(platform, WindowAttributes{}, first.sink, OpenedWindow{});
        auto b = windows.open(platform, WindowAttributes{}, second.sink, OpenedWindow{});
        REQUIRE(a);
        REQUIRE(b);
        CHECK_FALSE(windows.shouldShutdown());

        SUBCASE("last close without guards") {
            CHECK_FALSE(windows.close((*a)->id()));
            CHECK(windows.close((*b)->id()));
        }

        SUBCASE("guard keeps the application alive") {
            windows.preventShutdown();
            CHECK(windows.guardCount() == 1);
            CHECK_FALSE(windows.close((*a)->id()));
            CHECK_FALSE(windows.close((*b)->id()));
            CHECK(windows.empty());
            CHECK_FALSE(windows.shouldShutdown());
            CHECK(windows.allowShutdown());
            CHECK(windows.guardCount() == 0);
        }

        SUBCASE("releasing a guard with windows open") {
            windows.preventShutdown();
            windows.preventShutdown();
            CHECK_FALSE(windows.allowShutdown());
            CHECK_FALSE(windows.allowShutdown());
            CHECK(windows.guardCount() == 0);
        }

        SUBCASE("unmatched release does not underflow") {
            CHECK_FALSE(windows.allowShutdown());
            CHECK(windows.guardCount() == 0);
        }
    }

    TEST_CASE("Full mailbox drops the tail") {
        HeadlessPlatform platform;
        Windows          windows;
        auto             a = makeMailbox(kDefaultMailboxCapacity);
        auto             b = makeMailbox(kDefaultMailboxCapacity);

        auto openedA = windows.open(platform, WindowAttributes{}, a.sink, OpenedWindow{});
        auto openedB = windows.open(platform, WindowAttributes{}, b.sink, OpenedWindow{});
        REQUIRE(openedA);
        REQUIRE(openedB);
        auto idA = (*openedA)->id();
        auto idB = (*openedB)->id();

        std::size_t delivered = 0;
        std::size_t dropped   = 0;
        for (std::uint32_t i = 0; i < 70000; ++i) {
            switch (windows.send(idA, Event::Resized{WindowSize{i, i}})) {
            case SendStatus::Delivered:
                ++delivered;
                break;
            case SendStatus::Dropped:
                ++dropped;
                break;
            default:
                FAIL("unexpected send status");
            }
        }
        CHECK(delivered == 65536);
        CHECK(dropped == 4464);
        CHECK(windows.droppedEvents() == 4464);
        CHECK(windows.contains(idA));

        // The other window is unaffected.
        CHECK(windows.send(idB, Event::Focused{true}) == SendStatus::Delivered);
        CHECK(b.receiver->size() == 1);

        // The queued events are the first 65,536 in order.
        auto first = a.receiver->tryReceive();
        REQUIRE(first);
        auto const& event = std::get<WindowEvent>(first->payload);
        CHECK(std::get<Event::Resized>(event).size == WindowSize{0, 0});

        std::size_t drained = 1;
        while (a.receiver->tryReceive()) {
            ++drained;
        }
        CHECK(drained == 65536);

        // Once drained the window accepts events again.
        CHECK(windows.send(idA, Event::Focused{true}) == SendStatus::Delivered);
    }

    TEST_CASE("Disconnected mailbox is removed lazily") {
        HeadlessPlatform platform;
        Windows          windows;
        auto             mailbox = makeMailbox(4);
        OpenedWindow     opened;

        auto created = windows.open(platform, WindowAttributes{}, mailbox.sink, opened);
        REQUIRE(created);
        auto id = (*created)->id();

        mailbox.receiver.reset();
        CHECK(windows.contains(id));
        CHECK(windows.send(id, Event::Focused{true}) == SendStatus::Disconnected);
        CHECK_FALSE(windows.contains(id));
        CHECK_FALSE(opened.id().has_value());
        CHECK(windows.send(id, Event::Focused{true}) == SendStatus::NotFound);
    }

    TEST_CASE("Closing disconnects the mailbox after it drains") {
        HeadlessPlatform platform;
        Windows          windows;
        auto             mailbox = makeMailbox(2);

        auto created = windows.open(platform, WindowAttributes{}, mailbox.sink, OpenedWindow{});
        REQUIRE(created);
        auto id = (*created)->id();
        CHECK(windows.send(id, Event::Focused{true}) == SendStatus::Delivered);
        CHECK(windows.send(id, Event::Focused{false}) == SendStatus::Delivered);
        CHECK(windows.send(id, Event::Focused{true}) == SendStatus::Dropped);

        CHECK(windows.close(id));
        // The sink is still alive here, so only the explicit disconnect ends the stream.
        CHECK(mailbox.sink->trySendEvent(Event::Focused{true}) == SendStatus::Disconnected);
        CHECK(mailbox.sink->trySendUser("late").error() == "late");

        CHECK(mailbox.receiver->receive().has_value());
        CHECK(mailbox.receiver->receive().has_value());
        auto after = mailbox.receiver->receive();
        REQUIRE_FALSE(after);
        CHECK(after.error() == ReceiveError::Disconnected);
    }

    TEST_CASE("Open failures leave the registry unchanged") {
        HeadlessPlatform platform;
        Windows          windows;
        auto             mailbox = makeMailbox(4);

        SUBCASE("platform error") {
            platform.failNextCreate("no display");
            OpenedWindow opened;
            auto         created = windows.open(platform, WindowAttributes{}, mailbox.sink, opened);
            REQUIRE_FALSE(created);
            CHECK(created.error().code == Error::Code::PlatformError);
            CHECK(describeError(created.error()) == "platform_error:no display");
            CHECK(windows.empty());
            CHECK_FALSE(opened.id().has_value());
        }

        SUBCASE("unknown parent") {
            WindowAttributes attributes;
            attributes.parent = WindowId{4242};
            auto created      = windows.open(platform, attributes, mailbox.sink, OpenedWindow{});
            REQUIRE_FALSE(created);
            CHECK(created.error().code == Error::Code::InvalidParent);
            CHECK(windows.empty());
        }

        SUBCASE("parent must still be registered") {
            auto parent = windows.open(platform, WindowAttributes{}, makeMailbox(4).sink, OpenedWindow{});
            REQUIRE(parent);
            auto parentId = (*parent)->id();

            WindowAttributes attributes;
            attributes.parent = parentId;
            auto child        = windows.open(platform, attributes, mailbox.sink, OpenedWindow{});
            REQUIRE(child);
            auto headless = platform.window((*child)->id());
            REQUIRE(headless);
            CHECK(headless->parent() == parentId);

            windows.close(parentId);
            auto orphan = windows.open(platform, attributes, makeMailbox(4).sink, OpenedWindow{});
            REQUIRE_FALSE(orphan);
            CHECK(orphan.error().code == Error::Code::InvalidParent);
        }
    }

    TEST_CASE("Broadcast and closeAll") {
        HeadlessPlatform platform;
        Windows          windows;
        auto             a = makeMailbox(4);
        auto             b = makeMailbox(4);
        OpenedWindow     openedA;
        REQUIRE(windows.open(platform, WindowAttributes{}, a.sink, openedA));
        REQUIRE(windows.open(platform, WindowAttributes{}, b.sink, OpenedWindow{}));

        CHECK(windows.broadcast(Event::ThemeChanged{Theme::Light}) == 2);
        for (auto* mailbox : {&a, &b}) {
            auto message = mailbox->receiver->tryReceive();
            REQUIRE(message);
            auto const& event = std::get<WindowEvent>(message->payload);
            REQUIRE(std::holds_alternative<Event::ThemeChanged>(event));
            CHECK(std::get<Event::ThemeChanged>(event).theme == Theme::Light);
        }

        CHECK(windows.closeAll() == 2);
        CHECK(windows.empty());
        CHECK_FALSE(openedA.id().has_value());
        for (auto* mailbox : {&a, &b}) {
            auto message = mailbox->receiver->tryReceive();
            REQUIRE(message);
            CHECK(std::holds_alternative<Event::Destroyed>(std::get<WindowEvent>(message->payload)));
            CHECK(mailbox->receiver->tryReceive().error() == ReceiveError::Disconnected);
        }
    }
}
