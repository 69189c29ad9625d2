#pragma once

#include <chrono>
#include <optional>

namespace WS {

using RedrawClock = std::chrono::steady_clock;

struct RedrawTarget {
    enum class Kind {
        Immediate,
        Scheduled,
    };

    Kind                     kind = Kind::Immediate;
    RedrawClock::time_point  at{};

    static auto immediate() -> RedrawTarget { return RedrawTarget{Kind::Immediate, {}}; }
    static auto scheduled(RedrawClock::time_point at) -> RedrawTarget { return RedrawTarget{Kind::Scheduled, at}; }

    auto operator==(RedrawTarget const&) const -> bool = default;
};

// How a worker should wait for its next mailbox message.
struct RedrawWait {
    enum class Mode {
        Poll,       // redraw is due: only take what is already queued
        Timed,      // wait at most `remaining`
        Indefinite, // nothing scheduled
    };

    Mode                        mode = Mode::Indefinite;
    RedrawClock::duration       remaining{};
};

/**
 * Redraw target of one window: none, immediate, or no later than an instant.
 * Requests only ever move the deadline earlier; a later instant than the
 * current target (or any instant while an immediate redraw is pending) is
 * ignored.
 */
class RedrawSchedule {
public:
    [[nodiscard]] auto target() const -> std::optional<RedrawTarget> { return target_; }

    auto setNeedsRedraw() -> void;
    auto redrawAt(RedrawClock::time_point instant) -> void;
    auto redrawIn(RedrawClock::duration duration) -> void;
    auto clear() -> void;

    [[nodiscard]] auto wait(RedrawClock::time_point now = RedrawClock::now()) const -> RedrawWait;

private:
    std::optional<RedrawTarget> target_;
};

} // namespace WS
