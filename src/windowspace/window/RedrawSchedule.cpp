#include <windowspace/window/RedrawSchedule.hpp>

namespace WS {

auto RedrawSchedule::setNeedsRedraw() -> void {
    target_ = RedrawTarget::immediate();
}

auto RedrawSchedule::redrawAt(RedrawClock::time_point instant) -> void {
    if (target_) {
        if (target_->kind == RedrawTarget::Kind::Immediate) {
            return;
        }
        if (target_->at <= instant) {
            return;
        }
    }
    target_ = RedrawTarget::scheduled(instant);
}

auto RedrawSchedule::redrawIn(RedrawClock::duration duration) -> void {
    this->redrawAt(RedrawClock::now() + duration);
}

auto RedrawSchedule::clear() -> void {
    target_.reset();
}

auto RedrawSchedule::wait(RedrawClock::time_point now) const -> RedrawWait {
    if (!target_) {
        return RedrawWait{RedrawWait::Mode::Indefinite, {}};
    }
    if (target_->kind == RedrawTarget::Kind::Immediate || target_->at <= now) {
        return RedrawWait{RedrawWait::Mode::Poll, {}};
    }
    return RedrawWait{RedrawWait::Mode::Timed, target_->at - now};
}

} // namespace WS
