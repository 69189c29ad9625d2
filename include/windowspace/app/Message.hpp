#pragma once

#include <concepts>

namespace WS {

/**
 * Application message traits. `M` is what App<M>::send carries to the
 * application callback, `M::Response` is what comes back, `M::Window` is what
 * windows receive in their mailboxes and `M::Error` is the application error
 * type (window initialization failures, App<M>::sendError).
 */
template <typename T>
concept Message = std::movable<T> && requires {
    typename T::Window;
    typename T::Response;
    typename T::Error;
} && std::movable<typename T::Window> && std::movable<typename T::Response> && std::movable<typename T::Error>;

// For applications that exchange no messages.
struct NoMessage {
    using Window   = NoMessage;
    using Response = NoMessage;
    using Error    = NoMessage;
};

} // namespace WS
