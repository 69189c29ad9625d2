#pragma once

#include <windowspace/core/Error.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace WS {

inline constexpr std::size_t kDefaultMailboxCapacity = 65536;

struct AppOptions {
    // Slots per window mailbox. Events arriving while a mailbox is full are dropped.
    std::size_t               mailbox_capacity{kDefaultMailboxCapacity};
    int                       exit_code_success{0};
    // Returned by PendingApp::run when a faulted window was the last one open.
    int                       exit_code_fault{1};
    std::chrono::milliseconds worker_exit_timeout{std::chrono::milliseconds{2000}};
    bool                      logging_enabled{false};
};

auto ValidateAppOptions(AppOptions const& options) -> std::optional<std::string>;

// Reads WINDOWSPACE_MAILBOX_CAPACITY, WINDOWSPACE_FAULT_EXIT_CODE,
// WINDOWSPACE_WORKER_EXIT_TIMEOUT_MS and WINDOWSPACE_LOG.
auto ApplyAppEnvOverrides(AppOptions& options) -> Expected<void>;

auto LoadAppOptionsJson(std::string_view text, AppOptions base = {}) -> Expected<AppOptions>;

} // namespace WS
