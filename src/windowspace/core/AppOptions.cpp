#include <windowspace/core/AppOptions.hpp>
#include <windowspace/log/TaggedLogger.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <iterator>
#include <limits>
#include <optional>
#include <string>

namespace WS {

namespace {

constexpr std::size_t  kMaxMailboxCapacity     = std::size_t{1} << 24;
constexpr std::int64_t kMinExitCode            = 0;
constexpr std::int64_t kMinFaultExitCode       = 1;
constexpr std::int64_t kMaxExitCode            = 255;
constexpr std::int64_t kMaxWorkerExitTimeoutMs = std::numeric_limits<std::int32_t>::max();

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

template <typename Setter>
auto apply_env(char const* key, Setter&& setter) -> Expected<void> {
    if (const char* raw = std::getenv(key)) {
        if (!setter(std::string_view{raw})) {
            return std::unexpected(Error{Error::Code::InvalidConfiguration,
                                         std::string{key} + " has an invalid value: " + raw});
        }
    }
    return {};
}

auto malformed(std::string message) -> Error {
    return Error{Error::Code::MalformedInput, std::move(message)};
}

// Reads an integer field without narrowing; std::nullopt when outside [min, max].
auto json_integer_in_range(nlohmann::json const& value, std::int64_t min, std::int64_t max)
        -> std::optional<std::int64_t> {
    if (value.is_number_unsigned()) {
        auto const raw = value.get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(max)) {
            return std::nullopt;
        }
        auto const parsed = static_cast<std::int64_t>(raw);
        if (parsed < min) {
            return std::nullopt;
        }
        return parsed;
    }
    auto const raw = value.get<std::int64_t>();
    if (raw < min || raw > max) {
        return std::nullopt;
    }
    return raw;
}

auto out_of_range(char const* key, nlohmann::json const& value, std::int64_t min, std::int64_t max) -> Error {
    return Error{Error::Code::InvalidConfiguration,
                 std::string{key} + " must be in [" + std::to_string(min) + ", " + std::to_string(max) + "], got "
                         + value.dump()};
}

} // namespace

auto ValidateAppOptions(AppOptions const& options) -> std::optional<std::string> {
    if (options.mailbox_capacity == 0) {
        return std::string{"mailbox_capacity must be > 0"};
    }
    if (options.mailbox_capacity > kMaxMailboxCapacity) {
        return std::string{"mailbox_capacity must be <= "} + std::to_string(kMaxMailboxCapacity);
    }
    if (options.exit_code_fault == options.exit_code_success) {
        return std::string{"exit_code_fault must differ from exit_code_success"};
    }
    if (options.worker_exit_timeout < std::chrono::milliseconds::zero()) {
        return std::string{"worker_exit_timeout must be >= 0"};
    }
    return std::nullopt;
}

auto ApplyAppEnvOverrides(AppOptions& options) -> Expected<void> {
    if (auto status = apply_env("WINDOWSPACE_MAILBOX_CAPACITY", [&](std::string_view value) {
            std::size_t parsed = options.mailbox_capacity;
            if (!parse_integer_in_range<std::size_t>(value, 1, kMaxMailboxCapacity, parsed)) {
                return false;
            }
            options.mailbox_capacity = parsed;
            return true;
        });
        !status) {
        return status;
    }

    if (auto status = apply_env("WINDOWSPACE_FAULT_EXIT_CODE", [&](std::string_view value) {
            int parsed = options.exit_code_fault;
            if (!parse_integer_in_range<int>(value, static_cast<int>(kMinFaultExitCode), static_cast<int>(kMaxExitCode), parsed)) {
                return false;
            }
            options.exit_code_fault = parsed;
            return true;
        });
        !status) {
        return status;
    }

    if (auto status = apply_env("WINDOWSPACE_WORKER_EXIT_TIMEOUT_MS", [&](std::string_view value) {
            std::int64_t parsed = options.worker_exit_timeout.count();
            if (!parse_integer_in_range<std::int64_t>(value, 0, kMaxWorkerExitTimeoutMs, parsed)) {
                return false;
            }
            options.worker_exit_timeout = std::chrono::milliseconds{parsed};
            return true;
        });
        !status) {
        return status;
    }

    if (auto status = apply_env("WINDOWSPACE_LOG", [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed) {
                return false;
            }
            options.logging_enabled = *parsed;
            return true;
        });
        !status) {
        return status;
    }

    if (auto invalid = ValidateAppOptions(options)) {
        return std::unexpected(Error{Error::Code::InvalidConfiguration, *invalid});
    }
    return {};
}

auto LoadAppOptionsJson(std::string_view text, AppOptions base) -> Expected<AppOptions> {
    auto document = nlohmann::json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return std::unexpected(malformed("options are not valid JSON"));
    }
    if (!document.is_object()) {
        return std::unexpected(malformed("options must be a JSON object"));
    }

    if (auto it = document.find("mailbox_capacity"); it != document.end()) {
        if (!it->is_number_unsigned()) {
            return std::unexpected(malformed("mailbox_capacity must be an unsigned integer"));
        }
        auto const raw = it->get<std::uint64_t>();
        if (raw == 0 || raw > kMaxMailboxCapacity) {
            return std::unexpected(out_of_range("mailbox_capacity", *it, 1, static_cast<std::int64_t>(kMaxMailboxCapacity)));
        }
        base.mailbox_capacity = static_cast<std::size_t>(raw);
    }
    if (auto it = document.find("exit_code_success"); it != document.end()) {
        if (!it->is_number_integer()) {
            return std::unexpected(malformed("exit_code_success must be an integer"));
        }
        auto parsed = json_integer_in_range(*it, kMinExitCode, kMaxExitCode);
        if (!parsed) {
            return std::unexpected(out_of_range("exit_code_success", *it, kMinExitCode, kMaxExitCode));
        }
        base.exit_code_success = static_cast<int>(*parsed);
    }
    if (auto it = document.find("exit_code_fault"); it != document.end()) {
        if (!it->is_number_integer()) {
            return std::unexpected(malformed("exit_code_fault must be an integer"));
        }
        auto parsed = json_integer_in_range(*it, kMinFaultExitCode, kMaxExitCode);
        if (!parsed) {
            return std::unexpected(out_of_range("exit_code_fault", *it, kMinFaultExitCode, kMaxExitCode));
        }
        base.exit_code_fault = static_cast<int>(*parsed);
    }
    if (auto it = document.find("worker_exit_timeout_ms"); it != document.end()) {
        if (!it->is_number_integer()) {
            return std::unexpected(malformed("worker_exit_timeout_ms must be an integer"));
        }
        auto parsed = json_integer_in_range(*it, 0, kMaxWorkerExitTimeoutMs);
        if (!parsed) {
            return std::unexpected(out_of_range("worker_exit_timeout_ms", *it, 0, kMaxWorkerExitTimeoutMs));
        }
        base.worker_exit_timeout = std::chrono::milliseconds{*parsed};
    }
    if (auto it = document.find("logging_enabled"); it != document.end()) {
        if (!it->is_boolean()) {
            return std::unexpected(malformed("logging_enabled must be a boolean"));
        }
        base.logging_enabled = it->get<bool>();
    }

    if (auto invalid = ValidateAppOptions(base)) {
        ws_log("Rejected options: " + *invalid, "Config", "Error");
        return std::unexpected(Error{Error::Code::InvalidConfiguration, *invalid});
    }
    return base;
}

} // namespace WS
