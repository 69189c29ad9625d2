#pragma once
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace WS {

struct Error {
    enum class Code {
        PlatformError = 0,
        InvalidParent,
        MalformedInput,
        InvalidConfiguration
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::PlatformError:
        return "platform_error";
    case Error::Code::InvalidParent:
        return "invalid_parent";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::InvalidConfiguration:
        return "invalid_configuration";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

// Message of a captured exception, for logs. Never rethrows.
auto describeException(std::exception_ptr const& fault) -> std::string;

} // namespace WS
