#include <windowspace/core/Error.hpp>

#include <doctest/doctest.h>

#include <stdexcept>
#include <vector>

using namespace WS;

TEST_SUITE("core.error") {
    TEST_CASE("Error string helpers") {
        std::vector<Error::Code> codes;
        for (int i = static_cast<int>(Error::Code::PlatformError);
             i <= static_cast<int>(Error::Code::InvalidConfiguration);
             ++i) {
            codes.push_back(static_cast<Error::Code>(i));
        }

        for (auto code : codes) {
            auto label = errorCodeToString(code);
            CHECK_FALSE(label.empty());
            Error e{code, {}};
            CHECK(describeError(e) == std::string{label});
        }

        Error withMsg{Error::Code::InvalidParent, "Window(4)"};
        CHECK(describeError(withMsg) == "invalid_parent:Window(4)");

        Error platform{Error::Code::PlatformError, {}};
        CHECK(describeError(platform) == "platform_error");

        auto unknownLabel = errorCodeToString(static_cast<Error::Code>(999));
        CHECK(unknownLabel == "unknown_error");
    }

    TEST_CASE("describeException") {
        CHECK(describeException(nullptr) == "no exception");
        CHECK(describeException(std::make_exception_ptr(std::runtime_error("render failed"))) == "render failed");
        CHECK(describeException(std::make_exception_ptr(std::string("plain"))) == "plain");
        CHECK(describeException(std::make_exception_ptr(42)) == "non-standard exception");
    }
}
