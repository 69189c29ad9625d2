#ifdef WS_LOG_DEBUG
#include <windowspace/log/TaggedLogger.hpp>

#include <doctest/doctest.h>

#include <chrono>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace {

auto captureStderr(std::function<void()> fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    fn();
    std::cerr.rdbuf(original);
    return buffer.str();
}

void waitForFlush() {
    std::this_thread::sleep_for(20ms);
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("logging_disabled_by_default_drops_messages") {
    auto output = captureStderr([] {
        WS::TaggedLogger logger;
        logger.log_impl("should not appear", std::source_location::current(), "TestTag");
        waitForFlush();
    });

    CHECK(output.empty());
}

TEST_CASE("enabled_logger_writes_tags_thread_and_message") {
    auto output = captureStderr([] {
        WS::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.log_impl("hello log", std::source_location::current(), "TestTag");
        waitForFlush();
    });

    CHECK(output.find("[TestTag]") != std::string::npos);
    CHECK(output.find("hello log") != std::string::npos);
    CHECK(output.find("Thread 0") != std::string::npos);
}

TEST_CASE("trace_tag_is_skipped_by_default") {
    auto skipped = captureStderr([] {
        WS::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.log_impl("filtered", std::source_location::current(), "Dispatcher", "Trace");
        waitForFlush();
    });
    CHECK(skipped.empty());

    auto cleared = captureStderr([] {
        WS::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setSkipTags({});
        logger.log_impl("trace allowed", std::source_location::current(), "Trace");
        waitForFlush();
    });
    CHECK(cleared.find("trace allowed") != std::string::npos);
}

TEST_CASE("enabled_tags_gate_output") {
    auto accepted = captureStderr([] {
        WS::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setEnabledTags({"Worker"});
        logger.log_impl("keep me", std::source_location::current(), "Worker");
        waitForFlush();
    });
    CHECK(accepted.find("keep me") != std::string::npos);

    auto rejected = captureStderr([] {
        WS::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setEnabledTags({"Worker"});
        logger.log_impl("drop me", std::source_location::current(), "Worker", "Dispatcher");
        waitForFlush();
    });
    CHECK(rejected.empty());
}

TEST_CASE("thread_name_is_used_in_output") {
    auto output = captureStderr([] {
        WS::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setThreadName("Window 7");
        logger.log_impl("with name", std::source_location::current(), "Worker");
        waitForFlush();
    });

    CHECK(output.find("[Window 7]") != std::string::npos);
}

TEST_CASE("global_wrappers_and_macro_emit_joined_tags") {
    auto output = captureStderr([] {
        WS::set_thread_name("WrapperThread");
        WS::set_logging_enabled(true);
        ws_log("via macro", "Alpha", "Beta");
        waitForFlush();
        WS::set_logging_enabled(false);
    });

    CHECK(output.find("[Alpha][Beta]") != std::string::npos);
    CHECK(output.find("[WrapperThread]") != std::string::npos);
}

TEST_CASE("short_path_includes_parent_directory") {
    auto output = captureStderr([] {
        WS::TaggedLogger logger;
        logger.setLoggingEnabled(true);
#line 42 "dir/subdir/TaggedLoggerChild.cpp"
        logger.log_impl("has parent", std::source_location::current(), "Solo");
#line 138 "tests/unit/log/test_TaggedLogger.cpp"
        waitForFlush();
    });

    CHECK(output.find("subdir/TaggedLoggerChild.cpp:42") != std::string::npos);
}

} // TEST_SUITE
#endif // WS_LOG_DEBUG
