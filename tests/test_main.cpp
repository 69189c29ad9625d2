#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include <windowspace/log/TaggedLogger.hpp>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>

struct ShowTestStart : public doctest::IReporter {
    ShowTestStart(const doctest::ContextOptions& /* in */) {
    }
    void test_case_start(const doctest::TestCaseData& in) override {
#ifdef WS_LOG_DEBUG
        std::lock_guard<std::mutex> lock(WS::logger().coutMutex);
#endif
        std::cout << "Test: " << in.m_name << std::endl;
    }
    void report_query(const doctest::QueryData&) override {
    }
    void test_run_start() override {
    }
    void test_run_end(const doctest::TestRunStats&) override {
    }
    void test_case_reenter(const doctest::TestCaseData&) override {
    }
    void test_case_end(const doctest::CurrentTestCaseStats&) override {
    }
    void test_case_exception(const doctest::TestCaseException&) override {
    }
    void subcase_start(const doctest::SubcaseSignature& in) override {
#ifdef WS_LOG_DEBUG
        std::lock_guard<std::mutex> lock(WS::logger().coutMutex);
#endif
        std::cout << "\tSubcase: " << in.m_name << std::endl;
    }
    void subcase_end() override {
    }
    void log_assert(const doctest::AssertData&) override {
    }
    void log_message(const doctest::MessageData&) override {
    }
    void test_case_skipped(const doctest::TestCaseData&) override {
    }
};

REGISTER_LISTENER("test_start", 1, ShowTestStart);

int main(int argc, char** argv) {
    WS::set_logging_enabled(false);

    doctest::Context context;
    context.applyCommandLine(argc, argv);

    if (context.shouldExit()) {
        return context.run();
    }

#ifdef WS_LOG_DEBUG
    WS::set_thread_name("TestMain");
    // WINDOWSPACE_LOG=1 turns on runtime logging while the tests run.
    bool enableLog = false;
    if (const char* envLog = std::getenv("WINDOWSPACE_LOG")) {
        if (std::strcmp(envLog, "0") != 0) enableLog = true;
    }
    if (enableLog) {
        WS::set_logging_enabled(true);
        ws_log("Starting test execution", "Test");
    }
#endif

    int res = context.run();

#ifdef WS_LOG_DEBUG
    if (enableLog) {
        ws_log(res == 0 ? "All tests passed" : "Some tests failed", "Test");
    }
#endif

    return res;
}
