#include <doctest/doctest.h>

#include "log/TaggedLogger.hpp"

#ifdef WS_LOG_DEBUG

#include <iostream>
#include <memory>
#include <source_location>
#include <sstream>
#include <string>
#include <thread>

namespace {

// Swaps std::cerr for a string buffer while a local logger runs and drains.
class CapturedLog {
public:
    CapturedLog()
        : previous(std::cerr.rdbuf(buffer.rdbuf())) {}

    ~CapturedLog() { std::cerr.rdbuf(previous); }

    auto text() const -> std::string { return buffer.str(); }

private:
    std::ostringstream buffer;
    std::streambuf*    previous;
};

auto log_with(WS::TaggedLogger& logger, std::string const& message, std::string tag) -> void {
    logger.log_impl(message, std::source_location::current(), std::move(tag));
}

} // namespace

TEST_SUITE("TaggedLogger") {

TEST_CASE("disabled logger writes nothing") {
    CapturedLog capture;
    {
        WS::TaggedLogger logger;
        log_with(logger, "should not appear", "Supervisor");
    }
    CHECK(capture.text().empty());
}

TEST_CASE("enabled logger drains queued messages on destruction") {
    CapturedLog capture;
    {
        WS::TaggedLogger logger;
        logger.set_logging_enabled(true);
        logger.set_thread_name("Tester");
        log_with(logger, "launched clock", "Supervisor");
        log_with(logger, "denied clipboard.write", "Capability");
    }
    auto text = capture.text();
    CHECK(text.find("launched clock") != std::string::npos);
    CHECK(text.find("[Supervisor]") != std::string::npos);
    CHECK(text.find("[Tester]") != std::string::npos);
    CHECK(text.find("denied clipboard.write") != std::string::npos);
    CHECK(text.find("[test_TaggedLogger.cpp:") != std::string::npos);
    CHECK(text.find("unit/log/") == std::string::npos);
}

TEST_CASE("every tag of an entry is printed") {
    CapturedLog capture;
    {
        WS::TaggedLogger logger;
        logger.set_logging_enabled(true);
        logger.log_impl("reader gave up", std::source_location::current(), "Discovery", "Error");
    }
    CHECK(capture.text().find("[Discovery][Error]") != std::string::npos);
}

TEST_CASE("enabled tag set filters messages") {
    CapturedLog capture;
    {
        WS::TaggedLogger logger;
        logger.set_logging_enabled(true);
        logger.set_enabled_tags({"Focus"});
        log_with(logger, "focus 1 -> 2", "Focus");
        log_with(logger, "surface 3 created", "Surface");
    }
    auto text = capture.text();
    CHECK(text.find("focus 1 -> 2") != std::string::npos);
    CHECK(text.find("surface 3 created") == std::string::npos);
}

TEST_CASE("skipped tags are dropped") {
    CapturedLog capture;
    {
        WS::TaggedLogger logger;
        logger.set_logging_enabled(true);
        log_with(logger, "listener noise", "Listener");
    }
    CHECK(capture.text().find("listener noise") == std::string::npos);
}

TEST_CASE("unnamed threads get numbered names") {
    CapturedLog capture;
    {
        WS::TaggedLogger logger;
        logger.set_logging_enabled(true);
        std::thread worker([&logger] { log_with(logger, "from worker", "Discovery"); });
        worker.join();
    }
    CHECK(capture.text().find("[Thread ") != std::string::npos);
}

} // TEST_SUITE

#endif // WS_LOG_DEBUG
