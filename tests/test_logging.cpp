#include "doctest.h"

#include "capture_log_sink.h"

#include "hidock/io/io_status.h"

#include <cstring>
#include <string>

using namespace hidock;
using namespace hidock::tests;

TEST_CASE("Logger: level filter and tags")
{
    CaptureLogSink sink;
    log::Logger logger(&sink, log::Level::Info, "core");

    HD_LOGE(logger, "disk %d failed", 2);
    HD_LOGI(logger, "hello %s", "there");
    HD_LOGD(logger, "hidden");

    const auto lines = sink.lines();
    REQUIRE(lines.size() == 2);
    CHECK(lines[0].level == log::Level::Error);
    CHECK(lines[0].tag == "core");
    CHECK(lines[0].text == "disk 2 failed");
    CHECK(lines[1].text == "hello there");

    const log::Logger tagged = logger.with_tag("usb");
    HD_LOGW(tagged, "stall");
    CHECK(sink.lines().back().tag == "usb");
    CHECK(tagged.min_level() == log::Level::Info);
}

TEST_CASE("Logger: default instance discards output")
{
    log::Logger quiet;
    CHECK_FALSE(quiet.enabled(log::Level::Error));
    HD_LOGE(quiet, "nobody hears this");
}

TEST_CASE("Logger: long messages are not truncated")
{
    CaptureLogSink sink;
    log::Logger logger = sink.logger();
    const std::string big(2000, 'x');
    HD_LOGI(logger, "%s", big.c_str());
    REQUIRE(sink.lines().size() == 1);
    CHECK(sink.lines()[0].text.size() == 2000);
}

TEST_CASE("level names round trip")
{
    for (auto lvl : {log::Level::Error, log::Level::Warn, log::Level::Info,
                     log::Level::Debug, log::Level::Verbose}) {
        CHECK(log::parse_level(log::level_name(lvl)) == lvl);
    }
    CHECK(log::parse_level("chatty") == log::Level::Info);
}

TEST_CASE("IOStatus names")
{
    CHECK(std::strcmp(io::to_string(io::IOStatus::Ok), "ok") == 0);
    CHECK(std::strcmp(io::to_string(io::IOStatus::Blocked), "blocked") == 0);
    CHECK(io::IOResult::failure(io::IOStatus::Timeout, "x").message == "x");
}
