#include <catch2/catch_test_macros.hpp>
#include <fileserve/core/logging.hpp>

#include <sstream>

using namespace fileserve;

TEST_CASE("Log levels", "[logging]") {
    CHECK(log_level_name(LogLevel::Warn) == "WARN");
    CHECK(parse_log_level("debug") == LogLevel::Debug);
    CHECK(parse_log_level("ERROR") == LogLevel::Error);
    CHECK(parse_log_level("nonsense") == LogLevel::Info);
}

TEST_CASE("Logger filters by level", "[logging]") {
    auto sink = std::make_shared<MemorySink>();
    Logger logger("files");
    logger.add_sink(sink);
    logger.set_level(LogLevel::Warn);

    logger.debug("hidden");
    logger.info("hidden too");
    logger.warn("short read");
    logger.error("seek failed");

    auto entries = sink->entries();
    REQUIRE(entries.size() == 2);
    CHECK(entries[0].level == LogLevel::Warn);
    CHECK(entries[0].logger_name == "files");
    CHECK(sink->contains(LogLevel::Error, "seek"));
    CHECK_FALSE(sink->contains(LogLevel::Debug, "hidden"));

    sink->clear();
    CHECK(sink->entries().empty());
}

TEST_CASE("Structured fields", "[logging]") {
    auto sink = std::make_shared<MemorySink>();
    Logger logger("files");
    logger.add_sink(sink);

    logger.log(logger.entry(LogLevel::Info, "range evaluated")
                   .field("path", std::string("/srv/a.mp4"))
                   .field("bytes", 4096));

    auto entries = sink->entries();
    REQUIRE(entries.size() == 1);
    CHECK(entries[0].find_field("path") == "/srv/a.mp4");
    CHECK(entries[0].find_field("bytes") == "4096");
    CHECK(entries[0].find_field("missing").empty());
}

TEST_CASE("JSON sink", "[logging]") {
    std::ostringstream out;
    Logger logger("files");
    logger.add_sink(std::make_shared<JsonSink>(out));

    logger.log(logger.entry(LogLevel::Warn, "quote \" here")
                   .field("path", std::string("/tmp/x")));

    auto line = out.str();
    CHECK(line.find("\"level\":\"WARN\"") != std::string::npos);
    CHECK(line.find("quote \\\" here") != std::string::npos);
    CHECK(line.find("\"path\":\"/tmp/x\"") != std::string::npos);
}

TEST_CASE("Text sink quotes values with spaces", "[logging]") {
    std::ostringstream out;
    Logger logger("files", LogLevel::Debug);
    logger.add_sink(std::make_shared<StreamSink>(out));

    logger.log(logger.entry(LogLevel::Debug, "range evaluated")
                   .field("status", "satisfiable")
                   .field("range", "bytes=0-1, 5-9")
                   .field("multi", true));

    auto line = out.str();
    CHECK(line.find("[DEBUG] [files] range evaluated") != std::string::npos);
    CHECK(line.find("status=satisfiable") != std::string::npos);
    CHECK(line.find("range=\"bytes=0-1, 5-9\"") != std::string::npos);
    CHECK(line.find("multi=true") != std::string::npos);
}

TEST_CASE("Off disables every level", "[logging]") {
    auto sink = std::make_shared<MemorySink>();
    Logger logger("files", LogLevel::Off);
    logger.add_sink(sink);
    logger.error("nothing");
    CHECK(sink->entries().empty());
    CHECK(parse_log_level("OFF") == LogLevel::Off);
    CHECK(parse_log_level("Warning") == LogLevel::Warn);
}
