#include <gtest/gtest.h>
#include "PDR/DebugConsoleSink.hpp"
#include <spdlog/logger.h>
#include <spdlog/details/os.h>
#include <memory>
#include <string>

using namespace PDR;

TEST(DebugConsoleSinkTest, WritesFormattedRecordsThroughPutc) {
    std::string console;
    auto sink = std::make_shared<debug_console_sink_st>([&console](char c) { console.push_back(c); });
    sink->set_pattern("[%n] %l: %v");

    auto logger = std::make_shared<spdlog::logger>("display_pd", sink);
    logger->set_level(spdlog::level::debug);
    logger->info("photo {} shown", 3);
    logger->debug("ring occupancy {}", 0);
    logger->trace("not printed");

    EXPECT_NE(console.find("[display_pd] info: photo 3 shown"), std::string::npos);
    EXPECT_NE(console.find("[display_pd] debug: ring occupancy 0"), std::string::npos);
    EXPECT_EQ(console.find("not printed"), std::string::npos);
    EXPECT_EQ(console.back(), '\n');
}

TEST(DebugConsoleSinkTest, SinkLevelFiltersIndependently) {
    std::string console;
    auto sink = std::make_shared<debug_console_sink_mt>([&console](char c) { console.push_back(c); });
    sink->set_pattern("%v");
    sink->set_level(spdlog::level::warn);

    spdlog::logger logger("net_pd", sink);
    logger.info("link up");
    logger.warn("rx ring full");
    logger.flush();

    EXPECT_EQ(console, std::string("rx ring full") + spdlog::details::os::default_eol);
}
