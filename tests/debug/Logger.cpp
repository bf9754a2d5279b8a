#include <debug/log/Logger.hpp>
#include <config/ConfigManager.hpp>

#include "../shared/TestEnvironment.hpp"

#include <gtest/gtest.h>

TEST(Logger, rollingKeepsRecentLines) {
    Log::logger->log(Log::DEBUG, "switching {} -> {}", 3, 4);

    EXPECT_NE(Log::logger->rolling().find("switching 3 -> 4"), std::string::npos);

    if (!Env::isTrace()) {
        Log::logger->log(Log::TRACE, "only with tracing on {}", 5);
        EXPECT_EQ(Log::logger->rolling().find("only with tracing on 5"), std::string::npos);
    }

    EXPECT_EQ(g_pConfigManager->parseKeyword("debug:disable_logs", "1"), "");
    Log::logger->log(Log::WARN, "muted {}", 6);
    EXPECT_EQ(Log::logger->rolling().find("muted 6"), std::string::npos);

    EXPECT_EQ(g_pConfigManager->parseKeyword("debug:disable_logs", "0"), "");
    Log::logger->log(Log::WARN, "back {}", 7);
    EXPECT_NE(Log::logger->rolling().find("back 7"), std::string::npos);
}
