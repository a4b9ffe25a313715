//----------------------------------------------------------------------------------------------------------------------
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <set>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

TEST(LoggerSuite, UnregisteredLoggerTest)
{
    auto const spLogger = Logger::Get("unregistered");
    ASSERT_TRUE(spLogger);
    EXPECT_EQ(spLogger->name(), "unregistered");
    EXPECT_TRUE(spLogger->sinks().empty());
    EXPECT_FALSE(spdlog::get("unregistered"));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(LoggerSuite, ComponentLoggersTest)
{
    Logger::Initialize(spdlog::level::off);
    Logger::Initialize(spdlog::level::off); // Repeated initialization keeps the existing loggers.

    std::set<std::string> names;
    for (auto const name : {
        Logger::Name::Core, Logger::Name::Discovery, Logger::Name::Pairing, Logger::Name::Connection,
        Logger::Name::Router, Logger::Name::Clipboard, Logger::Name::Notification, Logger::Name::Transfer,
        Logger::Name::WebSocket }) {
        auto const spLogger = Logger::Get(name);
        ASSERT_TRUE(spLogger);
        EXPECT_EQ(spLogger, spdlog::get(std::string{ name })) << name;
        EXPECT_EQ(spLogger->sinks().size(), 1u) << name;
        names.emplace(spLogger->name());
    }

    // Each component logs under its own tag.
    EXPECT_EQ(names.size(), 9u);
    EXPECT_NE(Logger::Get(Logger::Name::Clipboard), Logger::Get(Logger::Name::Router));
    EXPECT_NE(Logger::Get(Logger::Name::Notification), Logger::Get(Logger::Name::Router));
}

//----------------------------------------------------------------------------------------------------------------------
