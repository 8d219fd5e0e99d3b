#include "mlink/log/LogHistory.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace mlink::log;

namespace
{
    LogEntry entry(Level level, std::string message)
    {
        return { std::chrono::system_clock::now(), level, std::move(message), {}, "test.cpp", 1, "test" };
    }
}

TEST(log_history, returns_recent_entries_oldest_first)
{
    LogHistory history(10);
    history.add(entry(Level::Info, "a"));
    history.add(entry(Level::Info, "b"));
    history.add(entry(Level::Info, "c"));

    auto recent = history.recent(2);

    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].message, "b");
    EXPECT_EQ(recent[1].message, "c");
    EXPECT_EQ(history.recent().size(), 3u);
}

TEST(log_history, filters_by_level)
{
    LogHistory history(10);
    history.add(entry(Level::Debug, "noise"));
    history.add(entry(Level::Warning, "careful"));
    history.add(entry(Level::Info, "fine"));
    history.add(entry(Level::Error, "broken"));

    auto recent = history.recent(0, Level::Warning);

    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].message, "careful");
    EXPECT_EQ(recent[1].message, "broken");
}

TEST(log_history, drops_oldest_when_full)
{
    LogHistory history(2);
    history.add(entry(Level::Info, "a"));
    history.add(entry(Level::Info, "b"));
    history.add(entry(Level::Info, "c"));

    EXPECT_EQ(history.size(), 2u);
    EXPECT_EQ(history.overflowCount(), 1u);
    EXPECT_EQ(history.recent().front().message, "b");

    history.setCapacity(1);
    EXPECT_EQ(history.size(), 1u);
    EXPECT_EQ(history.recent().front().message, "c");
    EXPECT_EQ(history.overflowCount(), 2u);

    history.clear();
    EXPECT_EQ(history.size(), 0u);
    EXPECT_EQ(history.overflowCount(), 0u);
}

TEST(log_entry, strips_signature_to_qualified_name)
{
    EXPECT_EQ(qualifiedFunctionName("void mcell::plc::PLCLink::check_health()"), "mcell::plc::PLCLink::check_health");
    EXPECT_EQ(qualifiedFunctionName("int main(int, char**)"), "main");
    EXPECT_EQ(qualifiedFunctionName("static"), "static");
}
