// MCELL-Prod headers
#include "app/StatusMonitor.hpp"
#include "process/StatusFeed.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

namespace mcell::test
{
    namespace
    {
        model::CellStatus make_status(model::SystemState state, int delivered)
        {
            model::CellStatus status{};
            status.system_state = state;
            status.feeder = { "feeder", 0, "Idle", delivered };
            return status;
        }

        mlink::coro::Task<std::vector<model::SystemState>> collect(mlink::coro::Channel<model::CellStatus> stream)
        {
            std::vector<model::SystemState> states;
            while (auto status = co_await stream.next()) {
                states.push_back(status->system_state);
            }
            co_return states;
        }
    }

    TEST(status_feed, each_subscriber_gets_every_snapshot)
    {
        process::StatusFeed feed;
        auto first = feed.subscribe();
        auto second = feed.subscribe();
        EXPECT_NE(first.id, second.id);
        EXPECT_EQ(feed.subscriber_count(), 2u);

        feed.on_status(make_status(model::SystemState::Running, 0));
        feed.on_status(make_status(model::SystemState::Paused, 0));

        EXPECT_EQ(first.stream.size(), 2u);
        EXPECT_EQ(second.stream.size(), 2u);
    }

    TEST(status_feed, slow_subscriber_loses_oldest_snapshots)
    {
        process::StatusFeed feed(2);
        auto subscription = feed.subscribe();

        feed.on_status(make_status(model::SystemState::Stopped, 0));
        feed.on_status(make_status(model::SystemState::Running, 0));
        feed.on_status(make_status(model::SystemState::Paused, 0));
        feed.unsubscribe(subscription.id);

        auto states = mlink::coro::syncWait(collect(subscription.stream));
        EXPECT_EQ(states, (std::vector{ model::SystemState::Running, model::SystemState::Paused }));
    }

    TEST(status_feed, unsubscribe_closes_the_stream_once)
    {
        process::StatusFeed feed;
        auto subscription = feed.subscribe();

        EXPECT_TRUE(feed.unsubscribe(subscription.id));
        EXPECT_TRUE(subscription.stream.isClosed());
        EXPECT_FALSE(feed.unsubscribe(subscription.id));
        EXPECT_EQ(feed.subscriber_count(), 0u);

        feed.on_status(make_status(model::SystemState::Running, 0));
        EXPECT_EQ(subscription.stream.size(), 0u);
    }

    TEST(status_feed, close_all_ends_every_stream)
    {
        process::StatusFeed feed;
        auto first = feed.subscribe();
        auto second = feed.subscribe();

        feed.close_all();

        EXPECT_TRUE(first.stream.isClosed());
        EXPECT_TRUE(second.stream.isClosed());
        EXPECT_EQ(feed.subscriber_count(), 0u);
    }

    TEST(status_monitor, consumes_the_feed_on_its_own_thread)
    {
        process::StatusFeed feed;
        app::StatusMonitor monitor(feed);
        monitor.start();
        EXPECT_EQ(feed.subscriber_count(), 1u);

        feed.on_status(make_status(model::SystemState::Stopped, 0));
        feed.on_status(make_status(model::SystemState::Running, 0));
        feed.on_status(make_status(model::SystemState::Running, 1));

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (monitor.received() < 3 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        EXPECT_EQ(monitor.received(), 3u);

        monitor.stop();
        EXPECT_EQ(feed.subscriber_count(), 0u);
    }

    TEST(status_monitor, keeps_consuming_after_a_restart)
    {
        process::StatusFeed feed;
        app::StatusMonitor monitor(feed);

        auto wait_for = [&monitor](std::size_t count) {
            auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
            while (monitor.received() < count && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            return monitor.received();
        };

        monitor.start();
        feed.on_status(make_status(model::SystemState::Running, 0));
        EXPECT_EQ(wait_for(1), 1u);
        monitor.stop();

        monitor.start();
        EXPECT_EQ(feed.subscriber_count(), 1u);
        feed.on_status(make_status(model::SystemState::Paused, 0));
        feed.on_status(make_status(model::SystemState::Running, 0));
        EXPECT_EQ(wait_for(3), 3u);

        monitor.stop();
        EXPECT_EQ(feed.subscriber_count(), 0u);
    }
}
