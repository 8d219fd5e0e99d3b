// MCELL-Prod headers
#include "process/FeederMachine.hpp"
#include "process/SharedSignals.hpp"

// MCELL-Fake headers
#include "ManualClock.hpp"
#include "MockPlcIo.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <vector>

namespace mcell::test
{
    using namespace std::chrono_literals;
    using model::SystemState;
    using process::FeederMark;
    using process::FeederState;
    using ::testing::_;
    using ::testing::InSequence;
    using ::testing::NiceMock;
    using ::testing::Return;

    class FeederTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            ON_CALL(plc, read_marks()).WillByDefault([this]() -> mlink::Result<std::vector<bool>> {
                if (marks_error) {
                    return mlink::fail(*marks_error);
                }
                return marks;
            });
            ON_CALL(plc, write_coil(_)).WillByDefault(Return(mlink::success()));
            ON_CALL(plc, clear_coil(_)).WillByDefault(Return(mlink::success()));
            ON_CALL(plc, is_connected()).WillByDefault(Return(true));
        }

        void set_mark(FeederMark mark, bool value) { marks[static_cast<std::size_t>(mark) - 1] = value; }

        // moves past the current dwell and any pending mark refresh
        void run_for(std::chrono::milliseconds elapsed, SystemState state = SystemState::Running)
        {
            clock.advance(elapsed);
            feeder.step(state);
        }

        NiceMock<MockPlcIo> plc;
        process::SharedSignals signals;
        ManualClock clock;
        process::FeederMachine feeder{ plc, signals, clock };

        std::vector<bool> marks = std::vector<bool>(8, false);
        std::optional<mlink::Error> marks_error;
    };

    TEST_F(FeederTest, delivers_a_requested_part)
    {
        set_mark(FeederMark::Enabled, true);

        feeder.step(SystemState::Running);
        EXPECT_EQ(feeder.state(), FeederState::WaitingRequest);

        run_for(1000ms);
        EXPECT_EQ(feeder.state(), FeederState::WaitingRequest);

        signals.request_part();
        EXPECT_CALL(plc, clear_coil(std::string_view("M6")));
        run_for(500ms);
        EXPECT_EQ(feeder.state(), FeederState::Requesting);

        EXPECT_CALL(plc, write_coil(std::string_view("M1")));
        run_for(500ms);
        EXPECT_EQ(feeder.state(), FeederState::StartingMotor);

        run_for(500ms);
        EXPECT_EQ(feeder.state(), FeederState::StartingMotor);
        EXPECT_TRUE(signals.part_requested());

        set_mark(FeederMark::MotorOn, true);
        EXPECT_CALL(plc, clear_coil(std::string_view("M1")));
        run_for(500ms);
        EXPECT_EQ(feeder.state(), FeederState::Delivering);
        EXPECT_FALSE(signals.part_requested());

        set_mark(FeederMark::PartDetected, true);
        run_for(500ms);
        EXPECT_EQ(feeder.state(), FeederState::Idle);
        EXPECT_EQ(feeder.counter(), 1);
        EXPECT_TRUE(signals.take_part_delivered());
        EXPECT_FALSE(signals.part_delivered());
    }

    TEST_F(FeederTest, starting_motor_waits_without_timeout)
    {
        set_mark(FeederMark::Enabled, true);
        signals.request_part();

        feeder.step(SystemState::Running);   // WaitingRequest
        run_for(1000ms);                     // Requesting
        run_for(500ms);                      // StartingMotor
        ASSERT_EQ(feeder.state(), FeederState::StartingMotor);

        for (int i = 0; i < 100; ++i) {
            run_for(500ms);
        }
        EXPECT_EQ(feeder.state(), FeederState::StartingMotor);
    }

    TEST_F(FeederTest, entering_running_clears_reset_mark_first)
    {
        set_mark(FeederMark::Enabled, true);

        InSequence sequence;
        EXPECT_CALL(plc, clear_coil(std::string_view("M6")));
        EXPECT_CALL(plc, read_marks());

        feeder.step(SystemState::Running);
    }

    TEST_F(FeederTest, resuming_from_pause_clears_reset_mark_again)
    {
        set_mark(FeederMark::Enabled, true);
        EXPECT_CALL(plc, clear_coil(std::string_view("M6"))).Times(2);

        feeder.step(SystemState::Running);
        run_for(100ms, SystemState::Paused);
        run_for(100ms, SystemState::Running);
        run_for(100ms, SystemState::Running);
    }

    TEST_F(FeederTest, disable_preempts_a_pending_request)
    {
        set_mark(FeederMark::Enabled, true);
        signals.request_part();

        feeder.step(SystemState::Running);   // WaitingRequest
        run_for(1000ms);                     // Requesting
        ASSERT_EQ(feeder.state(), FeederState::Requesting);

        set_mark(FeederMark::Enabled, false);
        EXPECT_CALL(plc, write_coil(_)).Times(0);
        run_for(500ms);

        EXPECT_EQ(feeder.state(), FeederState::Disabled);
        EXPECT_TRUE(signals.part_requested());

        set_mark(FeederMark::Enabled, true);
        run_for(500ms);
        EXPECT_EQ(feeder.state(), FeederState::Idle);

        // the request survived, so the sequence runs again and retries M1
        {
            InSequence order;
            EXPECT_CALL(plc, clear_coil(std::string_view("M6"))).Times(1);
            EXPECT_CALL(plc, write_coil(std::string_view("M1"))).Times(1);
        }

        run_for(500ms);
        EXPECT_EQ(feeder.state(), FeederState::WaitingRequest);

        run_for(1000ms);
        EXPECT_EQ(feeder.state(), FeederState::Requesting);

        run_for(500ms);
        EXPECT_EQ(feeder.state(), FeederState::StartingMotor);
        EXPECT_TRUE(signals.part_requested());
    }

    TEST_F(FeederTest, no_stock_holds_until_refilled)
    {
        set_mark(FeederMark::Enabled, true);
        set_mark(FeederMark::NoStock, true);

        feeder.step(SystemState::Running);
        EXPECT_EQ(feeder.state(), FeederState::NoStock);
        EXPECT_TRUE(feeder.marks().no_stock);

        run_for(1000ms);
        EXPECT_EQ(feeder.state(), FeederState::NoStock);

        set_mark(FeederMark::NoStock, false);
        run_for(500ms);
        EXPECT_EQ(feeder.state(), FeederState::Idle);
    }

    TEST_F(FeederTest, failed_request_write_retries)
    {
        set_mark(FeederMark::Enabled, true);
        signals.request_part();

        feeder.step(SystemState::Running);
        run_for(1000ms);
        ASSERT_EQ(feeder.state(), FeederState::Requesting);

        EXPECT_CALL(plc, write_coil(std::string_view("M1")))
          .WillOnce(Return(mlink::Result<void>(mlink::fail(mlink::Error::NotConnected))))
          .WillOnce(Return(mlink::success()));

        run_for(500ms);
        EXPECT_EQ(feeder.state(), FeederState::Requesting);
        run_for(100ms);
        EXPECT_EQ(feeder.state(), FeederState::StartingMotor);
    }

    TEST_F(FeederTest, failed_mark_read_keeps_last_values)
    {
        set_mark(FeederMark::Enabled, true);
        feeder.step(SystemState::Running);
        ASSERT_EQ(feeder.state(), FeederState::WaitingRequest);

        marks_error = mlink::Error::Timeout;
        set_mark(FeederMark::Enabled, false);
        run_for(1000ms);

        EXPECT_EQ(feeder.state(), FeederState::WaitingRequest);
        EXPECT_TRUE(feeder.marks().enabled);
    }

    TEST_F(FeederTest, marks_refresh_at_most_every_half_second)
    {
        EXPECT_CALL(plc, read_marks()).Times(2);

        feeder.step(SystemState::Running);
        run_for(100ms);
        run_for(100ms);
        run_for(300ms);
    }

    TEST_F(FeederTest, stopped_returns_to_idle_and_clears_counter)
    {
        set_mark(FeederMark::Enabled, true);
        feeder.step(SystemState::Running);
        ASSERT_EQ(feeder.state(), FeederState::WaitingRequest);

        run_for(1000ms, SystemState::Stopped);
        EXPECT_EQ(feeder.state(), FeederState::Idle);
        EXPECT_EQ(feeder.counter(), 0);
    }

    TEST_F(FeederTest, paused_holds_state)
    {
        set_mark(FeederMark::Enabled, true);
        signals.request_part();
        feeder.step(SystemState::Running);

        run_for(1000ms, SystemState::Paused);
        run_for(1000ms, SystemState::Paused);
        EXPECT_EQ(feeder.state(), FeederState::WaitingRequest);
        EXPECT_TRUE(signals.part_requested());
    }

    TEST_F(FeederTest, describes_states_with_delays)
    {
        auto config = feeder.config();

        EXPECT_EQ(config.name, "feeder");
        ASSERT_EQ(config.states.size(), 8u);
        EXPECT_EQ(config.states[0].label, "Idle");
        EXPECT_EQ(config.states[0].delay_ms, 1000);
        EXPECT_EQ(config.states[3].value, 10);
        EXPECT_EQ(config.states[3].label, "WaitingRequest");
        EXPECT_EQ(config.states[4].delay_ms, 100);
        EXPECT_EQ(config.states[7].value, 100);
    }

    TEST_F(FeederTest, addresses_marks_by_number)
    {
        EXPECT_EQ(process::FeederMachine::address_of(FeederMark::Request), "M1");
        EXPECT_EQ(process::FeederMachine::address_of(FeederMark::Reset), "M6");
    }
}
