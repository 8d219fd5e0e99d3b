#include "process/CyclicMachine.hpp"

#include "ManualClock.hpp"

#include <gtest/gtest.h>

namespace mcell::test
{
    using namespace std::chrono_literals;
    using model::SystemState;
    using process::RobotState;
    using process::VisionState;

    TEST(vision_machine, cycles_through_every_state)
    {
        ManualClock clock;
        process::VisionMachine vision(clock);
        EXPECT_EQ(vision.state(), VisionState::Capturing);

        vision.step(SystemState::Running);
        EXPECT_EQ(vision.state(), VisionState::Processing);
        EXPECT_EQ(vision.counter(), 1);

        clock.advance(999ms);
        vision.step(SystemState::Running);
        EXPECT_EQ(vision.state(), VisionState::Processing);

        clock.advance(1ms);
        vision.step(SystemState::Running);
        EXPECT_EQ(vision.state(), VisionState::Validating);

        clock.advance(1000ms);
        vision.step(SystemState::Running);
        EXPECT_EQ(vision.state(), VisionState::Capturing);
        EXPECT_EQ(vision.counter(), 3);
    }

    TEST(robot_machine, advances_every_one_and_a_half_seconds)
    {
        ManualClock clock;
        process::RobotMachine robot(clock);

        robot.step(SystemState::Running);
        EXPECT_EQ(robot.state(), RobotState::Moving);

        clock.advance(1000ms);
        robot.step(SystemState::Running);
        EXPECT_EQ(robot.state(), RobotState::Moving);

        clock.advance(500ms);
        robot.step(SystemState::Running);
        EXPECT_EQ(robot.state(), RobotState::Approaching);
        EXPECT_EQ(robot.counter(), 2);
    }

    TEST(robot_machine, paused_holds_state_and_counter)
    {
        ManualClock clock;
        process::RobotMachine robot(clock);
        robot.step(SystemState::Running);

        for (int i = 0; i < 5; ++i) {
            clock.advance(1500ms);
            robot.step(SystemState::Paused);
        }

        EXPECT_EQ(robot.state(), RobotState::Moving);
        EXPECT_EQ(robot.counter(), 1);
    }

    TEST(vision_machine, stopped_returns_to_initial_state)
    {
        ManualClock clock;
        process::VisionMachine vision(clock);
        vision.step(SystemState::Running);
        clock.advance(1000ms);
        vision.step(SystemState::Running);

        clock.advance(1000ms);
        vision.step(SystemState::Stopped);

        auto status = vision.status();
        EXPECT_EQ(status.name, "vision");
        EXPECT_EQ(status.state, 0);
        EXPECT_EQ(status.state_label, "Capturing");
        EXPECT_EQ(status.counter, 0);
    }

    TEST(vision_machine, reset_makes_next_step_due_immediately)
    {
        ManualClock clock;
        process::VisionMachine vision(clock);
        vision.step(SystemState::Running);

        vision.reset();
        vision.step(SystemState::Running);

        EXPECT_EQ(vision.state(), VisionState::Processing);
        EXPECT_EQ(vision.counter(), 1);
    }

    TEST(robot_machine, describes_its_states)
    {
        ManualClock clock;
        process::RobotMachine robot(clock);

        auto config = robot.config();

        EXPECT_EQ(config.name, "robot");
        ASSERT_EQ(config.states.size(), 3u);
        EXPECT_EQ(config.states[2].label, "Approaching");
        EXPECT_EQ(config.states[2].delay_ms, 1500);
    }
}
