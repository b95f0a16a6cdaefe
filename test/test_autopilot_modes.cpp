#include <gtest/gtest.h>

#include "xplane_autopilot_cpp/autopilot_modes.hpp"

namespace {

const PIDKey kHeadingKey{Field::MagPsi, Field::MagPsiSetpoint, Field::PhiSetpoint};
const PIDKey kRollKey{Field::Phi, Field::PhiSetpoint, Field::AileronTrim};
const PIDKey kYawKey{Field::Beta, Field::BetaSetpoint, Field::RudderTrim};

class AutopilotModesTest : public ::testing::Test {
protected:
    void SetUp() override {
        heading_ = headingCascade();
        registerCascade(state_, heading_);
        state_.setMode(Mode::Heading, true);
    }

    void tickAt(double time) {
        state_.setTime(time);
        runCascade(state_, heading_);
    }

    Cascade heading_;
    ControlState state_;
};

}  // namespace

TEST(CascadeTest, HeadingCascadeShape) {
    const Cascade cascade = headingCascade();
    EXPECT_EQ(cascade.name, "heading");
    EXPECT_EQ(cascade.mode, Mode::Heading);
    ASSERT_EQ(cascade.stages.size(), 3u);
    EXPECT_EQ(cascade.stages[0].key, kHeadingKey);
    EXPECT_EQ(cascade.stages[1].key, kRollKey);
    EXPECT_EQ(cascade.stages[2].key, kYawKey);

    const PIDGains& heading = cascade.stages[0].gains;
    EXPECT_EQ(heading.p, 1.0);
    EXPECT_EQ(heading.d, -0.5);
    EXPECT_EQ(heading.output_min, -30.0);
    EXPECT_EQ(heading.output_max, 30.0);
    EXPECT_EQ(heading.modulo, 360.0);

    ASSERT_EQ(cascade.outputs.size(), 2u);
    EXPECT_EQ(cascade.outputs[0], Field::AileronTrim);
    EXPECT_EQ(cascade.outputs[1], Field::RudderTrim);
}

TEST(CascadeTest, AirspeedAndAltitudeHaveNoControlLaw) {
    ControlState state;
    state.setMode(Mode::Airspeed, true);
    state.setMode(Mode::Altitude, true);
    state.setTime(1.0);

    EXPECT_TRUE(runCascade(state, airspeedCascade()));
    EXPECT_TRUE(runCascade(state, altitudeCascade()));
    EXPECT_TRUE(airspeedCascade().outputs.empty());
    EXPECT_TRUE(altitudeCascade().outputs.empty());
    EXPECT_EQ(state.get(Field::ElevatorTrim), 0.0);
}

TEST(CascadeTest, RegisteringTwiceKeepsFirstGains) {
    ControlState state;
    registerCascade(state, headingCascade());

    HeadingModeGains other;
    other.roll.p = 7.0;
    registerCascade(state, headingCascade(other));

    EXPECT_EQ(state.pid(kRollKey).gains().p, 0.5);
}

TEST_F(AutopilotModesTest, OffModeLeavesStateAlone) {
    state_.setMode(Mode::Heading, false);
    state_.set(Field::MagPsiSetpoint, 100.0);
    state_.setTime(1.0);

    EXPECT_FALSE(runCascade(state_, heading_));
    EXPECT_FALSE(state_.pid(kHeadingKey).previousTime().has_value());
    EXPECT_EQ(state_.get(Field::PhiSetpoint), 0.0);
}

TEST_F(AutopilotModesTest, LaterStagesUseEarlierOutputsInTheSameTick) {
    state_.set(Field::MagPsi, 90.0);
    state_.set(Field::MagPsiSetpoint, 91.0);
    state_.set(Field::Phi, 0.0);
    state_.set(Field::Beta, 0.2);

    tickAt(0.0);
    EXPECT_EQ(state_.get(Field::PhiSetpoint), 0.0);

    tickAt(1.0);
    EXPECT_DOUBLE_EQ(*state_.get(Field::PhiSetpoint), 1.0);
    // Roll stage already saw the new roll setpoint
    EXPECT_DOUBLE_EQ(*state_.get(Field::AileronTrim), 0.5);
    EXPECT_DOUBLE_EQ(*state_.get(Field::RudderTrim), -0.2);

    EXPECT_EQ(state_.pid(kHeadingKey).previousTime(), 1.0);
    EXPECT_EQ(state_.pid(kRollKey).previousTime(), 1.0);
    EXPECT_EQ(state_.pid(kYawKey).previousTime(), 1.0);
}

TEST_F(AutopilotModesTest, HeadingErrorWrapsThroughNorth) {
    state_.set(Field::MagPsi, 350.0);
    state_.set(Field::MagPsiSetpoint, 10.0);

    tickAt(0.0);
    tickAt(1.0);
    EXPECT_DOUBLE_EQ(*state_.get(Field::PhiSetpoint), 20.0);
}

TEST_F(AutopilotModesTest, RollSetpointLimitedToThirtyDegrees) {
    state_.set(Field::MagPsi, 0.0);
    state_.set(Field::MagPsiSetpoint, 90.0);

    tickAt(0.0);
    tickAt(1.0);
    EXPECT_DOUBLE_EQ(*state_.get(Field::PhiSetpoint), 30.0);
    EXPECT_DOUBLE_EQ(*state_.get(Field::AileronTrim), 1.0);
}

TEST_F(AutopilotModesTest, ControllersKeepStateAcrossModeToggle) {
    state_.set(Field::Beta, 0.2);
    tickAt(0.0);
    tickAt(1.0);
    const double err_sum = state_.pid(kYawKey).errorSum();

    state_.setMode(Mode::Heading, false);
    tickAt(2.0);
    EXPECT_EQ(state_.pid(kYawKey).errorSum(), err_sum);
    EXPECT_EQ(state_.pid(kYawKey).previousTime(), 1.0);

    // Resumes straight away, no first-step pause
    state_.setMode(Mode::Heading, true);
    state_.set(Field::Beta, 0.4);
    tickAt(3.0);
    EXPECT_DOUBLE_EQ(*state_.get(Field::RudderTrim), -0.4);
    EXPECT_DOUBLE_EQ(state_.pid(kYawKey).errorSum(), err_sum - 0.4);
}
