/*! @file test_step_planner.cpp
 *  @brief Test gait timing, footholds and body reference of the step planner
 */

#include <cmath>
#include <limits>

#include "StepPlanner.h"
#include "Utilities/ControllerErrors.h"
#include "Utilities/utilities.h"
#include "WooferTestHelpers.h"
#include "gtest/gtest.h"

class StepPlannerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    loadTestRobotParameters(robotParams);
    loadTestGaitParameters(gaitParams);
    woofer = buildWoofer<double>(robotParams);

    state.position = Vec3<double>(0, 0, 0.25);
    state.vWorld.setZero();
    state.orientation = Quat<double>(1, 0, 0, 0);
    state.omegaBody.setZero();
    state.jointAngles.setZero();
    state.jointVelocities.setZero();
    state.rBody.setIdentity();
    state.rpy.setZero();
    state.omegaWorld.setZero();
    contacts.setOnes();
  }

  // world position of a foot of the current state
  Vec3<double> footWorld(int leg) {
    WooferLegKinematics<double> kinematics(woofer);
    return state.position +
           legSegment(kinematics.forward(state.jointAngles, state.orientation),
                      leg);
  }

  RobotControlParameters robotParams;
  GaitPlannerParameters gaitParams;
  Woofer<double> woofer;
  RobotState<double> state;
  Vec4<double> contacts;
};

TEST_F(StepPlannerTest, phaseFollowsTime) {
  StepPlanner<double> planner(woofer);

  GaitPlan<double> plan =
      planner.update(state, contacts, 0.1, robotParams, gaitParams);
  EXPECT_NEAR(0.25, plan.phase, 1e-9);
  EXPECT_NEAR(0.5, plan.stepPhase, 1e-9);
  EXPECT_EQ(Vec4<double>(1, 0, 0, 1), plan.activeFeet);

  plan = planner.update(state, contacts, 0.3, robotParams, gaitParams);
  EXPECT_NEAR(0.75, plan.phase, 1e-9);
  EXPECT_NEAR(0.5, plan.stepPhase, 1e-9);
  EXPECT_EQ(Vec4<double>(0, 1, 1, 0), plan.activeFeet);

  // second cycle
  plan = planner.update(state, contacts, 0.45, robotParams, gaitParams);
  EXPECT_NEAR(0.125, plan.phase, 1e-9);
  EXPECT_NEAR(0.25, plan.stepPhase, 1e-9);
  EXPECT_EQ(Vec4<double>(1, 0, 0, 1), plan.activeFeet);
}

TEST_F(StepPlannerTest, phaseStaysInRange) {
  StepPlanner<double> planner(woofer);
  for (int i = 0; i < 2000; i++) {
    GaitPlan<double> plan = planner.update(state, contacts, i * 0.001,
                                           robotParams, gaitParams);
    ASSERT_GE(plan.phase, 0);
    ASSERT_LT(plan.phase, 1);
    ASSERT_GE(plan.stepPhase, 0);
    ASSERT_LE(plan.stepPhase, 1);
  }
}

TEST_F(StepPlannerTest, footholdsOnlyMoveAtLiftoffOverManyCycles) {
  // accumulated time lands next to every cycle boundary in floating point
  for (double period : {0.4, 0.6}) {
    gaitParams.gait_period = period;
    gaitParams.contact_schedule = {1, 0, 0, 1, 1, 1, 1, 1,
                                   0, 1, 1, 0, 1, 1, 1, 1};
    gaitParams.velocity_des = Vec3<double>(0.3, 0, 0);
    StepPlanner<double> planner(woofer);

    double t = 0;
    GaitPlan<double> last =
        planner.update(state, contacts, t, robotParams, gaitParams);
    for (int i = 0; i < 5000; i++) {
      t += 0.001;
      state.position[0] += 0.0003;
      GaitPlan<double> plan =
          planner.update(state, contacts, t, robotParams, gaitParams);

      int row = (int)std::floor(plan.phase * 4);
      if (row > 3) row = 3;
      for (int leg = 0; leg < 4; leg++) {
        ASSERT_EQ(gaitParams.contact_schedule[4 * row + leg],
                  plan.activeFeet[leg]);
        bool liftoff = plan.activeFeet[leg] < 1 && last.activeFeet[leg] >= 1;
        if (!liftoff) {
          ASSERT_TRUE(legSegment(plan.stepLocations, leg) ==
                      legSegment(last.stepLocations, leg))
              << "leg " << leg << " moved at t = " << t;
        } else {
          ASSERT_FALSE(legSegment(plan.stepLocations, leg) ==
                       legSegment(last.stepLocations, leg));
        }
      }
      last = plan;
    }
  }
}

TEST_F(StepPlannerTest, standingScheduleKeepsFeetDown) {
  gaitParams.contact_schedule = {1, 1, 1, 1};
  StepPlanner<double> planner(woofer);

  for (double t : {0.0, 0.1, 0.35, 0.9}) {
    GaitPlan<double> plan =
        planner.update(state, contacts, t, robotParams, gaitParams);
    EXPECT_EQ(Vec4<double>::Ones(), plan.activeFeet);
    EXPECT_NEAR(plan.phase, plan.stepPhase, 1e-12);
    for (int leg = 0; leg < NUM_LEGS; leg++) {
      EXPECT_TRUE(almostEqual(footWorld(leg),
                              legSegment(plan.stepLocations, leg), 1e-12));
    }
  }
}

TEST_F(StepPlannerTest, rejectsBadParameters) {
  StepPlanner<double> planner(woofer);

  gaitParams.gait_period = 0;
  EXPECT_THROW(planner.update(state, contacts, 0, robotParams, gaitParams),
               PlannerError);
  gaitParams.gait_period = 0.4;

  gaitParams.contact_schedule = {1, 0, 0, 1, 1};
  EXPECT_THROW(planner.update(state, contacts, 0, robotParams, gaitParams),
               PlannerError);

  gaitParams.contact_schedule = {};
  EXPECT_THROW(planner.update(state, contacts, 0, robotParams, gaitParams),
               PlannerError);

  gaitParams.contact_schedule = {1, 0, 1.5, 1};
  EXPECT_THROW(planner.update(state, contacts, 0, robotParams, gaitParams),
               PlannerError);
  gaitParams.contact_schedule = {1, 1, 1, 1};

  EXPECT_THROW(planner.update(state, contacts,
                              std::numeric_limits<double>::quiet_NaN(),
                              robotParams, gaitParams),
               PlannerError);

  gaitParams.body_height = -0.1;
  EXPECT_THROW(planner.update(state, contacts, 0, robotParams, gaitParams),
               PlannerError);
}

TEST_F(StepPlannerTest, bodyReferenceMovesWithCommand) {
  gaitParams.yaw_rate_des = 0.4;
  state.position = Vec3<double>(0.1, 0.2, 0.3);
  state.rpy = Vec3<double>(0, 0, 0.3);
  StepPlanner<double> planner(woofer);

  GaitPlan<double> plan =
      planner.update(state, contacts, 1.0, robotParams, gaitParams);
  EXPECT_TRUE(almostEqual(Vec3<double>(0.1, 0.2, 0.25), plan.pRef, 1e-12));
  EXPECT_TRUE(almostEqual(Vec3<double>(0, 0, 0.3), plan.rpyRef, 1e-12));

  // the reference ignores where the body actually went
  state.position = Vec3<double>(5, 5, 5);
  plan = planner.update(state, contacts, 1.5, robotParams, gaitParams);
  EXPECT_TRUE(almostEqual(Vec3<double>(0.2, 0.2, 0.25), plan.pRef, 1e-12));
  EXPECT_TRUE(almostEqual(Vec3<double>(0, 0, 0.5), plan.rpyRef, 1e-12));

  planner.reset();
  plan = planner.update(state, contacts, 2.0, robotParams, gaitParams);
  EXPECT_TRUE(almostEqual(Vec3<double>(5, 5, 0.25), plan.pRef, 1e-12));
}

TEST_F(StepPlannerTest, footholdsChosenAtLiftoff) {
  StepPlanner<double> planner(woofer);

  // first segment: front left and back right lift off
  GaitPlan<double> plan =
      planner.update(state, contacts, 0.0, robotParams, gaitParams);

  // each leg stands for half of a 0.4 s cycle, vx = 0.2
  double stepOffset = 0.2 * 0.2 / 2;
  for (int leg : {FRONT_LEFT, BACK_RIGHT}) {
    Vec3<double> hip = woofer.getHipLocation(leg);
    Vec3<double> expected(hip[0] + stepOffset, hip[1], 0);
    EXPECT_TRUE(almostEqual(expected, legSegment(plan.stepLocations, leg),
                            1e-12));
    EXPECT_TRUE(almostEqual(footWorld(leg),
                            legSegment(plan.prevStepLocations, leg), 1e-12));
  }
  for (int leg : {FRONT_RIGHT, BACK_LEFT}) {
    EXPECT_TRUE(almostEqual(footWorld(leg), legSegment(plan.stepLocations, leg),
                            1e-12));
  }
  Vec3<double> frontLeftStep = legSegment(plan.stepLocations, FRONT_LEFT);

  // same segment, the body moved: footholds stay put
  state.position = Vec3<double>(0.01, 0, 0.25);
  plan = planner.update(state, contacts, 0.1, robotParams, gaitParams);
  EXPECT_TRUE(almostEqual(frontLeftStep,
                          legSegment(plan.stepLocations, FRONT_LEFT), 1e-12));

  // second segment: front right and back left lift off from where they are
  plan = planner.update(state, contacts, 0.25, robotParams, gaitParams);
  EXPECT_EQ(Vec4<double>(0, 1, 1, 0), plan.activeFeet);
  Vec3<double> hip = woofer.getHipLocation(FRONT_RIGHT);
  EXPECT_TRUE(almostEqual(Vec3<double>(0.01 + hip[0] + stepOffset, hip[1], 0),
                          legSegment(plan.stepLocations, FRONT_RIGHT), 1e-12));
  EXPECT_TRUE(almostEqual(footWorld(FRONT_RIGHT),
                          legSegment(plan.prevStepLocations, FRONT_RIGHT),
                          1e-12));
  EXPECT_TRUE(almostEqual(frontLeftStep,
                          legSegment(plan.stepLocations, FRONT_LEFT), 1e-12));
}

TEST_F(StepPlannerTest, footholdLeadsTurn) {
  gaitParams.velocity_des = Vec3<double>::Zero();
  gaitParams.yaw_rate_des = 1.0;
  StepPlanner<double> planner(woofer);

  GaitPlan<double> plan =
      planner.update(state, contacts, 0.0, robotParams, gaitParams);

  // half of the 0.2 s stance at 1 rad/s
  double angle = 0.1;
  Vec3<double> hip = woofer.getHipLocation(FRONT_LEFT);
  Vec3<double> expected(hip[0] * std::cos(angle) - hip[1] * std::sin(angle),
                        hip[0] * std::sin(angle) + hip[1] * std::cos(angle), 0);
  EXPECT_TRUE(almostEqual(expected, legSegment(plan.stepLocations, FRONT_LEFT),
                          1e-12));
}
