#include <gtest/gtest.h>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <vector>

#include "scripted_random_source.hpp"
#include "snooker/components/basic.hpp"
#include "snooker/core/simulator.hpp"
#include "snooker/scenarios/snooker_frame.hpp"
#include "snooker/systems/movement.hpp"
#include "snooker/systems/obstacles.hpp"
#include "snooker/systems/trajectory.hpp"

namespace {

const double kPi = std::acos(-1.0);

// Frame layout with only the motion systems running
// Pocket clearance so large that no object ball may be placed
class CrowdedPocketsScenario : public SnookerFrameScenario {
public:
    TableConfig getTableConfig() const override {
        TableConfig cfg = SnookerFrameScenario::getTableConfig();
        cfg.pocketBallClearance = 600.0;
        return cfg;
    }
};

class MotionOnlyScenario : public SnookerFrameScenario {
public:
    SystemConfig getConfig() const override {
        SystemConfig cfg = SnookerFrameScenario::getConfig();
        cfg.activeSystems = {Systems::SystemType::MOVEMENT, Systems::SystemType::DAMPENING};
        return cfg;
    }
};

} // namespace

class TableSimulatorTest : public ::testing::Test {
protected:
    TableSimulatorTest()
        : random(std::make_shared<ScriptedRandomSource>(std::vector<double>{600.0, 400.0})),
          simulator(random) {}

    std::shared_ptr<ScriptedRandomSource> random;
    TableSimulator simulator;
};

TEST_F(TableSimulatorTest, FrameLayout) {
    auto &registry = simulator.getRegistry();
    EXPECT_EQ(registry.view<Components::Ball>().size(), 22u);

    auto cue = simulator.cueBall();
    ASSERT_TRUE(cue.has_value());
    const auto &pos = registry.get<Components::Position>(*cue);
    EXPECT_DOUBLE_EQ(pos.x, 210.0);
    EXPECT_DOUBLE_EQ(pos.y, 250.0);
    EXPECT_TRUE(registry.all_of<Components::CueAim>(*cue));
    EXPECT_TRUE(simulator.getTable().isInDZone(pos.x, pos.y));

    EXPECT_EQ(simulator.obstacles().count(registry), 0u);
}

TEST_F(TableSimulatorTest, AimingProducesTrailAndShotHidesIt) {
    auto &registry = simulator.getRegistry();
    auto cue = *simulator.cueBall();

    auto &aim = registry.get<Components::CueAim>(cue);
    aim.angle = kPi;
    aim.visible = true;

    simulator.tick();
    ASSERT_TRUE(registry.all_of<Components::PredictedTrail>(cue));
    EXPECT_TRUE(registry.get<Components::PredictedTrail>(cue).visible);
    EXPECT_FALSE(registry.get<Components::PredictedTrail>(cue).samples.empty());

    ASSERT_TRUE(simulator.shoot(50.0));
    const auto &vel = registry.get<Components::Velocity>(cue);
    EXPECT_NEAR(vel.x, 10.5, 1e-9);
    EXPECT_NEAR(vel.y, 0.0, 1e-9);
    EXPECT_FALSE(registry.get<Components::CueAim>(cue).visible);

    simulator.tick();
    EXPECT_FALSE(registry.get<Components::PredictedTrail>(cue).visible);
    EXPECT_GT(registry.get<Components::Position>(cue).x, 210.0);
}

TEST_F(TableSimulatorTest, ShotPowerIsClamped) {
    auto &registry = simulator.getRegistry();
    auto cue = *simulator.cueBall();

    registry.get<Components::CueAim>(cue).angle = kPi;
    ASSERT_TRUE(simulator.shoot(500.0));
    EXPECT_NEAR(registry.get<Components::Velocity>(cue).x, simulator.maxShotSpeed, 1e-9);

    // Negative power still sends the ball along the aim, at minimum speed
    registry.get<Components::CueAim>(cue).angle = kPi;
    ASSERT_TRUE(simulator.shoot(-50.0));
    EXPECT_NEAR(registry.get<Components::Velocity>(cue).x, 1.0, 1e-9);
    EXPECT_NEAR(registry.get<Components::Velocity>(cue).y, 0.0, 1e-9);
}

TEST_F(TableSimulatorTest, BallsComeToRestAfterShot) {
    auto &registry = simulator.getRegistry();
    auto cue = *simulator.cueBall();
    registry.get<Components::CueAim>(cue).angle = kPi;

    ASSERT_TRUE(simulator.shoot(50.0));
    for (int i = 0; i < 400; ++i) {
        simulator.tick();
    }

    EXPECT_FALSE(Systems::anyBallsMoving(registry, 0.0));
    const auto &pos = registry.get<Components::Position>(cue);
    EXPECT_GT(pos.x, 210.0);
    EXPECT_LT(pos.x, simulator.getTable().getBoundaries().right);
}

TEST_F(TableSimulatorTest, ObstacleSpawnsAfterIntervalOnIdleTable) {
    auto &registry = simulator.getRegistry();

    for (int i = 0; i < 419; ++i) {
        simulator.tick();
    }
    EXPECT_EQ(simulator.obstacles().count(registry), 0u);

    simulator.tick();
    ASSERT_EQ(simulator.obstacles().count(registry), 1u);

    auto view = registry.view<Components::Obstacle, Components::Position>();
    for (auto [entity, obstacle, pos] : view.each()) {
        EXPECT_DOUBLE_EQ(pos.x, 600.0);
        EXPECT_DOUBLE_EQ(pos.y, 400.0);
        EXPECT_EQ(obstacle.phase, Components::ObstaclePhase::Warning);
    }
}

TEST_F(TableSimulatorTest, ResetRestoresLayout) {
    auto &registry = simulator.getRegistry();
    auto cue = *simulator.cueBall();
    registry.get<Components::CueAim>(cue).angle = kPi;
    simulator.shoot(80.0);
    for (int i = 0; i < 30; ++i) {
        simulator.tick();
    }

    simulator.reset();
    auto fresh = simulator.cueBall();
    ASSERT_TRUE(fresh.has_value());
    EXPECT_DOUBLE_EQ(registry.get<Components::Position>(*fresh).x, 210.0);
    EXPECT_DOUBLE_EQ(registry.get<Components::Velocity>(*fresh).length(), 0.0);
    EXPECT_EQ(registry.view<Components::Ball>().size(), 22u);
}

TEST_F(TableSimulatorTest, ShootWithoutCueBall) {
    SnookerFrameConfig cfg;
    cfg.placeCueBall = false;
    simulator.loadScenario(std::make_unique<SnookerFrameScenario>(cfg));
    simulator.reset();

    EXPECT_FALSE(simulator.cueBall().has_value());
    EXPECT_FALSE(simulator.shoot(50.0));
    EXPECT_EQ(simulator.getRegistry().view<Components::Ball>().size(), 21u);
}

TEST_F(TableSimulatorTest, ObjectBallsOnlyPlacedAtValidPositions) {
    simulator.loadScenario(std::make_unique<CrowdedPocketsScenario>());
    simulator.reset();

    auto &registry = simulator.getRegistry();
    // Only the cue ball remains; it is placed in the D without the check
    EXPECT_EQ(registry.view<Components::Ball>().size(), 1u);
    EXPECT_TRUE(simulator.cueBall().has_value());
}

TEST_F(TableSimulatorTest, MissingSystemsAreReported) {
    simulator.loadScenario(std::make_unique<MotionOnlyScenario>());
    simulator.reset();

    EXPECT_THROW(simulator.trajectory(), std::logic_error);
    EXPECT_THROW(simulator.obstacles(), std::logic_error);
    EXPECT_NO_THROW(simulator.tick());
}
