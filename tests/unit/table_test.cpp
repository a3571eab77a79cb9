#include <gtest/gtest.h>
#include <stdexcept>
#include "snooker/core/table.hpp"

class TableTest : public ::testing::Test {
protected:
    Table table;
};

TEST_F(TableTest, BoundariesFollowConfig) {
    TableBounds b = table.getBoundaries();
    EXPECT_DOUBLE_EQ(b.left, 0.0);
    EXPECT_DOUBLE_EQ(b.right, 1000.0);
    EXPECT_DOUBLE_EQ(b.top, 0.0);
    EXPECT_DOUBLE_EQ(b.bottom, 500.0);

    TableConfig cfg;
    cfg.originX = 100.0;
    cfg.originY = 50.0;
    Table shifted(cfg);
    TableBounds s = shifted.getBoundaries();
    EXPECT_DOUBLE_EQ(s.left, 100.0);
    EXPECT_DOUBLE_EQ(s.right, 1100.0);
    EXPECT_DOUBLE_EQ(s.bottom, 550.0);
}

TEST_F(TableTest, SixPocketsInsetFromRails) {
    const auto& pockets = table.getPocketPositions();
    ASSERT_EQ(pockets.size(), 6u);

    double const inset = table.getPocketRadius() * 0.5;
    EXPECT_NEAR(table.getPocketRadius(), 500.0 / 36.0 * 1.5, 1e-12);

    EXPECT_EQ(pockets[0].name, "top-left");
    EXPECT_DOUBLE_EQ(pockets[0].position.x, inset);
    EXPECT_DOUBLE_EQ(pockets[0].position.y, inset);

    EXPECT_EQ(pockets[5].name, "bottom-middle");
    EXPECT_DOUBLE_EQ(pockets[5].position.x, 500.0);
    EXPECT_DOUBLE_EQ(pockets[5].position.y, 500.0 - inset);
}

TEST_F(TableTest, DZoneIsHalfDiscBehindBaulk) {
    Position centre = table.getDCentre();
    EXPECT_DOUBLE_EQ(centre.x, 250.0);
    EXPECT_DOUBLE_EQ(centre.y, 250.0);

    EXPECT_TRUE(table.isInDZone(240.0, 250.0));
    EXPECT_TRUE(table.isInDZone(250.0, 330.0));     // On the arc, on the line
    EXPECT_FALSE(table.isInDZone(260.0, 250.0));    // In front of baulk line
    EXPECT_FALSE(table.isInDZone(240.0, 350.0));    // Outside radius
    EXPECT_TRUE(table.isInRestrictedZone(200.0, 250.0));
}

TEST_F(TableTest, ValidBallPositionAvoidsDAndPockets) {
    EXPECT_TRUE(table.isValidBallPosition(600.0, 250.0));
    EXPECT_FALSE(table.isValidBallPosition(200.0, 250.0));
    EXPECT_FALSE(table.isValidBallPosition(20.0, 20.0));
}

TEST_F(TableTest, SpotsAndTriangle) {
    auto blue = table.getBallSpotPosition("blue");
    ASSERT_TRUE(blue.has_value());
    EXPECT_DOUBLE_EQ(blue->x, 500.0);
    EXPECT_DOUBLE_EQ(blue->y, 250.0);

    auto black = table.getBallSpotPosition("black");
    ASSERT_TRUE(black.has_value());
    EXPECT_DOUBLE_EQ(black->x, 880.0);

    EXPECT_FALSE(table.getBallSpotPosition("purple").has_value());

    auto reds = table.getRedTrianglePositions();
    ASSERT_EQ(reds.size(), 15u);
    // Apex on the centre line, behind the pink
    EXPECT_DOUBLE_EQ(reds[0].x, 750.0);
    EXPECT_DOUBLE_EQ(reds[0].y, 250.0);
    // Back row has five balls one diameter apart
    EXPECT_NEAR(reds[14].y - reds[10].y, 4.0 * 500.0 / 36.0, 1e-9);
}

TEST(TableConfigTest, RejectsDegenerateTable) {
    TableConfig cfg;
    cfg.width = 0.0;
    EXPECT_THROW(Table{cfg}, std::invalid_argument);

    TableConfig negativeBall;
    negativeBall.ballDiameter = -1.0;
    EXPECT_THROW(validateTableConfig(negativeBall), std::invalid_argument);
}
