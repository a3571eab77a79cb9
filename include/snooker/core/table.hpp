/**
 * @file table.hpp
 * @brief Geometry of the snooker table: rails, pockets, the D and ball spots
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "snooker/core/constants.hpp"
#include "snooker/math/vector_math.hpp"

/**
 * @struct TableBounds
 * @brief Outer rectangle of the playing surface, before cushion and ball insets.
 *
 * y grows downwards, so top < bottom.
 */
struct TableBounds {
    double left;
    double right;
    double top;
    double bottom;
};

/**
 * @struct Pocket
 */
struct Pocket {
    Position position;
    std::string name;
};

/**
 * @struct TableConfig
 * @brief Dimensions of the table and its markings (pixels)
 */
struct TableConfig {
    double originX = 0.0;             // Left edge of the table
    double originY = 0.0;             // Top edge of the table
    double length = SnookerConstants::TableLength;   // Along x
    double width = SnookerConstants::TableWidth;     // Along y

    double cushionThickness = SnookerConstants::CushionThickness;
    double ballDiameter = SnookerConstants::BallDiameter;
    double pocketRadiusFactor = 1.5;  // Pocket radius in ball diameters

    double baulkFraction = 0.25;      // Baulk line position along the length
    double dRadius = 80.0;            // Radius of the D
    double pocketBallClearance = 40.0; // Closest a placed ball may sit to a pocket
};

/**
 * @brief Validates a table configuration.
 * @throws std::invalid_argument on non-positive dimensions
 */
void validateTableConfig(const TableConfig& config);

/**
 * @class Table
 * @brief Read-only table geometry queried by the prediction and obstacle systems.
 */
class Table {
public:
    Table();
    explicit Table(const TableConfig& config);

    /** @brief Outer rectangle {left, right, top, bottom} */
    TableBounds getBoundaries() const;

    const std::vector<Pocket>& getPocketPositions() const { return pockets; }
    double getPocketRadius() const { return pocketRadius; }
    double getBallRadius() const { return config.ballDiameter * 0.5; }
    double getCushionThickness() const { return config.cushionThickness; }
    const TableConfig& getConfig() const { return config; }

    /**
     * @brief True when (x, y) is behind the baulk line and within the D.
     */
    bool isInDZone(double x, double y) const;

    /**
     * @brief Area the obstacle field must keep clear; the D, where the
     * cue ball is placed.
     */
    bool isInRestrictedZone(double x, double y) const { return isInDZone(x, y); }

    /**
     * @brief True when a ball could be placed at (x, y): outside the D and
     * not too close to any pocket.
     */
    bool isValidBallPosition(double x, double y) const;

    /**
     * @brief Spot of a coloured ball ("yellow", "green", "brown", "blue", "pink", "black").
     */
    std::optional<Position> getBallSpotPosition(const std::string& colour) const;

    /**
     * @brief Fifteen red positions in a five-row triangle behind the pink.
     */
    std::vector<Position> getRedTrianglePositions() const;

    /** @brief Centre of the D on the baulk line */
    Position getDCentre() const;

private:
    void initializePockets();

    TableConfig config;
    double pocketRadius;
    std::vector<Pocket> pockets;
};
