/**
 * @file table.cpp
 * @brief Implementation of table geometry queries.
 */

#include "snooker/core/table.hpp"

#include <stdexcept>
#include <utility>

namespace {

struct Spot {
    const char* colour;
    double u; // fraction of length
    double v; // fraction of width
};

constexpr Spot kSpots[] = {
    {"brown",  0.25,  0.5},   // Centre of D
    {"green",  0.25,  0.35},
    {"yellow", 0.25,  0.65},
    {"blue",   0.5,   0.5},   // Centre of table
    {"pink",   0.735, 0.5},
    {"black",  0.88,  0.5},
};

constexpr int kRedRows = 5;
constexpr int kRedCount = 15;
constexpr double kRowSpacing = 0.87; // cos(30 deg), in diameters

} // namespace

void validateTableConfig(const TableConfig& config) {
    if (config.length <= 0.0 || config.width <= 0.0) {
        throw std::invalid_argument("Table length and width must be positive");
    }
    if (config.ballDiameter <= 0.0) {
        throw std::invalid_argument("Ball diameter must be positive");
    }
    if (config.cushionThickness < 0.0 || config.dRadius < 0.0) {
        throw std::invalid_argument("Cushion thickness and D radius must be non-negative");
    }
}

Table::Table() : Table(TableConfig{}) {}

Table::Table(const TableConfig& cfg)
    : config(cfg),
      pocketRadius(cfg.ballDiameter * cfg.pocketRadiusFactor)
{
    validateTableConfig(config);
    initializePockets();
}

void Table::initializePockets() {
    // Corner pockets move inward diagonally, middle pockets inward vertically only
    double const inset = pocketRadius * 0.5;
    double const x = config.originX;
    double const y = config.originY;
    double const len = config.length;
    double const w = config.width;

    pockets = {
        {Position(x + inset, y + inset), "top-left"},
        {Position(x + len - inset, y + inset), "top-right"},
        {Position(x + inset, y + w - inset), "bottom-left"},
        {Position(x + len - inset, y + w - inset), "bottom-right"},
        {Position(x + len / 2.0, y + inset), "top-middle"},
        {Position(x + len / 2.0, y + w - inset), "bottom-middle"},
    };
}

TableBounds Table::getBoundaries() const {
    return TableBounds{
        config.originX,
        config.originX + config.length,
        config.originY,
        config.originY + config.width
    };
}

Position Table::getDCentre() const {
    return Position(config.originX + config.length * config.baulkFraction,
                    config.originY + config.width * 0.5);
}

bool Table::isInDZone(double x, double y) const {
    Position const centre = getDCentre();
    double const distanceFromCentre = Position(x, y).dist(centre);
    return x <= centre.x && distanceFromCentre <= config.dRadius;
}

bool Table::isValidBallPosition(double x, double y) const {
    Position const centre = getDCentre();
    Position const p(x, y);
    if (x < centre.x && p.dist(centre) < config.dRadius) {
        return false;
    }
    for (const auto& pocket : pockets) {
        if (p.dist(pocket.position) < config.pocketBallClearance) {
            return false;
        }
    }
    return true;
}

std::optional<Position> Table::getBallSpotPosition(const std::string& colour) const {
    for (const auto& spot : kSpots) {
        if (colour == spot.colour) {
            return Position(config.originX + config.length * spot.u,
                            config.originY + config.width * spot.v);
        }
    }
    return std::nullopt;
}

std::vector<Position> Table::getRedTrianglePositions() const {
    std::vector<Position> positions;
    positions.reserve(kRedCount);

    double const startX = config.originX + config.length * 0.75;
    double const startY = config.originY + config.width * 0.5;
    double const diameter = config.ballDiameter;
    double const radius = diameter * 0.5;

    for (int row = 0; row < kRedRows; ++row) {
        int const ballsInRow = row + 1;
        double const rowStartY = startY - (ballsInRow - 1) * radius;
        for (int col = 0; col < ballsInRow && static_cast<int>(positions.size()) < kRedCount; ++col) {
            positions.emplace_back(startX + row * diameter * kRowSpacing,
                                   rowStartY + col * diameter);
        }
    }
    return positions;
}
