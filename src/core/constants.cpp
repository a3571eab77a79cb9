#include "snooker/core/constants.hpp"

namespace SnookerConstants {

    const double Pi      = 3.14159265358979323846;

    // A 2:1 table; ball diameter is 1/36 of the table width
    const double TableLength      = 1000.0;
    const double TableWidth       = 500.0;
    const double CushionThickness = 12.0;
    const double BallDiameter     = 500.0 / 36.0;
    const double BallRadius       = 500.0 / 72.0;

    const unsigned int TicksPerSecond = 60;

    double ticksToSeconds(int ticks) {
        return static_cast<double>(ticks) / TicksPerSecond;
    }

    double degreesToRadians(double degrees) {
        return degrees * Pi / 180.0;
    }

} // namespace SnookerConstants
