#ifndef SNOOKER_CONSTANTS_HPP
#define SNOOKER_CONSTANTS_HPP

namespace SnookerConstants {

    // Truly global constants
    extern const double Pi;

    // Table geometry (pixels)
    extern const double TableLength;
    extern const double TableWidth;
    extern const double CushionThickness;
    extern const double BallDiameter;
    extern const double BallRadius;

    // Timing
    extern const unsigned int TicksPerSecond;

    // Utility conversions
    double ticksToSeconds(int ticks);
    double degreesToRadians(double degrees);
}

#endif // SNOOKER_CONSTANTS_HPP
