#include "snooker/core/random_source.hpp"

#include <ctime>

EngineRandomSource::EngineRandomSource()
    : generator{static_cast<unsigned int>(time(nullptr))} {}

EngineRandomSource::EngineRandomSource(unsigned int seed)
    : generator{seed} {}

double EngineRandomSource::uniform(double low, double high) {
    if (!(high > low)) {
        return low;
    }
    std::uniform_real_distribution<> dist(low, high);
    return dist(generator);
}
