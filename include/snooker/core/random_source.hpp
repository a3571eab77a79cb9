/**
 * @file random_source.hpp
 * @brief Injectable source of uniform random numbers
 */

#pragma once

#include <random>

/**
 * @class IRandomSource
 * @brief Supplies uniformly distributed doubles to randomized searches.
 *
 * Tests substitute a scripted implementation to force specific candidates.
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /**
     * @brief Returns a value in [low, high)
     */
    virtual double uniform(double low, double high) = 0;
};

/**
 * @class EngineRandomSource
 * @brief IRandomSource backed by std::default_random_engine
 */
class EngineRandomSource : public IRandomSource {
public:
    /** @brief Seeds from the wall clock */
    EngineRandomSource();

    explicit EngineRandomSource(unsigned int seed);

    double uniform(double low, double high) override;

private:
    std::default_random_engine generator;
};
