#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "snooker/core/random_source.hpp"

// Replays a fixed list of values, cycling when exhausted; bounds are ignored.
class ScriptedRandomSource : public IRandomSource {
public:
    explicit ScriptedRandomSource(std::vector<double> values) : values(std::move(values)) {}

    double uniform(double /*low*/, double /*high*/) override {
        ++calls;
        if (values.empty()) {
            return 0.0;
        }
        double const v = values[next % values.size()];
        ++next;
        return v;
    }

    int calls = 0;

private:
    std::vector<double> values;
    std::size_t next = 0;
};
