#pragma once

#include <algorithm>

// Index into [current] + forecast. Moves are clamped to [0, upper].
class Cursor {
public:
    int Value() const { return value_; }

    void Step(int delta, int upper) {
        upper = std::max(0, upper);
        value_ = std::clamp(value_ + delta, 0, upper);
    }

    void Reset() { value_ = 0; }

private:
    int value_ = 0;
};
