#include "rotary_decoder.hpp"

bool decodeRotation(const PinSnapshot& snapshot, bool reversed, Direction* out)
{
    if (out == nullptr || snapshot.clk != 0) {
        return false;
    }

    bool clockwise = (snapshot.dt != 0);
    if (reversed) {
        clockwise = !clockwise;
    }
    *out = clockwise ? Direction::CLOCKWISE : Direction::COUNTER_CLOCKWISE;
    return true;
}

const char* directionName(Direction dir)
{
    switch (dir) {
        case Direction::CLOCKWISE:
            return "clockwise";
        case Direction::COUNTER_CLOCKWISE:
            return "counter-clockwise";
    }
    return "unknown";
}
