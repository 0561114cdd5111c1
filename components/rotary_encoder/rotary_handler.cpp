#include "rotary_handler.hpp"

void RotaryHandler::handleRotation(Direction dir)
{
    switch (dir) {
        case Direction::CLOCKWISE:
            onClockwise();
            break;
        case Direction::COUNTER_CLOCKWISE:
            onCounterClockwise();
            break;
    }
}
