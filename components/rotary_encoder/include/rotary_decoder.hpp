#ifndef ROTARY_DECODER_HPP
#define ROTARY_DECODER_HPP

#include <stdint.h>

enum class Direction {
    CLOCKWISE,
    COUNTER_CLOCKWISE,
};

// CLK边沿时刻采到的两路电平
struct PinSnapshot {
    const uint8_t clk;
    const uint8_t dt;
};

// CLK下降沿: DT为高 -> 顺时针, DT为低 -> 逆时针; CLK上升沿不产生事件
// 返回true表示out中有一个有效方向
bool decodeRotation(const PinSnapshot& snapshot, bool reversed, Direction* out);

const char* directionName(Direction dir);

#endif
