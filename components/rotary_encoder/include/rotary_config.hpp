#ifndef ROTARY_CONFIG_HPP
#define ROTARY_CONFIG_HPP

#include <stdint.h>

// KY-040 默认接线 (BCM编号)
#define ROTARY_DEFAULT_CLK_GPIO     13
#define ROTARY_DEFAULT_DT_GPIO      19
#define ROTARY_DEFAULT_SW_GPIO      26

#define ROTARY_DEFAULT_DEBOUNCE_MS  20      // 按键防抖窗口
#define ROTARY_SWITCH_ACTIVE_LOW    0       // 按下时SW为低电平
#define ROTARY_SWITCH_ACTIVE_HIGH   1

enum class PullMode {
    OFF,
    DOWN,
    UP,
};

struct RotaryConfig {
    int clkGpio = ROTARY_DEFAULT_CLK_GPIO;
    int dtGpio = ROTARY_DEFAULT_DT_GPIO;
    int swGpio = ROTARY_DEFAULT_SW_GPIO;
    PullMode pull = PullMode::UP;
    int switchActiveLevel = ROTARY_SWITCH_ACTIVE_LOW;
    uint32_t debounceMs = ROTARY_DEFAULT_DEBOUNCE_MS;
    bool reversed = false;      // 交换顺时针/逆时针
};

#endif
