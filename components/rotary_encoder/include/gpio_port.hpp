#ifndef GPIO_PORT_HPP
#define GPIO_PORT_HPP

#include <stdint.h>
#include "rotary_config.hpp"
#include "rotary_err.hpp"

#define ROTARY_LEVEL_LOW        0
#define ROTARY_LEVEL_HIGH       1
#define ROTARY_LEVEL_TIMEOUT    2   // 看门狗到期，不是真实电平

// 主机GPIO库的最小接口
// 所有边沿回调和看门狗回调必须在同一个线程里串行投递
class GpioPort {
public:
    typedef void (*EdgeFunc)(int gpio, int level, uint32_t tick, void* user);

    virtual ~GpioPort() {}

    virtual rotary_err_t setupInput(int gpio, PullMode pull) = 0;
    // 返回0/1，失败时返回负数
    virtual int read(int gpio) = 0;
    virtual rotary_err_t setEdgeCallback(int gpio, EdgeFunc func, void* user) = 0;
    virtual rotary_err_t clearEdgeCallback(int gpio) = 0;
    // ms毫秒内该引脚没有变化则以ROTARY_LEVEL_TIMEOUT调用回调，0表示取消
    virtual rotary_err_t setWatchdog(int gpio, uint32_t ms) = 0;
    virtual void delayMs(uint32_t ms) = 0;
};

#endif
