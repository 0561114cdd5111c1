#ifndef PIGPIO_PORT_HPP
#define PIGPIO_PORT_HPP

#include "gpio_port.hpp"

// 树莓派上基于pigpio的实现，一个进程只能有一个实例
class PigpioPort : public GpioPort {
public:
    PigpioPort();
    ~PigpioPort() override;

    PigpioPort(const PigpioPort&) = delete;
    PigpioPort& operator=(const PigpioPort&) = delete;

    rotary_err_t init();
    void deinit();

    rotary_err_t setupInput(int gpio, PullMode pull) override;
    int read(int gpio) override;
    rotary_err_t setEdgeCallback(int gpio, EdgeFunc func, void* user) override;
    rotary_err_t clearEdgeCallback(int gpio) override;
    rotary_err_t setWatchdog(int gpio, uint32_t ms) override;
    void delayMs(uint32_t ms) override;

private:
    bool initialized;

    static constexpr uint32_t ALERT_DRAIN_US = 2000;   // alert线程默认1ms处理一次
};

#endif
