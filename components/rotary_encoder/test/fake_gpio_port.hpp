#ifndef FAKE_GPIO_PORT_HPP
#define FAKE_GPIO_PORT_HPP

#include <functional>
#include <map>
#include <set>

#include "gpio_port.hpp"

// 测试用GpioPort: 电平、时间和看门狗都由测试手动推进
class FakeGpioPort : public GpioPort {
public:
    struct Edge {
        EdgeFunc func = nullptr;
        void* user = nullptr;
    };

    rotary_err_t setupInput(int gpio, PullMode pull) override {
        if (failSetup.count(gpio)) {
            return ROTARY_ERR_BAD_GPIO;
        }
        pulls[gpio] = pull;
        if (!levels.count(gpio)) {
            levels[gpio] = (pull == PullMode::DOWN) ? ROTARY_LEVEL_LOW : ROTARY_LEVEL_HIGH;
        }
        return ROTARY_OK;
    }

    int read(int gpio) override {
        if (failRead.count(gpio) || !levels.count(gpio)) {
            return -3;
        }
        return levels[gpio];
    }

    rotary_err_t setEdgeCallback(int gpio, EdgeFunc func, void* user) override {
        if (failCallback.count(gpio)) {
            return ROTARY_ERR_BAD_GPIO;
        }
        edges[gpio].func = func;
        edges[gpio].user = user;
        return ROTARY_OK;
    }

    rotary_err_t clearEdgeCallback(int gpio) override {
        edges.erase(gpio);
        return ROTARY_OK;
    }

    rotary_err_t setWatchdog(int gpio, uint32_t ms) override {
        if (ms == 0) {
            watchdogs.erase(gpio);
            return ROTARY_OK;
        }
        if (failWatchdog.count(gpio)) {
            return ROTARY_ERR_BAD_WATCHDOG;
        }
        watchdogs[gpio] = ms;
        watchdogArms[gpio]++;
        return ROTARY_OK;
    }

    void delayMs(uint32_t ms) override {
        now += ms * 1000;
        delayCalls++;
        if (onDelay) {
            onDelay();
        }
    }

    // 改变电平，有回调时按边沿投递
    void setLevel(int gpio, int level, uint32_t atUs) {
        now = atUs;
        if (levels.count(gpio) && levels[gpio] == level) {
            return;
        }
        levels[gpio] = level;
        if (edges.count(gpio) && edges[gpio].func) {
            edges[gpio].func(gpio, level, now, edges[gpio].user);
        }
    }

    // 只改电平不触发回调，模拟没有挂中断的DT脚
    void forceLevel(int gpio, int level) { levels[gpio] = level; }

    bool watchdogArmed(int gpio) const { return watchdogs.count(gpio) != 0; }

    // 看门狗到期，没有装看门狗时返回false
    bool expireWatchdog(int gpio, uint32_t atUs) {
        now = atUs;
        if (!watchdogArmed(gpio) || !edges.count(gpio)) {
            return false;
        }
        edges[gpio].func(gpio, ROTARY_LEVEL_TIMEOUT, now, edges[gpio].user);
        return true;
    }

    bool hasCallback(int gpio) const { return edges.count(gpio) != 0; }

    std::map<int, int> levels;
    std::map<int, PullMode> pulls;
    std::map<int, Edge> edges;
    std::map<int, uint32_t> watchdogs;
    std::map<int, int> watchdogArms;
    std::set<int> failSetup;
    std::set<int> failCallback;
    std::set<int> failRead;
    std::set<int> failWatchdog;
    std::function<void()> onDelay;
    uint32_t now = 0;
    int delayCalls = 0;
};

#endif
