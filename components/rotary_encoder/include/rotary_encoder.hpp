#ifndef ROTARY_ENCODER_HPP
#define ROTARY_ENCODER_HPP

#include <atomic>
#include <stdint.h>

#include "gpio_port.hpp"
#include "rotary_config.hpp"
#include "rotary_decoder.hpp"
#include "rotary_err.hpp"
#include "rotary_handler.hpp"
#include "switch_debouncer.hpp"

//----------------------------------------------RotaryEncoder类定义----------------------------------------------//
// KY-040驱动: CLK边沿判方向，SW边沿经防抖后判按下/释放
// 回调都在GpioPort的回调线程里执行，handler为空时只计数
class RotaryEncoder {
public:
    RotaryEncoder(GpioPort& port, const RotaryConfig& config, RotaryHandler* handler, const char* name = "Encoder");
    ~RotaryEncoder();

    RotaryEncoder(const RotaryEncoder&) = delete;
    RotaryEncoder& operator=(const RotaryEncoder&) = delete;

    rotary_err_t init();
    void deinit();
    bool isInitialized() const { return initialized; }

    // 阻塞直到stop()，可以在信号处理函数里调用stop()
    void run();
    void stop() { stopRequested = true; }

    int32_t getValue() const { return value; }
    void setValue(int32_t val) { value = val; }
    void reset() { value = 0; }

    const SwitchDebouncer& getDebouncer() const { return debouncer; }

    void onClockEdge(int level, uint32_t tick);
    void onSwitchEdge(int level, uint32_t tick);

private:
    static void clockEdgeHandler(int gpio, int level, uint32_t tick, void* arg);
    static void switchEdgeHandler(int gpio, int level, uint32_t tick, void* arg);

    rotary_err_t validateConfig() const;
    void onSwitchTimeout(uint32_t tick);
    void dispatchButton(ButtonState state);

    GpioPort& port;
    RotaryConfig config;
    RotaryHandler* handler;
    const char* name;
    SwitchDebouncer debouncer;

    bool initialized;
    bool clkRegistered;
    bool swRegistered;
    std::atomic<int32_t> value;
    std::atomic<bool> stopRequested;

    static constexpr uint32_t RUN_POLL_MS = 50;         // run()检查stop的间隔
    static constexpr uint32_t MAX_DEBOUNCE_MS = 60000;  // 看门狗上限
};
//----------------------------------------------RotaryEncoder类定义----------------------------------------------//

#endif
