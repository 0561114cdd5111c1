#ifndef SWITCH_DEBOUNCER_HPP
#define SWITCH_DEBOUNCER_HPP

#include <stdint.h>

enum class ButtonState {
    PRESSED,
    RELEASED,
};

//----------------------------------------------SwitchDebouncer类定义----------------------------------------------//
// 按键防抖: 边沿进入等待，窗口结束后重新读电平确认，不阻塞回调线程
class SwitchDebouncer {
public:
    enum class State {
        IDLE,               // 空闲状态
        SETTLING_PRESS,     // 等待按下稳定
        PRESSED,            // 按下状态
        SETTLING_RELEASE    // 等待释放稳定
    };

    SwitchDebouncer(uint32_t windowUs, int activeLevel);

    // 返回true表示有未到期的窗口，调用者需要在之后调用poll
    bool edge(int level, uint32_t tick);
    // 返回true表示确认了一次按下或释放，结果写入out
    bool poll(int level, uint32_t tick, ButtonState* out);

    bool settling() const { return state == State::SETTLING_PRESS || state == State::SETTLING_RELEASE; }
    State getState() const { return state; }
    uint32_t getWindowUs() const { return windowUs; }
    void reset();
    // 放弃未完成的窗口，回到边沿之前的稳定状态
    void abandon();

private:
    bool isActive(int level) const { return (level != 0) == (activeLevel != 0); }

    uint32_t windowUs;
    int activeLevel;
    State state;
    uint32_t settleStart;
};
//----------------------------------------------SwitchDebouncer类定义----------------------------------------------//

#endif
