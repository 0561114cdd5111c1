#include "switch_debouncer.hpp"
#include "rotary_log.hpp"

#define TAG "DEBOUNCE"

SwitchDebouncer::SwitchDebouncer(uint32_t windowUs, int activeLevel)
    : windowUs(windowUs),
      activeLevel(activeLevel),
      state(State::IDLE),
      settleStart(0) {
}

void SwitchDebouncer::reset()
{
    state = State::IDLE;
    settleStart = 0;
}

void SwitchDebouncer::abandon()
{
    if (state == State::SETTLING_PRESS) {
        state = State::IDLE;
    } else if (state == State::SETTLING_RELEASE) {
        state = State::PRESSED;
    }
}

bool SwitchDebouncer::edge(int level, uint32_t tick)
{
    switch (state)
    {
        case State::IDLE:
            if (isActive(level)) {  // 可能是按下
                settleStart = tick;
                state = State::SETTLING_PRESS;
                ROTARY_LOGV(TAG, "press edge at %u, settling", tick);
            }
            break;

        case State::PRESSED:
            if (!isActive(level)) {  // 可能是释放
                settleStart = tick;
                state = State::SETTLING_RELEASE;
                ROTARY_LOGV(TAG, "release edge at %u, settling", tick);
            }
            break;

        case State::SETTLING_PRESS:
        case State::SETTLING_RELEASE:
            // 窗口内的抖动，等到期后再判断
            ROTARY_LOGV(TAG, "bounce at %u ignored", tick);
            break;
    }
    return settling();
}

bool SwitchDebouncer::poll(int level, uint32_t tick, ButtonState* out)
{
    if (!settling()) {
        return false;
    }
    // 无符号相减，tick回绕也成立
    if (tick - settleStart < windowUs) {
        return false;
    }

    switch (state)
    {
        case State::SETTLING_PRESS:
            if (isActive(level)) {
                state = State::PRESSED;
                if (out) *out = ButtonState::PRESSED;
                return true;
            }
            ROTARY_LOGD(TAG, "press shorter than %u us dropped as noise", windowUs);
            state = State::IDLE;
            break;

        case State::SETTLING_RELEASE:
            if (!isActive(level)) {
                state = State::IDLE;
                if (out) *out = ButtonState::RELEASED;
                return true;
            }
            state = State::PRESSED;
            break;

        default:
            break;
    }
    return false;
}
