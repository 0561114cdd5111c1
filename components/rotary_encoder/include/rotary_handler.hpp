#ifndef ROTARY_HANDLER_HPP
#define ROTARY_HANDLER_HPP

#include "callback.hpp"
#include "rotary_decoder.hpp"

// 编码器事件接口，所有钩子默认什么都不做
// 可以重写handle*，也可以只重写on*
class RotaryHandler {
public:
    virtual ~RotaryHandler() {}

    virtual void handleRotation(Direction dir);
    virtual void handlePress() { onPressed(); }
    virtual void handleRelease() { onReleased(); }

    virtual void onClockwise() {}
    virtual void onCounterClockwise() {}
    virtual void onPressed() {}
    virtual void onReleased() {}
};

// 把事件转发给普通函数回调
class CallbackRotaryHandler : public RotaryHandler {
public:
    void onClockwise() override { CallbackClockwise.trigger(); }
    void onCounterClockwise() override { CallbackCounterClockwise.trigger(); }
    void onPressed() override { CallbackPressed.trigger(); }
    void onReleased() override { CallbackReleased.trigger(); }

    Callback CallbackClockwise{"Encoder_RIGHT"};
    Callback CallbackCounterClockwise{"Encoder_LEFT"};
    Callback CallbackPressed{"Encoder_PRESS"};
    Callback CallbackReleased{"Encoder_RELEASE"};
};

#endif
