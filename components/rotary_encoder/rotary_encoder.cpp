#include "rotary_encoder.hpp"
#include "rotary_log.hpp"

#define TAG "ENCODER"

// RotaryEncoder类实现
RotaryEncoder::RotaryEncoder(GpioPort& port, const RotaryConfig& config, RotaryHandler* handler, const char* name)
    : port(port), config(config), handler(handler), name(name),
    debouncer(config.debounceMs * 1000, config.switchActiveLevel),
    initialized(false), clkRegistered(false), swRegistered(false),
    value(0), stopRequested(false)
    {
}

RotaryEncoder::~RotaryEncoder()
{
    deinit();
}

rotary_err_t RotaryEncoder::validateConfig() const
{
    if (config.clkGpio < 0 || config.dtGpio < 0 || config.swGpio < 0) {
        ROTARY_LOGE(TAG, "%s: negative gpio number (clk %d, dt %d, sw %d)",
                    name, config.clkGpio, config.dtGpio, config.swGpio);
        return ROTARY_ERR_INVALID_ARG;
    }
    if (config.clkGpio == config.dtGpio || config.clkGpio == config.swGpio || config.dtGpio == config.swGpio) {
        ROTARY_LOGE(TAG, "%s: clk, dt and sw must be different pins", name);
        return ROTARY_ERR_INVALID_ARG;
    }
    if (config.debounceMs == 0 || config.debounceMs > MAX_DEBOUNCE_MS) {
        ROTARY_LOGE(TAG, "%s: debounce window %u ms out of range", name, config.debounceMs);
        return ROTARY_ERR_INVALID_ARG;
    }
    if (config.switchActiveLevel != ROTARY_SWITCH_ACTIVE_LOW && config.switchActiveLevel != ROTARY_SWITCH_ACTIVE_HIGH) {
        ROTARY_LOGE(TAG, "%s: switch active level must be 0 or 1", name);
        return ROTARY_ERR_INVALID_ARG;
    }
    return ROTARY_OK;
}

rotary_err_t RotaryEncoder::init()
{
    if (initialized) {
        return ROTARY_ERR_INVALID_STATE;
    }

    rotary_err_t err = validateConfig();
    if (err != ROTARY_OK) {
        return err;
    }

    // 三个引脚都配置为输入
    const int pins[] = {config.clkGpio, config.dtGpio, config.swGpio};
    for (int gpio : pins) {
        err = port.setupInput(gpio, config.pull);
        if (err != ROTARY_OK) {
            ROTARY_LOGE(TAG, "%s: setup gpio %d failed: %s", name, gpio, rotary_err_to_name(err));
            return err;
        }
    }

    debouncer.reset();

    // CLK和SW注册边沿回调，DT只在CLK边沿时读取
    err = port.setEdgeCallback(config.clkGpio, clockEdgeHandler, this);
    if (err != ROTARY_OK) {
        ROTARY_LOGE(TAG, "%s: register clk callback failed: %s", name, rotary_err_to_name(err));
        deinit();
        return err;
    }
    clkRegistered = true;

    err = port.setEdgeCallback(config.swGpio, switchEdgeHandler, this);
    if (err != ROTARY_OK) {
        ROTARY_LOGE(TAG, "%s: register sw callback failed: %s", name, rotary_err_to_name(err));
        deinit();
        return err;
    }
    swRegistered = true;

    initialized = true;
    ROTARY_LOGI(TAG, "%s initialized on clk %d, dt %d, sw %d (debounce %u ms)",
                name, config.clkGpio, config.dtGpio, config.swGpio, config.debounceMs);
    return ROTARY_OK;
}

// pigpio清除回调时不会等待正在执行的回调，PigpioPort::clearEdgeCallback里会等两个alert周期
void RotaryEncoder::deinit()
{
    if (swRegistered) {
        rotary_err_t err = port.setWatchdog(config.swGpio, 0);
        if (err != ROTARY_OK) {
            ROTARY_LOGW(TAG, "%s: cancel sw watchdog failed: %s", name, rotary_err_to_name(err));
        }
        err = port.clearEdgeCallback(config.swGpio);
        if (err != ROTARY_OK) {
            ROTARY_LOGW(TAG, "%s: remove sw callback failed: %s", name, rotary_err_to_name(err));
        }
        swRegistered = false;
    }
    if (clkRegistered) {
        rotary_err_t err = port.clearEdgeCallback(config.clkGpio);
        if (err != ROTARY_OK) {
            ROTARY_LOGW(TAG, "%s: remove clk callback failed: %s", name, rotary_err_to_name(err));
        }
        clkRegistered = false;
    }
    if (initialized) {
        initialized = false;
        ROTARY_LOGI(TAG, "%s deinitialized", name);
    }
}

void RotaryEncoder::run()
{
    while (!stopRequested) {
        port.delayMs(RUN_POLL_MS);
    }
    stopRequested = false;
}

void RotaryEncoder::clockEdgeHandler(int gpio, int level, uint32_t tick, void* arg)
{
    RotaryEncoder* encoder = static_cast<RotaryEncoder*>(arg);
    encoder->onClockEdge(level, tick);
}

void RotaryEncoder::switchEdgeHandler(int gpio, int level, uint32_t tick, void* arg)
{
    RotaryEncoder* encoder = static_cast<RotaryEncoder*>(arg);
    encoder->onSwitchEdge(level, tick);
}

void RotaryEncoder::onClockEdge(int level, uint32_t tick)
{
    if (level == ROTARY_LEVEL_TIMEOUT) {
        return;
    }

    int dtLevel = port.read(config.dtGpio);
    if (dtLevel < 0) {
        ROTARY_LOGE(TAG, "%s: read dt gpio %d failed (%d)", name, config.dtGpio, dtLevel);
        return;
    }

    Direction dir;
    PinSnapshot snapshot{static_cast<uint8_t>(level), static_cast<uint8_t>(dtLevel)};
    if (!decodeRotation(snapshot, config.reversed, &dir)) {
        return;  // CLK上升沿
    }

    if (dir == Direction::CLOCKWISE) {
        value++;
    } else {
        value--;
    }
    ROTARY_LOGD(TAG, "%s %s at %u, value %d", name, directionName(dir), tick, static_cast<int>(value));

    if (handler) {
        handler->handleRotation(dir);
    }
}

void RotaryEncoder::onSwitchEdge(int level, uint32_t tick)
{
    if (level == ROTARY_LEVEL_TIMEOUT) {
        onSwitchTimeout(tick);
        return;
    }

    bool wasSettling = debouncer.settling();
    if (debouncer.edge(level, tick) && !wasSettling) {
        // 窗口内没有新边沿时看门狗到期，到期后再确认
        rotary_err_t err = port.setWatchdog(config.swGpio, config.debounceMs);
        if (err != ROTARY_OK) {
            // 没有看门狗就不会再有到期回调，只能现在按窗口已过处理
            ROTARY_LOGE(TAG, "%s: arm sw watchdog failed: %s, confirming now", name, rotary_err_to_name(err));
            onSwitchTimeout(tick + debouncer.getWindowUs());
        }
    }
}

void RotaryEncoder::onSwitchTimeout(uint32_t tick)
{
    int swLevel = port.read(config.swGpio);
    if (swLevel < 0) {
        ROTARY_LOGE(TAG, "%s: read sw gpio %d failed (%d)", name, config.swGpio, swLevel);
        debouncer.abandon();
    } else {
        ButtonState state;
        if (debouncer.poll(swLevel, tick, &state)) {
            dispatchButton(state);
        }
    }

    if (!debouncer.settling()) {
        rotary_err_t err = port.setWatchdog(config.swGpio, 0);
        if (err != ROTARY_OK) {
            ROTARY_LOGW(TAG, "%s: cancel sw watchdog failed: %s", name, rotary_err_to_name(err));
        }
    }
}

void RotaryEncoder::dispatchButton(ButtonState state)
{
    if (state == ButtonState::PRESSED) {
        ROTARY_LOGI(TAG, "%s pressed", name);
        if (handler) {
            handler->handlePress();
        }
    } else {
        ROTARY_LOGI(TAG, "%s released", name);
        if (handler) {
            handler->handleRelease();
        }
    }
}
