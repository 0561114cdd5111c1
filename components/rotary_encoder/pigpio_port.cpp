#include "pigpio_port.hpp"
#include "rotary_log.hpp"

#include <pigpio.h>

#define TAG "PIGPIO"

// pigpio的负数错误码转换成rotary_err_t
static rotary_err_t pigpio_to_err(int rc)
{
    if (rc >= 0) {
        return ROTARY_OK;
    }
    switch (rc) {
        case PI_INIT_FAILED:
            return ROTARY_ERR_GPIO_INIT;
        case PI_BAD_GPIO:
        case PI_BAD_USER_GPIO:
        case PI_BAD_MODE:
            return ROTARY_ERR_BAD_GPIO;
        case PI_BAD_PUD:
            return ROTARY_ERR_BAD_PULL;
        case PI_BAD_WDOG_TIMEOUT:
            return ROTARY_ERR_BAD_WATCHDOG;
        case PI_NOT_PERMITTED:
            return ROTARY_ERR_NOT_PERMITTED;
        default:
            return ROTARY_FAIL;
    }
}

static unsigned to_pigpio_pull(PullMode pull)
{
    switch (pull) {
        case PullMode::UP:
            return PI_PUD_UP;
        case PullMode::DOWN:
            return PI_PUD_DOWN;
        case PullMode::OFF:
        default:
            return PI_PUD_OFF;
    }
}

PigpioPort::PigpioPort() : initialized(false) {}

PigpioPort::~PigpioPort()
{
    deinit();
}

rotary_err_t PigpioPort::init()
{
    if (initialized) {
        return ROTARY_ERR_INVALID_STATE;
    }

    int version = gpioInitialise();
    if (version < 0) {
        ROTARY_LOGE(TAG, "gpioInitialise failed (%d), root privileges or pigpiod running?", version);
        return pigpio_to_err(version);
    }

    initialized = true;
    ROTARY_LOGI(TAG, "pigpio initialized, version %d", version);
    return ROTARY_OK;
}

void PigpioPort::deinit()
{
    if (!initialized) {
        return;
    }
    gpioTerminate();
    initialized = false;
    ROTARY_LOGI(TAG, "pigpio terminated");
}

rotary_err_t PigpioPort::setupInput(int gpio, PullMode pull)
{
    if (!initialized) {
        return ROTARY_ERR_INVALID_STATE;
    }

    int rc = gpioSetMode(gpio, PI_INPUT);
    if (rc < 0) {
        ROTARY_LOGE(TAG, "gpioSetMode(%d) failed (%d)", gpio, rc);
        return pigpio_to_err(rc);
    }

    rc = gpioSetPullUpDown(gpio, to_pigpio_pull(pull));
    if (rc < 0) {
        ROTARY_LOGE(TAG, "gpioSetPullUpDown(%d) failed (%d)", gpio, rc);
        return pigpio_to_err(rc);
    }
    return ROTARY_OK;
}

int PigpioPort::read(int gpio)
{
    return gpioRead(gpio);
}

rotary_err_t PigpioPort::setEdgeCallback(int gpio, EdgeFunc func, void* user)
{
    if (!initialized) {
        return ROTARY_ERR_INVALID_STATE;
    }

    // pigpio在自己的alert线程里依次调用所有回调
    int rc = gpioSetAlertFuncEx(gpio, func, user);
    if (rc < 0) {
        ROTARY_LOGE(TAG, "gpioSetAlertFuncEx(%d) failed (%d)", gpio, rc);
    }
    return pigpio_to_err(rc);
}

rotary_err_t PigpioPort::clearEdgeCallback(int gpio)
{
    if (!initialized) {
        return ROTARY_ERR_INVALID_STATE;
    }
    int rc = gpioSetAlertFuncEx(gpio, nullptr, nullptr);
    if (rc < 0) {
        return pigpio_to_err(rc);
    }
    // alert线程可能还在执行旧回调，等它跑完再返回
    gpioDelay(ALERT_DRAIN_US);
    return ROTARY_OK;
}

rotary_err_t PigpioPort::setWatchdog(int gpio, uint32_t ms)
{
    if (!initialized) {
        return ROTARY_ERR_INVALID_STATE;
    }

    int rc = gpioSetWatchdog(gpio, ms);
    if (rc < 0) {
        ROTARY_LOGE(TAG, "gpioSetWatchdog(%d, %u) failed (%d)", gpio, ms, rc);
    }
    return pigpio_to_err(rc);
}

void PigpioPort::delayMs(uint32_t ms)
{
    gpioDelay(ms * 1000);
}
