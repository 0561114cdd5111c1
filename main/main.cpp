#include <signal.h>
#include <stdio.h>
#include <stdlib.h>

#include "pigpio_port.hpp"
#include "rotary_encoder.hpp"
#include "rotary_log.hpp"

#define TAG "MAIN"

// 每个事件打印一行
class PrintingHandler : public RotaryHandler {
public:
    void onClockwise() override { printf("The encoder was turned to the right 1 notch\n"); }
    void onCounterClockwise() override { printf("The encoder was turned to the left 1 notch\n"); }
    void onPressed() override { printf("The encoder was pressed down\n"); }
    void onReleased() override { printf("The encoder button was released\n"); }
};

static RotaryEncoder* s_encoder = nullptr;

static void handle_sigint(int)
{
    if (s_encoder) {
        s_encoder->stop();
    }
}

static bool parse_gpio(const char* text, int* out)
{
    char* end = nullptr;
    long value = strtol(text, &end, 10);
    if (end == text || *end != '\0' || value < 0 || value > 53) {
        return false;
    }
    *out = static_cast<int>(value);
    return true;
}

static void print_usage(const char* prog)
{
    fprintf(stderr, "usage: %s [clk dt sw]\n", prog);
    fprintf(stderr, "  defaults: clk %d, dt %d, sw %d (BCM numbering)\n",
            ROTARY_DEFAULT_CLK_GPIO, ROTARY_DEFAULT_DT_GPIO, ROTARY_DEFAULT_SW_GPIO);
    fprintf(stderr, "  ROTARY_LOG_LEVEL=none|error|warn|info|debug|verbose\n");
}

int main(int argc, char** argv)
{
    rotary_log_level_set(rotary_log_level_from_string(getenv("ROTARY_LOG_LEVEL"), ROTARY_LOG_INFO));

    RotaryConfig config;
    if (argc == 4) {
        if (!parse_gpio(argv[1], &config.clkGpio) ||
            !parse_gpio(argv[2], &config.dtGpio) ||
            !parse_gpio(argv[3], &config.swGpio)) {
            print_usage(argv[0]);
            return 1;
        }
    } else if (argc != 1) {
        print_usage(argv[0]);
        return 1;
    }

    PigpioPort port;
    ROTARY_ERROR_CHECK(port.init());

    PrintingHandler handler;
    RotaryEncoder encoder(port, config, &handler);
    s_encoder = &encoder;

    // pigpio会接管SIGINT，要在初始化之后再装；装之前s_encoder必须已经有效
    signal(SIGINT, handle_sigint);
    signal(SIGTERM, handle_sigint);

    rotary_err_t err = encoder.init();
    if (err != ROTARY_OK) {
        ROTARY_LOGE(TAG, "encoder init failed: %s", rotary_err_to_name(err));
        s_encoder = nullptr;
        return 1;
    }

    ROTARY_LOGI(TAG, "Turn or press the knob, Ctrl+C to exit");
    encoder.run();

    s_encoder = nullptr;
    encoder.deinit();
    ROTARY_LOGI(TAG, "final value %d", static_cast<int>(encoder.getValue()));
    return 0;
}
