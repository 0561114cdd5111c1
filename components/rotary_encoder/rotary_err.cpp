#include "rotary_err.hpp"
#include "rotary_log.hpp"

#define TAG "ROTARY_ERR"

typedef struct {
    rotary_err_t code;
    const char* name;
} rotary_err_msg_t;

static const rotary_err_msg_t rotary_err_msg_table[] = {
    {ROTARY_OK,                "ROTARY_OK"},
    {ROTARY_FAIL,              "ROTARY_FAIL"},
    {ROTARY_ERR_INVALID_ARG,   "ROTARY_ERR_INVALID_ARG"},
    {ROTARY_ERR_INVALID_STATE, "ROTARY_ERR_INVALID_STATE"},
    {ROTARY_ERR_GPIO_INIT,     "ROTARY_ERR_GPIO_INIT"},
    {ROTARY_ERR_BAD_GPIO,      "ROTARY_ERR_BAD_GPIO"},
    {ROTARY_ERR_BAD_PULL,      "ROTARY_ERR_BAD_PULL"},
    {ROTARY_ERR_BAD_WATCHDOG,  "ROTARY_ERR_BAD_WATCHDOG"},
    {ROTARY_ERR_NOT_PERMITTED, "ROTARY_ERR_NOT_PERMITTED"},
};

static const char rotary_unknown_msg[] = "ERROR";

const char* rotary_err_to_name(rotary_err_t code)
{
    for (size_t i = 0; i < sizeof(rotary_err_msg_table) / sizeof(rotary_err_msg_table[0]); i++) {
        if (rotary_err_msg_table[i].code == code) {
            return rotary_err_msg_table[i].name;
        }
    }
    return rotary_unknown_msg;
}

void rotary_error_check_failed(rotary_err_t rc, const char* file, int line, const char* expression)
{
    ROTARY_LOGE(TAG, "ROTARY_ERROR_CHECK failed: rotary_err_t 0x%x (%s) at %s:%d",
                rc, rotary_err_to_name(rc), file, line);
    ROTARY_LOGE(TAG, "expression: %s", expression);
    rotary_log_flush();
}
