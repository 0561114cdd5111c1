#ifndef ROTARY_ERR_HPP
#define ROTARY_ERR_HPP

#include <stdlib.h>

typedef int rotary_err_t;

#define ROTARY_OK                   0
#define ROTARY_FAIL                 -1
#define ROTARY_ERR_INVALID_ARG      0x101   // 配置参数非法
#define ROTARY_ERR_INVALID_STATE    0x102   // 重复初始化等状态错误
#define ROTARY_ERR_GPIO_INIT        0x103   // GPIO库初始化失败
#define ROTARY_ERR_BAD_GPIO         0x104   // 引脚号不存在
#define ROTARY_ERR_BAD_PULL         0x105   // 上下拉设置失败
#define ROTARY_ERR_BAD_WATCHDOG     0x106   // 看门狗设置失败
#define ROTARY_ERR_NOT_PERMITTED    0x107   // 没有操作该引脚的权限

const char* rotary_err_to_name(rotary_err_t code);

// 出错直接退出进程，只用于初始化阶段
#define ROTARY_ERROR_CHECK(x) do {                                          \
        rotary_err_t err_rc_ = (x);                                         \
        if (err_rc_ != ROTARY_OK) {                                         \
            rotary_error_check_failed(err_rc_, __FILE__, __LINE__, #x);     \
            exit(1);                                                        \
        }                                                                   \
    } while (0)

void rotary_error_check_failed(rotary_err_t rc, const char* file, int line, const char* expression);

#endif
