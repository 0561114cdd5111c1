#ifndef CALLBACK_HPP
#define CALLBACK_HPP

#include "rotary_log.hpp"

#define ROTARY_MAX_CALLBACKS 10

// 编码器事件的回调列表，每个回调带一个user指针
class Callback {
public:
    typedef void (*CallbackFunc)(void* user);

    explicit Callback(const char* name) : name(name), callback_count(0) {}

    // 同一个(func, user)只能注册一次，空函数和列表满都返回false
    bool registerCallback(CallbackFunc func, void* user = nullptr) {
        if (!func) {
            ROTARY_LOGE(CALLBACK_TAG, "%s: invalid callback", name);
            return false;
        }

        if (indexOf(func, user) >= 0) {
            ROTARY_LOGW(CALLBACK_TAG, "%s: callback already registered", name);
            return false;
        }

        if (callback_count >= ROTARY_MAX_CALLBACKS) {
            ROTARY_LOGW(CALLBACK_TAG, "%s: callback list is full (%d)", name, ROTARY_MAX_CALLBACKS);
            return false;
        }

        entries[callback_count].func = func;
        entries[callback_count].user = user;
        callback_count++;
        ROTARY_LOGD(CALLBACK_TAG, "%s: callback registered, %d in total", name, callback_count);
        return true;
    }

    bool unregisterCallback(CallbackFunc func, void* user = nullptr) {
        int index = indexOf(func, user);
        if (index < 0) {
            ROTARY_LOGW(CALLBACK_TAG, "%s: callback not found", name);
            return false;
        }

        // 后面的前移，保持触发顺序
        for (int j = index; j < callback_count - 1; j++) {
            entries[j] = entries[j + 1];
        }
        callback_count--;
        entries[callback_count] = Entry();
        ROTARY_LOGD(CALLBACK_TAG, "%s: callback unregistered, %d left", name, callback_count);
        return true;
    }

    // 按注册顺序触发
    void trigger() const {
        for (int i = 0; i < callback_count; i++) {
            entries[i].func(entries[i].user);
        }
    }

    int count() const { return callback_count; }
    const char* getName() const { return name; }

private:
    struct Entry {
        CallbackFunc func = nullptr;
        void* user = nullptr;
    };

    int indexOf(CallbackFunc func, void* user) const {
        for (int i = 0; i < callback_count; i++) {
            if (entries[i].func == func && entries[i].user == user) {
                return i;
            }
        }
        return -1;
    }

    static constexpr const char* CALLBACK_TAG = "CALLBACK";

    const char* name;
    Entry entries[ROTARY_MAX_CALLBACKS];
    int callback_count;
};

#endif
