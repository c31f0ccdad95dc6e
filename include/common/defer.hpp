#pragma once

#include <utility>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = ::runner::scope_exit_tag() + [&]

namespace runner {

/**
 * @brief 在离开作用域时执行回调，用于在任何退出路径上回收文件描述符等资源
 * 回调不允许抛出异常
 */
template <typename F>
struct scope_exit {
    explicit scope_exit(F &&f) : f(std::move(f)), active(true) {}
    scope_exit(scope_exit &&other) : f(std::move(other.f)), active(other.active) {
        other.active = false;
    }
    scope_exit(const scope_exit &) = delete;
    scope_exit &operator=(const scope_exit &) = delete;

    ~scope_exit() {
        if (active) f();
    }

private:
    F f;
    bool active;
};

struct scope_exit_tag {};

template <typename F>
scope_exit<F> operator+(scope_exit_tag, F &&f) {
    return scope_exit<F>(std::forward<F>(f));
}

}  // namespace runner
