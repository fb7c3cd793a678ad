#pragma once

#include <utility>

namespace passk {

/**
 * @brief 在作用域结束时执行一段代码，无论是正常返回还是抛出异常
 * 用法：
 * defer { cleanup(); };
 */
template <typename F>
struct deferred_action {
    explicit deferred_action(F &&func) : func(std::move(func)) {}
    deferred_action(const deferred_action &) = delete;
    deferred_action &operator=(const deferred_action &) = delete;

    ~deferred_action() {
        func();
    }

private:
    F func;
};

struct deferred_action_builder {
    template <typename F>
    deferred_action<F> operator+(F &&func) {
        return deferred_action<F>(std::forward<F>(func));
    }
};

}  // namespace passk

#define PASSK_DEFER_CONCAT_IMPL(a, b) a##b
#define PASSK_DEFER_CONCAT(a, b) PASSK_DEFER_CONCAT_IMPL(a, b)
#define defer auto PASSK_DEFER_CONCAT(_deferred_, __LINE__) = ::passk::deferred_action_builder() + [&]()
