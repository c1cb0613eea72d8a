#pragma once

#include <functional>

#define BRIDGE_DEFER_1(x, y) x##y
#define BRIDGE_DEFER_2(x, y) BRIDGE_DEFER_1(x, y)
#define BRIDGE_DEFER_0(x) BRIDGE_DEFER_2(x, __COUNTER__)

/**
 * 在作用域结束时执行一段代码，用于释放 C 接口申请的资源
 * @code{.cpp}
 *     inflateInit(&stream);
 *     defer { inflateEnd(&stream); };
 * @endcode
 * 代码块中不能抛出异常。
 */
#define defer auto BRIDGE_DEFER_0(_deferred_action) = bridge::scope_exit() + [&]() noexcept

namespace bridge {

struct scope_exit {
    std::function<void()> f;
    scope_exit();
    explicit scope_exit(std::function<void()> f);
    scope_exit(scope_exit &&other) noexcept;
    scope_exit(const scope_exit &) = delete;
    ~scope_exit();

    scope_exit operator+(std::function<void()> f) const;
};

}  // namespace bridge
