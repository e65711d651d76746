#pragma once

#include <functional>

#define JUDGEBOX_DEFER_1(x, y) x##y
#define JUDGEBOX_DEFER_2(x, y) JUDGEBOX_DEFER_1(x, y)
#define JUDGEBOX_DEFER_0(x) JUDGEBOX_DEFER_2(x, __COUNTER__)
#define defer auto JUDGEBOX_DEFER_0(_defered_option) = judgebox::scoped_guard() + [&]

namespace judgebox {

/**
 * @brief 在作用域结束时执行清理函数
 * 通过 defer { ... }; 使用
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace judgebox
