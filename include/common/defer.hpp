#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)

/**
 * 在作用域退出时执行代码块，无论是正常返回还是抛出异常
 * @code{.cpp}
 *     auto box = provider.acquire(limits, mounts);
 *     defer { box->release(); };
 * @endcode
 */
#define defer auto DEFER_0(_deferred_action) = grader::scoped_guard() + [&]()

namespace grader {

struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other);
    scoped_guard(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace grader
