#pragma once

#include <boost/throw_exception.hpp>
#include <exception>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace passk {

/**
 * @brief 评测框架内所有异常的基类
 * 支持通过 << 追加错误信息，比如：
 * BOOST_THROW_EXCEPTION(internal_error() << "unknown task " << task_id);
 */
struct passk_exception : public std::exception {
public:
    passk_exception() = default;
    explicit passk_exception(const std::string &what);

    const char *what() const noexcept override;

    void append(const std::string &text);

private:
    std::string message;
};

/**
 * @brief 表示评测框架自身的逻辑错误，比如违反了内部约束
 */
struct internal_error : public passk_exception {
    using passk_exception::passk_exception;
};

/**
 * @brief 表示沙箱环境不可用
 * 比如找不到编译器、无法 fork、无法创建网络命名空间、无法创建工作文件夹。
 * 这类错误不是候选代码的问题，调用方必须和 CompileError/RuntimeError 区分开来。
 */
struct sandbox_unavailable : public passk_exception {
    using passk_exception::passk_exception;
};

template <typename E, typename T,
          typename = std::enable_if_t<std::is_base_of_v<passk_exception, std::decay_t<E>>>>
std::decay_t<E> operator<<(E &&ex, const T &value) {
    std::decay_t<E> result(std::forward<E>(ex));
    std::ostringstream ss;
    ss << value;
    result.append(ss.str());
    return result;
}

}  // namespace passk
