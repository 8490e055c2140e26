#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace grader {

struct grader_exception : std::exception {
    grader_exception();
    explicit grader_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const grader_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示提交引用不合法
 * 比如文件不存在、不可读、没有在元数据中登记。
 * 在调度之前就会被拒绝，不会进入评测池
 */
struct intake_error : public grader_exception {
    intake_error(const std::string &reference, const std::string &message);

    /**
     * @brief 出错的提交引用（路径或者标识符）
     */
    std::string reference;
};

/**
 * @brief 同一个提交被引用了两次，或者两个提交产生了相同的标识符
 */
struct duplicate_submission : public intake_error {
    duplicate_submission(const std::string &reference, const std::string &message);
};

/**
 * @brief 表示沙箱或者评测环境的错误，与提交内容无关
 * 执行器会将该异常转换为 environment_failure，调度器会进行有限次数的重试
 */
struct environment_error : public grader_exception {
    environment_error();
    explicit environment_error(const std::string &message);
};

/**
 * @brief 宿主资源不足，无法创建新的沙箱
 * 比如沙箱数量达到上限、运行目录所在磁盘剩余空间不足
 */
struct resource_exhausted : public environment_error {
    explicit resource_exhausted(const std::string &message);
};

/**
 * @brief 评测器镜像不可用
 * 镜像目录不存在或者评测器无法启动，这意味着之后所有提交都无法评测
 */
struct image_unavailable : public environment_error {
    explicit image_unavailable(const std::string &message);
};

/**
 * @brief 同一个提交的评测结果被上报了两次
 * 这是调度器的逻辑错误而不是输入错误
 */
struct duplicate_report : public grader_exception {
    explicit duplicate_report(const std::string &id);
};

}  // namespace grader
