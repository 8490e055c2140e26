#pragma once

#include <string>
#include <variant>
#include <vector>
#include "common/status.hpp"
#include "judge/check.hpp"

/**
 * 这个头文件包含一次执行的结果
 * 每次执行必然产生以下四种结果之一，调度器根据结果决定是否重试
 */
namespace grader {

namespace outcome {

/**
 * @brief 评测器正常执行完毕
 * results 中可能有失败的检查，这不影响 completed 的判定
 */
struct completed {
    std::vector<check_result> results;
};

/**
 * @brief 执行超时被杀死
 * results 保存超时前评测器已经上报的检查结果，未上报的检查为 NOT_RUN
 */
struct timed_out {
    std::vector<check_result> results;
    double elapsed = 0;
};

/**
 * @brief 选手代码导致评测器崩溃
 * 这是提交的问题，不会被重试
 */
struct submission_crashed {
    std::vector<check_result> results;
    std::string cause;
};

enum class environment_cause {
    /**
     * @brief 宿主资源不足，无法创建沙箱
     */
    RESOURCE_EXHAUSTED,

    /**
     * @brief 评测器镜像不可用，整个批次都无法继续
     */
    IMAGE_UNAVAILABLE,

    /**
     * @brief 沙箱或者评测器自身出错
     */
    INFRASTRUCTURE,

    /**
     * @brief 批次被取消，执行被强制终止
     */
    CANCELLED
};

/**
 * @brief 与提交无关的环境错误，可以重试
 */
struct environment_failure {
    environment_cause cause = environment_cause::INFRASTRUCTURE;
    std::string message;
};

}  // namespace outcome

using execution_outcome = std::variant<outcome::completed, outcome::timed_out, outcome::submission_crashed, outcome::environment_failure>;

/**
 * @brief 执行结果对应的得分归因
 */
fault_kind fault_of(const execution_outcome &result);

/**
 * @brief 执行结果中包含的检查结果
 * 环境错误没有检查结果，返回空列表
 */
std::vector<check_result> results_of(const execution_outcome &result);

/**
 * @brief 执行结果的简短描述，用于日志和报告的 message 列
 */
std::string describe(const execution_outcome &result);

const char *get_display_message(outcome::environment_cause cause);

}  // namespace grader
