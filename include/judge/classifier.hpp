#pragma once

#include <string>
#include "common/status.hpp"
#include "judge/outcome.hpp"

namespace grader {

/**
 * @brief 调度器对一次执行结果采取的动作
 */
enum class decision {
    /**
     * @brief 将提交放回等待队列末尾重新执行
     */
    RETRY,

    /**
     * @brief 记录结果，提交进入终止状态
     */
    RECORD,

    /**
     * @brief 记录结果并中止整个批次
     */
    ABORT
};

struct classification {
    decision action = decision::RECORD;

    /**
     * @brief 提交的新状态
     */
    job_status status = job_status::DONE;

    fault_kind fault = fault_kind::NONE;

    /**
     * @brief 写入报告 message 列的原因
     */
    std::string reason;
};

/**
 * @brief 根据执行结果判断提交是否需要重试
 * 只有环境错误会被重试：超时、崩溃、检查失败都是提交自身的问题，重试只会得到相同的结果。
 * 评测器镜像不可用意味着之后的提交也无法评测，因此直接中止批次。
 * @param result 执行结果
 * @param attempts 提交已经执行的次数，包括本次
 * @param max_retries 最多重试的次数，提交最多执行 max_retries + 1 次
 */
classification classify(const execution_outcome &result, unsigned attempts, unsigned max_retries);

const char *get_display_message(decision action);

}  // namespace grader
