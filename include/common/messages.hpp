#pragma once

#include <cstddef>
#include "judge/outcome.hpp"
#include "judge/submission.hpp"

/**
 * 调度器和 worker 之间传递的消息
 * 调度器通过任务队列发送 dispatch，worker 执行完毕后通过结果队列返回 report
 */
namespace grader::message {

/**
 * @brief 调度器派发给 worker 的评测任务
 */
struct dispatch {
    /**
     * @brief 提交在调度器任务列表中的下标，用于返回结果时找到对应的提交
     */
    std::size_t index = 0;

    /**
     * @brief 提交的快照，worker 只读
     */
    submission_job job;

    /**
     * @brief 为真时 worker 收到该消息后退出
     */
    bool stop = false;
};

/**
 * @brief worker 返回给调度器的执行结果
 * 调度器收到该消息时，对应的沙箱一定已经被释放
 */
struct report {
    std::size_t index = 0;
    int worker_id = 0;
    execution_outcome outcome;
};

}  // namespace grader::message
