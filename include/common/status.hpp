#pragma once

namespace grader {

/**
 * @brief 表示一个提交在评测池中的状态
 */
enum class job_status {
    /**
     * @brief 提交已经通过 intake 校验，正在等待队列中，还未分配到执行槽位
     */
    PENDING = 0,

    /**
     * @brief 提交已经派发给 worker，正在某个沙箱中执行
     */
    RUNNING = 1,

    /**
     * @brief 提交上一次执行遇到了环境错误，已经被重新放回等待队列的末尾
     */
    RETRYING = 2,

    /**
     * @brief 提交评测结束，分数由 check 结果计算得到
     * 包括检查全部失败得零分、超时、用户程序崩溃等情况，这些都是提交自身的问题
     */
    DONE = 3,

    /**
     * @brief 提交因为环境问题无法完成评测
     * 重试次数耗尽、批次超时或者批次被中止时进入该状态，分数记为 0
     */
    FAILED_FATAL = 4
};

/**
 * @brief 提交最终得分的归因
 * 报告中必须区分"因为检查失败而得零分"和"因为环境/超时/崩溃而得零分"
 */
enum class fault_kind {
    /**
     * @brief 评测器正常结束，分数完全由检查结果决定
     */
    NONE = 0,

    /**
     * @brief 评测超出单个提交的时钟时间限制或者 CPU 时间限制
     */
    TIMEOUT = 1,

    /**
     * @brief 选手代码崩溃（非零退出码、被信号杀死、评测器输出损坏）
     */
    CRASHED = 2,

    /**
     * @brief 沙箱创建失败、资源耗尽、批次中止等与提交内容无关的错误
     */
    ENVIRONMENT = 3
};

/**
 * @brief 单个检查的结果
 */
enum class check_status {
    PASSED = 0,
    FAILED = 1,

    /**
     * @brief 检查拿到了部分分数
     */
    PARTIAL = 2,

    /**
     * @brief 检查没有被执行，比如评测器在执行到该检查前超时或崩溃
     */
    NOT_RUN = 3
};

const char *get_display_message(job_status);

const char *get_display_message(fault_kind);

const char *get_display_message(check_status);

}  // namespace grader
