#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "judge/classifier.hpp"
#include "judge/outcome.hpp"
#include "judge/submission.hpp"

namespace grader {

enum class worker_state {
    START,
    IDLE,
    JUDGING,
    CRASHED,
    STOPPED
};

const char *get_display_message(worker_state state);

/**
 * @brief 执行监控行为
 * worker 线程和调度器线程都会调用监控器，实现需要保证线程安全
 */
struct monitor {
    virtual ~monitor();

    /**
     * @brief 监控上报某个 worker 开始执行一个提交
     * @param worker_id 执行提交的 Worker 编号
     * @param job 提交，attempts 为包括本次在内的执行次数
     */
    virtual void start_job(int worker_id, const submission_job &job);

    /**
     * @brief 监控上报某个 worker 执行完一个提交，此时沙箱已经被释放
     * @param worker_id 执行提交的 Worker 编号
     * @param job 提交
     * @param result 本次执行的结果
     */
    virtual void end_job(int worker_id, const submission_job &job, const execution_outcome &result);

    /**
     * @brief 监控上报一个提交因为环境错误被放回等待队列
     */
    virtual void job_retried(const submission_job &job, const std::string &reason);

    /**
     * @brief 监控上报一个提交已经进入终止状态
     */
    virtual void job_finished(const submission_job &job, const classification &c);

    /**
     * @brief 监控上报当前某个 Worker 的状态
     * @param worker_id Worker 编号
     * @param state Worker 的新状态
     * @param information 如果 Worker 崩溃，则为错误原因，用于日志记录
     */
    virtual void worker_state_changed(int worker_id, worker_state state, const std::string &information);
};

/**
 * @brief 将监控信息写入日志
 */
struct log_monitor : public monitor {
    void start_job(int worker_id, const submission_job &job) override;
    void end_job(int worker_id, const submission_job &job, const execution_outcome &result) override;
    void job_retried(const submission_job &job, const std::string &reason) override;
    void job_finished(const submission_job &job, const classification &c) override;
    void worker_state_changed(int worker_id, worker_state state, const std::string &information) override;
};

using monitor_list = std::vector<std::shared_ptr<monitor>>;

/**
 * @brief 依次调用所有监控器
 * 监控器抛出的异常会被记录到日志，不会影响评测
 * @param worker_id 调用方的 Worker 编号，调度器为 -1
 */
void call_monitors(int worker_id, const monitor_list &monitors, const std::function<void(monitor &)> &callback);

}  // namespace grader
