#pragma once

#include <atomic>
#include <filesystem>
#include <vector>
#include "common/exceptions.hpp"
#include "judge/check.hpp"
#include "judge/evaluator.hpp"
#include "judge/report.hpp"
#include "judge/submission.hpp"
#include "monitor/monitor.hpp"
#include "sandbox/sandbox.hpp"

namespace grader {

struct grade_options {
    /**
     * @brief 同时执行的提交数上限，也是同时存在的沙箱数上限，至少为 1
     */
    unsigned concurrency = 1;

    /**
     * @brief 单个提交的时钟时间限制，单位为秒，小于等于 0 表示不限制
     */
    double per_job_timeout = -1;

    /**
     * @brief 环境错误的最大重试次数，提交最多执行 max_retries + 1 次
     */
    unsigned max_retries = 1;

    /**
     * @brief 整个批次的时钟时间限制，单位为秒，小于等于 0 表示不限制
     * 超时后等待中的提交直接记为失败，正在执行的提交被取消
     */
    double batch_timeout = -1;

    sandbox_limits limits;

    /**
     * @brief 超时的提交是否保留超时前已经通过的检查的分数
     */
    bool timeout_partial_credit = true;

    /**
     * @brief 外部停止标记，比如收到 SIGINT，为真时与批次超时的处理方式相同
     */
    const std::atomic<bool> *stop = nullptr;

    /**
     * @brief 复制到每个沙箱中的辅助文件，比如作业需要读取的数据文件
     */
    std::vector<std::filesystem::path> support_files;
};

/**
 * @brief 批次被中止
 * 已经完成的提交的结果仍然保存在 report 中，report.complete 为 false
 */
struct fatal_batch_error : public grader_exception {
    fatal_batch_error(const std::string &reason, grade_report report);

    grade_report report;
};

/**
 * @brief 并行评测一批提交
 * 调度器按照提交的顺序派发任务，同一时刻最多有 concurrency 个提交在执行。
 * 遇到环境错误的提交会被放回等待队列末尾重试。
 * 每个提交在报告中恰好对应一行。
 *
 * @param jobs 通过 intake 校验的提交
 * @param checks 检查集
 * @param provider 沙箱提供者，必须是线程安全的
 * @param eval 评测器，必须是线程安全的
 * @param options 评测参数
 * @param monitors 监控器
 * @return 按标识符排序的报告
 * @throw fatal_batch_error 批次超时、外部停止或者评测器镜像不可用
 * @throw std::invalid_argument 如果 concurrency 为 0
 */
grade_report grade(std::vector<submission_job> jobs, const check_set &checks, sandbox_provider &provider,
                   evaluator &eval, const grade_options &options, const monitor_list &monitors = {});

}  // namespace grader
