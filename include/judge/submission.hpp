#pragma once

#include <filesystem>
#include <memory>
#include <ostream>
#include <string>
#include "common/status.hpp"
#include "judge/check.hpp"

namespace grader {

/**
 * @brief 一个等待评测的提交
 * 由 intake 创建，评测期间归调度器所有，直到进入终止状态
 */
struct submission_job {
    /**
     * @brief 提交的标识符，在一个批次中唯一
     * 报告按照标识符排序
     */
    std::string id;

    /**
     * @brief 提交文件在宿主上的绝对路径
     */
    std::filesystem::path path;

    /**
     * @brief 评测本提交使用的检查集
     */
    std::shared_ptr<const check_set> checks;

    /**
     * @brief 已经派发执行的次数
     * 每次派发给 worker 时加 1，因此第一次执行成功的提交 attempts 为 1
     */
    unsigned attempts = 0;

    job_status status = job_status::PENDING;
};

std::ostream &operator<<(std::ostream &os, const submission_job &job);

}  // namespace grader
