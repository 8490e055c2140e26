#pragma once

#include <atomic>
#include <filesystem>
#include <vector>
#include "judge/evaluator.hpp"
#include "judge/outcome.hpp"
#include "judge/submission.hpp"
#include "sandbox/sandbox.hpp"

namespace grader {

struct runner_options {
    sandbox_limits limits;

    /**
     * @brief 单次执行的时钟时间限制，单位为秒，小于等于 0 表示不限制
     */
    double timeout = -1;

    /**
     * @brief 批次取消标记，为空表示不可取消
     */
    const std::atomic<bool> *cancelled = nullptr;

    /**
     * @brief 每个沙箱都需要的辅助文件，只读地复制到提交文件所在的 submission 文件夹
     */
    std::vector<std::filesystem::path> support_files;
};

/**
 * @brief 在一个新的沙箱中评测一个提交
 * 该函数创建沙箱，注入提交文件，调用评测器，并保证无论以何种方式退出都会释放沙箱。
 * 该函数不会抛出异常：沙箱创建失败、文件注入失败、评测器抛出的异常都会转换为 environment_failure。
 *
 * 提交文件注入到沙箱内的 submission/<文件名>，检查集挂载到 checks，
 * 辅助文件挂载到 submission/<辅助文件名>。
 * @param job 被评测的提交
 * @param provider 沙箱的创建者
 * @param eval 评测器
 * @param options 资源限制和执行预算
 * @return 执行结果
 */
execution_outcome run_submission(const submission_job &job, sandbox_provider &provider, evaluator &eval, const runner_options &options);

}  // namespace grader
