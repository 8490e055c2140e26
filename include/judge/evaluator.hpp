#pragma once

#include <string>
#include "judge/check.hpp"
#include "judge/outcome.hpp"
#include "sandbox/sandbox.hpp"

namespace grader {

/**
 * @brief 表示一种在沙箱内运行检查集的方式
 * 评测器只负责在已经准备好的沙箱中执行检查并解析结果，沙箱的创建和释放由执行器负责。
 * 评测器自身崩溃也必须转换为执行结果，而不是抛出异常。
 */
struct evaluator {
    virtual ~evaluator() = default;

    /**
     * @brief 在沙箱内评测一个提交
     * @param box 已经注入提交和检查集的沙箱
     * @param artifact 提交在沙箱内的相对路径
     * @param checks 检查集，返回的检查结果按照其中的顺序排列
     * @param budget 执行预算
     * @return 执行结果
     */
    virtual execution_outcome evaluate(sandbox &box, const std::string &artifact, const check_set &checks, const execution_budget &budget) = 0;
};

}  // namespace grader
