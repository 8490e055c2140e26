#pragma once

#include <map>
#include <mutex>
#include <string>
#include "judge/check.hpp"
#include "judge/classifier.hpp"
#include "judge/outcome.hpp"
#include "judge/report.hpp"
#include "judge/submission.hpp"

namespace grader {

/**
 * @brief 收集提交的最终结果并生成报告
 * 结果可以以任意顺序从任意线程加入，报告按照标识符排序。
 * 每个提交只能加入一次，已经加入的结果不会被覆盖。
 */
class result_aggregator {
public:
    /**
     * @param checks 检查集
     * @param timeout_partial_credit 超时的提交是否保留超时前已经通过的检查的分数
     */
    result_aggregator(const check_set &checks, bool timeout_partial_credit);

    /**
     * @brief 加入一个已经进入终止状态的提交
     * @param job 提交
     * @param result 最后一次执行的结果，之前被重试的执行结果不计入
     * @param c 分类结果
     * @throw duplicate_report 如果该提交已经加入过
     */
    void add(const submission_job &job, const execution_outcome &result, const classification &c);

    /**
     * @brief 加入一个没有得到有效执行结果的提交，比如批次被中止时还在等待队列中的提交
     * 该提交记为 FAILED_FATAL、环境错误、0 分
     * @throw duplicate_report 如果该提交已经加入过
     */
    void add_failure(const submission_job &job, const std::string &reason);

    std::size_t size() const;

    /**
     * @brief 生成按标识符排序的报告
     */
    grade_report report() const;

private:
    check_set checks;
    bool timeout_partial_credit;

    mutable std::mutex mut;
    std::map<std::string, grade_row> rows;

    void insert(grade_row &&row);
};

}  // namespace grader
