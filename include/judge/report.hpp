#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "judge/check.hpp"

/**
 * 这个头文件包含评测报告
 * 报告中每个进入评测池的提交恰好对应一行，按照标识符排序
 */
namespace grader {

struct grade_row {
    std::string id;

    /**
     * @brief 提交文件的路径
     */
    std::filesystem::path path;

    job_status status = job_status::DONE;

    /**
     * @brief 得分的归因
     * 用于区分"检查失败而得零分"和"因为环境、超时或崩溃而得零分"
     */
    fault_kind fault = fault_kind::NONE;

    /**
     * @brief 按照检查集顺序排列的检查结果
     */
    std::vector<check_result> checks;

    double total = 0;

    unsigned attempts = 0;

    /**
     * @brief 超时、崩溃、环境错误的描述，正常完成时为空
     */
    std::string message;
};

struct grade_report {
    /**
     * @brief 检查集定义，决定 CSV 中检查列的顺序
     */
    std::vector<check_definition> checks;

    /**
     * @brief 按照标识符排序的报告行
     */
    std::vector<grade_row> rows;

    /**
     * @brief 批次是否完整执行
     * 批次被中止时为 false，此时 abort_reason 记录中止原因
     */
    bool complete = true;

    std::string abort_reason;

    /**
     * @brief 每个提交的满分
     */
    double possible() const;

    /**
     * @brief 根据标识符查找报告行
     * @return 报告行，不存在时返回 nullptr
     */
    const grade_row *find(const std::string &id) const;
};

/**
 * @brief 以 CSV 格式输出报告
 * 列依次为 identifier、每个检查的得分、total、status、fault、attempts、message
 */
void write_csv(std::ostream &os, const grade_report &report);

void to_json(nlohmann::json &j, const check_result &result);
void to_json(nlohmann::json &j, const grade_row &row);

/**
 * @brief 以 JSON 格式输出报告，包含 complete 标记和检查集定义
 */
void to_json(nlohmann::json &j, const grade_report &report);

/**
 * @brief 将报告写入 dir/final_grades.csv 和 dir/final_grades.json
 * @throw std::runtime_error 如果文件无法写入
 */
void write_report(const std::filesystem::path &dir, const grade_report &report);

}  // namespace grader
