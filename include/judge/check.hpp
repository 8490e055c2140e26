#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "common/status.hpp"

/**
 * 这个头文件包含检查集信息
 * 包含：
 * 1. check_definition 类（表示教师编写的一个检查）
 * 2. check_set 类（表示一组有序的检查，以及它们所在的文件夹）
 * 3. check_result 类（表示一个检查对某个提交的评测结果）
 */
namespace grader {

struct check_definition {
    /**
     * @brief 检查的名字，在检查集中唯一
     * 评测器上报结果时使用这个名字来对应检查
     */
    std::string name;

    /**
     * @brief 本检查的满分
     */
    double points = 1;

    /**
     * @brief 是否为隐藏检查，只影响报告的展示
     */
    bool hidden = false;
};

/**
 * @brief 表示一组有序的检查
 * 检查集是一个文件夹：
 *
 * tests
 * ├── checks.json // 可选，定义检查的顺序和分值
 * ├── q1.py
 * └── q2.py
 *
 * 如果存在 checks.json，那么它必须是 [{"name": "q1", "points": 2, "hidden": false}, ...] 形式
 * 的数组，检查的顺序就是数组的顺序；否则文件夹下每个非隐藏的普通文件都是一个
 * 检查，名字为去掉扩展名的文件名，满分为 1，按照文件名排序。
 */
struct check_set {
    /**
     * @brief 检查集所在的文件夹，评测时会以只读方式挂载到沙箱的 checks 文件夹
     * 为空时表示没有需要挂载的文件
     */
    std::filesystem::path dir;

    /**
     * @brief 检查的定义，顺序即为报告中列的顺序
     */
    std::vector<check_definition> checks;

    /**
     * @brief 所有检查的满分之和
     */
    double total_points() const;

    /**
     * @brief 根据检查名查找检查的下标
     * @return 检查在 checks 中的下标，不存在时返回 -1
     */
    int index_of(const std::string &name) const;

    /**
     * @brief 从文件夹中读取检查集
     * @param dir 检查集文件夹
     * @throw intake_error 文件夹不存在、checks.json 格式错误、检查名重复或者没有任何检查
     */
    static check_set load(const std::filesystem::path &dir);
};

struct check_result {
    std::string name;

    check_status status = check_status::NOT_RUN;

    /**
     * @brief 本检查得到的分数，范围为 [0, possible]
     */
    double score = 0;

    /**
     * @brief 本检查的满分
     */
    double possible = 0;

    /**
     * @brief 评测器为本检查输出的诊断信息，比如失败的断言
     */
    std::string output;
};

/**
 * @brief 生成一组全部未执行的检查结果，顺序与检查集定义一致
 */
std::vector<check_result> unreached_results(const check_set &checks);

/**
 * @brief 将评测器上报的结果按检查集的定义顺序对齐
 * 检查集中存在但没有上报的检查记为 NOT_RUN、0 分；检查集中不存在的检查会被忽略。
 * @param checks 检查集
 * @param reported 评测器上报的结果，顺序任意
 */
std::vector<check_result> align_results(const check_set &checks, const std::vector<check_result> &reported);

/**
 * @brief 根据得分和满分推断检查的结果
 */
check_status verdict_of(double score, double possible);

/**
 * @brief 提交的总分，只由检查结果决定
 */
double total_score(const std::vector<check_result> &results);

}  // namespace grader
