#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "judge/evaluator.hpp"

namespace grader {

/**
 * @brief 在沙箱内运行一个外部命令作为评测器
 * 命令以如下方式调用，路径都相对于沙箱根目录：
 *
 *     <command...> <submission> checks results.jsonl
 *
 * 评测器每完成一个检查就向 results.jsonl 追加一行 JSON：
 *
 *     {"name": "q1", "score": 1, "possible": 1, "output": "..."}
 *
 * 其中 possible 和 output 是可选的。如果给出了 possible，分数会按照检查集中的满分缩放。
 * 评测器的退出码约定见 error_codes。结果文件是符号链接时视为格式错误。
 */
class script_evaluator : public evaluator {
public:
    /**
     * @param command 评测器命令
     * @param env 额外传给评测器的环境变量，例如 GRADER_SEED
     */
    explicit script_evaluator(std::vector<std::string> command, std::map<std::string, std::string> env = {});

    execution_outcome evaluate(sandbox &box, const std::string &artifact, const check_set &checks, const execution_budget &budget) override;

    /**
     * @brief 解析评测器写入的结果文件
     * 文件末尾不完整的一行（评测器在写入时被杀死）会被忽略
     * @param results_file 结果文件
     * @param checks 检查集
     * @param malformed 如果结果文件中有无法解析的行，设置为真
     * @return 按检查集顺序排列的检查结果
     */
    static std::vector<check_result> parse_results(const std::filesystem::path &results_file, const check_set &checks, bool &malformed);

private:
    std::vector<std::string> command;
    std::map<std::string, std::string> env;
};

}  // namespace grader
