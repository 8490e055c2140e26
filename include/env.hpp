#pragma once

#include <map>
#include <string>

namespace grader {

/**
 * @brief 生成评测器退出码约定的环境变量表
 * 沙箱只保留 PATH 环境变量，因此这些约定需要在每次执行评测器时显式传入
 * @return E_SUCCESS、E_INTERNAL_ERROR、E_SUBMISSION_ERROR 到退出码的映射
 */
std::map<std::string, std::string> error_code_variables();

}  // namespace grader
