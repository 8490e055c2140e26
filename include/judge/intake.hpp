#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "judge/check.hpp"
#include "judge/submission.hpp"

namespace grader {

/**
 * @brief 宽松模式下被跳过的提交引用
 */
struct intake_rejection {
    std::string reference;
    std::string reason;
};

/**
 * @brief 列出提交文件夹下所有扩展名匹配的普通文件
 * 隐藏文件会被跳过，结果按照文件名排序
 * @param dir 提交文件夹
 * @param extensions 允许的扩展名，比如 ".py"，为空表示不限制
 * @throw intake_error 如果文件夹不存在
 */
std::vector<std::filesystem::path> list_submissions(const std::filesystem::path &dir, const std::vector<std::string> &extensions);

/**
 * @brief 读取提交的元数据
 * 元数据文件为 [{"identifier": "...", "filename": "..."}] 形式的 JSON 数组
 * @return 文件名到标识符的映射
 * @throw intake_error 如果文件无法解析
 * @throw duplicate_submission 如果同一个文件名或者标识符出现两次
 */
std::map<std::string, std::string> load_metadata(const std::filesystem::path &file);

/**
 * @brief 读取 YAML 格式的提交元数据
 * 格式与 load_metadata 相同，为包含 identifier 和 filename 的映射组成的序列：
 *
 *     - identifier: alice
 *       filename: alice.ipynb
 *
 * @throw intake_error 如果文件无法解析
 * @throw duplicate_submission 如果同一个文件名或者标识符出现两次
 */
std::map<std::string, std::string> load_yaml_metadata(const std::filesystem::path &file);

/**
 * @brief 检查提交引用并生成评测任务
 * 标识符为去掉扩展名的文件名；如果提供了元数据，则使用元数据中登记的标识符。
 * @param refs 提交文件的路径，返回的任务保持相同的顺序
 * @param checks 所有提交共用的检查集
 * @param metadata 文件名到标识符的映射，为空表示不使用元数据
 * @param rejected 不为空时开启宽松模式：不合法的引用记录到 rejected 中并跳过，而不是抛出异常
 * @throw intake_error 如果文件不存在、不可读，或者没有在元数据中登记
 * @throw duplicate_submission 如果同一个文件被引用两次，或者两个提交的标识符相同
 */
std::vector<submission_job> normalize_submissions(const std::vector<std::filesystem::path> &refs,
                                                  const std::shared_ptr<const check_set> &checks,
                                                  const std::map<std::string, std::string> &metadata = {},
                                                  std::vector<intake_rejection> *rejected = nullptr);

}  // namespace grader
