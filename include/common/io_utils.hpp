#pragma once

#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 读取文本文件末尾最多 limit 个字节
 * 用于在日志和报告中附带评测器的输出，避免选手程序打印大量内容撑爆报告
 */
std::string read_file_tail(const std::filesystem::path &path, std::size_t limit);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 这里用于确保计算沙箱内路径时不会出现目录遍历攻击，如果拿到的文件名
 * 包含 "../" 或者是绝对路径，那么注入的文件有可能逃出沙箱目录。
 * @param subpath 被检查的文件名
 * @return subpath 本身
 * @throw std::runtime_error 如果 subpath 不安全
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 递归修改文件夹内所有文件的写权限
 * @param dir 要被修改的文件夹（或文件）
 * @param writable 为真时添加属主写权限，为假时移除所有写权限
 */
void set_writable(const std::filesystem::path &dir, bool writable);

/**
 * @brief 递归地让所有用户都可以读取文件夹内的文件
 * 文件夹和属主可执行的文件同时添加所有用户的执行权限
 */
void set_world_readable(const std::filesystem::path &dir);

}  // namespace grader
