#pragma once

#include <boost/lexical_cast.hpp>
#include <chrono>
#include <cstdlib>
#include <map>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 根据 key 来查找环境变量并转换为 T 类型
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @throw boost::bad_lexical_cast 如果环境变量的值无法转换为 T
 */
template <typename T>
T get_env_as(const std::string &key, const T &def_value) {
    const char *value = getenv(key.c_str());
    if (!value) return def_value;
    return boost::lexical_cast<T>(value);
}

/**
 * @brief 设置环境变量
 * @param key 环境变量的键
 * @param value 环境变量的值
 * @param replace 若为真，则覆盖已有的环境变量值
 */
void set_env(const std::string &key, const std::string &value, bool replace = true);

/**
 * @brief 将 key=value 形式的环境变量列表转换为 execve 需要的格式
 * @param env 环境变量表
 * @return 每项都是 "key=value" 的字符串列表
 */
std::vector<std::string> to_environ(const std::map<std::string, std::string> &env);

/**
 * @brief 根据用户名或者 uid 查找用户
 * @param name 用户名，或者十进制的 uid
 * @return uid，用户不存在时返回 -1
 */
long get_userid(const std::string &name);

/**
 * @brief 根据用户组名或者 gid 查找用户组
 * @param name 用户组名，或者十进制的 gid
 * @return gid，用户组不存在时返回 -1
 */
long get_groupid(const std::string &name);

struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    /**
     * @brief 从构造开始经过的时间，单位为秒
     */
    double seconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace grader
