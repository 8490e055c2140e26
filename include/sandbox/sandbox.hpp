#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

/**
 * 这个头文件包含沙箱的抽象接口
 * 包含：
 * 1. sandbox_limits 类（沙箱内进程的资源限制）
 * 2. sandbox 类（一个隔离的执行环境，生命周期为 CREATED -> ACTIVE -> TORN_DOWN）
 * 3. sandbox_provider 类（沙箱的创建者，负责检查宿主资源和评测器镜像）
 */
namespace grader {

struct sandbox_limits {
    /**
     * @brief CPU 时间限制，单位为秒，小于等于 0 表示不限制
     * 超过限制时进程会收到 SIGXCPU，执行结果按超时处理
     */
    double cpu_time = -1;

    /**
     * @brief 地址空间限制，单位为 KB，小于 0 表示不限制
     */
    int64_t memory_limit = -1;

    /**
     * @brief 写入单个文件的大小限制，单位为 KB，小于 0 表示不限制
     */
    int64_t file_limit = -1;

    /**
     * @brief 进程数限制，小于 0 表示不限制
     */
    int proc_limit = -1;
};

/**
 * @brief 在创建沙箱时复制进沙箱的宿主文件或文件夹
 */
struct mount {
    std::filesystem::path source;

    /**
     * @brief 沙箱内的相对路径
     */
    std::string target;

    bool read_only = true;
};

enum class sandbox_state { CREATED, ACTIVE, TORN_DOWN };

/**
 * @brief 单次执行的预算
 */
struct execution_budget {
    /**
     * @brief 时钟时间限制，单位为秒，小于等于 0 表示不限制
     */
    double timeout = -1;

    /**
     * @brief 取消标记，为真时正在执行的命令会被杀死
     * 由调度器持有，为空表示不可取消
     */
    const std::atomic<bool> *cancelled = nullptr;
};

struct execution_result {
    enum kind_type {
        /**
         * @brief 命令正常退出，exitcode 有效
         */
        EXITED,

        /**
         * @brief 命令超出时钟时间或者 CPU 时间限制被杀死
         */
        TIMED_OUT,

        /**
         * @brief 命令被信号杀死，signal 有效
         */
        SIGNALED,

        /**
         * @brief 命令因为取消标记被杀死
         */
        CANCELLED
    } kind = EXITED;

    int exitcode = 0;
    int signal = 0;

    /**
     * @brief 命令执行的时钟时间，单位为秒
     */
    double wall_time = 0;
};

/**
 * @brief 一个隔离的执行环境
 * 沙箱拥有一个私有的文件夹，同一时刻只属于一个评测任务。
 * 沙箱被释放后不再可用，release 可以被重复调用。
 */
class sandbox {
public:
    virtual ~sandbox() = default;

    virtual sandbox_state state() const = 0;

    /**
     * @brief 沙箱的根目录，评测器的工作目录
     */
    virtual std::filesystem::path root() const = 0;

    /**
     * @brief 将宿主文件复制到沙箱内
     * @param source 宿主文件路径
     * @param target 沙箱内的相对路径，不能包含 ".." 或者是绝对路径
     * @throw environment_error 如果复制失败
     * @throw std::logic_error 如果沙箱已经被释放
     */
    virtual void inject(const std::filesystem::path &source, const std::string &target) = 0;

    /**
     * @brief 在沙箱内执行命令
     * 命令的 stdout 和 stderr 分别写入沙箱根目录下的 program.out 和 program.err
     * @param command 命令及其参数，第一项在沙箱根目录下解析
     * @param env 额外的环境变量
     * @param budget 执行预算
     * @throw image_unavailable 如果命令无法启动
     * @throw environment_error 如果创建进程失败
     */
    virtual execution_result execute(const std::vector<std::string> &command,
                                     const std::map<std::string, std::string> &env,
                                     const execution_budget &budget) = 0;

    /**
     * @brief 杀死沙箱内残留的进程并删除沙箱文件夹
     * 重复调用无效果，不会抛出异常
     */
    virtual void release() noexcept = 0;
};

class sandbox_provider {
public:
    virtual ~sandbox_provider() = default;

    /**
     * @brief 创建一个新的沙箱
     * @param limits 沙箱内进程的资源限制
     * @param mounts 需要复制进沙箱的文件
     * @throw resource_exhausted 宿主资源不足
     * @throw image_unavailable 评测器镜像不可用
     * @throw environment_error 其他创建失败的情况
     */
    virtual std::unique_ptr<sandbox> acquire(const sandbox_limits &limits, const std::vector<mount> &mounts) = 0;
};

const char *get_display_message(sandbox_state state);

}  // namespace grader
