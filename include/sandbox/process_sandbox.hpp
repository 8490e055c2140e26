#pragma once

#include <sys/types.h>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include "sandbox/sandbox.hpp"

namespace grader {

struct process_sandbox_options {
    /**
     * @brief 所有沙箱文件夹的父目录
     */
    std::filesystem::path run_dir;

    /**
     * @brief 评测器镜像文件夹，每个沙箱都会复制一份只读的镜像到 image 子目录
     */
    std::filesystem::path image;

    /**
     * @brief 同时存在的沙箱数上限，0 表示不限制
     */
    int capacity = 0;

    /**
     * @brief run_dir 所在磁盘需要保留的最小剩余空间，单位为 KB
     */
    long min_free_space = 0;

    /**
     * @brief 是否让每个沙箱以独立的用户运行
     * 开启时评测程序必须以 root 运行。占用第 i 个槽位的沙箱以 uid 为 run_uid + i、
     * gid 为 run_gid + i 的身份执行命令；沙箱文件夹属于 root，属组为该用户组，
     * 其他用户没有任何权限，因此沙箱之间互相不可见，沙箱内也无法修改只读的镜像和检查集。
     */
    bool isolate = true;

    uid_t run_uid = 60000;
    gid_t run_gid = 60000;

    /**
     * @brief 为真时释放沙箱后保留沙箱文件夹，用于调试评测器
     */
    bool keep_dirs = false;
};

/**
 * @brief 沙箱槽位表
 * 槽位号决定了沙箱内进程使用的 uid，同一时刻每个槽位最多被一个沙箱占用
 */
class sandbox_slots {
public:
    explicit sandbox_slots(int capacity);

    /**
     * @brief 占用编号最小的空闲槽位
     * @throw resource_exhausted 如果所有槽位都被占用
     */
    int reserve();

    void free(int slot) noexcept;

    int live() const;

private:
    mutable std::mutex mut;
    int capacity;
    std::set<int> used;
};

/**
 * @brief 沙箱内进程使用的用户身份
 */
struct sandbox_user {
    uid_t uid;
    gid_t gid;
};

/**
 * @brief 基于进程的沙箱
 * 每个沙箱是 run_dir 下的一个随机命名的私有文件夹。
 * 命令在独立的进程组中执行，受 setrlimit 限制；以 root 运行时额外隔离网络、IPC 和主机名，
 * 并切换到沙箱专属的用户。
 * 超时或者取消时，先向进程组发送 SIGTERM，0.1 秒后发送 SIGKILL。
 */
class process_sandbox : public sandbox {
public:
    process_sandbox(const std::filesystem::path &root, const sandbox_limits &limits,
                    std::shared_ptr<sandbox_slots> slots, int slot,
                    std::optional<sandbox_user> user, bool keep_dir);
    ~process_sandbox() override;

    process_sandbox(const process_sandbox &) = delete;
    process_sandbox &operator=(const process_sandbox &) = delete;

    sandbox_state state() const override;
    std::filesystem::path root() const override;
    void inject(const std::filesystem::path &source, const std::string &target) override;
    execution_result execute(const std::vector<std::string> &command,
                             const std::map<std::string, std::string> &env,
                             const execution_budget &budget) override;
    void release() noexcept override;

private:
    std::filesystem::path root_dir;
    sandbox_limits limits;
    std::shared_ptr<sandbox_slots> slots;
    int slot;
    std::optional<sandbox_user> user;
    bool keep_dir;
    sandbox_state current = sandbox_state::CREATED;

    /**
     * @brief 最近一次执行的进程组号，释放沙箱时用于清理残留进程
     */
    pid_t last_pgid = -1;
};

class process_sandbox_provider : public sandbox_provider {
public:
    explicit process_sandbox_provider(const process_sandbox_options &options);

    std::unique_ptr<sandbox> acquire(const sandbox_limits &limits, const std::vector<mount> &mounts) override;

    /**
     * @brief 当前存活的沙箱数
     */
    int live() const;

private:
    process_sandbox_options options;
    std::shared_ptr<sandbox_slots> slots;
};

}  // namespace grader
