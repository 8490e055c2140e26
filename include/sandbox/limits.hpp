#pragma once

#include <sys/types.h>
#include "sandbox/sandbox.hpp"

namespace grader {

/**
 * @brief 在子进程中设置资源限制
 * 该函数在 fork 之后、exec 之前调用，因此只能调用异步信号安全的函数，
 * 不会分配内存也不会抛出异常。
 *
 * CPU 时间的硬限制比软限制多 1 秒：达到软限制时内核发送 SIGXCPU，
 * 达到硬限制时发送 SIGKILL。我们通过 SIGXCPU 判断是否超出 CPU 时间限制。
 * @param limits 资源限制
 * @return 0 表示成功，否则为 setrlimit 失败时的 errno
 */
int apply_limits(const sandbox_limits &limits) noexcept;

/**
 * @brief 在子进程中将进程与宿主的网络、IPC 和主机名隔离
 * 只有以 root 运行时才会生效，否则什么都不做；没有权限创建命名空间时同样什么都不做
 * @return 0 表示成功，否则为 unshare 失败时的 errno
 */
int isolate_namespaces() noexcept;

/**
 * @brief 在子进程中切换到沙箱专属的用户和用户组
 * 先清空附加用户组，再依次设置 gid 和 uid，之后进程无法再恢复 root 权限。
 * 必须在 isolate_namespaces 之后调用。
 * @return 0 表示成功，否则为失败时的 errno；切换后仍然是 root 时返回 EPERM
 */
int drop_privileges(uid_t uid, gid_t gid) noexcept;

}  // namespace grader
