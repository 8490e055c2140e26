#include "sandbox/limits.hpp"
#include <errno.h>
#include <grp.h>
#include <sched.h>
#include <sys/resource.h>
#include <unistd.h>
#include <cmath>

namespace grader {

static int set_rlimit(int resource, rlim_t cur, rlim_t max) noexcept {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    if (setrlimit(resource, &lim) != 0) return errno;
    return 0;
}

int apply_limits(const sandbox_limits &limits) noexcept {
    int err = 0;

    if (limits.cpu_time > 0) {
        rlim_t cputime_limit = (rlim_t)std::ceil(limits.cpu_time);
        if ((err = set_rlimit(RLIMIT_CPU, cputime_limit, cputime_limit + 1))) return err;
    }

    if (limits.memory_limit >= 0) {
        rlim_t bytes = (rlim_t)limits.memory_limit * 1024;
        if ((err = set_rlimit(RLIMIT_AS, bytes, bytes))) return err;
    }

    if (limits.file_limit >= 0) {
        rlim_t bytes = (rlim_t)limits.file_limit * 1024;
        if ((err = set_rlimit(RLIMIT_FSIZE, bytes, bytes))) return err;
    }

    if (limits.proc_limit > 0) {
        if ((err = set_rlimit(RLIMIT_NPROC, limits.proc_limit, limits.proc_limit))) return err;
    }

    return set_rlimit(RLIMIT_CORE, 0, 0);
}

int isolate_namespaces() noexcept {
    if (geteuid() != 0) return 0;
    // 容器内的 root 可能没有 CAP_SYS_ADMIN，此时退化为只依靠文件夹隔离
    if (unshare(CLONE_NEWNET | CLONE_NEWIPC | CLONE_NEWUTS) != 0 && errno != EPERM && errno != EINVAL) return errno;
    return 0;
}

int drop_privileges(uid_t uid, gid_t gid) noexcept {
    gid_t groups[1] = {gid};
    if (setgroups(1, groups) != 0) return errno;
    if (setgid(gid) != 0) return errno;
    if (setuid(uid) != 0) return errno;

    if (geteuid() == 0 || getuid() == 0) return EPERM;
    return 0;
}

}  // namespace grader
