#include "sandbox/process_sandbox.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cstring>
#include <stdexcept>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "sandbox/limits.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

static const useconds_t KILL_DELAY = 100 * 1000;  // 0.1s
static const useconds_t POLL_INTERVAL = 10 * 1000;  // 10ms

enum child_stage : int {
    STAGE_SETUP = 1,
    STAGE_LIMITS = 2,
    STAGE_EXEC = 3
};

struct child_failure {
    int stage;
    int error;
};

static void report_child_failure(int fd, int stage, int error) {
    child_failure failure{stage, error};
    ssize_t ret = write(fd, &failure, sizeof(failure));
    (void)ret;
    _exit(127);
}

static void kill_group(pid_t pgid, int sig) {
    if (pgid <= 0) return;
    if (kill(-pgid, sig) != 0 && errno != ESRCH)
        LOG(WARNING) << "Unable to send signal " << sig << " to process group " << pgid << ": " << strerror(errno);
}

/**
 * @brief 杀死属于 uid 的所有进程
 * 沙箱内的进程可能通过 setsid 脱离进程组，但无法改变自己的 uid。
 * 由一个切换到该用户的子进程执行 kill(-1)，这样只会影响该用户的进程。
 */
static void kill_user_processes(uid_t uid) {
    pid_t pid = fork();
    if (pid < 0) {
        LOG(WARNING) << "Unable to fork for killing processes of user " << uid << ": " << strerror(errno);
        return;
    }
    if (pid == 0) {
        if (setuid(uid) != 0) _exit(1);
        kill(-1, SIGKILL);
        _exit(0);
    }
    int status;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
        ;
}

sandbox_slots::sandbox_slots(int capacity) : capacity(capacity) {}

int sandbox_slots::reserve() {
    lock_guard<mutex> guard(mut);
    if (capacity > 0 && (int)used.size() >= capacity)
        throw resource_exhausted(fmt::format("sandbox capacity {} reached", capacity));
    int slot = 0;
    while (used.count(slot)) ++slot;
    used.insert(slot);
    return slot;
}

void sandbox_slots::free(int slot) noexcept {
    lock_guard<mutex> guard(mut);
    used.erase(slot);
}

int sandbox_slots::live() const {
    lock_guard<mutex> guard(mut);
    return (int)used.size();
}

process_sandbox::process_sandbox(const fs::path &root, const sandbox_limits &limits, shared_ptr<sandbox_slots> slots,
                                 int slot, optional<sandbox_user> user, bool keep_dir)
    : root_dir(root), limits(limits), slots(move(slots)), slot(slot), user(user), keep_dir(keep_dir) {}

process_sandbox::~process_sandbox() {
    release();
}

sandbox_state process_sandbox::state() const {
    return current;
}

fs::path process_sandbox::root() const {
    return root_dir;
}

void process_sandbox::inject(const fs::path &source, const string &target) {
    if (current == sandbox_state::TORN_DOWN)
        throw logic_error("sandbox " + root_dir.string() + " has been released");

    fs::path dest = root_dir / assert_safe_path(target);
    try {
        fs::create_directories(dest.parent_path());
        fs::copy(source, dest, fs::copy_options::recursive | fs::copy_options::overwrite_existing);
        if (user) set_world_readable(dest);
    } catch (fs::filesystem_error &ex) {
        throw environment_error(fmt::format("unable to inject {} into {}: {}", source.string(), target, ex.what()));
    }
}

execution_result process_sandbox::execute(const vector<string> &command, const map<string, string> &env, const execution_budget &budget) {
    if (current == sandbox_state::TORN_DOWN)
        throw logic_error("sandbox " + root_dir.string() + " has been released");
    if (command.empty())
        throw invalid_argument("command should not be empty");
    current = sandbox_state::ACTIVE;

    // fork 之后子进程只能调用异步信号安全的函数，因此所有参数都要提前准备好
    vector<char *> argv;
    for (auto &arg : command) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

    map<string, string> full_env = env;
    full_env.emplace("PATH", get_env("PATH", "/usr/local/bin:/usr/bin:/bin"));
    vector<string> env_strings = to_environ(full_env);
    vector<char *> envp;
    for (auto &item : env_strings) envp.push_back(const_cast<char *>(item.c_str()));
    envp.push_back(nullptr);

    string workdir = root_dir.string();
    string out_path = (root_dir / "program.out").string();
    string err_path = (root_dir / "program.err").string();
    bool switch_user = user.has_value();
    uid_t run_uid = switch_user ? user->uid : 0;
    gid_t run_gid = switch_user ? user->gid : 0;

    int null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (null_fd < 0) throw environment_error(fmt::format("unable to open /dev/null: {}", strerror(errno)));
    defer { close(null_fd); };
    // 沙箱内的进程可以在沙箱文件夹中创建文件，不能跟随它留下的符号链接
    int out_fd = open(out_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC | O_NOFOLLOW, 0644);
    if (out_fd < 0) throw environment_error(fmt::format("unable to open {}: {}", out_path, strerror(errno)));
    defer { close(out_fd); };
    int err_fd = open(err_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC | O_NOFOLLOW, 0644);
    if (err_fd < 0) throw environment_error(fmt::format("unable to open {}: {}", err_path, strerror(errno)));
    defer { close(err_fd); };

    int error_pipe[2];
    if (pipe2(error_pipe, O_CLOEXEC) != 0)
        throw environment_error(fmt::format("unable to create pipe: {}", strerror(errno)));

    elapsed_time timer;
    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(error_pipe[0]);
        close(error_pipe[1]);
        throw environment_error(fmt::format("unable to fork: {}", strerror(err)));
    }

    if (pid == 0) {  // 子进程
        close(error_pipe[0]);
        // 在独立的进程组中运行，这样可以通过一个信号杀死评测器派生的所有进程
        if (setpgid(0, 0) != 0) report_child_failure(error_pipe[1], STAGE_SETUP, errno);
        if (dup2(null_fd, STDIN_FILENO) < 0 || dup2(out_fd, STDOUT_FILENO) < 0 || dup2(err_fd, STDERR_FILENO) < 0)
            report_child_failure(error_pipe[1], STAGE_SETUP, errno);
        if (chdir(workdir.c_str()) != 0) report_child_failure(error_pipe[1], STAGE_SETUP, errno);

        int err;
        if ((err = apply_limits(limits))) report_child_failure(error_pipe[1], STAGE_LIMITS, err);
        if ((err = isolate_namespaces())) report_child_failure(error_pipe[1], STAGE_SETUP, err);
        if (switch_user && (err = drop_privileges(run_uid, run_gid))) report_child_failure(error_pipe[1], STAGE_SETUP, err);

        execvpe(argv[0], argv.data(), envp.data());
        report_child_failure(error_pipe[1], STAGE_EXEC, errno);
    }

    // 父进程
    setpgid(pid, pid);  // 与子进程中的 setpgid 竞争，谁先执行都可以
    last_pgid = pid;
    close(error_pipe[1]);

    child_failure failure{0, 0};
    ssize_t n;
    do {
        n = read(error_pipe[0], &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    close(error_pipe[0]);

    if (n == sizeof(failure)) {
        int status;
        waitpid(pid, &status, 0);
        last_pgid = -1;
        string message = fmt::format("unable to start {}: {}", command[0], strerror(failure.error));
        if (failure.stage == STAGE_EXEC && (failure.error == ENOENT || failure.error == EACCES || failure.error == ENOEXEC))
            throw image_unavailable(message);
        throw environment_error(message);
    }

    execution_result result;
    bool cancelled = false, timed_out = false;
    int status = 0;
    struct rusage usage;
    while (true) {
        pid_t ret = wait4(pid, &status, WNOHANG, &usage);
        if (ret == pid) break;
        if (ret < 0 && errno != EINTR) {
            int err = errno;
            kill_group(pid, SIGKILL);
            throw environment_error(fmt::format("unable to wait for {}: {}", command[0], strerror(err)));
        }

        if (budget.timeout > 0 && timer.seconds() > budget.timeout)
            timed_out = true;
        else if (budget.cancelled && budget.cancelled->load())
            cancelled = true;

        if (timed_out || cancelled) {
            LOG(INFO) << (timed_out ? "Wall time limit exceeded" : "Execution cancelled") << ", killing process group " << pid;
            kill_group(pid, SIGTERM);
            usleep(KILL_DELAY);
            kill_group(pid, SIGKILL);
            while (wait4(pid, &status, 0, &usage) < 0 && errno == EINTR)
                ;
            break;
        }

        usleep(POLL_INTERVAL);  // 10ms，这里必须等待，不可以忙等，否则会挤占其他 worker 的执行权
    }

    // 评测器退出后，它派生的进程可能仍然存活
    kill_group(pid, SIGKILL);
    last_pgid = -1;

    result.wall_time = timer.seconds();
    double cpu_time = usage.ru_utime.tv_sec + usage.ru_utime.tv_usec / 1e6 + usage.ru_stime.tv_sec + usage.ru_stime.tv_usec / 1e6;

    if (timed_out) {
        result.kind = execution_result::TIMED_OUT;
    } else if (cancelled) {
        result.kind = execution_result::CANCELLED;
    } else if (WIFEXITED(status)) {
        result.kind = execution_result::EXITED;
        result.exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        bool cpu_exceeded = result.signal == SIGXCPU || (result.signal == SIGKILL && limits.cpu_time > 0 && cpu_time >= limits.cpu_time);
        result.kind = cpu_exceeded ? execution_result::TIMED_OUT : execution_result::SIGNALED;
    }

    DLOG(INFO) << "Command " << command[0] << " in " << root_dir << " finished in " << result.wall_time
               << "s (cpu " << cpu_time << "s), status " << status;
    return result;
}

void process_sandbox::release() noexcept {
    if (current == sandbox_state::TORN_DOWN) return;
    sandbox_state previous = current;
    current = sandbox_state::TORN_DOWN;

    if (last_pgid > 0) {
        kill_group(last_pgid, SIGKILL);
        last_pgid = -1;
    }
    if (user) kill_user_processes(user->uid);

    if (keep_dir) {
        try {
            if (user && fs::exists(root_dir)) {
                // 槽位会被新的沙箱复用，保留的文件夹不能再对该用户组开放
                if (chown(root_dir.c_str(), (uid_t)-1, getegid()) != 0)
                    LOG(WARNING) << "Unable to change group of sandbox " << root_dir << ": " << strerror(errno);
                fs::permissions(root_dir, fs::perms::owner_all, fs::perm_options::replace);
            }
        } catch (std::exception &ex) {
            LOG(WARNING) << "Unable to lock down sandbox " << root_dir << ": " << ex.what();
        }
        LOG(INFO) << "Keeping sandbox " << root_dir << " (" << get_display_message(previous) << ")";
    } else {
        DLOG(INFO) << "Removing sandbox " << root_dir << " (" << get_display_message(previous) << ")";
        try {
            if (fs::exists(root_dir)) {
                set_writable(root_dir, true);
                fs::remove_all(root_dir);
            }
        } catch (std::exception &ex) {
            LOG(WARNING) << "Unable to remove sandbox " << root_dir << ": " << ex.what();
        }
    }

    if (slots) slots->free(slot);
}

process_sandbox_provider::process_sandbox_provider(const process_sandbox_options &options)
    : options(options), slots(make_shared<sandbox_slots>(options.capacity)) {}

int process_sandbox_provider::live() const {
    return slots->live();
}

unique_ptr<sandbox> process_sandbox_provider::acquire(const sandbox_limits &limits, const vector<mount> &mounts) {
    if (!fs::is_directory(options.image))
        throw image_unavailable(fmt::format("evaluator image {} does not exist", options.image.string()));
    if (options.isolate && geteuid() != 0)
        throw image_unavailable("isolated sandboxes require root privileges");

    try {
        fs::create_directories(options.run_dir);
        // 沙箱用户可以进入 run_dir，但不能列出其他沙箱的文件夹
        if (options.isolate)
            fs::permissions(options.run_dir, fs::perms::owner_all | fs::perms::group_exec | fs::perms::others_exec,
                            fs::perm_options::replace);
        if (options.min_free_space > 0) {
            fs::space_info space = fs::space(options.run_dir);
            if (space.available < (uintmax_t)options.min_free_space * 1024)
                throw resource_exhausted(fmt::format("only {}KB free in {}", space.available / 1024, options.run_dir.string()));
        }
    } catch (fs::filesystem_error &ex) {
        throw environment_error(fmt::format("unable to prepare run directory: {}", ex.what()));
    }

    int slot = slots->reserve();
    optional<sandbox_user> user;
    if (options.isolate)
        user = sandbox_user{options.run_uid + (uid_t)slot, options.run_gid + (gid_t)slot};

    string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());
    fs::path root = options.run_dir / uuid;
    auto box = make_unique<process_sandbox>(root, limits, slots, slot, user, options.keep_dirs);

    // 创建失败时 box 析构会清理已经创建的文件并归还槽位
    try {
        fs::create_directories(root);
        if (user) {
            // 沙箱文件夹属于评测程序，只有该沙箱的用户组可以在其中创建文件。
            // 设置了粘滞位后，沙箱用户无法删除或重命名不属于自己的 image、checks 和 submission
            if (chown(root.c_str(), geteuid(), user->gid) != 0)
                throw environment_error(fmt::format("unable to change group of sandbox {}: {}", root.string(), strerror(errno)));
            fs::permissions(root, fs::perms::owner_all | fs::perms::group_all | fs::perms::sticky_bit,
                            fs::perm_options::replace);
        }

        fs::copy(options.image, root / "image", fs::copy_options::recursive);
        if (user) set_world_readable(root / "image");
        set_writable(root / "image", false);

        for (auto &m : mounts) {
            fs::path dest = root / assert_safe_path(m.target);
            fs::create_directories(dest.parent_path());
            fs::copy(m.source, dest, fs::copy_options::recursive);
            if (user) set_world_readable(dest);
            if (m.read_only) set_writable(dest, false);
        }
    } catch (fs::filesystem_error &ex) {
        throw environment_error(fmt::format("unable to create sandbox {}: {}", root.string(), ex.what()));
    }

    DLOG(INFO) << "Created sandbox " << root << " in slot " << slot;
    return box;
}

}  // namespace grader
