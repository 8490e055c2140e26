#include "gtest/gtest.h"
#include <signal.h>
#include <unistd.h>
#include <atomic>
#include <thread>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "sandbox/process_sandbox.hpp"
#include "test/worker.hpp"

using namespace std;
using namespace std::filesystem;
using namespace grader;

class ProcessSandboxTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }

    void SetUp() override {
        dir = make_temp_dir("sandbox");
        write_file(dir / "image" / "hello.txt", "hello");
        write_file(dir / "checks" / "q1.py", "assert True");

        options = make_sandbox_options(dir);
    }

    void TearDown() override {
        set_writable(dir, true);
        remove_all(dir);
    }

    execution_result run(sandbox &box, const string &script, double timeout = 10) {
        execution_budget budget;
        budget.timeout = timeout;
        return box.execute({"sh", "-c", script}, {}, budget);
    }

    path dir;
    process_sandbox_options options;
};

TEST_F(ProcessSandboxTest, ExecuteCapturesOutputAndExitCode) {
    process_sandbox_provider provider(options);
    auto box = provider.acquire(sandbox_limits(), {});
    EXPECT_EQ(box->state(), sandbox_state::CREATED);

    execution_result result = run(*box, "echo hello; echo oops >&2; exit 3");
    EXPECT_EQ(box->state(), sandbox_state::ACTIVE);
    EXPECT_EQ(result.kind, execution_result::EXITED);
    EXPECT_EQ(result.exitcode, 3);
    EXPECT_EQ(read_file_content(box->root() / "program.out"), "hello\n");
    EXPECT_EQ(read_file_content(box->root() / "program.err"), "oops\n");
}

TEST_F(ProcessSandboxTest, EnvironmentIsReduced) {
    set_env("GRADER_TEST_SECRET", "leaked");
    process_sandbox_provider provider(options);
    auto box = provider.acquire(sandbox_limits(), {});

    execution_budget budget;
    box->execute({"sh", "-c", "echo \"$E_SUCCESS-$GRADER_TEST_SECRET\""}, {{"E_SUCCESS", "0"}}, budget);
    EXPECT_EQ(read_file_content(box->root() / "program.out"), "0-\n");
}

TEST_F(ProcessSandboxTest, ImageAndMountsAreCopied) {
    process_sandbox_provider provider(options);
    mount checks;
    checks.source = dir / "checks";
    checks.target = "checks";
    auto box = provider.acquire(sandbox_limits(), {checks});

    EXPECT_EQ(read_file_content(box->root() / "image" / "hello.txt"), "hello");
    EXPECT_EQ(read_file_content(box->root() / "checks" / "q1.py"), "assert True");

    box->inject(dir / "checks" / "q1.py", "submission/answer.py");
    EXPECT_TRUE(is_regular_file(box->root() / "submission" / "answer.py"));
    EXPECT_ANY_THROW(box->inject(dir / "checks" / "q1.py", "../escape.py"));
    EXPECT_ANY_THROW(box->inject(dir / "checks" / "q1.py", "submission/../../escape.py"));

    execution_result result = run(*box, "echo x > checks/q1.py");
    EXPECT_NE(result.exitcode, 0);
    EXPECT_EQ(read_file_content(box->root() / "checks" / "q1.py"), "assert True");
    EXPECT_EQ(read_file_content(dir / "checks" / "q1.py"), "assert True");
}

TEST_F(ProcessSandboxTest, DotsInsideFileNameAreAllowed) {
    process_sandbox_provider provider(options);
    auto box = provider.acquire(sandbox_limits(), {});

    box->inject(dir / "checks" / "q1.py", "submission/john..doe.py");
    EXPECT_TRUE(is_regular_file(box->root() / "submission" / "john..doe.py"));
    box->inject(dir / "checks" / "q1.py", "submission/..hidden..py");
    EXPECT_TRUE(is_regular_file(box->root() / "submission" / "..hidden..py"));
}

TEST_F(ProcessSandboxTest, SandboxUserCannotTouchOtherSandboxes) {
    if (geteuid() != 0) GTEST_SKIP() << "switching to sandbox users requires root";

    process_sandbox_provider provider(options);
    mount checks;
    checks.source = dir / "checks";
    checks.target = "checks";
    auto first = provider.acquire(sandbox_limits(), {checks});
    auto second = provider.acquire(sandbox_limits(), {checks});
    string sibling = second->root().filename().string();

    execution_result result = run(*first, "id -u");
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_NE(read_file_content(first->root() / "program.out"), "0\n");

    result = run(*first, "echo forged > ../" + sibling + "/results.jsonl");
    EXPECT_NE(result.exitcode, 0);
    EXPECT_FALSE(exists(second->root() / "results.jsonl"));

    result = run(*first, "ls ..");
    EXPECT_NE(result.exitcode, 0);

    // 沙箱用户不是只读文件的属主，无法恢复写权限
    result = run(*first, "chmod -R u+w checks; echo x > checks/q1.py");
    EXPECT_NE(result.exitcode, 0);
    EXPECT_EQ(read_file_content(first->root() / "checks" / "q1.py"), "assert True");

    result = run(*first, "mv checks gone || rm -rf checks");
    EXPECT_NE(result.exitcode, 0);
    EXPECT_TRUE(exists(first->root() / "checks" / "q1.py"));

    // 沙箱用户仍然可以在沙箱根目录写入自己的文件
    result = run(*first, "echo ok > results.jsonl");
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_EQ(read_file_content(first->root() / "results.jsonl"), "ok\n");
}

TEST_F(ProcessSandboxTest, IsolationRequiresRoot) {
    if (geteuid() == 0) GTEST_SKIP() << "running as root";

    options.isolate = true;
    process_sandbox_provider provider(options);
    EXPECT_THROW(provider.acquire(sandbox_limits(), {}), image_unavailable);
    EXPECT_EQ(provider.live(), 0);
}

TEST_F(ProcessSandboxTest, KeptSandboxSurvivesRelease) {
    options.keep_dirs = true;
    process_sandbox_provider provider(options);
    auto box = provider.acquire(sandbox_limits(), {});
    path root = box->root();
    run(*box, "echo data > scratch.txt");

    box->release();
    EXPECT_EQ(box->state(), sandbox_state::TORN_DOWN);
    EXPECT_EQ(provider.live(), 0);
    EXPECT_EQ(read_file_content(root / "scratch.txt"), "data\n");
}

TEST_F(ProcessSandboxTest, SlotsAreReused) {
    sandbox_slots slots(2);
    EXPECT_EQ(slots.reserve(), 0);
    EXPECT_EQ(slots.reserve(), 1);
    EXPECT_THROW(slots.reserve(), resource_exhausted);

    slots.free(0);
    EXPECT_EQ(slots.live(), 1);
    EXPECT_EQ(slots.reserve(), 0);
    EXPECT_EQ(slots.live(), 2);
}

TEST_F(ProcessSandboxTest, StateDisplayMessages) {
    EXPECT_STREQ(get_display_message(sandbox_state::CREATED), "created");
    EXPECT_STREQ(get_display_message(sandbox_state::ACTIVE), "active");
    EXPECT_STREQ(get_display_message(sandbox_state::TORN_DOWN), "torn-down");
}

TEST_F(ProcessSandboxTest, SandboxesAreIsolated) {
    process_sandbox_provider provider(options);
    auto first = provider.acquire(sandbox_limits(), {});
    auto second = provider.acquire(sandbox_limits(), {});
    EXPECT_NE(first->root(), second->root());
    EXPECT_EQ(provider.live(), 2);

    run(*first, "echo secret > scratch.txt");
    EXPECT_TRUE(exists(first->root() / "scratch.txt"));
    EXPECT_FALSE(exists(second->root() / "scratch.txt"));

    execution_result result = run(*second, "test -f scratch.txt");
    EXPECT_NE(result.exitcode, 0);
}

TEST_F(ProcessSandboxTest, WallTimeLimit) {
    process_sandbox_provider provider(options);
    auto box = provider.acquire(sandbox_limits(), {});

    execution_result result = run(*box, "sleep 10", 0.5);
    EXPECT_EQ(result.kind, execution_result::TIMED_OUT);
    EXPECT_GE(result.wall_time, 0.5);
    EXPECT_LT(result.wall_time, 5);
}

TEST_F(ProcessSandboxTest, CpuTimeLimit) {
    process_sandbox_provider provider(options);
    sandbox_limits limits;
    limits.cpu_time = 1;
    auto box = provider.acquire(limits, {});

    execution_result result = run(*box, "while :; do :; done", 20);
    EXPECT_EQ(result.kind, execution_result::TIMED_OUT);
    EXPECT_LT(result.wall_time, 15);
}

TEST_F(ProcessSandboxTest, CrashBySignal) {
    process_sandbox_provider provider(options);
    auto box = provider.acquire(sandbox_limits(), {});

    execution_result result = run(*box, "kill -SEGV $$");
    EXPECT_EQ(result.kind, execution_result::SIGNALED);
    EXPECT_EQ(result.signal, SIGSEGV);
}

TEST_F(ProcessSandboxTest, Cancellation) {
    process_sandbox_provider provider(options);
    auto box = provider.acquire(sandbox_limits(), {});

    atomic<bool> cancelled{false};
    thread canceller([&] {
        this_thread::sleep_for(chrono::milliseconds(100));
        cancelled = true;
    });

    execution_budget budget;
    budget.cancelled = &cancelled;
    execution_result result = box->execute({"sh", "-c", "sleep 10"}, {}, budget);
    canceller.join();

    EXPECT_EQ(result.kind, execution_result::CANCELLED);
    EXPECT_LT(result.wall_time, 5);
}

TEST_F(ProcessSandboxTest, MissingCommandMeansImageUnavailable) {
    process_sandbox_provider provider(options);
    auto box = provider.acquire(sandbox_limits(), {});
    execution_budget budget;
    EXPECT_THROW(box->execute({"image/missing-evaluator"}, {}, budget), image_unavailable);
}

TEST_F(ProcessSandboxTest, ReleaseIsIdempotent) {
    process_sandbox_provider provider(options);
    auto box = provider.acquire(sandbox_limits(), {});
    path root = box->root();
    run(*box, "echo data > scratch.txt");
    EXPECT_TRUE(exists(root));

    box->release();
    EXPECT_EQ(box->state(), sandbox_state::TORN_DOWN);
    EXPECT_FALSE(exists(root));
    EXPECT_EQ(provider.live(), 0);

    box->release();
    EXPECT_EQ(provider.live(), 0);
    EXPECT_THROW(box->inject(dir / "checks" / "q1.py", "late.py"), logic_error);
    EXPECT_THROW(run(*box, "true"), logic_error);
}

TEST_F(ProcessSandboxTest, DestructorReleases) {
    process_sandbox_provider provider(options);
    path root;
    {
        auto box = provider.acquire(sandbox_limits(), {});
        root = box->root();
        EXPECT_EQ(provider.live(), 1);
    }
    EXPECT_FALSE(exists(root));
    EXPECT_EQ(provider.live(), 0);
}

TEST_F(ProcessSandboxTest, CapacityIsEnforced) {
    options.capacity = 1;
    process_sandbox_provider provider(options);

    auto box = provider.acquire(sandbox_limits(), {});
    EXPECT_THROW(provider.acquire(sandbox_limits(), {}), resource_exhausted);
    box->release();
    EXPECT_NO_THROW(provider.acquire(sandbox_limits(), {}));
}

TEST_F(ProcessSandboxTest, MissingImage) {
    options.image = dir / "missing-image";
    process_sandbox_provider provider(options);
    EXPECT_THROW(provider.acquire(sandbox_limits(), {}), image_unavailable);
    EXPECT_EQ(provider.live(), 0);
}

TEST_F(ProcessSandboxTest, MissingMountSourceIsEnvironmentError) {
    process_sandbox_provider provider(options);
    mount missing;
    missing.source = dir / "missing-checks";
    missing.target = "checks";
    EXPECT_THROW(provider.acquire(sandbox_limits(), {missing}), environment_error);
    EXPECT_EQ(provider.live(), 0);
}
