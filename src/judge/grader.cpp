#include "judge/grader.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <deque>
#include <stdexcept>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/defer.hpp"
#include "common/messages.hpp"
#include "common/utils.hpp"
#include "judge/aggregator.hpp"
#include "judge/classifier.hpp"
#include "judge/runner.hpp"
#include "worker.hpp"

namespace grader {
using namespace std;

fatal_batch_error::fatal_batch_error(const string &reason, grade_report report)
    : grader_exception(reason), report(move(report)) {}

grade_report grade(vector<submission_job> jobs, const check_set &checks, sandbox_provider &provider,
                   evaluator &eval, const grade_options &options, const monitor_list &monitors) {
    if (options.concurrency == 0)
        throw invalid_argument("concurrency should be at least 1");

    result_aggregator aggregator(checks, options.timeout_partial_credit);
    if (jobs.empty()) return aggregator.report();

    atomic<bool> cancelled{false};
    concurrent_queue<message::dispatch> task_queue;
    concurrent_queue<message::report> result_queue;

    runner_options run_options;
    run_options.limits = options.limits;
    run_options.timeout = options.per_job_timeout;
    run_options.cancelled = &cancelled;
    run_options.support_files = options.support_files;
    job_runner runner = [&](const submission_job &job) {
        return run_submission(job, provider, eval, run_options);
    };

    size_t slots = min<size_t>(options.concurrency, jobs.size());
    vector<thread> workers;
    defer {
        cancelled = true;
        for (size_t i = 0; i < workers.size(); ++i) {
            message::dispatch stop;
            stop.stop = true;
            task_queue.push(move(stop));
        }
        for (auto &worker : workers) worker.join();
    };
    for (size_t i = 0; i < slots; ++i)
        workers.push_back(start_worker((int)i, task_queue, result_queue, runner, monitors));

    LOG(INFO) << "Grading " << jobs.size() << " submissions with " << slots << " workers";

    // 等待队列和执行中的提交数只由当前线程读写
    deque<size_t> pending;
    for (size_t i = 0; i < jobs.size(); ++i) pending.push_back(i);
    size_t in_flight = 0;

    bool aborting = false;
    string abort_reason;
    elapsed_time timer;

    auto abort_batch = [&](const string &reason) {
        if (aborting) return;
        aborting = true;
        abort_reason = reason;
        cancelled = true;
        LOG(ERROR) << "Aborting batch: " << reason << ", " << pending.size() << " pending and " << in_flight << " running submissions";

        for (size_t idx : pending) {
            submission_job &job = jobs[idx];
            job.status = job_status::FAILED_FATAL;
            aggregator.add_failure(job, reason);
        }
        pending.clear();
    };

    while (!pending.empty() || in_flight > 0) {
        while (!aborting && in_flight < slots && !pending.empty()) {
            size_t idx = pending.front();
            pending.pop_front();

            submission_job &job = jobs[idx];
            ++job.attempts;
            job.status = job_status::RUNNING;

            message::dispatch task;
            task.index = idx;
            task.job = job;
            task_queue.push(move(task));
            ++in_flight;
        }

        if (!aborting) {
            if (options.batch_timeout > 0 && timer.seconds() > options.batch_timeout)
                abort_batch("batch timeout exceeded");
            else if (options.stop && options.stop->load())
                abort_batch("batch stopped");
        }

        message::report report;
        if (!result_queue.pop_for(report, chrono::milliseconds(10)))
            continue;
        --in_flight;

        submission_job &job = jobs[report.index];
        classification c = classify(report.outcome, job.attempts, options.max_retries);

        // 批次中止后返回的环境错误都是被取消的执行，不再重试
        if (aborting && c.fault == fault_kind::ENVIRONMENT) {
            c.action = decision::RECORD;
            c.status = job_status::FAILED_FATAL;
            c.reason = abort_reason;
        }

        switch (c.action) {
            case decision::RETRY:
                job.status = job_status::RETRYING;
                pending.push_back(report.index);
                call_monitors(-1, monitors, [&](monitor &m) { m.job_retried(job, c.reason); });
                break;
            case decision::ABORT:
                job.status = c.status;
                aggregator.add(job, report.outcome, c);
                call_monitors(-1, monitors, [&](monitor &m) { m.job_finished(job, c); });
                abort_batch(c.reason);
                break;
            case decision::RECORD:
                job.status = c.status;
                aggregator.add(job, report.outcome, c);
                call_monitors(-1, monitors, [&](monitor &m) { m.job_finished(job, c); });
                break;
        }
    }

    grade_report result = aggregator.report();
    LOG(INFO) << "Graded " << result.rows.size() << " submissions in " << timer.seconds() << "s";

    if (aborting) {
        result.complete = false;
        result.abort_reason = abort_reason;
        throw fatal_batch_error(abort_reason, move(result));
    }
    return result;
}

}  // namespace grader
