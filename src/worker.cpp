#include "worker.hpp"
#include <glog/logging.h>

namespace grader {
using namespace std;

static void worker_loop(int worker_id, concurrent_queue<message::dispatch> &task_queue,
                        concurrent_queue<message::report> &result_queue,
                        const job_runner &runner, const monitor_list &monitors) {
    call_monitors(worker_id, monitors, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::START, ""); });

    while (true) {
        message::dispatch task = task_queue.pop();
        if (task.stop) break;

        message::report report;
        report.index = task.index;
        report.worker_id = worker_id;

        call_monitors(worker_id, monitors, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::JUDGING, ""); });
        call_monitors(worker_id, monitors, [&](monitor &m) { m.start_job(worker_id, task.job); });

        try {
            report.outcome = runner(task.job);
        } catch (std::exception &ex) {
            // 即使执行崩溃也要返回结果，否则调度器会一直等待这个槽位
            call_monitors(worker_id, monitors, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::CRASHED, ex.what()); });
            report.outcome = outcome::environment_failure{outcome::environment_cause::INFRASTRUCTURE, ex.what()};
        }

        call_monitors(worker_id, monitors, [&](monitor &m) { m.end_job(worker_id, task.job, report.outcome); });
        result_queue.push(move(report));

        call_monitors(worker_id, monitors, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::IDLE, ""); });
    }

    call_monitors(worker_id, monitors, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::STOPPED, ""); });
}

thread start_worker(int worker_id, concurrent_queue<message::dispatch> &task_queue,
                    concurrent_queue<message::report> &result_queue,
                    job_runner runner, monitor_list monitors) {
    return thread([worker_id, &task_queue, &result_queue, runner = move(runner), monitors = move(monitors)] {
        worker_loop(worker_id, task_queue, result_queue, runner, monitors);
    });
}

}  // namespace grader
