#include "monitor/monitor.hpp"
#include <glog/logging.h>
#include <boost/assign.hpp>
#include <unordered_map>

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<worker_state, const char *> worker_state_string = boost::assign::map_list_of
    (worker_state::START, "start")
    (worker_state::IDLE, "idle")
    (worker_state::JUDGING, "judging")
    (worker_state::CRASHED, "crashed")
    (worker_state::STOPPED, "stopped");
// clang-format on

const char *get_display_message(worker_state state) {
    return worker_state_string.at(state);
}

void call_monitors(int worker_id, const monitor_list &monitors, const function<void(monitor &)> &callback) {
    try {
        for (auto &m : monitors) callback(*m);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Worker " << worker_id << " has crashed when reporting monitoring information, " << ex.what();
    }
}

monitor::~monitor() {}

void monitor::start_job(int, const submission_job &) {}

void monitor::end_job(int, const submission_job &, const execution_outcome &) {}

void monitor::job_retried(const submission_job &, const string &) {}

void monitor::job_finished(const submission_job &, const classification &) {}

void monitor::worker_state_changed(int, worker_state, const string &) {}

void log_monitor::start_job(int worker_id, const submission_job &job) {
    LOG(INFO) << "Worker " << worker_id << " started " << job << ", attempt " << job.attempts;
}

void log_monitor::end_job(int worker_id, const submission_job &job, const execution_outcome &result) {
    fault_kind fault = fault_of(result);
    if (fault == fault_kind::NONE)
        LOG(INFO) << "Worker " << worker_id << " finished " << job;
    else
        LOG(INFO) << "Worker " << worker_id << " finished " << job << " with " << get_display_message(fault) << ": " << describe(result);
}

void log_monitor::job_retried(const submission_job &job, const string &reason) {
    LOG(WARNING) << job << " will be retried after environment error: " << reason;
}

void log_monitor::job_finished(const submission_job &job, const classification &c) {
    VLOG(1) << job << " is " << get_display_message(c.status) << " (" << get_display_message(c.action) << ")";
}

void log_monitor::worker_state_changed(int worker_id, worker_state state, const string &information) {
    if (state == worker_state::CRASHED)
        LOG(ERROR) << "Worker " << worker_id << " crashed: " << information;
    else
        VLOG(1) << "Worker " << worker_id << " is " << get_display_message(state);
}

}  // namespace grader
