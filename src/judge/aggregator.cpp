#include "judge/aggregator.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

result_aggregator::result_aggregator(const check_set &checks, bool timeout_partial_credit)
    : checks(checks), timeout_partial_credit(timeout_partial_credit) {}

void result_aggregator::insert(grade_row &&row) {
    lock_guard<mutex> guard(mut);
    if (rows.count(row.id))
        throw duplicate_report(row.id);
    string id = row.id;
    rows.emplace(id, move(row));
}

void result_aggregator::add(const submission_job &job, const execution_outcome &result, const classification &c) {
    grade_row row;
    row.id = job.id;
    row.path = job.path;
    row.status = c.status;
    row.fault = c.fault;
    row.attempts = job.attempts;
    row.message = c.reason;
    row.checks = align_results(checks, results_of(result));

    if (c.fault == fault_kind::TIMEOUT && !timeout_partial_credit) {
        for (auto &check : row.checks) check.score = 0;
    }
    if (c.status == job_status::FAILED_FATAL) {
        for (auto &check : row.checks) check.score = 0;
    }
    row.total = total_score(row.checks);

    LOG(INFO) << job << " recorded: " << get_display_message(row.status)
              << (row.fault == fault_kind::NONE ? "" : string(", ") + get_display_message(row.fault))
              << ", score " << row.total << ", attempts " << row.attempts;
    insert(move(row));
}

void result_aggregator::add_failure(const submission_job &job, const string &reason) {
    grade_row row;
    row.id = job.id;
    row.path = job.path;
    row.status = job_status::FAILED_FATAL;
    row.fault = fault_kind::ENVIRONMENT;
    row.attempts = job.attempts;
    row.message = reason;
    row.checks = unreached_results(checks);
    row.total = 0;

    LOG(WARNING) << job << " failed: " << reason;
    insert(move(row));
}

size_t result_aggregator::size() const {
    lock_guard<mutex> guard(mut);
    return rows.size();
}

grade_report result_aggregator::report() const {
    grade_report result;
    result.checks = checks.checks;

    lock_guard<mutex> guard(mut);
    for (auto &[id, row] : rows) result.rows.push_back(row);
    return result;
}

}  // namespace grader
