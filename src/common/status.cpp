#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<job_status, const char *> job_status_string = boost::assign::map_list_of
    (job_status::PENDING, "pending")
    (job_status::RUNNING, "running")
    (job_status::RETRYING, "retrying")
    (job_status::DONE, "done")
    (job_status::FAILED_FATAL, "failed-fatal");

static const unordered_map<fault_kind, const char *> fault_kind_string = boost::assign::map_list_of
    (fault_kind::NONE, "")
    (fault_kind::TIMEOUT, "timeout")
    (fault_kind::CRASHED, "crashed")
    (fault_kind::ENVIRONMENT, "environment");

static const unordered_map<check_status, const char *> check_status_string = boost::assign::map_list_of
    (check_status::PASSED, "passed")
    (check_status::FAILED, "failed")
    (check_status::PARTIAL, "partial")
    (check_status::NOT_RUN, "not-run");
// clang-format on

const char *get_display_message(job_status stat) {
    return job_status_string.at(stat);
}

const char *get_display_message(fault_kind fault) {
    return fault_kind_string.at(fault);
}

const char *get_display_message(check_status stat) {
    return check_status_string.at(stat);
}

}  // namespace grader
