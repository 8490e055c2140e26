#include "judge/classifier.hpp"
#include <fmt/core.h>
#include <boost/assign.hpp>
#include <unordered_map>

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<decision, const char *> decision_string = boost::assign::map_list_of
    (decision::RETRY, "retry")
    (decision::RECORD, "record")
    (decision::ABORT, "abort");
// clang-format on

const char *get_display_message(decision action) {
    return decision_string.at(action);
}

classification classify(const execution_outcome &result, unsigned attempts, unsigned max_retries) {
    classification c;
    c.fault = fault_of(result);
    c.reason = describe(result);

    auto failure = get_if<outcome::environment_failure>(&result);
    if (!failure) {
        c.action = decision::RECORD;
        c.status = job_status::DONE;
        return c;
    }

    c.status = job_status::FAILED_FATAL;
    if (failure->cause == outcome::environment_cause::IMAGE_UNAVAILABLE) {
        c.action = decision::ABORT;
    } else if (failure->cause != outcome::environment_cause::CANCELLED && attempts <= max_retries) {
        c.action = decision::RETRY;
        c.status = job_status::RETRYING;
    } else {
        c.action = decision::RECORD;
        if (failure->cause != outcome::environment_cause::CANCELLED)
            c.reason = fmt::format("{} (gave up after {} attempts)", c.reason, attempts);
    }
    return c;
}

}  // namespace grader
