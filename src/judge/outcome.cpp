#include "judge/outcome.hpp"
#include <fmt/core.h>
#include <boost/assign.hpp>
#include <unordered_map>

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<outcome::environment_cause, const char *> environment_cause_string = boost::assign::map_list_of
    (outcome::environment_cause::RESOURCE_EXHAUSTED, "resource exhausted")
    (outcome::environment_cause::IMAGE_UNAVAILABLE, "image unavailable")
    (outcome::environment_cause::INFRASTRUCTURE, "infrastructure failure")
    (outcome::environment_cause::CANCELLED, "cancelled");
// clang-format on

const char *get_display_message(outcome::environment_cause cause) {
    return environment_cause_string.at(cause);
}

namespace {

struct fault_visitor {
    fault_kind operator()(const outcome::completed &) const { return fault_kind::NONE; }
    fault_kind operator()(const outcome::timed_out &) const { return fault_kind::TIMEOUT; }
    fault_kind operator()(const outcome::submission_crashed &) const { return fault_kind::CRASHED; }
    fault_kind operator()(const outcome::environment_failure &) const { return fault_kind::ENVIRONMENT; }
};

struct results_visitor {
    vector<check_result> operator()(const outcome::completed &o) const { return o.results; }
    vector<check_result> operator()(const outcome::timed_out &o) const { return o.results; }
    vector<check_result> operator()(const outcome::submission_crashed &o) const { return o.results; }
    vector<check_result> operator()(const outcome::environment_failure &) const { return {}; }
};

struct describe_visitor {
    string operator()(const outcome::completed &) const {
        return "";
    }

    string operator()(const outcome::timed_out &o) const {
        return fmt::format("timed out after {:.1f}s", o.elapsed);
    }

    string operator()(const outcome::submission_crashed &o) const {
        return "crashed: " + o.cause;
    }

    string operator()(const outcome::environment_failure &o) const {
        if (o.message.empty()) return get_display_message(o.cause);
        return fmt::format("{}: {}", get_display_message(o.cause), o.message);
    }
};

}  // namespace

fault_kind fault_of(const execution_outcome &result) {
    return visit(fault_visitor{}, result);
}

vector<check_result> results_of(const execution_outcome &result) {
    return visit(results_visitor{}, result);
}

string describe(const execution_outcome &result) {
    return visit(describe_visitor{}, result);
}

}  // namespace grader
