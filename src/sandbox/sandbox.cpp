#include "sandbox/sandbox.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<sandbox_state, const char *> sandbox_state_string = boost::assign::map_list_of
    (sandbox_state::CREATED, "created")
    (sandbox_state::ACTIVE, "active")
    (sandbox_state::TORN_DOWN, "torn-down");
// clang-format on

const char *get_display_message(sandbox_state state) {
    return sandbox_state_string.at(state);
}

}  // namespace grader
