#include "env.hpp"
#include "config.hpp"

namespace grader {
using namespace std;

map<string, string> error_code_variables() {
    return {
        {"E_SUCCESS", to_string(grader::error_codes::E_SUCCESS)},
        {"E_INTERNAL_ERROR", to_string(grader::error_codes::E_INTERNAL_ERROR)},
        {"E_SUBMISSION_ERROR", to_string(grader::error_codes::E_SUBMISSION_ERROR)}};
}

}  // namespace grader
