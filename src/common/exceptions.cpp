#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace grader {
using namespace std;

grader_exception::grader_exception()
    : grader_exception("") {}

grader_exception::grader_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *grader_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const grader_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

intake_error::intake_error(const string &reference, const string &message)
    : grader_exception(message), reference(reference) {}

duplicate_submission::duplicate_submission(const string &reference, const string &message)
    : intake_error(reference, message) {}

environment_error::environment_error()
    : grader_exception() {}

environment_error::environment_error(const string &message)
    : grader_exception(message) {}

resource_exhausted::resource_exhausted(const string &message)
    : environment_error(message) {}

image_unavailable::image_unavailable(const string &message)
    : environment_error(message) {}

duplicate_report::duplicate_report(const string &id)
    : grader_exception("submission " + id + " has been reported twice") {}

}  // namespace grader
