#include "judge/submission.hpp"

namespace grader {
using namespace std;

ostream &operator<<(ostream &os, const submission_job &job) {
    return os << "Submission[" << job.id << "]";
}

}  // namespace grader
