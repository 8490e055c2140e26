#include "judge/runner.hpp"
#include <glog/logging.h>
#include "common/defer.hpp"
#include "common/exceptions.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

execution_outcome run_submission(const submission_job &job, sandbox_provider &provider, evaluator &eval, const runner_options &options) {
    using outcome::environment_cause;
    using outcome::environment_failure;

    if (!job.checks)
        return environment_failure{environment_cause::INFRASTRUCTURE, "submission has no check set"};

    vector<mount> mounts;
    if (!job.checks->dir.empty()) {
        mount checks_mount;
        checks_mount.source = job.checks->dir;
        checks_mount.target = "checks";
        mounts.push_back(checks_mount);
    }
    for (auto &file : options.support_files) {
        mount support;
        support.source = file;
        support.target = "submission/" + file.filename().string();
        mounts.push_back(support);
    }

    unique_ptr<sandbox> box;
    try {
        box = provider.acquire(options.limits, mounts);
    } catch (image_unavailable &ex) {
        LOG(ERROR) << job << ": evaluator image unavailable: " << ex.what();
        return environment_failure{environment_cause::IMAGE_UNAVAILABLE, ex.what()};
    } catch (resource_exhausted &ex) {
        LOG(WARNING) << job << ": unable to acquire sandbox: " << ex.what();
        return environment_failure{environment_cause::RESOURCE_EXHAUSTED, ex.what()};
    } catch (environment_error &ex) {
        LOG(WARNING) << job << ": unable to create sandbox: " << ex.what();
        return environment_failure{environment_cause::INFRASTRUCTURE, ex.what()};
    } catch (std::exception &ex) {
        LOG(ERROR) << job << ": unexpected error while creating sandbox: " << ex.what();
        return environment_failure{environment_cause::INFRASTRUCTURE, ex.what()};
    }
    defer { box->release(); };

    string artifact = "submission/" + job.path.filename().string();
    try {
        box->inject(job.path, artifact);
    } catch (std::exception &ex) {
        LOG(WARNING) << job << ": unable to inject submission: " << ex.what();
        return environment_failure{environment_cause::INFRASTRUCTURE, ex.what()};
    }

    execution_budget budget;
    budget.timeout = options.timeout;
    budget.cancelled = options.cancelled;

    try {
        return eval.evaluate(*box, artifact, *job.checks, budget);
    } catch (std::exception &ex) {
        LOG(ERROR) << job << ": evaluator failed: " << ex.what();
        return environment_failure{environment_cause::INFRASTRUCTURE, ex.what()};
    }
}

}  // namespace grader
