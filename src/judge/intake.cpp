#include "judge/intake.hpp"
#include <glog/logging.h>
#include <unistd.h>
#include <algorithm>
#include <nlohmann/json.hpp>
#include <set>
#include <yaml-cpp/yaml.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

vector<fs::path> list_submissions(const fs::path &dir, const vector<string> &extensions) {
    if (!fs::is_directory(dir))
        throw intake_error(dir.string(), "submission directory does not exist");

    vector<fs::path> result;
    for (auto &entry : fs::directory_iterator(dir)) {
        auto &path = entry.path();
        if (!entry.is_regular_file() || path.filename().string()[0] == '.') continue;
        if (!extensions.empty() && find(extensions.begin(), extensions.end(), path.extension().string()) == extensions.end())
            continue;
        result.push_back(path);
    }
    sort(result.begin(), result.end());
    return result;
}

static void register_metadata(const string &identifier, const string &filename,
                              map<string, string> &result, set<string> &identifiers) {
    if (!identifiers.insert(identifier).second)
        throw duplicate_submission(identifier, "identifier " + identifier + " appears twice in metadata");
    if (!result.emplace(filename, identifier).second)
        throw duplicate_submission(filename, "file " + filename + " appears twice in metadata");
}

map<string, string> load_metadata(const fs::path &file) {
    if (!fs::is_regular_file(file))
        throw intake_error(file.string(), "metadata file does not exist");

    json j;
    try {
        j = json::parse(read_file_content(file));
    } catch (json::parse_error &ex) {
        throw intake_error(file.string(), string("malformed metadata: ") + ex.what());
    }
    if (!j.is_array())
        throw intake_error(file.string(), "metadata should be an array");

    map<string, string> result;
    set<string> identifiers;
    for (auto &item : j) {
        if (!item.is_object() || !item.contains("identifier") || !item.contains("filename") ||
            !item.at("identifier").is_string() || !item.at("filename").is_string())
            throw intake_error(file.string(), "metadata entry should have identifier and filename: " + item.dump());

        register_metadata(item.at("identifier").get<string>(), item.at("filename").get<string>(), result, identifiers);
    }
    return result;
}

map<string, string> load_yaml_metadata(const fs::path &file) {
    if (!fs::is_regular_file(file))
        throw intake_error(file.string(), "metadata file does not exist");

    map<string, string> result;
    set<string> identifiers;
    try {
        YAML::Node root = YAML::LoadFile(file.string());
        if (!root.IsSequence())
            throw intake_error(file.string(), "metadata should be a sequence");

        for (auto item : root) {
            if (!item.IsMap() || !item["identifier"] || !item["filename"] ||
                !item["identifier"].IsScalar() || !item["filename"].IsScalar())
                throw intake_error(file.string(), "metadata entry should have identifier and filename");

            register_metadata(item["identifier"].as<string>(), item["filename"].as<string>(), result, identifiers);
        }
    } catch (YAML::Exception &ex) {
        throw intake_error(file.string(), string("malformed metadata: ") + ex.what());
    }
    return result;
}

static submission_job make_job(const fs::path &ref, const shared_ptr<const check_set> &checks, const map<string, string> &metadata) {
    if (!fs::exists(ref))
        throw intake_error(ref.string(), "submission does not exist");
    if (!fs::is_regular_file(ref))
        throw intake_error(ref.string(), "submission is not a regular file");
    if (access(ref.c_str(), R_OK) != 0)
        throw intake_error(ref.string(), "submission is not readable");

    submission_job job;
    job.path = fs::canonical(ref);
    job.checks = checks;
    job.status = job_status::PENDING;

    if (metadata.empty()) {
        job.id = ref.stem().string();
    } else {
        auto it = metadata.find(ref.filename().string());
        if (it == metadata.end())
            throw intake_error(ref.string(), "submission is not registered in metadata");
        job.id = it->second;
    }
    if (job.id.empty())
        throw intake_error(ref.string(), "submission has an empty identifier");
    return job;
}

vector<submission_job> normalize_submissions(const vector<fs::path> &refs, const shared_ptr<const check_set> &checks,
                                             const map<string, string> &metadata, vector<intake_rejection> *rejected) {
    vector<submission_job> jobs;
    set<fs::path> paths;
    set<string> identifiers;

    for (auto &ref : refs) {
        try {
            submission_job job = make_job(ref, checks, metadata);
            if (paths.count(job.path))
                throw duplicate_submission(ref.string(), "submission " + job.path.string() + " is referenced twice");
            if (identifiers.count(job.id))
                throw duplicate_submission(ref.string(), "identifier " + job.id + " is used by another submission");
            paths.insert(job.path);
            identifiers.insert(job.id);
            jobs.push_back(move(job));
        } catch (intake_error &ex) {
            if (!rejected) throw;
            LOG(WARNING) << "Skipping submission " << ex.reference << ": " << ex.what();
            rejected->push_back({ex.reference, ex.what()});
        }
    }

    LOG(INFO) << "Accepted " << jobs.size() << " of " << refs.size() << " submissions";
    return jobs;
}

}  // namespace grader
