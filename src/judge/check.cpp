#include "judge/check.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <nlohmann/json.hpp>
#include <set>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

static const char *CHECKS_MANIFEST = "checks.json";

double check_set::total_points() const {
    double total = 0;
    for (auto &check : checks) total += check.points;
    return total;
}

int check_set::index_of(const string &name) const {
    for (size_t i = 0; i < checks.size(); ++i)
        if (checks[i].name == name) return (int)i;
    return -1;
}

static vector<check_definition> load_manifest(const fs::path &manifest) {
    vector<check_definition> result;
    json j;
    try {
        j = json::parse(read_file_content(manifest));
    } catch (json::parse_error &ex) {
        throw intake_error(manifest.string(), string("malformed check manifest: ") + ex.what());
    }

    if (!j.is_array())
        throw intake_error(manifest.string(), "check manifest should be an array");

    for (auto &item : j) {
        check_definition check;
        if (!item.is_object() || !item.contains("name") || !item.at("name").is_string())
            throw intake_error(manifest.string(), "check without name: " + item.dump());
        check.name = item.at("name").get<string>();
        if (item.contains("points")) {
            if (!item.at("points").is_number())
                throw intake_error(manifest.string(), "points of check " + check.name + " should be a number");
            check.points = item.at("points").get<double>();
        }
        if (item.contains("hidden")) {
            if (!item.at("hidden").is_boolean())
                throw intake_error(manifest.string(), "hidden of check " + check.name + " should be a boolean");
            check.hidden = item.at("hidden").get<bool>();
        }
        if (check.points < 0)
            throw intake_error(manifest.string(), "points of check " + check.name + " should not be negative");
        result.push_back(check);
    }
    return result;
}

static vector<check_definition> load_directory(const fs::path &dir) {
    vector<fs::path> files;
    for (auto &entry : fs::directory_iterator(dir)) {
        auto &path = entry.path();
        if (!entry.is_regular_file() || path.filename().string()[0] == '.') continue;
        files.push_back(path);
    }
    sort(files.begin(), files.end());

    vector<check_definition> result;
    for (auto &file : files) {
        check_definition check;
        check.name = file.stem().string();
        result.push_back(check);
    }
    return result;
}

check_set check_set::load(const fs::path &dir) {
    if (!fs::is_directory(dir))
        throw intake_error(dir.string(), "check set directory does not exist");

    check_set result;
    result.dir = fs::absolute(dir);

    fs::path manifest = dir / CHECKS_MANIFEST;
    if (fs::is_regular_file(manifest))
        result.checks = load_manifest(manifest);
    else
        result.checks = load_directory(dir);

    if (result.checks.empty())
        throw intake_error(dir.string(), "check set contains no checks");

    set<string> names;
    for (auto &check : result.checks)
        if (!names.insert(check.name).second)
            throw intake_error(dir.string(), "duplicate check " + check.name);

    LOG(INFO) << "Loaded " << result.checks.size() << " checks worth " << result.total_points() << " points from " << dir;
    return result;
}

vector<check_result> unreached_results(const check_set &checks) {
    vector<check_result> results;
    for (auto &check : checks.checks) {
        check_result result;
        result.name = check.name;
        result.possible = check.points;
        results.push_back(result);
    }
    return results;
}

check_status verdict_of(double score, double possible) {
    if (score >= possible) return check_status::PASSED;
    if (score <= 0) return check_status::FAILED;
    return check_status::PARTIAL;
}

vector<check_result> align_results(const check_set &checks, const vector<check_result> &reported) {
    vector<check_result> results = unreached_results(checks);
    for (auto &item : reported) {
        int idx = checks.index_of(item.name);
        if (idx < 0) {
            LOG(WARNING) << "Ignoring result of unknown check " << item.name;
            continue;
        }
        check_result &result = results[idx];
        result.status = item.status;
        result.score = item.status == check_status::NOT_RUN ? 0 : clamp(item.score, 0.0, result.possible);
        result.output = item.output;
    }
    return results;
}

double total_score(const vector<check_result> &results) {
    double total = 0;
    for (auto &result : results) total += result.score;
    return total;
}

}  // namespace grader
