#include "judge/script_evaluator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <cstring>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "env.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

static const char *RESULTS_FILE = "results.jsonl";
static const char *CHECKS_DIR = "checks";
static const size_t OUTPUT_TAIL = 4096;  // 4K

script_evaluator::script_evaluator(vector<string> command, map<string, string> env)
    : command(move(command)), env(move(env)) {}

static bool parse_line(const string &line, check_result &result) {
    json j;
    try {
        j = json::parse(line);
    } catch (json::parse_error &) {
        return false;
    }
    if (!j.is_object() || !j.contains("name") || !j.at("name").is_string() ||
        !j.contains("score") || !j.at("score").is_number())
        return false;

    result.name = j.at("name").get<string>();
    result.score = j.at("score").get<double>();
    result.possible = -1;
    if (j.contains("possible")) {
        if (!j.at("possible").is_number()) return false;
        result.possible = j.at("possible").get<double>();
    }
    if (j.contains("output") && j.at("output").is_string())
        result.output = j.at("output").get<string>();
    return true;
}

vector<check_result> script_evaluator::parse_results(const fs::path &results_file, const check_set &checks, bool &malformed) {
    malformed = false;
    if (fs::is_symlink(results_file)) {
        LOG(WARNING) << "Result file " << results_file << " is a symbolic link";
        malformed = true;
        return align_results(checks, {});
    }
    string content = read_file_content(results_file, "");

    vector<check_result> reported;
    size_t begin = 0;
    while (begin < content.size()) {
        size_t end = content.find('\n', begin);
        bool complete = end != string::npos;
        string line = content.substr(begin, complete ? end - begin : string::npos);
        begin = complete ? end + 1 : content.size();

        if (line.find_first_not_of(" \t\r") == string::npos) continue;

        check_result item;
        if (!parse_line(line, item)) {
            // 最后一行没有换行符，说明评测器在写入时被杀死了
            if (!complete) {
                LOG(WARNING) << "Ignoring truncated result line in " << results_file;
                continue;
            }
            LOG(WARNING) << "Malformed result line in " << results_file << ": " << line;
            malformed = true;
            continue;
        }

        int idx = checks.index_of(item.name);
        if (idx < 0) {
            LOG(WARNING) << "Evaluator reported unknown check " << item.name;
            continue;
        }

        double points = checks.checks[idx].points;
        if (item.possible > 0)
            item.score = item.score / item.possible * points;
        else if (item.possible == 0)
            item.score = points;
        item.status = verdict_of(item.score, points);
        reported.push_back(item);
    }
    return align_results(checks, reported);
}

static string describe_exit(const execution_result &exec, const fs::path &stderr_file) {
    string cause;
    if (exec.kind == execution_result::SIGNALED)
        cause = fmt::format("killed by signal {} ({})", exec.signal, strsignal(exec.signal));
    else
        cause = fmt::format("exited with code {}", exec.exitcode);

    string err = read_file_tail(stderr_file, OUTPUT_TAIL);
    if (!err.empty()) cause += "\n" + err;
    return cause;
}

execution_outcome script_evaluator::evaluate(sandbox &box, const string &artifact, const check_set &checks, const execution_budget &budget) {
    vector<string> args = command;
    args.push_back(artifact);
    args.push_back(CHECKS_DIR);
    args.push_back(RESULTS_FILE);

    map<string, string> variables = error_code_variables();
    for (auto &[key, value] : env) variables[key] = value;

    execution_result exec;
    try {
        exec = box.execute(args, variables, budget);
    } catch (image_unavailable &ex) {
        return outcome::environment_failure{outcome::environment_cause::IMAGE_UNAVAILABLE, ex.what()};
    } catch (environment_error &ex) {
        return outcome::environment_failure{outcome::environment_cause::INFRASTRUCTURE, ex.what()};
    }

    fs::path root = box.root();
    if (DEBUG) {
        LOG(INFO) << "Evaluator stdout in " << root << ":\n" << read_file_tail(root / "program.out", OUTPUT_TAIL);
        LOG(INFO) << "Evaluator stderr in " << root << ":\n" << read_file_tail(root / "program.err", OUTPUT_TAIL);
    }

    bool malformed = false;
    vector<check_result> results = parse_results(root / RESULTS_FILE, checks, malformed);

    switch (exec.kind) {
        case execution_result::TIMED_OUT:
            return outcome::timed_out{results, exec.wall_time};
        case execution_result::CANCELLED:
            return outcome::environment_failure{outcome::environment_cause::CANCELLED, "execution cancelled"};
        case execution_result::SIGNALED:
            return outcome::submission_crashed{results, describe_exit(exec, root / "program.err")};
        case execution_result::EXITED:
            break;
    }

    switch (exec.exitcode) {
        case E_SUCCESS:
            if (malformed)
                return outcome::submission_crashed{results, "evaluator produced malformed results"};
            return outcome::completed{results};
        case E_INTERNAL_ERROR:
            return outcome::environment_failure{outcome::environment_cause::INFRASTRUCTURE,
                                                "evaluator internal error: " + read_file_tail(root / "program.err", OUTPUT_TAIL)};
        default:
            return outcome::submission_crashed{results, describe_exit(exec, root / "program.err")};
    }
}

}  // namespace grader
