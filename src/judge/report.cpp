#include "judge/report.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <fstream>
#include <stdexcept>

namespace grader {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

double grade_report::possible() const {
    double total = 0;
    for (auto &check : checks) total += check.points;
    return total;
}

const grade_row *grade_report::find(const string &id) const {
    for (auto &row : rows)
        if (row.id == id) return &row;
    return nullptr;
}

static string csv_escape(const string &field) {
    if (field.find_first_of(",\"\r\n") == string::npos) return field;
    string result = "\"";
    for (char c : field) {
        if (c == '"') result += '"';
        result += c;
    }
    return result + "\"";
}

static string format_score(double score) {
    return fmt::format("{:g}", score);
}

void write_csv(ostream &os, const grade_report &report) {
    os << "identifier";
    for (auto &check : report.checks) os << "," << csv_escape(check.name);
    os << ",total,status,fault,attempts,message\n";

    for (auto &row : report.rows) {
        os << csv_escape(row.id);
        for (auto &result : row.checks) os << "," << format_score(result.score);
        os << "," << format_score(row.total)
           << "," << get_display_message(row.status)
           << "," << get_display_message(row.fault)
           << "," << row.attempts
           << "," << csv_escape(row.message) << "\n";
    }
}

void to_json(json &j, const check_result &result) {
    j = {{"name", result.name},
         {"status", get_display_message(result.status)},
         {"score", result.score},
         {"possible", result.possible}};
    if (!result.output.empty()) j["output"] = result.output;
}

void to_json(json &j, const grade_row &row) {
    j = {{"identifier", row.id},
         {"path", row.path.string()},
         {"status", get_display_message(row.status)},
         {"fault", row.fault == fault_kind::NONE ? json() : json(get_display_message(row.fault))},
         {"checks", row.checks},
         {"total", row.total},
         {"attempts", row.attempts},
         {"message", row.message}};
}

void to_json(json &j, const grade_report &report) {
    json checks = json::array();
    for (auto &check : report.checks)
        checks.push_back({{"name", check.name}, {"points", check.points}, {"hidden", check.hidden}});

    j = {{"complete", report.complete},
         {"possible", report.possible()},
         {"checks", checks},
         {"submissions", report.rows}};
    if (!report.complete) j["abort_reason"] = report.abort_reason;
}

void write_report(const fs::path &dir, const grade_report &report) {
    fs::create_directories(dir);

    fs::path csv_path = dir / "final_grades.csv";
    ofstream csv(csv_path);
    if (!csv) throw runtime_error("unable to write " + csv_path.string());
    write_csv(csv, report);

    fs::path json_path = dir / "final_grades.json";
    ofstream fout(json_path);
    if (!fout) throw runtime_error("unable to write " + json_path.string());
    fout << json(report).dump(2) << endl;

    LOG(INFO) << "Report of " << report.rows.size() << " submissions written to " << dir;
}

}  // namespace grader
