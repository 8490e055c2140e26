#include "common/utils.hpp"
#include <errno.h>
#include <grp.h>
#include <pwd.h>
#include <stdlib.h>
#include <algorithm>
#include <cctype>

namespace grader {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

vector<string> to_environ(const map<string, string> &env) {
    vector<string> result;
    for (auto &[key, value] : env)
        result.push_back(key + "=" + value);
    return result;
}

static bool is_number(const string &s) {
    return !s.empty() && all_of(s.begin(), s.end(), [](unsigned char c) { return isdigit(c); });
}

long get_userid(const string &name) {
    if (is_number(name)) return boost::lexical_cast<long>(name);

    errno = 0;
    struct passwd *pwd = getpwnam(name.c_str());
    if (!pwd || errno) return -1;
    return (long)pwd->pw_uid;
}

long get_groupid(const string &name) {
    if (is_number(name)) return boost::lexical_cast<long>(name);

    errno = 0;
    struct group *g = getgrnam(name.c_str());
    if (!g || errno) return -1;
    return (long)g->gr_gid;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::seconds() const {
    return duration<chrono::duration<double>>().count();
}

}  // namespace grader
