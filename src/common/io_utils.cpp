#include "common/io_utils.hpp"
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace grader {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(fs::path const &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

string read_file_tail(const fs::path &path, size_t limit) {
    ifstream fin(path.string(), ios::binary | ios::ate);
    if (!fin) return "";
    streamoff size = fin.tellg();
    streamoff begin = size > (streamoff)limit ? size - (streamoff)limit : 0;
    fin.seekg(begin);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string assert_safe_path(const string &subpath) {
    fs::path path(subpath);
    if (subpath.empty() || path.is_absolute())
        throw runtime_error("subpath is not safe " + subpath);
    // 只有等于 ".." 的路径分量才会返回上一层，"john..doe.py" 是合法的文件名
    for (auto &part : path)
        if (part == "..")
            throw runtime_error("subpath is not safe " + subpath);
    return subpath;
}

void set_writable(const fs::path &dir, bool writable) {
    const auto write_perms = writable ? fs::perms::owner_write
                                      : fs::perms::owner_write | fs::perms::group_write | fs::perms::others_write;
    const auto opts = writable ? fs::perm_options::add : fs::perm_options::remove;

    if (fs::is_symlink(dir)) return;
    if (!fs::is_directory(dir)) {
        fs::permissions(dir, write_perms, opts);
        return;
    }

    // 添加权限时需要先处理目录本身，否则无法进入目录修改子项；移除权限时顺序相反
    if (writable) fs::permissions(dir, write_perms, opts);
    for (auto &entry : fs::directory_iterator(dir))
        set_writable(entry.path(), writable);
    if (!writable) fs::permissions(dir, write_perms, opts);
}

void set_world_readable(const fs::path &dir) {
    if (fs::is_symlink(dir)) return;

    auto perms = fs::perms::owner_read | fs::perms::group_read | fs::perms::others_read;
    bool traversable = fs::is_directory(dir) ||
                       (fs::status(dir).permissions() & fs::perms::owner_exec) != fs::perms::none;
    if (traversable) perms |= fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;
    fs::permissions(dir, perms, fs::perm_options::add);

    if (fs::is_directory(dir))
        for (auto &entry : fs::directory_iterator(dir))
            set_world_readable(entry.path());
}

}  // namespace grader
