#include "judgebox/common/io_utils.hpp"
#include <fstream>
#include <iterator>

namespace judgebox {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(fs::path const &path, const string &def) {
    error_code ec;
    if (!fs::exists(path, ec)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

bool is_contained_path(const fs::path &subpath) {
    fs::path relative = subpath.relative_path().lexically_normal();
    for (auto &part : relative)
        if (part == "..") return false;
    return true;
}

}  // namespace judgebox
