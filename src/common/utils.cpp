#include "judgebox/common/utils.hpp"
#include <stdlib.h>
#include <algorithm>

namespace judgebox {
using namespace std;

bool is_number(const string &s) {
    return !s.empty() && all_of(s.begin(), s.end(), ::isdigit);
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

}  // namespace judgebox
