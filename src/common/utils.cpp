#include "common/utils.hpp"
#include <cstdlib>
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

time_t parse_datetime(const string &literal) {
    if (literal.empty()) return 0;
    struct tm mytm = {};
    strptime(literal.c_str(), "%Y-%m-%d %H:%M:%S", &mytm);
    return timegm(&mytm);
}

string format_datetime(time_t time) {
    struct tm mytm;
    gmtime_r(&time, &mytm);
    char buffer[32];
    strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &mytm);
    return buffer;
}

elapsed_time::elapsed_time() {
    start = chrono::system_clock::now();
}
