#include "common/io_utils.hpp"
#include <fstream>
#include <sstream>
#include <vector>

namespace arbiter {
using namespace std;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

bool utf8_check_is_valid(const string &string) {
    int c, i, ix, n, j;
    for (i = 0, ix = string.length(); i < ix; i++) {
        c = (unsigned char)string[i];
        if (0x00 <= c && c <= 0x7f)
            n = 0;  // 0bbbbbbb
        else if ((c & 0xE0) == 0xC0)
            n = 1;  // 110bbbbb
        else if (c == 0xed && i < (ix - 1) && ((unsigned char)string[i + 1] & 0xa0) == 0xa0)
            return false;  //U+d800 to U+dfff
        else if ((c & 0xF0) == 0xE0)
            n = 2;  // 1110bbbb
        else if ((c & 0xF8) == 0xF0)
            n = 3;  // 11110bbb
        else
            return false;
        for (j = 0; j < n && i < ix; j++) {  // n bytes matching 10bbbbbb follow ?
            if ((++i == ix) || (((unsigned char)string[i] & 0xC0) != 0x80))
                return false;
        }
    }
    return true;
}

string sanitize_utf8(const string &text) {
    if (utf8_check_is_valid(text)) return text;
    string result = text;
    for (char &c : result)
        if ((unsigned char)c > 0x7f) c = '?';
    return result;
}

static bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

string normalize_trailing_whitespace(const string &text) {
    vector<string> lines;
    stringstream ss(text);
    string line;
    while (getline(ss, line)) {
        size_t end = line.size();
        while (end > 0 && is_blank(line[end - 1])) --end;
        lines.push_back(line.substr(0, end));
    }
    while (!lines.empty() && lines.back().empty()) lines.pop_back();

    string result;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i) result += '\n';
        result += lines[i];
    }
    return result;
}

}  // namespace arbiter
