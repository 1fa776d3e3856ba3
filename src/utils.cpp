#include "utils.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>

using namespace std;

static atomic<bool> g_log_verbose(true);

void set_log_verbose(bool verbose) { g_log_verbose.store(verbose); }
bool log_verbose() { return g_log_verbose.load(); }

vector<string> split_csv_line(const string& line)
{
    vector<string> out;
    string cur;
    bool in_quote = false;
    for (size_t i = 0; i < line.size(); ++i)
    {
        char c = line[i];
        if (c == '"') {
            // doubled quote inside a quoted field
            if (in_quote && i + 1 < line.size() && line[i+1] == '"') {
                cur.push_back('"'); ++i; continue;
            }
            in_quote = !in_quote;
            continue;
        }
        if (c == '\r') continue;
        if (c == ',' && !in_quote) { out.push_back(cur); cur.clear(); }
        else cur.push_back(c);
    }
    out.push_back(cur);
    return out;
}

string trim_copy(const string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && isspace((unsigned char)s[b])) ++b;
    while (e > b && isspace((unsigned char)s[e-1])) --e;
    return s.substr(b, e - b);
}

string to_lower_copy(const string& s) {
    string out = s;
    transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return (char)tolower(c); });
    return out;
}

bool parse_int_field(const string& field, int& out) {
    string s = trim_copy(field);
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long v = strtol(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    if (v < (long)INT_MIN || v > (long)INT_MAX) return false;
    out = (int)v;
    return true;
}

bool parse_double_field(const string& field, double& out) {
    string s = trim_copy(field);
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    double v = strtod(s.c_str(), &end);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    if (!isfinite(v)) return false;
    out = v;
    return true;
}
