#include <tallybook/core/utils.hpp>
#include <algorithm>
#include <numeric>
#include <cctype>
#include <cstdlib>
#include <climits>
#include <cstdio>
#include <sstream>
#include <sys/stat.h>
#include <sys/types.h>
#include <errno.h>

namespace tallybook {

// ============ String utilities ============

std::string trim(const std::string& s) {
    return rtrim(ltrim(s));
}

std::string ltrim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    return s.substr(start);
}

std::string rtrim(const std::string& s) {
    size_t end = s.find_last_not_of(" \t\n\r");
    if (end == std::string::npos) return "";
    return s.substr(0, end + 1);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && 
           std::equal(prefix.begin(), prefix.end(), s.begin());
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(s);
    std::string part;
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    if (parts.empty()) return "";
    return std::accumulate(
        std::next(parts.begin()), parts.end(), parts[0],
        [&](const std::string& a, const std::string& b) {
            return a + delimiter + b;
        });
}

bool parse_int64(const std::string& s, int64_t& out) {
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') {
        return false;
    }
    out = static_cast<int64_t>(v);
    return true;
}

// ============ Money utilities ============

std::string format_money(int64_t minor_units) {
    bool negative = minor_units < 0;
    // Work in unsigned so INT64_MIN does not overflow on negation
    uint64_t n = negative ? (0 - static_cast<uint64_t>(minor_units))
                          : static_cast<uint64_t>(minor_units);
    uint64_t whole = n / 100;
    unsigned cents = static_cast<unsigned>(n % 100);
    
    std::string digits = std::to_string(whole);
    std::string grouped;
    int count = 0;
    for (size_t i = digits.size(); i > 0; --i) {
        if (count > 0 && count % 3 == 0) grouped += ',';
        grouped += digits[i - 1];
        ++count;
    }
    std::reverse(grouped.begin(), grouped.end());
    
    char frac[4];
    snprintf(frac, sizeof(frac), "%02u", cents);
    return std::string(negative ? "-" : "") + "$" + grouped + "." + frac;
}

bool parse_money(const std::string& text, int64_t& minor_units) {
    std::string s = trim(text);
    if (s.empty()) return false;
    
    bool negative = false;
    size_t i = 0;
    if (s[i] == '+' || s[i] == '-') {
        negative = (s[i] == '-');
        ++i;
    }
    
    int64_t whole = 0;
    size_t whole_digits = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
        if (whole > (INT64_MAX / 100 - 9) / 10) return false;
        whole = whole * 10 + (s[i] - '0');
        ++whole_digits;
        ++i;
    }
    
    int64_t frac = 0;
    size_t frac_digits = 0;
    if (i < s.size() && s[i] == '.') {
        ++i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
            if (frac_digits == 2) return false;
            frac = frac * 10 + (s[i] - '0');
            ++frac_digits;
            ++i;
        }
    }
    
    if (i != s.size() || (whole_digits == 0 && frac_digits == 0)) {
        return false;
    }
    if (frac_digits == 1) frac *= 10;
    
    int64_t value = whole * 100 + frac;
    minor_units = negative ? -value : value;
    return true;
}

// ============ Path utilities ============

std::string expand_home(const std::string& path) {
    if (path == "~" || starts_with(path, "~/")) {
        const char* home = std::getenv("HOME");
        if (home && *home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

bool create_parent_directory(const std::string& filepath) {
    size_t pos = filepath.rfind('/');
    if (pos == std::string::npos || pos == 0) return true; // No directory component
    
    std::string dir = filepath.substr(0, pos);
    
    std::string current;
    for (size_t i = 0; i < dir.size(); ++i) {
        current += dir[i];
        if (dir[i] == '/' || i == dir.size() - 1) {
            struct stat st;
            if (stat(current.c_str(), &st) != 0) {
                if (mkdir(current.c_str(), 0755) != 0 && errno != EEXIST) {
                    return false;
                }
            }
        }
    }
    
    return true;
}

} // namespace tallybook
