#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <regex>
#include <sstream>

namespace hybridmem {

uint64_t epoch_seconds() {
    return static_cast<uint64_t>(std::time(nullptr));
}

std::string format_iso8601(uint64_t epoch) {
    std::time_t t = static_cast<std::time_t>(std::min(epoch, kMaxEpochSeconds));
    std::tm tm_buf;
    if (!gmtime_r(&t, &tm_buf)) return {};
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

std::optional<uint64_t> parse_iso8601(const std::string& s) {
    std::string str = trim(s);
    if (str.size() < 19) return std::nullopt;

    int year = 0, mon = 0, day = 0, hour = 0, min = 0, sec = 0;
    char sep = 0;
    int consumed = 0;
    if (std::sscanf(str.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n",
                    &year, &mon, &day, &sep, &hour, &min, &sec, &consumed) != 7) {
        return std::nullopt;
    }
    if (sep != 'T' && sep != 't' && sep != ' ') return std::nullopt;
    if (mon < 1 || mon > 12 || day < 1 || day > 31 ||
        hour > 23 || min > 59 || sec > 60) {
        return std::nullopt;
    }

    size_t pos = static_cast<size_t>(consumed);

    // Fractional seconds are accepted and dropped
    if (pos < str.size() && str[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]))) {
            ++pos;
            ++digits;
        }
        if (digits == 0) return std::nullopt;
    }

    long offset = 0;
    if (pos < str.size()) {
        char c = str[pos];
        if (c == 'Z' || c == 'z') {
            ++pos;
        } else if (c == '+' || c == '-') {
            int oh = 0, om = 0;
            if (std::sscanf(str.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) {
                return std::nullopt;
            }
            offset = (oh * 3600L + om * 60L) * (c == '+' ? 1 : -1);
            pos += 6;
        } else {
            return std::nullopt;
        }
    }
    if (pos != str.size()) return std::nullopt;

    std::tm tm_buf{};
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = mon - 1;
    tm_buf.tm_mday = day;
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = min;
    tm_buf.tm_sec = sec;
    std::time_t t = timegm(&tm_buf);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;

    long long utc = static_cast<long long>(t) - offset;
    if (utc < 0) return std::nullopt;
    return static_cast<uint64_t>(utc);
}

std::string trim(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = s.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> words;
    std::istringstream stream(s);
    std::string word;
    while (stream >> word) {
        words.push_back(std::move(word));
    }
    return words;
}

uint32_t estimate_tokens(const std::string& text) {
    double words = static_cast<double>(split_words(text).size());
    // nearbyint rounds half to even under the default rounding mode
    double cost = std::nearbyint(words * 1.3);
    if (cost < 1.0) return 1;
    return static_cast<uint32_t>(cost);
}

std::string redact_emails(const std::string& text) {
    static const std::regex email_re(
        R"([A-Za-z0-9._%+\-]+@[A-Za-z0-9\-]+(\.[A-Za-z0-9\-]+)*\.[A-Za-z]{2,})");
    return std::regex_replace(text, email_re, "<EMAIL>");
}

bool parse_flag(const std::string& s) {
    std::string v = to_lower(trim(s));
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

std::string expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

} // namespace hybridmem
