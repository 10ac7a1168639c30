#include "utils.hpp"
#include <chrono>
#include <ctime>
#include <cctype>
#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

std::string current_username() {
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_name && *pw->pw_name) {
        return pw->pw_name;
    }
    const char* env = std::getenv("USER");
    return (env && *env) ? env : "unknown";
}

static std::string format_now(const char* pattern) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), pattern, &tm_buf);
    return std::string(buf);
}

std::string now_clock() {
    return format_now("%H:%M:%S");
}

std::string to_lower(const std::string& s) {
    std::string out(s);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

static bool is_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (char c : s) {
        if (!is_continuation(c)) ++n;
    }
    return n;
}

std::string utf8_prefix(const std::string& s, size_t count) {
    size_t seen = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (is_continuation(s[i])) continue;
        if (seen == count) return s.substr(0, i);
        ++seen;
    }
    return s;
}
