#include "utils.hpp"
#include <fmt/format.h>
#include <chrono>
#include <cstdio>
#include <cctype>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:               return "none";
        case ErrorKind::Timeout:            return "timeout";
        case ErrorKind::Backend:            return "backend";
        case ErrorKind::BackendUnavailable: return "backend unavailable";
        case ErrorKind::Corruption:         return "corruption";
        case ErrorKind::Conflict:           return "conflict";
    }
    return "unknown";
}

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::time_t parse_iso_time(const std::string& iso) {
    struct tm tm_buf = {};
    if (sscanf(iso.c_str(), "%d-%d-%dT%d:%d:%d",
               &tm_buf.tm_year, &tm_buf.tm_mon, &tm_buf.tm_mday,
               &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec) == 6) {
        tm_buf.tm_year -= 1900;
        tm_buf.tm_mon -= 1;
        tm_buf.tm_isdst = -1;
        return mktime(&tm_buf);
    }
    return 0;
}

std::string format_age(const std::string& iso, std::time_t now) {
    if (iso.empty()) return "never";

    std::time_t then = parse_iso_time(iso);
    if (then == 0) return "?";

    long seconds = static_cast<long>(std::difftime(now, then));
    if (seconds < 0) seconds = 0;
    long hours = seconds / 3600;
    long mins = (seconds % 3600) / 60;
    long secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    }
    return fmt::format("{}s", secs);
}

uint64_t parse_revision(const std::string& s) {
    std::string t = s;
    trim(t);
    if (t.empty()) return 0;
    for (char c : t) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return 0;
    }
    try {
        return std::stoull(t);
    } catch (const std::out_of_range&) {
        return 0;
    }
}
