#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace cmdgate {

std::string timestamp_now() {
    std::time_t t = std::time(nullptr);
    std::tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

std::string date_today() {
    std::time_t t = std::time(nullptr);
    std::tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm_buf);
    return buf;
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
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> result;
    std::istringstream stream(s);
    std::string token;
    while (std::getline(stream, token, delim)) {
        result.push_back(token);
    }
    return result;
}

std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> result;
    for (const auto& part : split(s, ',')) {
        std::string t = trim(part);
        if (!t.empty()) result.push_back(std::move(t));
    }
    return result;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
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

bool atomic_write_file(const std::string& path, const std::string& content) {
    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) return false;
    }

    std::string tmp = path + ".tmp." + std::to_string(::getpid());
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) return false;
        out << content;
        if (!out.good()) {
            out.close();
            std::filesystem::remove(tmp, ec);
            return false;
        }
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

// ── Durations ────────────────────────────────────────────────────

static double unit_nanos(const std::string& unit) {
    if (unit == "ns") return 1.0;
    if (unit == "us" || unit == "\xc2\xb5s" || unit == "\xce\xbcs") return 1e3;
    if (unit == "ms") return 1e6;
    if (unit == "s")  return 1e9;
    if (unit == "m")  return 60e9;
    if (unit == "h")  return 3600e9;
    return 0.0;
}

std::chrono::nanoseconds parse_duration(const std::string& text) {
    std::string s = trim(text);
    if (s.empty()) {
        throw std::invalid_argument("empty duration");
    }
    if (s[0] == '-') {
        throw std::invalid_argument("negative duration: " + text);
    }
    size_t i = (s[0] == '+') ? 1 : 0;
    if (s.substr(i) == "0") return std::chrono::nanoseconds(0);
    if (i >= s.size()) {
        throw std::invalid_argument("invalid duration: " + text);
    }

    double total = 0.0;
    while (i < s.size()) {
        size_t num_start = i;
        bool digits = false;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; digits = true; }
        if (i < s.size() && s[i] == '.') {
            ++i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; digits = true; }
        }
        if (!digits) {
            throw std::invalid_argument("invalid duration: " + text);
        }
        double value = std::strtod(s.substr(num_start, i - num_start).c_str(), nullptr);

        size_t unit_start = i;
        while (i < s.size() && s[i] != '.' &&
               !std::isdigit(static_cast<unsigned char>(s[i]))) {
            ++i;
        }
        std::string unit = s.substr(unit_start, i - unit_start);
        if (unit.empty()) {
            throw std::invalid_argument("missing unit in duration: " + text);
        }
        double scale = unit_nanos(unit);
        if (scale == 0.0) {
            throw std::invalid_argument("unknown unit \"" + unit + "\" in duration: " + text);
        }
        total += value * scale;
        if (total > 9.2e18) {
            throw std::invalid_argument("duration out of range: " + text);
        }
    }
    return std::chrono::nanoseconds(static_cast<int64_t>(std::llround(total)));
}

// Render v / 10^prec with trailing fractional zeros removed.
static std::string format_fixed(uint64_t v, int prec) {
    uint64_t scale = 1;
    for (int p = 0; p < prec; ++p) scale *= 10;
    std::string out = std::to_string(v / scale);
    uint64_t frac = v % scale;
    if (frac != 0) {
        std::string digits = std::to_string(frac);
        digits.insert(0, static_cast<size_t>(prec) - digits.size(), '0');
        while (!digits.empty() && digits.back() == '0') digits.pop_back();
        out += "." + digits;
    }
    return out;
}

std::string format_duration(std::chrono::nanoseconds d) {
    int64_t ns = d.count();
    if (ns == 0) return "0s";

    std::string sign;
    uint64_t u = 0;
    if (ns < 0) {
        sign = "-";
        u = static_cast<uint64_t>(-(ns + 1)) + 1;
    } else {
        u = static_cast<uint64_t>(ns);
    }

    if (u < 1000ULL) return sign + std::to_string(u) + "ns";
    if (u < 1000000ULL) return sign + format_fixed(u, 3) + "us";
    if (u < 1000000000ULL) return sign + format_fixed(u, 6) + "ms";

    uint64_t hours = u / 3600000000000ULL;
    u %= 3600000000000ULL;
    uint64_t minutes = u / 60000000000ULL;
    u %= 60000000000ULL;

    std::string out = sign;
    if (hours > 0) out += std::to_string(hours) + "h";
    if (hours > 0 || minutes > 0) out += std::to_string(minutes) + "m";
    out += format_fixed(u, 9) + "s";
    return out;
}

} // namespace cmdgate
