#include "util/timestamp.hpp"
#include "types/errors.hpp"

#include <array>
#include <cctype>
#include <iomanip>
#include <locale>
#include <sstream>

namespace kvs::util {

namespace {

constexpr std::array FORMATS = {
    "%Y-%m-%dT%H:%M:%S",
    "%Y-%m-%d %H:%M:%S",
    "%Y-%m-%dT%H:%M",
    "%Y-%m-%d %H:%M",
    "%Y-%m-%d",
    "%Y/%m/%d %H:%M:%S",
    "%Y/%m/%d",
    "%d %b %Y %H:%M:%S",
    "%d %b %Y",
    "%b %d %Y",
};

// Index past "YYYY-MM-DD", where a time part may start; signs before it belong to the date.
constexpr size_t TIME_PART_START = 10;

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool allDigits(const std::string& s) {
    if (s.empty()) return false;
    for (const char c : s) if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    return true;
}

// Strips a trailing zone designator and returns its offset from UTC in seconds.
long stripZone(std::string& s) {
    if (s.size() > 4) {
        const auto tail = s.substr(s.size() - 4);
        if (tail == " UTC" || tail == " GMT") {
            s.erase(s.size() - 4);
            return 0;
        }
    }

    if (!s.empty() && (s.back() == 'Z' || s.back() == 'z')) {
        s.pop_back();
        return 0;
    }

    const auto sign = s.find_last_of("+-");
    if (sign == std::string::npos || sign <= TIME_PART_START) return 0;
    if (s.find(':') == std::string::npos || s.find(':') > sign) return 0; // no time part before it

    std::string digits = s.substr(sign + 1);
    if (digits.size() == 5 && digits[2] == ':') digits.erase(2, 1);
    if (!allDigits(digits) || (digits.size() != 2 && digits.size() != 4)) return 0;

    const long hours = std::stol(digits.substr(0, 2));
    const long minutes = digits.size() == 4 ? std::stol(digits.substr(2, 2)) : 0;
    if (hours > 23 || minutes > 59) throw types::ValidationError("Invalid UTC offset in date: " + s);

    const long offset = hours * 3600 + minutes * 60;
    const bool negative = s[sign] == '-';
    s.erase(sign);
    while (!s.empty() && s.back() == ' ') s.pop_back();
    return negative ? -offset : offset;
}

void stripFraction(std::string& s) {
    const auto dot = s.find('.', TIME_PART_START);
    if (dot == std::string::npos) return;
    size_t end = dot + 1;
    while (end < s.size() && std::isdigit(static_cast<unsigned char>(s[end]))) ++end;
    if (end == dot + 1) return;
    s.erase(dot, end - dot);
}

std::optional<std::tm> tryFormat(const std::string& s, const char* fmt) {
    std::tm tm = {};
    std::istringstream ss(s);
    ss.imbue(std::locale::classic());
    ss >> std::get_time(&tm, fmt);
    if (ss.fail()) return std::nullopt;
    ss >> std::ws;
    if (!ss.eof()) return std::nullopt;
    return tm;
}

bool sameCalendarDay(const std::tm& in, const std::time_t t) {
    std::tm out = {};
    gmtime_r(&t, &out);
    return out.tm_year == in.tm_year && out.tm_mon == in.tm_mon && out.tm_mday == in.tm_mday;
}

}

std::time_t parseDateTime(const std::string& str) {
    std::string s = trim(str);
    if (s.empty()) throw types::ValidationError("Empty date string");

    const long offset = stripZone(s);
    stripFraction(s);

    for (const char* fmt : FORMATS) {
        auto tm = tryFormat(s, fmt);
        if (!tm) continue;

        const std::tm fields = *tm;
        const std::time_t t = timegm(&*tm);
        if (t == static_cast<std::time_t>(-1) || !sameCalendarDay(fields, t))
            throw types::ValidationError("Invalid calendar date: " + str);

        return t - offset;
    }

    throw types::ValidationError("Unable to parse date string: " + str);
}

std::optional<std::time_t> parseOptionalDateTime(const std::string& str) {
    if (trim(str).empty()) return std::nullopt;
    return parseDateTime(str);
}

std::string timestampToString(const std::time_t ts) {
    std::tm tm = {};
    gmtime_r(&ts, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

} // namespace kvs::util
