#pragma once

#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace kv::util {

using TimePoint = std::chrono::system_clock::time_point;

// RFC3339 with nanosecond precision, always rendered in UTC ("Z").
// Trailing zeros of the fraction are dropped; a whole second has no fraction.
inline std::string toRfc3339(const TimePoint tp) {
    using namespace std::chrono;

    const auto secs = floor<seconds>(tp);
    const auto nanos = duration_cast<nanoseconds>(tp - secs).count();
    const std::time_t t = system_clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (nanos > 0) {
        std::string frac = std::to_string(nanos);
        frac.insert(0, 9 - frac.size(), '0');
        while (frac.back() == '0') frac.pop_back();
        oss << '.' << frac;
    }
    oss << 'Z';
    return oss.str();
}

// Accepts "YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM)".
inline TimePoint parseRfc3339(const std::string& str) {
    using namespace std::chrono;

    const auto fail = [&str]() { return std::runtime_error("Failed to parse RFC3339 timestamp: " + str); };

    if (str.size() < 20) throw fail();

    std::tm tm{};
    std::istringstream ss(str.substr(0, 19));
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) throw fail();

    TimePoint tp = system_clock::from_time_t(timegm(&tm));
    std::size_t pos = 19;

    if (str[pos] == '.') {
        ++pos;
        std::int64_t nanos = 0;
        int digits = 0;
        while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]))) {
            if (digits < 9) {
                nanos = nanos * 10 + (str[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) throw fail();
        while (digits < 9) {
            nanos *= 10;
            ++digits;
        }
        tp += duration_cast<system_clock::duration>(nanoseconds(nanos));
    }

    if (pos >= str.size()) throw fail();

    if (str[pos] == 'Z' || str[pos] == 'z') {
        ++pos;
    } else if (str[pos] == '+' || str[pos] == '-') {
        if (str.size() != pos + 6 || str[pos + 3] != ':' ||
            !std::isdigit(static_cast<unsigned char>(str[pos + 1])) ||
            !std::isdigit(static_cast<unsigned char>(str[pos + 2])) ||
            !std::isdigit(static_cast<unsigned char>(str[pos + 4])) ||
            !std::isdigit(static_cast<unsigned char>(str[pos + 5])))
            throw fail();

        const auto offset = hours(std::stoi(str.substr(pos + 1, 2))) + minutes(std::stoi(str.substr(pos + 4, 2)));
        tp = str[pos] == '+' ? tp - offset : tp + offset;
        pos += 6;
    } else {
        throw fail();
    }

    if (pos != str.size()) throw fail();
    return tp;
}

} // namespace kv::util
