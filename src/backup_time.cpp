#include "backup_time.hpp"
#include <cctype>
#include <ctime>
#include <format>

namespace {

std::tm toUtc(std::chrono::system_clock::time_point time) {
    auto timeT = std::chrono::system_clock::to_time_t(time);
    std::tm tmUtc{};
    gmtime_r(&timeT, &tmUtc);
    return tmUtc;
}

bool readDigits(std::string_view text, size_t pos, size_t count, int& value) {
    if (pos + count > text.size()) {
        return false;
    }
    value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
        value = value * 10 + (text[i] - '0');
    }
    return true;
}

} // namespace

std::string archiveTimestamp(std::chrono::system_clock::time_point time) {
    std::tm tmUtc = toUtc(time);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H-%M-%S", &tmUtc);
    return buf;
}

std::string archiveFileName(std::chrono::system_clock::time_point time, std::string_view extension) {
    return std::format("backup_{}_GMT.{}", archiveTimestamp(time), extension);
}

std::string formatIso8601(std::chrono::system_clock::time_point time) {
    std::tm tmUtc = toUtc(time);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tmUtc);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count() % 1000;
    if (millis < 0) {
        millis += 1000;
    }
    return std::format("{}.{:03d}Z", buf, millis);
}

std::optional<std::chrono::system_clock::time_point> parseIso8601(std::string_view text) {
    // YYYY-MM-DDTHH:MM:SS is 19 characters
    std::tm tmUtc{};
    int year, month, day, hour, minute, second;
    if (text.size() < 19 || text[4] != '-' || text[7] != '-' || (text[10] != 'T' && text[10] != ' ') ||
        text[13] != ':' || text[16] != ':' ||
        !readDigits(text, 0, 4, year) || !readDigits(text, 5, 2, month) || !readDigits(text, 8, 2, day) ||
        !readDigits(text, 11, 2, hour) || !readDigits(text, 14, 2, minute) || !readDigits(text, 17, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    tmUtc.tm_year = year - 1900;
    tmUtc.tm_mon = month - 1;
    tmUtc.tm_mday = day;
    tmUtc.tm_hour = hour;
    tmUtc.tm_min = minute;
    tmUtc.tm_sec = second;

    size_t pos = 19;
    std::chrono::nanoseconds fraction{0};
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        long long scale = 100000000;
        size_t start = pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (scale > 0) {
                fraction += std::chrono::nanoseconds((text[pos] - '0') * scale);
                scale /= 10;
            }
            ++pos;
        }
        if (pos == start) {
            return std::nullopt;
        }
    }

    std::chrono::seconds offset{0};
    if (pos < text.size()) {
        char sign = text[pos];
        if (sign == 'Z' || sign == 'z') {
            ++pos;
        } else if (sign == '+' || sign == '-') {
            int offHours, offMinutes;
            if (!readDigits(text, pos + 1, 2, offHours)) {
                return std::nullopt;
            }
            size_t minutesPos = pos + 3;
            if (minutesPos < text.size() && text[minutesPos] == ':') {
                ++minutesPos;
            }
            if (!readDigits(text, minutesPos, 2, offMinutes)) {
                return std::nullopt;
            }
            offset = std::chrono::hours(offHours) + std::chrono::minutes(offMinutes);
            if (sign == '-') {
                offset = -offset;
            }
            pos = minutesPos + 2;
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    std::time_t seconds = timegm(&tmUtc);
    auto instant = std::chrono::system_clock::from_time_t(seconds) - offset;
    return instant + std::chrono::duration_cast<std::chrono::system_clock::duration>(fraction);
}
