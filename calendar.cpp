#include "calendar.h"

#include <cctype>
#include <cstdio>

namespace {
    // Алгоритм days_from_civil / civil_from_days (пролептический григорианский календарь)
    long daysFromCivil(int y, int m, int d) {
        y -= m <= 2 ? 1 : 0;
        const long era = (y >= 0 ? y : y - 399) / 400;
        const long yoe = y - era * 400;
        const long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
        const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + doe - 719468;
    }

    void civilFromDays(long z, int& y, int& m, int& d) {
        z += 719468;
        const long era = (z >= 0 ? z : z - 146096) / 146097;
        const long doe = z - era * 146097;
        const long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const long mp  = (5 * doy + 2) / 153;
        d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
        m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
        y = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
    }

    bool isLeap(int y) {
        return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    }

    int daysInMonth(int y, int m) {
        static const int table[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (m == 2 && isLeap(y)) return 29;
        return table[m - 1];
    }

    bool readNumber(const std::string& s, size_t pos, size_t len, int& out) {
        out = 0;
        for (size_t i = pos; i < pos + len; ++i) {
            if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
            out = out * 10 + (s[i] - '0');
        }
        return true;
    }
}

bool parseDate(const std::string& s, long& dayNumber) {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return false;

    int y = 0, m = 0, d = 0;
    if (!readNumber(s, 0, 4, y) || !readNumber(s, 5, 2, m) || !readNumber(s, 8, 2, d)) {
        return false;
    }
    if (m < 1 || m > 12) return false;
    if (d < 1 || d > daysInMonth(y, m)) return false;

    dayNumber = daysFromCivil(y, m, d);
    return true;
}

std::string formatDate(long dayNumber) {
    int y = 0, m = 0, d = 0;
    civilFromDays(dayNumber, y, m, d);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", y, m, d);
    return std::string(buf);
}

int isoWeekday(long dayNumber) {
    // 1970-01-01 был четвергом
    long w = (dayNumber + 3) % 7;
    if (w < 0) w += 7;
    return static_cast<int>(w) + 1;
}

int isoWeekday(const std::string& date) {
    long day = 0;
    if (!parseDate(date, day)) return 0;
    return isoWeekday(day);
}

const char* weekdayName(int isoDay) {
    switch (isoDay) {
        case 1: return "Monday";
        case 2: return "Tuesday";
        case 3: return "Wednesday";
        case 4: return "Thursday";
        case 5: return "Friday";
        case 6: return "Saturday";
        case 7: return "Sunday";
    }
    return "Unknown";
}

bool parseTime(const std::string& s, int& minutes) {
    // допускаем "9:00" и "09:00"
    size_t colon = s.find(':');
    if (colon == std::string::npos || colon == 0 || colon > 2) return false;
    if (s.size() != colon + 3) return false;

    int h = 0, m = 0;
    if (!readNumber(s, 0, colon, h) || !readNumber(s, colon + 1, 2, m)) return false;
    if (h > 24 || m > 59 || (h == 24 && m != 0)) return false;

    minutes = h * 60 + m;
    return true;
}

std::string formatTime(int minutesFromMidnight) {
    int h = minutesFromMidnight / 60;
    int m = minutesFromMidnight % 60;
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", h, m);
    return std::string(buf);
}

std::vector<std::string> usableDates(
    const std::string& startDate,
    const std::string& endDate,
    const std::set<int>& excludedWeekdays
) {
    std::vector<std::string> dates;

    long first = 0, last = 0;
    if (!parseDate(startDate, first) || !parseDate(endDate, last)) {
        return dates;
    }

    for (long day = first; day <= last; ++day) {
        if (excludedWeekdays.count(isoWeekday(day))) continue;
        dates.push_back(formatDate(day));
    }
    return dates;
}
