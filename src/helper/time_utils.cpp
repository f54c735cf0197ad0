#include "time_utils.h"

#include <cctype>
#include <cstdio>

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date.
long long daysFromCivil(long long y, unsigned m, unsigned d) {
    y -= m <= 2;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

void civilFromDays(long long z, long long& y, unsigned& m, unsigned& d) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<long long>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += m <= 2;
}

bool isLeapYear(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int daysInMonth(int y, int m) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return m == 2 && isLeapYear(y) ? 29 : days[m - 1];
}

bool readNumber(const std::string& text, std::size_t& pos,
                std::size_t minDigits, std::size_t maxDigits, int& value) {
    std::size_t digits = 0;
    value = 0;
    while (pos < text.size() && digits < maxDigits &&
           std::isdigit(static_cast<unsigned char>(text[pos]))) {
        value = value * 10 + (text[pos] - '0');
        ++pos;
        ++digits;
    }
    return digits >= minDigits;
}

}  // namespace

Timestamp epochSentinel() {
    return Timestamp{};
}

Timestamp makeUtcTimestamp(int year, int month, int day, int hour, int minute, int second) {
    const long long days = daysFromCivil(year, static_cast<unsigned>(month),
                                         static_cast<unsigned>(day));
    const long long seconds = days * 86400LL + hour * 3600LL + minute * 60LL + second;
    return Timestamp(std::chrono::seconds(seconds));
}

std::string formatIso8601(Timestamp ts) {
    const long long total =
        std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
    long long days = total / 86400;
    long long rem = total % 86400;
    if (rem < 0) {
        rem += 86400;
        --days;
    }

    long long y = 0;
    unsigned m = 0;
    unsigned d = 0;
    civilFromDays(days, y, m, d);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02lld:%02lld:%02lldZ",
                  y, m, d, rem / 3600, (rem % 3600) / 60, rem % 60);
    return buf;
}

bool parseTimestamp(const std::string& text, const char* pattern, Timestamp& out) {
    int year = 1970, month = 1, day = 1, hour = 0, minute = 0, second = 0;
    bool twelveHour = false;
    bool pm = false;
    bool sawMeridiem = false;

    std::size_t pos = 0;
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])))
        ++pos;

    for (const char* p = pattern; *p; ++p) {
        if (*p == ' ') {
            while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])))
                ++pos;
            continue;
        }
        if (*p != '%') {
            if (pos >= text.size() || text[pos] != *p)
                return false;
            ++pos;
            continue;
        }

        ++p;
        switch (*p) {
            case 'Y':
                if (!readNumber(text, pos, 4, 4, year)) return false;
                break;
            case 'y':
                if (!readNumber(text, pos, 2, 2, year)) return false;
                year += year < 69 ? 2000 : 1900;
                break;
            case 'm':
                if (!readNumber(text, pos, 1, 2, month)) return false;
                break;
            case 'd':
                if (!readNumber(text, pos, 1, 2, day)) return false;
                break;
            case 'H':
                if (!readNumber(text, pos, 1, 2, hour)) return false;
                break;
            case 'I':
                if (!readNumber(text, pos, 1, 2, hour)) return false;
                twelveHour = true;
                break;
            case 'M':
                if (!readNumber(text, pos, 1, 2, minute)) return false;
                break;
            case 'S':
                if (!readNumber(text, pos, 1, 2, second)) return false;
                break;
            case 'p': {
                if (pos + 2 > text.size())
                    return false;
                const char a = static_cast<char>(std::toupper(static_cast<unsigned char>(text[pos])));
                const char b = static_cast<char>(std::toupper(static_cast<unsigned char>(text[pos + 1])));
                if (b != 'M' || (a != 'A' && a != 'P'))
                    return false;
                pm = a == 'P';
                sawMeridiem = true;
                pos += 2;
                break;
            }
            default:
                return false;
        }
    }

    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])))
        ++pos;
    if (pos != text.size())
        return false;

    if (twelveHour) {
        if (!sawMeridiem || hour < 1 || hour > 12)
            return false;
        hour = hour % 12 + (pm ? 12 : 0);
    }

    if (month < 1 || month > 12)                         return false;
    if (day < 1 || day > daysInMonth(year, month))       return false;
    if (hour > 23 || minute > 59 || second > 59)         return false;

    out = makeUtcTimestamp(year, month, day, hour, minute, second);
    return true;
}

bool parseTimestampAny(const std::string& text,
                       std::initializer_list<const char*> patterns,
                       Timestamp& out) {
    for (const char* pattern : patterns) {
        if (parseTimestamp(text, pattern, out))
            return true;
    }
    return false;
}
