#include "response_types.hpp"
#include <cstdio>

namespace recdock {

std::string DateTime::to_string() const {
    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d",
             year, month, day, hour, minute, second);
    return buf;
}

bool DateTime::valid() const {
    static const int days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (year < 1 || month < 1 || month > 12 || day < 1) return false;
    int max_day = days_in_month[month - 1];
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    if (month == 2 && leap) max_day = 29;
    if (day > max_day) return false;
    return hour >= 0 && hour < 24 && minute >= 0 && minute < 60 &&
           second >= 0 && second < 60;
}

std::string CardInfo::status_hex() const {
    char buf[16];
    snprintf(buf, sizeof(buf), "%x", status);
    return buf;
}

} // namespace recdock
