/**
 * @file StructuredRecord.cpp
 * @brief Value helpers of the structured record.
 */

#include "domain/StructuredRecord.hpp"

#include <cstdio>
#include <cstdlib>

namespace adaharvest::domain {

std::string CalendarDate::toIso() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

bool CalendarDate::IsValid(int year, int month, int day) {
    if (year < 1900 || year > 2999) return false;
    if (month < 1 || month > 12) return false;
    static const int kDaysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    int maxDay = kDaysInMonth[month - 1];
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    if (month == 2 && leap) maxDay = 29;
    return day >= 1 && day <= maxDay;
}

std::string FinancialAmount::toDecimalString() const {
    std::int64_t magnitude = cents < 0 ? -cents : cents;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%s%lld.%02lld",
                  cents < 0 ? "-" : "",
                  static_cast<long long>(magnitude / 100),
                  static_cast<long long>(magnitude % 100));
    return buf;
}

} // namespace adaharvest::domain
