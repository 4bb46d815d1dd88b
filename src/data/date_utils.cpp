#include "data/date_utils.hpp"

#include "common/errors.hpp"

#include <cctype>
#include <cmath>
#include <ctime>

namespace wealth {
namespace data {

namespace {

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) return 29;
    return days[month - 1];
}

std::tm to_tm(const std::string& date) {
    std::tm tm = {};
    tm.tm_year = extract_year(date) - 1900;
    tm.tm_mon = extract_month(date) - 1;
    tm.tm_mday = extract_day(date);
    tm.tm_hour = 12; // stay clear of DST transitions
    return tm;
}

std::string format_tm(const std::tm& tm) {
    char buffer[11];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm);
    return std::string(buffer);
}

} // namespace

bool is_valid_date(const std::string& date) {
    if (date.length() != 10) return false;
    if (date[4] != '-' || date[7] != '-') return false;
    for (size_t i = 0; i < date.length(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(date[i]))) return false;
    }
    int year = extract_year(date);
    int month = extract_month(date);
    int day = extract_day(date);
    if (year < 1900 || month < 1 || month > 12) return false;
    return day >= 1 && day <= days_in_month(year, month);
}

void require_valid_date(const std::string& field, const std::string& date) {
    if (!is_valid_date(date)) {
        throw ValidationError(field, "Expected date in YYYY-MM-DD format, got: '" + date + "'");
    }
}

int extract_year(const std::string& date) {
    return std::stoi(date.substr(0, 4));
}

int extract_month(const std::string& date) {
    return std::stoi(date.substr(5, 2));
}

int extract_day(const std::string& date) {
    return std::stoi(date.substr(8, 2));
}

int days_between(const std::string& from, const std::string& to) {
    std::tm tm1 = to_tm(from);
    std::tm tm2 = to_tm(to);
    std::time_t t1 = std::mktime(&tm1);
    std::time_t t2 = std::mktime(&tm2);
    if (t1 == (std::time_t)-1 || t2 == (std::time_t)-1) {
        throw ValidationError("date", "Cannot convert dates '" + from + "' and '" + to + "'");
    }
    double diff = std::difftime(t2, t1);
    return static_cast<int>(std::llround(diff / 86400.0));
}

std::string add_days(const std::string& date, int days) {
    std::tm tm = to_tm(date);
    tm.tm_mday += days;
    if (std::mktime(&tm) == (std::time_t)-1) {
        throw ValidationError("date", "Cannot offset date '" + date + "'");
    }
    return format_tm(tm);
}

std::string today() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    return format_tm(local);
}

} // namespace data
} // namespace wealth
