/**
 * @file date_utils.hpp
 * @brief Helpers for "YYYY-MM-DD" calendar dates.
 */

#ifndef WEALTH_DATA_DATE_UTILS_HPP
#define WEALTH_DATA_DATE_UTILS_HPP

#include <string>

namespace wealth {
namespace data {

/// True if the string is a real calendar date in YYYY-MM-DD form.
bool is_valid_date(const std::string& date);

/// Throws ValidationError naming `field` if the date is not valid.
void require_valid_date(const std::string& field, const std::string& date);

int extract_year(const std::string& date);
int extract_month(const std::string& date);
int extract_day(const std::string& date);

/// Signed number of days from `from` to `to` (positive when `to` is later).
int days_between(const std::string& from, const std::string& to);

/// Date `days` days after `date` (negative offsets go backwards).
std::string add_days(const std::string& date, int days);

/// Today's local date.
std::string today();

} // namespace data
} // namespace wealth

#endif // WEALTH_DATA_DATE_UTILS_HPP
