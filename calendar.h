#pragma once

#include <set>
#include <string>
#include <vector>

// Даты храним строками "YYYY-MM-DD" (лексикографическое сравнение = хронологическое).
// Для арифметики переводим в номер дня от 1970-01-01.

bool parseDate(const std::string& s, long& dayNumber);
std::string formatDate(long dayNumber);

// ISO: понедельник = 1 ... воскресенье = 7
int isoWeekday(long dayNumber);
int isoWeekday(const std::string& date);

const char* weekdayName(int isoDay);

// "09:30" <-> 570
bool parseTime(const std::string& s, int& minutes);
std::string formatTime(int minutesFromMidnight);

// Все даты окна [startDate, endDate], кроме исключённых дней недели
std::vector<std::string> usableDates(
    const std::string& startDate,
    const std::string& endDate,
    const std::set<int>& excludedWeekdays
);
