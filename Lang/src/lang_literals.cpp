#include "lang_literals.h"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <ctime>

namespace Forthic::Lang {

namespace {

bool AllDigits(const std::string& text, size_t begin, size_t count) {
  if (begin + count > text.size()) return false;
  for (size_t i = begin; i < begin + count; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
  }
  return true;
}

int DigitsValue(const std::string& text, size_t begin, size_t count) {
  int value = 0;
  for (size_t i = begin; i < begin + count; ++i) {
    value = value * 10 + (text[i] - '0');
  }
  return value;
}

bool CurrentUtcDate(int* year, int* month, int* day) {
  std::time_t now = std::time(nullptr);
  std::tm parts{};
  if (!gmtime_r(&now, &parts)) return false;
  *year = parts.tm_year + 1900;
  *month = parts.tm_mon + 1;
  *day = parts.tm_mday;
  return true;
}

// Parses HH:MM[:SS[.fraction]] starting at pos; pos is left past the time.
bool ParseClock(const std::string& text, size_t* pos) {
  size_t p = *pos;
  if (!AllDigits(text, p, 2) || p + 2 >= text.size() || text[p + 2] != ':') return false;
  if (!AllDigits(text, p + 3, 2)) return false;
  if (DigitsValue(text, p, 2) > 23 || DigitsValue(text, p + 3, 2) > 59) return false;
  p += 5;
  if (p < text.size() && text[p] == ':') {
    if (!AllDigits(text, p + 1, 2) || DigitsValue(text, p + 1, 2) > 59) return false;
    p += 3;
    if (p < text.size() && text[p] == '.') {
      size_t digits = 0;
      ++p;
      while (p < text.size() && std::isdigit(static_cast<unsigned char>(text[p]))) {
        ++p;
        ++digits;
      }
      if (digits == 0) return false;
    }
  }
  *pos = p;
  return true;
}

bool ParseDateParts(const std::string& text, int* year, int* month, int* day) {
  if (text.size() < 10 || text[4] != '-' || text[7] != '-') return false;
  if (!AllDigits(text, 0, 4) || !AllDigits(text, 5, 2) || !AllDigits(text, 8, 2)) return false;
  *year = DigitsValue(text, 0, 4);
  *month = DigitsValue(text, 5, 2);
  *day = DigitsValue(text, 8, 2);
  return IsValidCalendarDate(*year, *month, *day);
}

std::string Pad(int value, int width) {
  std::string digits = std::to_string(value);
  while (static_cast<int>(digits.size()) < width) digits.insert(digits.begin(), '0');
  return digits;
}

} // namespace

bool IsValidCalendarDate(int year, int month, int day) {
  static const int kDaysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month < 1 || month > 12 || day < 1) return false;
  int days = kDaysInMonth[month - 1];
  const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  if (month == 2 && leap) days = 29;
  return day <= days;
}

bool ParseBoolLiteral(const std::string& text, bool* out) {
  if (text == "TRUE") {
    *out = true;
    return true;
  }
  if (text == "FALSE") {
    *out = false;
    return true;
  }
  return false;
}

bool ParseIntLiteral(const std::string& text, int64_t* out) {
  size_t start = 0;
  if (!text.empty() && text[0] == '-') start = 1;
  if (text.size() == start) return false;
  if (!AllDigits(text, start, text.size() - start)) return false;
  if (text[start] == '0' && (text.size() - start > 1 || start == 1)) return false;
  errno = 0;
  char* end = nullptr;
  long long value = std::strtoll(text.c_str(), &end, 10);
  if (errno == ERANGE || end != text.c_str() + text.size()) return false;
  *out = static_cast<int64_t>(value);
  return true;
}

bool ParseFloatLiteral(const std::string& text, double* out) {
  if (text.find('.') == std::string::npos) return false;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c)) && c != '.' && c != '-' && c != '+' &&
        c != 'e' && c != 'E') {
      return false;
    }
  }
  errno = 0;
  char* end = nullptr;
  double value = std::strtod(text.c_str(), &end);
  if (end == text.c_str() || end != text.c_str() + text.size()) return false;
  if (errno == ERANGE) return false;
  *out = value;
  return true;
}

bool IsNumberLiteral(const std::string& text) {
  int64_t int_value = 0;
  double float_value = 0.0;
  return ParseIntLiteral(text, &int_value) || ParseFloatLiteral(text, &float_value);
}

bool ParseDateTimeLiteral(const std::string& text,
                          const std::string& default_timezone,
                          TemporalLiteral* out) {
  const size_t t_pos = text.find('T');
  if (t_pos != 10) return false;
  int year = 0;
  int month = 0;
  int day = 0;
  if (!ParseDateParts(text, &year, &month, &day)) return false;
  size_t pos = 11;
  if (!ParseClock(text, &pos)) return false;

  if (pos == text.size()) {
    out->kind = TemporalKind::ZonedDateTime;
    out->text = text;
    out->timezone = default_timezone;
    return true;
  }
  if (text[pos] == 'Z' && pos + 1 == text.size()) {
    out->kind = TemporalKind::Instant;
    out->text = text;
    out->timezone.clear();
    return true;
  }
  if ((text[pos] == '+' || text[pos] == '-') && pos + 6 == text.size() &&
      AllDigits(text, pos + 1, 2) && text[pos + 3] == ':' && AllDigits(text, pos + 4, 2)) {
    if (DigitsValue(text, pos + 1, 2) > 23 || DigitsValue(text, pos + 4, 2) > 59) return false;
    out->kind = TemporalKind::Instant;
    out->text = text;
    out->timezone.clear();
    return true;
  }
  return false;
}

bool ParsePlainDateLiteral(const std::string& text, TemporalLiteral* out) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') return false;
  const std::string year_part = text.substr(0, 4);
  const std::string month_part = text.substr(5, 2);
  const std::string day_part = text.substr(8, 2);
  const bool wildcard = year_part == "YYYY" || month_part == "MM" || day_part == "DD";

  int now_year = 0;
  int now_month = 0;
  int now_day = 0;
  if (wildcard && !CurrentUtcDate(&now_year, &now_month, &now_day)) return false;

  int year = now_year;
  int month = now_month;
  int day = now_day;
  if (year_part != "YYYY") {
    if (!AllDigits(year_part, 0, 4)) return false;
    year = DigitsValue(year_part, 0, 4);
  }
  if (month_part != "MM") {
    if (!AllDigits(month_part, 0, 2)) return false;
    month = DigitsValue(month_part, 0, 2);
  }
  if (day_part != "DD") {
    if (!AllDigits(day_part, 0, 2)) return false;
    day = DigitsValue(day_part, 0, 2);
  }
  if (!IsValidCalendarDate(year, month, day)) return false;

  out->kind = TemporalKind::PlainDate;
  out->text = Pad(year, 4) + "-" + Pad(month, 2) + "-" + Pad(day, 2);
  out->timezone.clear();
  return true;
}

bool ParseTimeLiteral(const std::string& text, std::string* out) {
  const size_t colon = text.find(':');
  if (colon != 1 && colon != 2) return false;
  if (!AllDigits(text, 0, colon) || !AllDigits(text, colon + 1, 2)) return false;
  int hours = DigitsValue(text, 0, colon);
  const int minutes = DigitsValue(text, colon + 1, 2);
  const std::string meridiem = text.substr(colon + 3);
  if (meridiem == "PM") {
    if (hours < 12) hours += 12;
  } else if (meridiem == "AM") {
    if (hours == 12) {
      hours = 0;
    } else if (hours > 12) {
      hours -= 12;
    }
  } else if (!meridiem.empty()) {
    return false;
  }
  if (hours > 23 || minutes > 59) return false;
  char buffer[6];
  std::snprintf(buffer, sizeof(buffer), "%02d:%02d", hours, minutes);
  *out = buffer;
  return true;
}

} // namespace Forthic::Lang
