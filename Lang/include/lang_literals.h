#pragma once

#include <cstdint>
#include <string>

namespace Forthic::Lang {

enum class TemporalKind : uint8_t {
  Instant,
  ZonedDateTime,
  PlainDate,
};

struct TemporalLiteral {
  TemporalKind kind = TemporalKind::Instant;
  std::string text;
  std::string timezone;
};

bool ParseBoolLiteral(const std::string& text, bool* out);
// Exact base-10 form only: optional '-', no leading zeros, no '+'.
bool ParseIntLiteral(const std::string& text, int64_t* out);
// Requires a '.'; exponent suffix allowed.
bool ParseFloatLiteral(const std::string& text, double* out);
bool IsNumberLiteral(const std::string& text);

// 2025-05-24T10:15:00Z and offset forms are instants. A value without zone
// designator becomes a zoned date-time in default_timezone.
bool ParseDateTimeLiteral(const std::string& text,
                          const std::string& default_timezone,
                          TemporalLiteral* out);
// YYYY-MM-DD; the YYYY, MM and DD wildcards take the current UTC date parts.
bool ParsePlainDateLiteral(const std::string& text, TemporalLiteral* out);

// 9:00, 23:15, 11:30PM, 12:05AM. Out-of-range hours before AM fold back by
// twelve. Fills out with the 24-hour HH:MM form.
bool ParseTimeLiteral(const std::string& text, std::string* out);

bool IsValidCalendarDate(int year, int month, int day);

} // namespace Forthic::Lang
