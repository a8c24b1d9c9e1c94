#pragma once

#include <string>

#include "config.hpp"
#include "receipt_types.hpp"
#include "sectioner.hpp"

struct CalendarDate {
  int year = 1970;
  int month = 1;
  int day = 1;

  bool operator<(const CalendarDate& o) const;
  bool operator<=(const CalendarDate& o) const;
  bool operator==(const CalendarDate& o) const;
  bool operator>(const CalendarDate& o) const { return o < *this; }

  // Same month/day `years` later (negative for earlier); Feb 29 falls back to Feb 28.
  CalendarDate addYears(int years) const;
  std::string iso() const;
};

bool isValidDate(int year, int month, int day);

// Current local date.
CalendarDate today();

// Best transaction date as ISO-8601. Plausibility is judged against `reference`
// so identical input on the same reference date yields identical output.
FieldResult<std::string> extractDate(const SectionedText& text, const ExtractorConfig& config,
                                     const CalendarDate& reference);
