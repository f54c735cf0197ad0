#pragma once

#include "../software_entry.h"

#include <initializer_list>
#include <string>

// Epoch; stands in for "no reliable timestamp" so records keep a fixed shape.
Timestamp epochSentinel();

// Builds a UTC instant from calendar fields. No range checking.
Timestamp makeUtcTimestamp(int year, int month, int day,
                           int hour = 0, int minute = 0, int second = 0);

// "YYYY-MM-DDTHH:MM:SSZ"
std::string formatIso8601(Timestamp ts);

// Parses `text` against a strftime-like pattern. Supported fields:
//   %Y four-digit year      %y two-digit year (69-99 → 19xx)
//   %m %d %H %I %M %S one or two digits
//   %p AM/PM (case-insensitive)
// A space in the pattern matches any run of whitespace; other characters
// must match literally. Trailing whitespace is allowed. The result is
// interpreted as UTC.
bool parseTimestamp(const std::string& text, const char* pattern, Timestamp& out);

// Tries each pattern in order; returns false when none matches.
bool parseTimestampAny(const std::string& text,
                       std::initializer_list<const char*> patterns,
                       Timestamp& out);
