#pragma once

#include <ctime>
#include <optional>
#include <string>

namespace kvs::util {

// Accepts ISO-8601 style dates and date-times (optional fractional seconds, 'Z' or
// +HH:MM / +HHMM offsets), "YYYY/MM/DD" and "DD Mon YYYY". Naive times are UTC.
// Throws types::ValidationError when nothing matches.
std::time_t parseDateTime(const std::string& str);

// Empty (or blank) input means "unset".
std::optional<std::time_t> parseOptionalDateTime(const std::string& str);

std::string timestampToString(std::time_t ts);

} // namespace kvs::util
