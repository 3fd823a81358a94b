#pragma once

#include <string>
#include <vector>

namespace kvs::util {

inline constexpr const char* REDACTED = "********";

// Masks a sensitive value for display. Empty stays empty so "unset" is still visible.
std::string redact(const std::string& value);

// Replaces every occurrence of each non-empty secret in text with the redaction marker.
std::string scrub(std::string text, const std::vector<std::string>& secrets);

}
