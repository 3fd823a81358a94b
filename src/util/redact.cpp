#include "util/redact.hpp"

#include <algorithm>

namespace kvs::util {

std::string redact(const std::string& value) {
    if (value.empty()) return {};
    return REDACTED;
}

std::string scrub(std::string text, const std::vector<std::string>& secrets) {
    // Longest first, so a secret containing another is masked whole
    std::vector<std::string> sorted;
    for (const auto& s : secrets) if (!s.empty()) sorted.push_back(s);
    std::sort(sorted.begin(), sorted.end(),
              [](const std::string& a, const std::string& b) { return a.size() > b.size(); });

    const std::string marker = REDACTED;
    for (const auto& secret : sorted) {
        size_t pos = 0;
        while ((pos = text.find(secret, pos)) != std::string::npos) {
            text.replace(pos, secret.size(), marker);
            pos += marker.size();
        }
    }
    return text;
}

}
