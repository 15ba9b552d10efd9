#ifndef EDMCPS_UTF8_SANITIZE_HPP
#define EDMCPS_UTF8_SANITIZE_HPP

// Text handed back by the studio application (project, timeline, clip names)
// is not guaranteed to be UTF-8, and nlohmann::json refuses to serialize
// invalid sequences. Everything external goes through here before it is
// placed into a response.

#include <string>

namespace utf8_sanitize {

// True if text is well-formed UTF-8 (no overlongs, no surrogates, <= U+10FFFF).
bool is_valid(const std::string &text);

// Replaces each ill-formed subsequence with U+FFFD. In-place version.
void sanitize(std::string &text);

// Replaces each ill-formed subsequence with U+FFFD. Returns a new string.
std::string sanitize(const std::string &text);

} // namespace utf8_sanitize

#endif // EDMCPS_UTF8_SANITIZE_HPP
