// Tests for UTF-8 validation and repair of text coming from the application.

#include "utils/utf8_sanitize.hpp"

#include <iostream>
#include <string>

namespace test_utf8_sanitize {

static const std::string kReplacement = "\xEF\xBF\xBD";

// Test: Valid text, including multi-byte characters, passes unchanged.
static bool test_valid_text_unchanged() {
    const std::string text = "Timeline \xC3\xA9t\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x8E\xAC";
    bool success = utf8_sanitize::is_valid(text) && utf8_sanitize::sanitize(text) == text;

    if (success) {
        std::cout << "  OK: Valid UTF-8 passes through unchanged" << std::endl;
    } else {
        std::cout << "  FAIL: Valid UTF-8 was altered" << std::endl;
    }
    return success;
}

// Test: A stray Latin-1 byte becomes one replacement character.
static bool test_latin1_byte_replaced() {
    const std::string text = std::string("Caf") + "\xE9";
    std::string sanitized = utf8_sanitize::sanitize(text);
    bool success = !utf8_sanitize::is_valid(text) && sanitized == "Caf" + kReplacement;

    if (success) {
        std::cout << "  OK: Latin-1 byte replaced with U+FFFD" << std::endl;
    } else {
        std::cout << "  FAIL: Latin-1 byte sanitized to " << sanitized.size() << " bytes" << std::endl;
    }
    return success;
}

// Test: Overlong encodings and surrogates are ill-formed.
static bool test_overlong_and_surrogate_rejected() {
    const std::string overlong = "\xC0\xAF";
    const std::string surrogate = "\xED\xA0\x80";
    bool success = !utf8_sanitize::is_valid(overlong) && !utf8_sanitize::is_valid(surrogate) &&
                   utf8_sanitize::is_valid(utf8_sanitize::sanitize(overlong)) &&
                   utf8_sanitize::is_valid(utf8_sanitize::sanitize(surrogate));

    if (success) {
        std::cout << "  OK: Overlong and surrogate sequences rejected and repaired" << std::endl;
    } else {
        std::cout << "  FAIL: Overlong or surrogate sequence accepted" << std::endl;
    }
    return success;
}

// Test: A sequence cut off at the end of the string is repaired.
static bool test_truncated_sequence() {
    std::string text = std::string("clip") + "\xE2\x82";
    std::string sanitized = text;
    utf8_sanitize::sanitize(sanitized);
    bool success = sanitized.compare(0, 4, "clip") == 0 && utf8_sanitize::is_valid(sanitized) &&
                   sanitized.find(kReplacement) != std::string::npos;

    if (success) {
        std::cout << "  OK: Truncated sequence repaired in place" << std::endl;
    } else {
        std::cout << "  FAIL: Truncated sequence left invalid" << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_valid_text_unchanged();
    all_passed &= test_latin1_byte_replaced();
    all_passed &= test_overlong_and_surrogate_rejected();
    all_passed &= test_truncated_sequence();
    return all_passed;
}

} // namespace test_utf8_sanitize
