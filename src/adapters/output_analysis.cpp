#include "adapters/output_analysis.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <regex>
#include <vector>

namespace cortex::adapters {

namespace {

const std::vector<std::regex>& rate_limit_patterns() {
    static const std::vector<std::regex> patterns = {
        std::regex("rate.?limit", std::regex::icase),
        std::regex("too many requests", std::regex::icase),
        std::regex("429"),
        std::regex("quota.?exceeded", std::regex::icase),
        std::regex("resource.?exhausted", std::regex::icase),
        std::regex("overloaded", std::regex::icase),
        std::regex("retry.?after", std::regex::icase),
        std::regex("tokens?.?per.?min", std::regex::icase),
        std::regex("requests?.?per.?min", std::regex::icase),
    };
    return patterns;
}

const std::regex& retry_after_pattern() {
    static const std::regex pattern(R"(retry.?after[:\s]+(\d+(?:\.\d+)?))",
                                    std::regex::icase);
    return pattern;
}

constexpr const char* kReplacementCharacter = "\xEF\xBF\xBD";

bool is_continuation(const unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

// Length of the valid UTF-8 sequence starting at `i`, or 0 when invalid.
std::size_t valid_sequence_length(const std::string& bytes, const std::size_t i) {
    const auto lead = static_cast<unsigned char>(bytes[i]);
    std::size_t length = 0;
    if (lead < 0x80) {
        return 1;
    }
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
    } else {
        return 0;
    }
    if (i + length > bytes.size()) {
        return 0;
    }
    for (std::size_t k = 1; k < length; ++k) {
        if (!is_continuation(static_cast<unsigned char>(bytes[i + k]))) {
            return 0;
        }
    }
    const auto second = static_cast<unsigned char>(bytes[i + 1]);
    // Overlong encodings, surrogates and code points above U+10FFFF.
    if ((lead == 0xE0 && second < 0xA0) || (lead == 0xED && second > 0x9F) ||
        (lead == 0xF0 && second < 0x90) || (lead == 0xF4 && second > 0x8F)) {
        return 0;
    }
    return length;
}

}  // namespace

std::string decode_lossy(const std::string& bytes) {
    std::string decoded;
    decoded.reserve(bytes.size());
    std::size_t i = 0;
    while (i < bytes.size()) {
        const std::size_t length = valid_sequence_length(bytes, i);
        if (length == 0) {
            decoded += kReplacementCharacter;
            ++i;
            continue;
        }
        decoded.append(bytes, i, length);
        i += length;
    }
    return decoded;
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return text;
}

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n\f\v";
    const auto begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

bool is_rate_limited(const std::string& stdout_text, const std::string& stderr_text) {
    const std::string combined = stdout_text + "\n" + stderr_text;
    for (const auto& pattern : rate_limit_patterns()) {
        if (std::regex_search(combined, pattern)) {
            return true;
        }
    }
    return false;
}

std::optional<double> extract_retry_after(const std::string& stdout_text,
                                          const std::string& stderr_text) {
    const std::string combined = stdout_text + "\n" + stderr_text;
    std::smatch match;
    if (!std::regex_search(combined, match, retry_after_pattern())) {
        return std::nullopt;
    }
    return std::strtod(match[1].str().c_str(), nullptr);
}

}  // namespace cortex::adapters
