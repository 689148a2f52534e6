#pragma once

#include <optional>
#include <string>

namespace cortex::adapters {

// Replaces invalid UTF-8 sequences with U+FFFD; never fails.
std::string decode_lossy(const std::string& bytes);

std::string trim(const std::string& text);

// ASCII-only; UTF-8 continuation bytes pass through untouched.
std::string lowercase(std::string text);

// Case-insensitive scan of stdout + stderr for throttling markers
// (rate limit, 429, quota exceeded, overloaded, retry-after, ...).
bool is_rate_limited(const std::string& stdout_text, const std::string& stderr_text);

// Seconds following a "retry after" marker, if any.
std::optional<double> extract_retry_after(const std::string& stdout_text,
                                          const std::string& stderr_text);

}  // namespace cortex::adapters
