#ifndef AIMCPS_UTF8_SANITIZE_HPP
#define AIMCPS_UTF8_SANITIZE_HPP

// UTF-8 hygiene for text that ends up inside JSON responses (file contents,
// subprocess output, tool error messages). nlohmann::json refuses to dump
// invalid UTF-8, so everything read from the outside goes through here.

#include <cstddef>
#include <string>

namespace utf8_sanitize {

// Replaces invalid UTF-8 sequences (broken multibyte, invalid bytes) with U+FFFD.
void sanitize(std::string &text);

// Copying variant of sanitize().
std::string sanitize(const std::string &text);

// Cuts text to at most max_bytes without splitting a multibyte sequence.
// Returns true if anything was removed.
bool truncate(std::string &text, std::size_t max_bytes);

// sanitize() followed by truncate(); the usual treatment for tool output.
std::string clean_output(const std::string &text, std::size_t max_bytes);

} // namespace utf8_sanitize

#endif // AIMCPS_UTF8_SANITIZE_HPP
