#include "utils/utf8_sanitize.hpp"

#include <utility>

namespace utf8_sanitize {

namespace {

const char kReplacement[] = "\xEF\xBF\xBD"; // U+FFFD
constexpr std::size_t kReplacementLength = sizeof(kReplacement) - 1;

// Length of the sequence introduced by a lead byte, or 0 for a byte that
// cannot start one (continuation bytes, overlong 0xC0/0xC1, 0xF5 and up).
std::size_t sequence_length(unsigned char lead) {
    if (lead < 0x80u) {
        return 1;
    }
    if (lead >= 0xC2u && lead <= 0xDFu) {
        return 2;
    }
    if (lead >= 0xE0u && lead <= 0xEFu) {
        return 3;
    }
    if (lead >= 0xF0u && lead <= 0xF4u) {
        return 4;
    }
    return 0;
}

bool is_continuation(unsigned char byte) {
    return (byte & 0xC0u) == 0x80u;
}

} // namespace

void sanitize(std::string &text) {
    std::string result;
    result.reserve(text.size());

    std::size_t position = 0;
    while (position < text.size()) {
        const auto lead = static_cast<unsigned char>(text[position]);
        const std::size_t length = sequence_length(lead);

        bool valid = length != 0 && position + length <= text.size();
        for (std::size_t offset = 1; valid && offset < length; ++offset) {
            valid = is_continuation(static_cast<unsigned char>(text[position + offset]));
        }

        if (!valid) {
            result.append(kReplacement, kReplacementLength);
            ++position;
            continue;
        }

        result.append(text, position, length);
        position += length;
    }

    text = std::move(result);
}

std::string sanitize(const std::string &text) {
    std::string copy = text;
    sanitize(copy);
    return copy;
}

bool truncate(std::string &text, std::size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return false;
    }

    std::size_t cut = max_bytes;
    // Back off to the start of the sequence the cut would split.
    while (cut > 0 && is_continuation(static_cast<unsigned char>(text[cut]))) {
        --cut;
    }
    text.resize(cut);
    return true;
}

std::string clean_output(const std::string &text, std::size_t max_bytes) {
    std::string cleaned = sanitize(text);
    truncate(cleaned, max_bytes);
    return cleaned;
}

} // namespace utf8_sanitize
