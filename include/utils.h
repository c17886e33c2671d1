#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <vector>

namespace voice_relay {

/**
 * @brief String utility functions
 */
namespace utils {

/**
 * @brief Trim whitespace from both ends of a string
 * @param str String to trim (modified in place)
 * @return Reference to the trimmed string
 */
inline std::string& trim(std::string& str) {
    str.erase(0, str.find_first_not_of(" \t\n\r"));
    str.erase(str.find_last_not_of(" \t\n\r") + 1);
    return str;
}

/**
 * @brief Trim whitespace from both ends of a string (returns copy)
 */
inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    trim(result);
    return result;
}

/**
 * @brief Lowercase a string in place
 */
inline std::string& normalize(std::string& str) {
    std::transform(str.begin(), str.end(), str.begin(),
                  [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

inline std::string normalize_copy(const std::string& str) {
    std::string result = str;
    normalize(result);
    return result;
}

/**
 * @brief Check if string is empty or contains only whitespace
 */
inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(" \t\n\r") == std::string::npos;
}

/**
 * @brief Check if transcript text is blank
 *
 * Blank means empty/whitespace, equal to the model's blank sentinel, or a
 * lone bracketed annotation such as "[Music]" or "(silence)".
 * @param text Raw transcript text
 * @param blank_sentinel String to treat as blank; compared after trim
 */
inline bool is_blank_transcript(const std::string& text, const std::string& blank_sentinel = "[BLANK_AUDIO]") {
    std::string t = trim_copy(text);
    if (t.empty()) return true;
    if (!blank_sentinel.empty() && t == blank_sentinel) return true;

    const char open = t.front();
    const char close = t.back();
    if ((open == '[' && close == ']') || (open == '(' && close == ')')) {
        return t.find_first_of("[]()", 1) == t.size() - 1;
    }
    return false;
}

// =============================================================================
// UTF-8
// =============================================================================

inline bool is_utf8_continuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

/**
 * @brief Number of bytes in a UTF-8 character from its lead byte
 * @return 1-4 for valid lead bytes, 1 for invalid (treat as single byte)
 */
inline int utf8_char_bytes(unsigned char lead) {
    if (lead < 0x80) return 1;
    if (lead < 0xC0) return 1;
    if (lead < 0xE0) return 2;
    if (lead < 0xF0) return 3;
    if (lead < 0xF8) return 4;
    return 1;
}

/**
 * @brief Decode the codepoint starting at `pos`
 * @param len Receives the byte length consumed (at least 1)
 * @return Codepoint, or 0xFFFFFFFF for malformed or truncated input
 */
inline uint32_t decode_utf8_at(const std::string& s, size_t pos, int& len) {
    const unsigned char lead = static_cast<unsigned char>(s[pos]);
    len = utf8_char_bytes(lead);
    if (pos + static_cast<size_t>(len) > s.size()) {
        len = 1;
        return 0xFFFFFFFF;
    }
    if (len == 1) return lead;
    for (int i = 1; i < len; i++) {
        if (!is_utf8_continuation(static_cast<unsigned char>(s[pos + i]))) {
            len = 1;
            return 0xFFFFFFFF;
        }
    }
    uint32_t cp = 0;
    if (len == 2) cp = lead & 0x1F;
    else if (len == 3) cp = lead & 0x0F;
    else cp = lead & 0x07;
    for (int i = 1; i < len; i++) {
        cp = (cp << 6) | (static_cast<unsigned char>(s[pos + i]) & 0x3F);
    }
    return cp;
}

/**
 * @brief Largest cut position <= `pos` that does not split a UTF-8 sequence
 */
inline size_t utf8_safe_cut(const std::string& s, size_t pos) {
    if (pos >= s.size()) return s.size();
    while (pos > 0 && is_utf8_continuation(static_cast<unsigned char>(s[pos]))) {
        pos--;
    }
    return pos;
}

// =============================================================================
// Base64 (RFC 4648, standard alphabet, padded)
// =============================================================================

inline std::string base64_encode(const uint8_t* data, size_t len) {
    static const char* alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((len + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < len; i += 3) {
        uint32_t triple = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        out.push_back(alphabet[(triple >> 18) & 0x3F]);
        out.push_back(alphabet[(triple >> 12) & 0x3F]);
        out.push_back(alphabet[(triple >> 6) & 0x3F]);
        out.push_back(alphabet[triple & 0x3F]);
    }

    const size_t rest = len - i;
    if (rest == 1) {
        uint32_t triple = uint32_t(data[i]) << 16;
        out.push_back(alphabet[(triple >> 18) & 0x3F]);
        out.push_back(alphabet[(triple >> 12) & 0x3F]);
        out += "==";
    } else if (rest == 2) {
        uint32_t triple = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
        out.push_back(alphabet[(triple >> 18) & 0x3F]);
        out.push_back(alphabet[(triple >> 12) & 0x3F]);
        out.push_back(alphabet[(triple >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

/**
 * @brief Decode base64, ignoring ASCII whitespace
 * @return Decoded bytes, or nullopt on an invalid character or bad padding
 */
inline std::optional<std::vector<uint8_t>> base64_decode(const std::string& encoded) {
    auto value_of = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    };

    std::vector<uint8_t> out;
    out.reserve((encoded.size() / 4) * 3);

    uint32_t accum = 0;
    int bits = 0;
    int padding = 0;
    size_t symbols = 0;

    for (char c : encoded) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        if (c == '=') {
            padding++;
            symbols++;
            continue;
        }
        if (padding > 0) return std::nullopt;  // data after padding
        int v = value_of(c);
        if (v < 0) return std::nullopt;
        accum = (accum << 6) | static_cast<uint32_t>(v);
        bits += 6;
        symbols++;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((accum >> bits) & 0xFF));
        }
    }

    if (symbols % 4 != 0 || padding > 2) return std::nullopt;
    return out;
}

} // namespace utils

} // namespace voice_relay
