#include "text_sanitizer.h"
#include "utils.h"
#include <cctype>
#include <sstream>
#include <vector>

namespace voice_relay {
namespace text {

namespace {

constexpr int MAX_PASSES = 8;

bool is_alnum(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

bool is_alpha(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

bool is_hspace(char c) {
    return c == ' ' || c == '\t';
}

bool is_ws(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool is_pause_punct(char c) {
    return c == '.' || c == ',' || c == ';' || c == ':' || c == '!' || c == '?';
}

bool starts_with(const std::string& s, size_t pos, const char* prefix) {
    return s.compare(pos, std::char_traits<char>::length(prefix), prefix) == 0;
}

/// Removing a token right before punctuation must not leave "word ."
void drop_gap_before(std::string& out, const std::string& src, size_t next) {
    if (next < src.size() && is_pause_punct(src[next])) {
        while (!out.empty() && is_hspace(out.back())) out.pop_back();
    }
}

bool is_code_fence(const std::string& line) {
    std::string t = utils::trim_copy(line);
    return starts_with(t, 0, "```") || starts_with(t, 0, "~~~");
}

/// ---, ***, ___ and their spaced forms
bool is_horizontal_rule(const std::string& line) {
    char mark = 0;
    int count = 0;
    for (char c : line) {
        if (is_ws(c)) continue;
        if (c != '-' && c != '*' && c != '_') return false;
        if (mark != 0 && c != mark) return false;
        mark = c;
        count++;
    }
    return count >= 3;
}

/**
 * @brief Remove block markers from the start of a line
 * @return true if the line is a list item
 */
bool strip_line_markers(std::string& line) {
    bool list_item = false;
    bool changed = true;
    while (changed) {
        changed = false;
        size_t start = 0;
        while (start < line.size() && is_hspace(line[start])) start++;
        line.erase(0, start);
        if (line.empty()) break;

        // Block quote
        if (line[0] == '>') {
            line.erase(0, 1);
            changed = true;
            continue;
        }

        // Heading: 1-6 hashes then space or end of line
        if (line[0] == '#') {
            size_t n = 0;
            while (n < line.size() && line[n] == '#') n++;
            if (n <= 6 && (n == line.size() || is_hspace(line[n]))) {
                line.erase(0, n);
                changed = true;
                continue;
            }
        }

        // Bullets
        if (line.size() >= 2 && (line[0] == '-' || line[0] == '*' || line[0] == '+') && is_hspace(line[1])) {
            line.erase(0, 2);
            list_item = changed = true;
            continue;
        }
        if (starts_with(line, 0, "\xE2\x80\xA2")) {  // •
            line.erase(0, 3);
            list_item = changed = true;
            continue;
        }

        // Numbered: 12. or 12)
        size_t d = 0;
        while (d < line.size() && std::isdigit(static_cast<unsigned char>(line[d]))) d++;
        if (d > 0 && d + 1 < line.size() && (line[d] == '.' || line[d] == ')') && is_hspace(line[d + 1])) {
            line.erase(0, d + 2);
            list_item = changed = true;
        }
    }
    return list_item;
}

/// Position of the bracket closing the one at `open`, or npos
size_t find_closing(const std::string& s, size_t open, char open_ch, char close_ch) {
    int depth = 0;
    for (size_t i = open; i < s.size(); i++) {
        if (s[i] == open_ch) depth++;
        else if (s[i] == close_ch) {
            depth--;
            if (depth == 0) return i;
        }
    }
    return std::string::npos;
}

/// Length of an http://, https:// or word-initial www. prefix at `pos`
size_t url_prefix_length(const std::string& s, size_t pos) {
    if (starts_with(s, pos, "https://")) return 8;
    if (starts_with(s, pos, "http://")) return 7;
    if (starts_with(s, pos, "www.") && (pos == 0 || !is_alnum(s[pos - 1]))) return 4;
    return 0;
}

size_t find_url_end(const std::string& s, size_t pos) {
    while (pos < s.size()) {
        char c = s[pos];
        if (is_ws(c) || c == '"' || c == '\'' || c == '<' || c == '>' || c == ')' || c == ']') break;
        if (is_pause_punct(c) && (pos + 1 >= s.size() || is_ws(s[pos + 1]))) break;
        pos++;
    }
    return pos;
}

/// Inline markup on one line
std::string clean_inline(const std::string& s) {
    std::string out;
    out.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        const char c = s[i];

        // [label](url) and ![alt](url)
        if (c == '[' || (c == '!' && i + 1 < s.size() && s[i + 1] == '[')) {
            const size_t open = (c == '!') ? i + 1 : i;
            const size_t close = find_closing(s, open, '[', ']');
            if (close != std::string::npos && close + 1 < s.size() && s[close + 1] == '(') {
                const size_t paren = find_closing(s, close + 1, '(', ')');
                if (paren != std::string::npos) {
                    out += s.substr(open + 1, close - open - 1);
                    i = paren + 1;
                    continue;
                }
            }
        }

        size_t url = url_prefix_length(s, i);
        if (url > 0 && (i == 0 || !is_alnum(s[i - 1]))) {
            i = find_url_end(s, i + url);
            drop_gap_before(out, s, i);
            continue;
        }

        // Hashtag: '#' opening a token and followed by a letter. "C#" stays.
        if (c == '#' && (i == 0 || !is_alnum(s[i - 1])) && i + 1 < s.size() && is_alpha(s[i + 1])) {
            i++;
            while (i < s.size() && (is_alnum(s[i]) || s[i] == '_')) i++;
            drop_gap_before(out, s, i);
            continue;
        }

        if (c == '_') {
            const bool inner = i > 0 && i + 1 < s.size() && is_alnum(s[i - 1]) && is_alnum(s[i + 1]);
            if (!inner) {
                i++;
                continue;
            }
        }

        switch (c) {
            case '`': case '*': case '~':
            case '[': case ']': case '{': case '}': case '<': case '>':
                i++;
                continue;
            case '|': case '\\': case '^':
                out.push_back(' ');
                i++;
                continue;
            default:
                break;
        }

        const unsigned char lead = static_cast<unsigned char>(c);
        if (lead >= 0x80) {
            int len = 1;
            uint32_t cp = utils::decode_utf8_at(s, i, len);
            if (cp != 0xFFFFFFFF && (is_emoji(cp) || cp == 0x2022)) {
                i += static_cast<size_t>(len);
                continue;
            }
            out.append(s, i, static_cast<size_t>(len));
            i += static_cast<size_t>(len);
            continue;
        }

        out.push_back(c);
        i++;
    }
    return out;
}

std::string collapse_whitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool gap = false;
    for (char c : s) {
        if (is_ws(c)) {
            gap = true;
            continue;
        }
        if (gap && !out.empty()) out.push_back(' ');
        gap = false;
        out.push_back(c);
    }
    return out;
}

std::string clean_once(const std::string& input) {
    std::istringstream stream(input);
    std::string line;
    std::string joined;

    while (std::getline(stream, line)) {
        if (is_code_fence(line) || is_horizontal_rule(line)) continue;

        const bool list_item = strip_line_markers(line);
        std::string cleaned = utils::trim_copy(collapse_whitespace(clean_inline(line)));
        if (cleaned.empty()) continue;

        if (!joined.empty()) {
            if (list_item && !is_pause_punct(joined.back())) {
                joined.push_back(',');
            }
            joined.push_back(' ');
        }
        joined += cleaned;
    }
    return collapse_whitespace(joined);
}

} // anonymous namespace

bool is_emoji(uint32_t cp) {
    return (cp >= 0x1F600 && cp <= 0x1F64F) ||  // Emoticons
           (cp >= 0x1F300 && cp <= 0x1F5FF) ||  // Misc symbols and pictographs
           (cp >= 0x1F680 && cp <= 0x1F6FF) ||  // Transport and map
           (cp >= 0x1F900 && cp <= 0x1F9FF) ||  // Supplemental symbols
           (cp >= 0x1F1E0 && cp <= 0x1F1FF) ||  // Regional indicators
           (cp >= 0x1FA00 && cp <= 0x1FAFF) ||
           (cp >= 0x2300 && cp <= 0x23FF) ||    // Misc technical
           (cp >= 0x2460 && cp <= 0x24FF) ||    // Enclosed alphanumerics
           (cp >= 0x2500 && cp <= 0x25FF) ||    // Box drawing, blocks, shapes
           (cp >= 0x2600 && cp <= 0x27BF) ||    // Misc symbols, dingbats
           (cp >= 0xFE00 && cp <= 0xFE0F) ||    // Variation selectors
           cp == 0x200D ||                      // ZWJ
           cp == 0x20E3 ||                      // Keycap
           (cp >= 0xE0000 && cp <= 0xE007F);    // Tags
}

std::string clean(const std::string& input) {
    std::string current = clean_once(input);
    for (int pass = 1; pass < MAX_PASSES; pass++) {
        std::string next = clean_once(current);
        if (next == current) break;
        current = std::move(next);
    }
    return current;
}

} // namespace text
} // namespace voice_relay
