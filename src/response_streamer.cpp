#include "response_streamer.h"
#include "utils.h"
#include <stdexcept>

namespace voice_relay {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool is_terminal(char c) {
    return c == '.' || c == '!' || c == '?';
}

/// Characters that may sit between terminal punctuation and the space: ." )
bool is_closer(char c) {
    return c == '"' || c == '\'' || c == ')' || c == ']';
}

/// Length of a full-width terminator (。！？) at `pos`, or 0
size_t fullwidth_terminal_len(const std::string& s, size_t pos) {
    if (pos + 3 > s.size()) return 0;
    const auto b0 = static_cast<unsigned char>(s[pos]);
    const auto b1 = static_cast<unsigned char>(s[pos + 1]);
    const auto b2 = static_cast<unsigned char>(s[pos + 2]);
    if (b0 == 0xE3 && b1 == 0x80 && b2 == 0x82) return 3;  // 。
    if (b0 == 0xEF && b1 == 0xBC && (b2 == 0x81 || b2 == 0x9F)) return 3;  // ！ ？
    return 0;
}

} // anonymous namespace

ResponseStreamer::ResponseStreamer(size_t max_unit_chars)
    : max_unit_chars_(max_unit_chars < 4 ? 4 : max_unit_chars) {}

std::vector<ResponseUnit> ResponseStreamer::feed(const std::string& fragment) {
    if (finished_) {
        throw std::logic_error("ResponseStreamer::feed after finish");
    }

    buffer_ += fragment;

    std::vector<ResponseUnit> units;
    while (!buffer_.empty()) {
        size_t end = find_boundary();
        if (end != std::string::npos && end <= max_unit_chars_) {
            units.push_back(take(end, false));
        } else if (buffer_.size() >= max_unit_chars_) {
            units.push_back(take(threshold_cut(), false));
        } else {
            break;
        }
    }
    return units;
}

ResponseUnit ResponseStreamer::finish() {
    if (finished_) {
        throw std::logic_error("ResponseStreamer::finish called twice");
    }
    finished_ = true;
    return take(buffer_.size(), true);
}

size_t ResponseStreamer::find_boundary() const {
    const size_t n = buffer_.size();
    for (size_t i = 0; i < n; i++) {
        size_t fw = fullwidth_terminal_len(buffer_, i);
        if (fw > 0) {
            size_t end = i + fw;
            while (end < n && is_space(buffer_[end])) end++;
            return end;
        }

        if (!is_terminal(buffer_[i])) continue;

        size_t j = i + 1;
        while (j < n && (is_terminal(buffer_[j]) || is_closer(buffer_[j]))) j++;
        if (j < n && is_space(buffer_[j])) {
            while (j < n && is_space(buffer_[j])) j++;
            return j;
        }
        // Terminal run at the end of the buffer: wait for what follows
        i = j - 1;
    }
    return std::string::npos;
}

size_t ResponseStreamer::threshold_cut() const {
    // Prefer the last whitespace inside the window
    for (size_t i = max_unit_chars_; i > 0; i--) {
        if (is_space(buffer_[i - 1])) {
            return i;
        }
    }
    size_t cut = utils::utf8_safe_cut(buffer_, max_unit_chars_);
    if (cut == 0) {
        cut = static_cast<size_t>(utils::utf8_char_bytes(static_cast<unsigned char>(buffer_[0])));
    }
    return cut;
}

ResponseUnit ResponseStreamer::take(size_t end, bool last) {
    ResponseUnit unit;
    unit.sequence = next_sequence_++;
    unit.text = buffer_.substr(0, end);
    unit.last = last;
    buffer_.erase(0, end);
    return unit;
}

} // namespace voice_relay
