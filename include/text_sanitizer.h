#pragma once

/**
 * @file text_sanitizer.h
 * @brief Strips markup that should not be spoken
 *
 * Removes markdown emphasis, headings, quotes, code fences and ticks,
 * horizontal rules, links (kept as their label), URLs, hashtags, emoji and
 * symbol clutter. List items become comma pauses. Whitespace collapses to
 * single spaces.
 *
 * clean() is idempotent, and single-spaced prose without markup comes back
 * unchanged: word-internal characters such as the underscore in
 * "snake_case", the hash in "C#" or the hyphen in "well-known" are kept.
 */

#include <cstdint>
#include <string>

namespace voice_relay {
namespace text {

std::string clean(const std::string& input);

/// True for the pictograph and dingbat ranges TTS voices cannot pronounce
bool is_emoji(uint32_t codepoint);

} // namespace text
} // namespace voice_relay
