/**
 * text::clean: markup removal, list pauses, idempotence, and plain prose
 * passing through untouched.
 *
 * Run from build dir: ./test_text_sanitizer
 */

#include "text_sanitizer.h"
#include <iostream>
#include <string>
#include <vector>

using namespace voice_relay;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

#define ASSERT_CLEAN(input, expected) do { \
    std::string got_ = text::clean(input); \
    if (got_ != (expected)) { \
        std::cerr << "FAIL: clean(" << #input << ") = \"" << got_ << "\" (line " << __LINE__ << ")\n"; \
        failed++; \
    } } while(0)

int main() {
    // --- Emphasis, headings, quotes, code ---
    ASSERT_CLEAN("**Bold** and _italic_ text.", "Bold and italic text.");
    ASSERT_CLEAN("# Title\nSome text.", "Title Some text.");
    ASSERT_CLEAN("> quoted text", "quoted text");
    ASSERT_CLEAN("Run `ls -la` first.", "Run ls -la first.");
    ASSERT_CLEAN("```python\nprint(1)\n```\nDone.", "print(1) Done.");
    ASSERT_CLEAN("A\n---\nB", "A B");
    ASSERT_CLEAN("~~old~~ new", "old new");

    // --- Links and URLs ---
    ASSERT_CLEAN("Check [the docs](https://example.com/a) now.", "Check the docs now.");
    ASSERT_CLEAN("Visit https://example.com/page. Thanks", "Visit. Thanks");
    ASSERT_CLEAN("See www.example.com for more", "See for more");

    // --- Hashtags and emoji ---
    ASSERT_CLEAN("Great day #sunny #fun", "Great day");
    ASSERT_CLEAN("Hello \xF0\x9F\x98\x80 world", "Hello world");
    ASSERT_CLEAN("Done \xE2\x9C\x85", "Done");
    ASSERT(text::is_emoji(0x1F600));
    ASSERT(!text::is_emoji('A'));
    ASSERT(!text::is_emoji(0x4E2D));  // CJK ideograph

    // --- Lists become comma pauses ---
    ASSERT_CLEAN("Steps:\n- Open the app\n- Tap start\n1. Done", "Steps: Open the app, Tap start, Done");
    ASSERT_CLEAN("* one\n* two", "one, two");

    // --- Whitespace ---
    ASSERT_CLEAN("  spaced   out\n\n text ", "spaced out text");
    ASSERT_CLEAN("", "");
    ASSERT_CLEAN("\xF0\x9F\x98\x80", "");

    // --- Plain prose is untouched ---
    {
        const std::vector<std::string> prose = {
            "It's 3:00 p.m., isn't it?",
            "I love C# and snake_case.",
            "A well-known fact: 2 + 2 = 4.",
            "\xE4\xBD\xA0\xE5\xA5\xBD\xEF\xBC\x8C\xE4\xB8\x96\xE7\x95\x8C\xE3\x80\x82",
            "She said \"hello\" (quietly).",
        };
        for (const auto& p : prose) {
            ASSERT_CLEAN(p, p);
        }
    }

    // --- Idempotence ---
    {
        const std::vector<std::string> inputs = {
            "**Bold** and _italic_ text.",
            "Steps:\n- Open the app\n- Tap start",
            "Check [the docs](https://example.com/a) now.",
            "[[nested]](x) **_mixed_** `code` #tag \xF0\x9F\x98\x80",
            "> # Quoted heading\n> - item",
            "Visit https://example.com/page. Thanks",
        };
        for (const auto& in : inputs) {
            std::string once = text::clean(in);
            ASSERT(text::clean(once) == once);
        }
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All text sanitizer tests passed.\n";
    return 0;
}
