/**
 * ResponseStreamer: sentence boundaries, length cuts, and the
 * concatenation / sequence / last-unit guarantees under arbitrary
 * fragmentation.
 *
 * Run from build dir: ./test_response_streamer
 */

#include "response_streamer.h"
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using namespace voice_relay;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static std::vector<ResponseUnit> run(const std::vector<std::string>& fragments, size_t max_chars = 200) {
    ResponseStreamer streamer(max_chars);
    std::vector<ResponseUnit> units;
    for (const auto& f : fragments) {
        auto out = streamer.feed(f);
        units.insert(units.end(), out.begin(), out.end());
    }
    units.push_back(streamer.finish());
    return units;
}

static std::string join(const std::vector<ResponseUnit>& units) {
    std::string out;
    for (const auto& u : units) out += u.text;
    return out;
}

static void check_invariants(const std::vector<ResponseUnit>& units, const std::string& source) {
    ASSERT(join(units) == source);
    for (size_t i = 0; i < units.size(); i++) {
        ASSERT(units[i].sequence == i);
        ASSERT(units[i].last == (i + 1 == units.size()));
    }
}

int main() {
    // --- Boundaries ---
    {
        auto units = run({"Hello there. How are", " you? I'm fine!"});
        ASSERT(units.size() == 3);
        ASSERT(units[0].text == "Hello there. ");
        ASSERT(units[1].text == "How are you? ");
        ASSERT(units[2].text == "I'm fine!");
        ASSERT(units[2].last);
    }

    // --- First unit leaves as soon as its boundary is seen ---
    {
        ResponseStreamer streamer;
        ASSERT(streamer.feed("Sure").empty());
        ASSERT(streamer.feed(".").empty());  // may still be "Sure.5"
        auto out = streamer.feed(" Next");
        ASSERT(out.size() == 1);
        ASSERT(out[0].text == "Sure. ");
        ASSERT(out[0].sequence == 0);
        ASSERT(!out[0].last);
        ASSERT(streamer.pending() == "Next");
    }

    // --- Decimal points and closing quotes ---
    {
        auto units = run({"It costs 3.50 dollars. He said \"no.\" Then left."});
        ASSERT(units.size() == 3);
        ASSERT(units[0].text == "It costs 3.50 dollars. ");
        ASSERT(units[1].text == "He said \"no.\" ");
        ASSERT(units[2].text == "Then left.");
    }

    // --- Repeated terminals and newlines ---
    {
        auto units = run({"Really?! Yes...\n\nOkay"});
        ASSERT(units.size() == 3);
        ASSERT(units[0].text == "Really?! ");
        ASSERT(units[1].text == "Yes...\n\n");
        ASSERT(units[2].text == "Okay");
    }

    // --- Full-width terminators need no following space ---
    {
        auto units = run({"\xE4\xBD\xA0\xE5\xA5\xBD\xE3\x80\x82\xE5\x86\x8D\xE8\xA7\x81\xEF\xBC\x81"});
        ASSERT(units.size() == 3);
        ASSERT(units[0].text == "\xE4\xBD\xA0\xE5\xA5\xBD\xE3\x80\x82");
        ASSERT(units[1].text == "\xE5\x86\x8D\xE8\xA7\x81\xEF\xBC\x81");
        ASSERT(units[2].text.empty());
        ASSERT(units[2].last);
    }

    // --- Long text without punctuation is cut at whitespace ---
    {
        std::string words;
        for (int i = 0; i < 30; i++) words += "word ";
        auto units = run({words}, 32);
        check_invariants(units, words);
        for (const auto& u : units) {
            ASSERT(u.text.size() <= 32);
            if (!u.last) ASSERT(u.text.back() == ' ');
        }
    }

    // --- No whitespace at all: cut stays on a UTF-8 boundary ---
    {
        std::string cjk;
        for (int i = 0; i < 40; i++) cjk += "\xE5\xAD\x97";  // 3-byte character
        auto units = run({cjk}, 32);
        check_invariants(units, cjk);
        for (const auto& u : units) {
            ASSERT(u.text.size() % 3 == 0);
            ASSERT(u.text.size() <= 32);
        }
    }

    // --- Empty reply yields exactly one empty last unit ---
    {
        auto units = run({});
        ASSERT(units.size() == 1);
        ASSERT(units[0].text.empty());
        ASSERT(units[0].last);
        ASSERT(units[0].sequence == 0);
    }

    // --- Misuse ---
    {
        ResponseStreamer streamer;
        streamer.finish();
        bool threw = false;
        try { streamer.feed("x"); } catch (const std::logic_error&) { threw = true; }
        ASSERT(threw);
        threw = false;
        try { streamer.finish(); } catch (const std::logic_error&) { threw = true; }
        ASSERT(threw);
    }

    // --- Any fragmentation gives the same units ---
    {
        const std::string source =
            "Great question! The answer has three parts. First, check the cable. "
            "Second, restart the router (it helps). Third? Call support at 555.1234 if it persists.";
        const auto reference = run({source});
        check_invariants(reference, source);

        std::mt19937 rng(42);
        for (int round = 0; round < 50; round++) {
            std::vector<std::string> fragments;
            size_t pos = 0;
            while (pos < source.size()) {
                size_t len = std::uniform_int_distribution<size_t>(1, 7)(rng);
                fragments.push_back(source.substr(pos, len));
                pos += len;
            }
            auto units = run(fragments);
            check_invariants(units, source);
            ASSERT(units.size() == reference.size());
            for (size_t i = 0; i < units.size() && i < reference.size(); i++) {
                ASSERT(units[i].text == reference[i].text);
            }
        }
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All response streamer tests passed.\n";
    return 0;
}
