#pragma once

/**
 * @file response_streamer.h
 * @brief Splits streamed agent text into sentence-sized units
 *
 * Push-driven: feed() returns every unit whose boundary the new fragment
 * completed, finish() returns the final unit. Units carry their trailing
 * whitespace, so concatenating all unit texts reproduces the source exactly.
 */

#include "core/constants.h"
#include <cstdint>
#include <string>
#include <vector>

namespace voice_relay {

struct ResponseUnit {
    uint64_t sequence = 0;
    std::string text;
    bool last = false;
};

class ResponseStreamer {
public:
    explicit ResponseStreamer(size_t max_unit_chars = constants::session::MAX_UNIT_CHARS);

    /**
     * @brief Append a fragment of agent output
     * @return Units completed by this fragment, in source order
     */
    std::vector<ResponseUnit> feed(const std::string& fragment);

    /**
     * @brief End of the source stream
     * @return The remaining text as the unit flagged `last` (possibly empty).
     *         Calling it again, or feeding afterwards, is an error.
     */
    ResponseUnit finish();

    bool finished() const { return finished_; }
    uint64_t units_emitted() const { return next_sequence_; }

    /// Text received but not yet part of an emitted unit
    const std::string& pending() const { return buffer_; }

private:
    size_t find_boundary() const;
    size_t threshold_cut() const;
    ResponseUnit take(size_t end, bool last);

    std::string buffer_;
    size_t max_unit_chars_;
    uint64_t next_sequence_ = 0;
    bool finished_ = false;
};

} // namespace voice_relay
