#pragma once

#include <cstddef>
#include <regex>
#include <vector>

namespace llmshield {

/**
 * @brief Overlapping slice of a text for bounded regex matching
 *
 * std::regex matching recurses per consumed character, so scanners never
 * hand it more than one window at a time. Consecutive windows share
 * kWindowOverlap bytes; a match no longer than the overlap lies entirely
 * inside some window. Each window owns the matches that start in its first
 * `owned` bytes, so counting by owner visits every match exactly once.
 */
struct TextWindow {
    size_t offset = 0;      // Start in the full text
    size_t length = 0;
    size_t owned = 0;       // Leading bytes whose matches belong to this window
    bool last = true;
};

inline constexpr size_t kWindowSize = 4096;
inline constexpr size_t kWindowOverlap = 1024;

/// @throws ShieldError(INTERNAL_ERROR) if overlap >= window
[[nodiscard]] std::vector<TextWindow> make_windows(size_t text_size,
                                                   size_t window = kWindowSize,
                                                   size_t overlap = kWindowOverlap);

/// Search flags for a window: context before the window is available, and the
/// cut at a non-final window's end is neither end of line nor end of word.
[[nodiscard]] std::regex_constants::match_flag_type window_flags(const TextWindow& w);

} // namespace llmshield
