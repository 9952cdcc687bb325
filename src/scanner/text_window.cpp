#include "scanner/text_window.hpp"
#include "core/error.hpp"

#include <algorithm>
#include <format>

namespace llmshield {

std::vector<TextWindow> make_windows(size_t text_size, size_t window, size_t overlap) {
    if (window == 0 || overlap >= window) {
        throw ShieldError(ErrorCategory::INTERNAL_ERROR,
            std::format("Invalid text window {} with overlap {}", window, overlap));
    }

    if (text_size <= window) {
        return {TextWindow{.offset = 0, .length = text_size, .owned = text_size, .last = true}};
    }

    const size_t stride = window - overlap;
    std::vector<TextWindow> windows;
    windows.reserve(text_size / stride + 1);

    for (size_t offset = 0;; offset += stride) {
        const size_t length = std::min(window, text_size - offset);
        const bool last = (offset + length == text_size);
        windows.push_back(TextWindow{
            .offset = offset,
            .length = length,
            .owned = last ? length : stride,
            .last = last,
        });
        if (last) break;
    }
    return windows;
}

std::regex_constants::match_flag_type window_flags(const TextWindow& w) {
    auto flags = std::regex_constants::match_default;
    if (w.offset > 0) {
        flags |= std::regex_constants::match_prev_avail;
    }
    if (!w.last) {
        flags |= std::regex_constants::match_not_eol | std::regex_constants::match_not_eow;
    }
    return flags;
}

} // namespace llmshield
