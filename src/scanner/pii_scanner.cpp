#include "scanner/pii_scanner.hpp"
#include "scanner/text_window.hpp"
#include "core/hash.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace llmshield {

namespace {

std::string strip_separators(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '-' || std::isspace(static_cast<unsigned char>(c))) continue;
        out += c;
    }
    return out;
}

size_t count_digits(std::string_view value) {
    return static_cast<size_t>(std::count_if(value.begin(), value.end(),
        [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }));
}

bool is_digit_at(std::string_view text, size_t pos) {
    return std::isdigit(static_cast<unsigned char>(text[pos])) != 0;
}

} // anonymous namespace

// ============================================================================
// Validators
// ============================================================================

namespace pii {

bool validate_iban(std::string_view cleaned) {
    if (cleaned.size() < 15 || cleaned.size() > 34) {
        return false;
    }

    // Move the country code and check digits to the end, letters become 10..35,
    // then reduce mod 97 one symbol at a time
    std::string rearranged;
    rearranged.reserve(cleaned.size());
    rearranged.append(cleaned.substr(4));
    rearranged.append(cleaned.substr(0, 4));

    unsigned remainder = 0;
    for (char c : rearranged) {
        if (c >= '0' && c <= '9') {
            remainder = (remainder * 10 + static_cast<unsigned>(c - '0')) % 97;
        } else if (c >= 'A' && c <= 'Z') {
            remainder = (remainder * 100 + static_cast<unsigned>(c - 'A' + 10)) % 97;
        } else {
            return false;
        }
    }
    return remainder == 1;
}

bool validate_luhn(std::string_view cleaned) {
    std::string digits;
    digits.reserve(cleaned.size());
    for (char c : cleaned) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits += c;
        }
    }

    if (digits.size() < 13 || digits.size() > 19) {
        return false;
    }

    int sum = 0;
    bool double_digit = false;

    // Process from right to left
    for (int i = static_cast<int>(digits.size()) - 1; i >= 0; --i) {
        int digit = digits[static_cast<size_t>(i)] - '0';
        if (double_digit) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }
        sum += digit;
        double_digit = !double_digit;
    }

    return (sum % 10) == 0;
}

bool validate_german_tax_id(std::string_view cleaned) {
    if (cleaned.size() != 11) return false;
    if (count_digits(cleaned) != cleaned.size()) return false;
    return cleaned[0] != '0';
}

bool validate_phone(std::string_view cleaned) {
    const auto digits = count_digits(cleaned);
    return digits >= 7 && digits <= 15;
}

bool validate_ip_not_private(std::string_view cleaned) {
    const auto parts = utils::split(std::string(cleaned), '.');
    if (parts.size() != 4) return false;

    const int a = utils::parse_int<int>(parts[0], -1);
    const int b = utils::parse_int<int>(parts[1], -1);

    // Private and loopback ranges are not personal data
    if (a == 10) return false;
    if (a == 172 && b >= 16 && b <= 31) return false;
    if (a == 192 && b == 168) return false;
    if (a == 127) return false;
    return true;
}

// ============================================================================
// Redaction
// ============================================================================

std::string mask_value(PiiType type, std::string_view value) {
    switch (type) {
        case PiiType::EMAIL: {
            const auto at = value.find('@');
            if (at == std::string_view::npos || at <= 1) return "[EMAIL]";
            return std::format("{}***@{}", value[0], value.substr(at + 1));
        }
        case PiiType::PHONE: {
            const auto tail = value.size() >= 2 ? value.substr(value.size() - 2) : value;
            return std::format("{}****{}", value.substr(0, 4), tail);
        }
        case PiiType::IBAN:
            return std::format("{} **** **** ****", value.substr(0, 4));
        case PiiType::CREDIT_CARD: {
            std::string digits;
            for (char c : value) {
                if (std::isdigit(static_cast<unsigned char>(c))) digits += c;
            }
            return std::format("**** **** **** {}",
                digits.size() > 12 ? digits.substr(12) : std::string{});
        }
        default:
            return std::format("[{}]", utils::to_upper(pii_type_to_string(type)));
    }
}

std::string tokenize_value(PiiType type, std::string_view value) {
    return std::format("[{}_{}]",
        utils::to_upper(pii_type_to_string(type)),
        hash::sha256_hex(value).substr(0, 8));
}

} // namespace pii

// ============================================================================
// PiiScanner
// ============================================================================

PiiScanner::PiiScanner(const Config& config) : config_(config) {
    const auto flags = std::regex::ECMAScript | std::regex::optimize;

    patterns_.push_back(Pattern{
        .type = PiiType::IBAN,
        .regex = std::regex(R"(\b[A-Z]{2}\s?\d{2}\s?\d{4}\s?\d{4}\s?\d{4}\s?\d{4}\s?\d{2,4}\b)", flags),
        .validator = &pii::validate_iban,
        .confidence = 0.95,
    });
    patterns_.push_back(Pattern{
        .type = PiiType::CREDIT_CARD,
        .regex = std::regex(R"(\b(?:\d{4}[\s-]?){3}\d{4}\b)", flags),
        .validator = &pii::validate_luhn,
        .confidence = 0.95,
    });
    patterns_.push_back(Pattern{
        .type = PiiType::GERMAN_TAX_ID,
        .regex = std::regex(R"(\b\d{2}\s?\d{3}\s?\d{3}\s?\d{3}\b)", flags),
        .validator = &pii::validate_german_tax_id,
        .confidence = 0.70,
    });
    patterns_.push_back(Pattern{
        .type = PiiType::GERMAN_SOCIAL_SECURITY,
        .regex = std::regex(R"(\b\d{2}\s?\d{6}\s?[A-Z]\s?\d{3}\b)", flags),
        .confidence = 0.75,
    });
    patterns_.push_back(Pattern{
        .type = PiiType::EMAIL,
        .regex = std::regex(R"(\b[A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9.-]{1,253}\.[A-Za-z]{2,24}\b)", flags),
        .confidence = 0.95,
    });
    // ECMAScript in std::regex has no lookbehind; the preceding digit is checked by hand
    patterns_.push_back(Pattern{
        .type = PiiType::PHONE,
        .regex = std::regex(R"((?:\+\d{1,3}|00\d{1,3}|0)\s?[\s\-/]?\(?\d{2,5}\)?[\s\-/]?\d{3,8}[\s\-/]?\d{0,5}\b)", flags),
        .validator = &pii::validate_phone,
        .reject_digit_before = true,
        .confidence = 0.80,
    });
    patterns_.push_back(Pattern{
        .type = PiiType::IP_ADDRESS,
        .regex = std::regex(R"(\b(?:(?:25[0-5]|2[0-4]\d|[01]?\d\d?)\.){3}(?:25[0-5]|2[0-4]\d|[01]?\d\d?)\b)", flags),
        .validator = &pii::validate_ip_not_private,
        .confidence = 0.85,
    });
    patterns_.push_back(Pattern{
        .type = PiiType::URL_WITH_CREDENTIALS,
        .regex = std::regex(R"(https?://[^:\s]{1,256}:[^@\s]{1,256}@[^\s]{1,256})", flags),
        .confidence = 0.95,
    });
}

PiiAction PiiScanner::resolve_action(PiiType type) const {
    const auto it = config_.type_actions.find(type);
    return it != config_.type_actions.end() ? it->second : config_.default_action;
}

size_t PiiScanner::scan_window(const Pattern& pattern, std::string_view text,
                               const TextWindow& w, size_t resume,
                               std::vector<PiiEntity>& out) {
    const auto window_end = text.begin() + static_cast<std::ptrdiff_t>(w.offset + w.length);
    size_t pos = std::max(w.offset, resume);

    while (pos <= w.offset + w.length) {
        std::match_results<std::string_view::const_iterator> m;
        auto flags = window_flags(w);
        if (pos > 0) flags |= std::regex_constants::match_prev_avail;

        if (!std::regex_search(text.begin() + static_cast<std::ptrdiff_t>(pos),
                               window_end, m, pattern.regex, flags)) {
            break;
        }

        const size_t start = pos + static_cast<size_t>(m.position(0));
        const size_t end = start + static_cast<size_t>(m.length(0));

        // Starts past the owned prefix are found again by the next window
        if (start - w.offset >= w.owned) {
            break;
        }

        if (pattern.reject_digit_before && start > 0 && is_digit_at(text, start - 1)) {
            pos = start + 1;
            continue;
        }
        pos = (end > start) ? end : start + 1;

        const auto value = text.substr(start, end - start);
        if (pattern.validator && !pattern.validator(strip_separators(value))) {
            continue;
        }

        out.push_back(PiiEntity{
            .type = pattern.type,
            .value = std::string(value),
            .start = start,
            .end = end,
            .confidence = pattern.confidence,
        });
    }
    return pos;
}

std::vector<PiiEntity> PiiScanner::detect(std::string_view text) const {
    std::vector<PiiEntity> raw;

    const auto windows = make_windows(text.size());

    for (const auto& pattern : patterns_) {
        size_t resume = 0;
        for (const auto& w : windows) {
            resume = scan_window(pattern, text, w, resume, raw);
        }
    }

    // Longer spans win ties at the same start; stable keeps catalogue order
    std::stable_sort(raw.begin(), raw.end(), [](const PiiEntity& a, const PiiEntity& b) {
        if (a.start != b.start) return a.start < b.start;
        return a.length() > b.length();
    });

    std::vector<PiiEntity> kept;
    kept.reserve(raw.size());
    // Kept entities are disjoint and ordered, so only the last one can overlap
    for (auto& entity : raw) {
        if (kept.empty() || !entity.overlaps(kept.back())) {
            kept.push_back(std::move(entity));
        }
    }
    return kept;
}

std::string PiiScanner::apply_redaction(std::string_view text,
                                        std::vector<PiiEntity> entities) const {
    std::sort(entities.begin(), entities.end(),
        [](const PiiEntity& a, const PiiEntity& b) { return a.start > b.start; });

    std::string out(text);
    for (const auto& e : entities) {
        const auto action = resolve_action(e.type);
        std::string replacement;
        if (action == PiiAction::TOKENIZE) {
            replacement = pii::tokenize_value(e.type, e.value);
        } else if (action == PiiAction::MASK) {
            replacement = pii::mask_value(e.type, e.value);
        } else {
            continue;
        }
        out.replace(e.start, e.length(), replacement);
    }
    return out;
}

ScannerResult PiiScanner::scan(std::string_view input, const ScanContext& /*context*/) const {
    const utils::Timer timer;
    ScannerResult result;

    auto entities = detect(input);
    std::erase_if(entities, [this](const PiiEntity& e) {
        return config_.allowed_types.contains(e.type);
    });

    if (entities.empty()) {
        result.decision = Decision::ALLOW;
        result.duration = timer.elapsed_us();
        return result;
    }

    bool should_block = false;
    for (const auto& e : entities) {
        const auto action = resolve_action(e.type);
        if (action == PiiAction::BLOCK) should_block = true;

        const char* type_name = pii_type_to_string(e.type);
        result.violations.push_back(Violation{
            .type = ViolationType::PII_DETECTED,
            .scanner = std::string(name()),
            .score = e.confidence,
            .threshold = 0.0,
            .message = std::format("{} detected", type_name),
            .detail = std::format("Found {} at position {}-{} (action: {})",
                type_name, e.start, e.end, pii_action_to_string(action)),
        });
    }

    if (should_block) {
        result.decision = Decision::BLOCK;
    } else {
        result.decision = Decision::WARN;
        auto redacted = apply_redaction(input, std::move(entities));
        if (redacted != input) {
            result.sanitized = std::move(redacted);
        }
    }

    result.duration = timer.elapsed_us();
    return result;
}

} // namespace llmshield
