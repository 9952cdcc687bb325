#pragma once

#include "scanner/iscanner.hpp"
#include "scanner/text_window.hpp"
#include "core/types.hpp"

#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace llmshield {

// ============================================================================
// Validators and redaction (exposed for reuse and testing)
// ============================================================================

namespace pii {

/// Validators receive the matched value with whitespace and '-' removed.
[[nodiscard]] bool validate_iban(std::string_view cleaned);
[[nodiscard]] bool validate_luhn(std::string_view cleaned);
[[nodiscard]] bool validate_german_tax_id(std::string_view cleaned);
[[nodiscard]] bool validate_phone(std::string_view cleaned);
[[nodiscard]] bool validate_ip_not_private(std::string_view cleaned);

/// Type-specific partial redaction, e.g. j***@example.com
[[nodiscard]] std::string mask_value(PiiType type, std::string_view value);

/// Deterministic pseudonym, e.g. [EMAIL_1a2b3c4d]
[[nodiscard]] std::string tokenize_value(PiiType type, std::string_view value);

} // namespace pii

/**
 * @brief Regex + checksum PII detector with masking
 *
 * Detection runs the pattern catalogue in order (IBAN, card, tax id, social
 * security, email, phone, IPv4, credentialed URL). Overlapping hits are
 * resolved by sorting on start offset then descending span and keeping a hit
 * only if it overlaps nothing already kept. Patterns run window by window
 * (see TextWindow); every pattern's match is bounded well below the overlap.
 *
 * Per-entity action: per-type override, else the default action. Types in the
 * allow-list are ignored. Any BLOCK entity blocks the scan and leaves the text
 * unmodified. Otherwise any remaining entity makes the scan warn: MASK and
 * TOKENIZE entities are redacted in descending start order, ALLOW entities are
 * reported but left in place.
 */
class PiiScanner final : public IScanner {
public:
    struct Config {
        PiiAction default_action = PiiAction::MASK;
        std::unordered_map<PiiType, PiiAction> type_actions;
        std::unordered_set<PiiType> allowed_types;
    };

    PiiScanner() : PiiScanner(Config{}) {}
    explicit PiiScanner(const Config& config);

    [[nodiscard]] ScannerResult scan(std::string_view input,
                                     const ScanContext& context) const override;
    [[nodiscard]] std::string_view name() const override { return "pii"; }

    /// Deduplicated entities, sorted by start offset, pairwise non-overlapping
    [[nodiscard]] std::vector<PiiEntity> detect(std::string_view text) const;

    [[nodiscard]] PiiAction resolve_action(PiiType type) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    struct Pattern {
        PiiType type;
        std::regex regex;
        bool (*validator)(std::string_view) = nullptr;
        bool reject_digit_before = false;
        double confidence = 0.0;
    };

    /// Matches starting in the window's owned prefix, searched from `resume`.
    /// Returns the position the next window resumes from.
    static size_t scan_window(const Pattern& pattern, std::string_view text,
                              const TextWindow& w, size_t resume,
                              std::vector<PiiEntity>& out);

    [[nodiscard]] std::string apply_redaction(std::string_view text,
                                              std::vector<PiiEntity> entities) const;

    Config config_;
    std::vector<Pattern> patterns_;
};

} // namespace llmshield
