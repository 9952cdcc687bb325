#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace llmshield {

// ============================================================================
// Decision
// ============================================================================

/**
 * @brief Tri-state scan outcome, totally ordered by severity
 *
 * ALLOW < WARN < BLOCK. A running decision is only ever escalated.
 */
enum class Decision {
    ALLOW,
    WARN,
    BLOCK
};

[[nodiscard]] inline constexpr int decision_rank(Decision d) noexcept {
    return static_cast<int>(d);
}

[[nodiscard]] inline constexpr Decision escalate(Decision current, Decision next) noexcept {
    return decision_rank(next) > decision_rank(current) ? next : current;
}

[[nodiscard]] inline const char* decision_to_string(Decision d) {
    switch (d) {
        case Decision::ALLOW: return "allow";
        case Decision::WARN:  return "warn";
        case Decision::BLOCK: return "block";
    }
    return "allow";
}

/// Accepts "allow", "warn", "block" and "flag" (alias for warn).
[[nodiscard]] inline std::optional<Decision> parse_decision(std::string_view s) {
    if (s == "allow") return Decision::ALLOW;
    if (s == "warn" || s == "flag") return Decision::WARN;
    if (s == "block") return Decision::BLOCK;
    return std::nullopt;
}

// ============================================================================
// Violations
// ============================================================================

enum class ViolationType {
    PROMPT_INJECTION,
    PII_DETECTED,
    TOOL_DENIED,
    TOOL_RATE_LIMIT,
    BUDGET_EXCEEDED,
    CONTENT_POLICY,
    MANIFEST_DRIFT
};

[[nodiscard]] inline const char* violation_type_to_string(ViolationType t) {
    switch (t) {
        case ViolationType::PROMPT_INJECTION: return "prompt_injection";
        case ViolationType::PII_DETECTED:     return "pii_detected";
        case ViolationType::TOOL_DENIED:      return "tool_denied";
        case ViolationType::TOOL_RATE_LIMIT:  return "tool_rate_limit";
        case ViolationType::BUDGET_EXCEEDED:  return "budget_exceeded";
        case ViolationType::CONTENT_POLICY:   return "content_policy";
        case ViolationType::MANIFEST_DRIFT:   return "manifest_drift";
    }
    return "content_policy";
}

/**
 * @brief One finding emitted by a scanner. Never mutated after creation.
 */
struct Violation {
    ViolationType type = ViolationType::CONTENT_POLICY;
    std::string scanner;        // Originating scanner name
    double score = 0.0;
    double threshold = 0.0;     // Threshold the score was compared against
    std::string message;
    std::string detail;         // Optional (empty = absent)
};

// ============================================================================
// Presets
// ============================================================================

enum class PresetName {
    PUBLIC_WEBSITE,
    INTERNAL_SUPPORT,
    OPS_AGENT
};

[[nodiscard]] inline const char* preset_to_string(PresetName p) {
    switch (p) {
        case PresetName::PUBLIC_WEBSITE:   return "public_website";
        case PresetName::INTERNAL_SUPPORT: return "internal_support";
        case PresetName::OPS_AGENT:        return "ops_agent";
    }
    return "public_website";
}

[[nodiscard]] inline std::optional<PresetName> parse_preset(std::string_view s) {
    if (s == "public_website") return PresetName::PUBLIC_WEBSITE;
    if (s == "internal_support") return PresetName::INTERNAL_SUPPORT;
    if (s == "ops_agent") return PresetName::OPS_AGENT;
    return std::nullopt;
}

// ============================================================================
// Scan Context
// ============================================================================

struct ToolCall {
    std::string name;
    std::string arguments;      // Raw JSON arguments as declared by the caller
    std::string server_id;      // Originating tool server (empty = unknown)
};

/**
 * @brief Per-call metadata. Empty strings mean "not provided".
 */
struct ScanContext {
    std::string agent_id;
    std::string session_id;
    std::string user_id;
    std::string user_type;      // lead | agency | customer | internal
    std::string locale;
    std::optional<PresetName> preset;
    std::vector<ToolCall> tools;
};

// ============================================================================
// Scan Results
// ============================================================================

struct ScanMeta {
    std::chrono::microseconds scan_duration{0};
    std::vector<std::string> scanners_run;
    bool cached = false;
};

/**
 * @brief Externally visible outcome of one scan call
 */
struct ScanResult {
    bool safe = true;
    Decision decision = Decision::ALLOW;
    std::string sanitized;              // Equal to input unless masking occurred
    std::vector<Violation> violations;  // Chain order, not re-sorted
    ScanMeta meta;
};

/**
 * @brief Outcome of a single scanner within the chain
 */
struct ScannerResult {
    Decision decision = Decision::ALLOW;
    std::vector<Violation> violations;
    std::optional<std::string> sanitized;   // Set only when the scanner rewrote the text
    std::chrono::microseconds duration{0};
};

// ============================================================================
// PII
// ============================================================================

enum class PiiType {
    EMAIL,
    PHONE,
    IBAN,
    CREDIT_CARD,
    GERMAN_TAX_ID,
    GERMAN_PERSONAL_ID,
    GERMAN_SOCIAL_SECURITY,
    IP_ADDRESS,
    URL_WITH_CREDENTIALS
};

[[nodiscard]] inline const char* pii_type_to_string(PiiType t) {
    switch (t) {
        case PiiType::EMAIL:                  return "email";
        case PiiType::PHONE:                  return "phone";
        case PiiType::IBAN:                   return "iban";
        case PiiType::CREDIT_CARD:            return "credit_card";
        case PiiType::GERMAN_TAX_ID:          return "german_tax_id";
        case PiiType::GERMAN_PERSONAL_ID:     return "german_personal_id";
        case PiiType::GERMAN_SOCIAL_SECURITY: return "german_social_security";
        case PiiType::IP_ADDRESS:             return "ip_address";
        case PiiType::URL_WITH_CREDENTIALS:   return "url_with_credentials";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<PiiType> parse_pii_type(std::string_view s) {
    if (s == "email") return PiiType::EMAIL;
    if (s == "phone") return PiiType::PHONE;
    if (s == "iban") return PiiType::IBAN;
    if (s == "credit_card") return PiiType::CREDIT_CARD;
    if (s == "german_tax_id") return PiiType::GERMAN_TAX_ID;
    if (s == "german_personal_id") return PiiType::GERMAN_PERSONAL_ID;
    if (s == "german_social_security") return PiiType::GERMAN_SOCIAL_SECURITY;
    if (s == "ip_address") return PiiType::IP_ADDRESS;
    if (s == "url_with_credentials") return PiiType::URL_WITH_CREDENTIALS;
    return std::nullopt;
}

enum class PiiAction {
    BLOCK,
    MASK,
    TOKENIZE,
    ALLOW
};

[[nodiscard]] inline const char* pii_action_to_string(PiiAction a) {
    switch (a) {
        case PiiAction::BLOCK:    return "block";
        case PiiAction::MASK:     return "mask";
        case PiiAction::TOKENIZE: return "tokenize";
        case PiiAction::ALLOW:    return "allow";
    }
    return "mask";
}

[[nodiscard]] inline std::optional<PiiAction> parse_pii_action(std::string_view s) {
    if (s == "block") return PiiAction::BLOCK;
    if (s == "mask") return PiiAction::MASK;
    if (s == "tokenize") return PiiAction::TOKENIZE;
    if (s == "allow") return PiiAction::ALLOW;
    return std::nullopt;
}

/**
 * @brief Internal detection record. Offsets are byte offsets into the scanned text.
 */
struct PiiEntity {
    PiiType type = PiiType::EMAIL;
    std::string value;
    size_t start = 0;
    size_t end = 0;             // Exclusive
    double confidence = 0.0;

    [[nodiscard]] size_t length() const { return end - start; }
    [[nodiscard]] bool overlaps(const PiiEntity& other) const {
        return start < other.end && end > other.start;
    }
};

} // namespace llmshield
