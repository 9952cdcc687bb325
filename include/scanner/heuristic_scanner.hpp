#pragma once

#include "scanner/iscanner.hpp"
#include "scanner/text_window.hpp"
#include "core/types.hpp"

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace llmshield {

enum class InjectionStrictness {
    LOW,        // threshold 0.5
    MEDIUM,     // threshold 0.3
    HIGH        // threshold 0.15
};

[[nodiscard]] const char* strictness_to_string(InjectionStrictness s);
[[nodiscard]] std::optional<InjectionStrictness> parse_strictness(std::string_view s);
[[nodiscard]] double strictness_threshold(InjectionStrictness s);

/**
 * @brief Weighted pattern scanner for prompt injection
 *
 * Every catalogue rule is matched case-insensitively against the input. Each
 * match adds its weight to the total score and emits one violation. Structural
 * signals (many newlines, markdown headers, role markers, very long input) add
 * to the score without emitting violations. The total is clamped to 1.0.
 *
 * Decision:
 *   score >= threshold        -> configured action (BLOCK unless set to WARN)
 *   score >= threshold * 0.6  -> WARN
 *   otherwise                 -> ALLOW
 *
 * Threshold precedence: explicit threshold, then strictness, then MEDIUM.
 *
 * Rules are matched window by window (see TextWindow), so a rule match must
 * fit within kWindowOverlap bytes.
 */
class HeuristicScanner final : public IScanner {
public:
    struct Config {
        std::optional<double> threshold;
        std::optional<InjectionStrictness> strictness;
        Decision action = Decision::BLOCK;
        std::vector<std::string> custom_patterns;   // ECMAScript regex, matched icase
    };

    struct Rule {
        std::string id;
        std::string category;
        std::regex pattern;
        double weight = 0.0;
        std::string description;
    };

    struct Evaluation {
        double score = 0.0;             // Clamped total, including structural signals
        double structural_score = 0.0;
        std::vector<Violation> violations;
    };

    HeuristicScanner() : HeuristicScanner(Config{}) {}

    /// @throws ShieldError(CONFIG_ERROR) on an invalid custom pattern or threshold
    explicit HeuristicScanner(const Config& config);

    [[nodiscard]] ScannerResult scan(std::string_view input,
                                     const ScanContext& context) const override;
    [[nodiscard]] std::string_view name() const override { return "heuristic"; }

    [[nodiscard]] Evaluation evaluate(std::string_view input) const;

    [[nodiscard]] double threshold() const { return threshold_; }
    [[nodiscard]] Decision action() const { return action_; }
    [[nodiscard]] size_t pattern_count() const { return rules_.size(); }
    [[nodiscard]] std::vector<std::string> pattern_ids() const;

    [[nodiscard]] static double structural_score(std::string_view input);

private:
    [[nodiscard]] static bool matches(const Rule& rule, std::string_view input,
                                      const std::vector<TextWindow>& windows);

    std::vector<Rule> rules_;
    double threshold_;
    Decision action_;
};

} // namespace llmshield
