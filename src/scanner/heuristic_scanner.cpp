#include "scanner/heuristic_scanner.hpp"
#include "scanner/text_window.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace llmshield {

namespace {

struct RuleSpec {
    const char* id;
    const char* category;
    const char* pattern;
    double weight;
    const char* description;
};

// ============================================================================
// Rule Catalogue
// ============================================================================

constexpr RuleSpec kRules[] = {
    // Instruction override
    {"INJ-001", "instruction_override",
     R"re(ignore\s+(all\s+)?(previous|prior|above|earlier|preceding)\s+(instructions?|prompts?|rules?|guidelines?|context))re",
     0.25, "Ignore previous instructions"},
    {"INJ-002", "instruction_override",
     R"re(disregard\s+(all\s+|your\s+)?(previous|prior|above|earlier)\s+(instructions?|context|rules?|guidelines?))re",
     0.25, "Disregard instructions"},
    {"INJ-003", "instruction_override",
     R"re(forget\s+(everything|all|your)\s+(about\s+)?(instructions?|rules?|training|guidelines?|constraints?))re",
     0.25, "Forget instructions"},
    {"INJ-004", "instruction_override",
     R"re(override\s+(your|the|all)\s+(instructions?|rules?|safety|guidelines?|constraints?|policies))re",
     0.25, "Override instructions"},
    {"INJ-005", "instruction_override",
     R"re(do\s+not\s+follow\s+(your|the|any)\s+(previous|original|initial)\s+(instructions?|rules?|guidelines?))re",
     0.25, "Do not follow instructions"},
    {"INJ-006", "instruction_override",
     R"re(new\s+(instructions?|rules?|guidelines?)[\s:]+)re",
     0.15, "New instructions prefix"},
    {"INJ-007", "instruction_override",
     R"re(from\s+now\s+on[,\s]+(you\s+)?(will|must|should|are|shall))re",
     0.20, "From now on directive"},
    {"INJ-008", "instruction_override",
     R"re(instead[,\s]+(you\s+)?(will|must|should|shall)\s+)re",
     0.15, "Instead directive"},

    // Role manipulation
    {"ROLE-001", "role_manipulation",
     R"re(you\s+are\s+now\s+(a|an|the|my)\s+)re",
     0.25, "You are now [role]"},
    {"ROLE-002", "role_manipulation",
     R"re(pretend\s+(you('re|\s+are)\s+|to\s+be\s+))re",
     0.25, "Pretend to be"},
    {"ROLE-003", "role_manipulation",
     R"re(act\s+as\s+(a|an|if\s+you\s+were)\s+)re",
     0.20, "Act as [role]"},
    {"ROLE-004", "role_manipulation",
     R"re(switch\s+to\s+.{0,30}\s+mode)re",
     0.25, "Switch to [X] mode"},
    {"ROLE-005", "role_manipulation",
     R"re(enter\s+(developer|debug|admin|god|sudo|root|jailbreak|DAN)\s+mode)re",
     0.35, "Enter privileged mode"},
    {"ROLE-006", "role_manipulation",
     R"re(you\s+have\s+no\s+(restrictions?|limitations?|rules?|constraints?|filters?))re",
     0.30, "No restrictions claim"},
    {"ROLE-007", "role_manipulation",
     R"re(\bDAN\b.{0,200}\b(do\s+anything|no\s+(restrictions?|limits?|filters?)))re",
     0.35, "DAN jailbreak pattern"},

    // System prompt extraction
    {"EXTRACT-001", "system_prompt_extraction",
     R"re(what\s+(is|are)\s+your\s+(system\s+)?(prompt|instructions?|rules?|guidelines?|directives?))re",
     0.30, "What is your system prompt"},
    {"EXTRACT-002", "system_prompt_extraction",
     R"re(show\s+(me\s+)?your\s+(system\s+)?(prompt|instructions?|config(uration)?|rules?))re",
     0.30, "Show your prompt"},
    {"EXTRACT-003", "system_prompt_extraction",
     R"re(repeat\s+(the|your)\s+(system\s+|initial\s+|original\s+)?(prompt|instructions?|message|rules?)\s*(word\s+for\s+word|verbatim|exactly)?)re",
     0.30, "Repeat your prompt"},
    {"EXTRACT-004", "system_prompt_extraction",
     R"re(output\s+(the|your)\s+(initial|system|original|first)\s+(prompt|instructions?|message))re",
     0.30, "Output initial prompt"},
    {"EXTRACT-005", "system_prompt_extraction",
     R"re(print\s+(your|the)\s+(system\s+)?(prompt|instructions?|configuration))re",
     0.30, "Print system prompt"},
    {"EXTRACT-006", "system_prompt_extraction",
     R"re(tell\s+me\s+(your|the)\s+(exact\s+)?(system\s+)?(prompt|instructions?|wording))re",
     0.30, "Tell me your prompt"},
    {"EXTRACT-007", "system_prompt_extraction",
     R"re(copy\s+(and\s+)?(paste|output)\s+(your|the)\s+(system\s+)?(prompt|instructions?))re",
     0.30, "Copy paste your prompt"},
    {"EXTRACT-008", "system_prompt_extraction",
     R"re((?:reveal|disclose|leak)\s+(?:your|the)\s+(?:hidden\s+|secret\s+)?(?:system\s+)?(?:prompt|instructions?))re",
     0.30, "Reveal your prompt"},

    // Encoding evasion
    {"ENCODE-001", "encoding_evasion",
     R"re((?:decode|translate|convert|interpret)\s+(?:this|the\s+following)\s+(?:from\s+)?(?:base64|rot13|hex|binary|morse|unicode|ascii|url.?encoded))re",
     0.20, "Decode from encoding"},
    {"ENCODE-002", "encoding_evasion",
     R"re((?:execute|follow|obey|run)\s+(?:the\s+)?(?:decoded|hidden|encoded|secret)\s+(?:instructions?|commands?|text))re",
     0.30, "Execute decoded instructions"},
    {"ENCODE-003", "encoding_evasion",
     R"re([A-Za-z0-9+/]{50,}={0,2})re",
     0.10, "Long Base64 string detected"},

    // Delimiter and special-token injection
    {"DELIM-001", "delimiter_injection",
     R"re(```\s*system\b)re",
     0.30, "Code block system injection"},
    {"DELIM-002", "delimiter_injection",
     R"re(\[SYSTEM\])re",
     0.30, "[SYSTEM] tag injection"},
    {"DELIM-003", "delimiter_injection",
     R"re(</?system>)re",
     0.30, "<system> tag injection"},
    {"DELIM-004", "delimiter_injection",
     R"re(###\s*(?:SYSTEM|INSTRUCTION|ADMIN|OVERRIDE))re",
     0.30, "### SYSTEM header injection"},
    {"DELIM-005", "delimiter_injection",
     R"re(<\|(?:im_start|im_end|system|endoftext)\|>)re",
     0.35, "ChatML special token injection"},
    {"DELIM-006", "delimiter_injection",
     R"re(\[INST\]|\[/INST\]|<<SYS>>|</s>)re",
     0.35, "Llama special token injection"},

    // Context manipulation
    {"CTX-001", "context_manipulation",
     R"re((?:imagine|suppose|assume|consider)\s+(?:that\s+)?(?:you\s+(?:are|have|were|can)|there\s+(?:are|is))\s+(?:no\s+)?(?:restrictions?|limitations?|rules?|safety|filters?))re",
     0.20, "Hypothetical no-restrictions"},
    {"CTX-002", "context_manipulation",
     R"re((?:in\s+a\s+)?(?:hypothetical|fictional|imaginary|theoretical)\s+(?:scenario|world|situation|context))re",
     0.10, "Hypothetical framing"},
    {"CTX-003", "context_manipulation",
     R"re((?:for\s+)?(?:educational|research|academic|testing|security\s+testing)\s+purposes?\s+only)re",
     0.10, "Educational purpose claim"},
    {"CTX-004", "context_manipulation",
     R"re(this\s+is\s+(?:a\s+)?(?:test|simulation|drill|exercise|safe\s+environment))re",
     0.10, "Test environment claim"},

    // Output manipulation
    {"OUT-001", "output_manipulation",
     R"re((?:respond|reply|answer|output)\s+(?:only\s+)?(?:with|in)\s+(?:json|xml|html|markdown|code|raw))re",
     0.05, "Format forcing (low risk)"},
    {"OUT-002", "output_manipulation",
     R"re(do\s+not\s+(?:mention|include|add|say|output)\s+(?:any\s+)?(?:warnings?|disclaimers?|caveats?|notes?|safety))re",
     0.20, "Suppress safety disclaimers"},
    {"OUT-003", "output_manipulation",
     R"re((?:never|don't|do\s+not)\s+(?:refuse|decline|reject|deny|say\s+(?:no|you\s+can't)))re",
     0.25, "Never refuse requests"},

    // Tool abuse
    {"TOOL-001", "tool_abuse",
     R"re((?:call|execute|run|invoke|use)\s+(?:the\s+)?(?:delete|remove|drop|destroy|wipe|kill|shutdown)[\s_])re",
     0.30, "Destructive tool invocation"},
    {"TOOL-002", "tool_abuse",
     R"re((?:send|forward|exfiltrate|leak|transmit)\s+(?:all\s+)?(?:the\s+)?(?:data|information|credentials?|secrets?|keys?|tokens?|api.?keys?)\s+(?:to|via|and))re",
     0.35, "Data exfiltration attempt"},
    {"TOOL-003", "tool_abuse",
     R"re((?:access|read|fetch|get|retrieve)\s+(?:the\s+)?(?:env|environment|\.env|secrets?|api.?keys?|credentials?|passwords?|tokens?))re",
     0.30, "Credential access attempt"},
};

constexpr double kCustomPatternWeight = 0.25;
constexpr double kWarnFraction = 0.6;

constexpr auto kRegexFlags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

const std::regex& role_marker_regex() {
    static const std::regex re(R"re(\b(system|user|assistant|human|ai|bot|admin)[\s:])re",
                               std::regex::ECMAScript | std::regex::icase);
    return re;
}

// Lines opening with one to three '#' followed by whitespace
size_t count_markdown_headers(std::string_view input) {
    size_t count = 0;
    size_t pos = 0;
    while (pos < input.size()) {
        size_t hashes = 0;
        while (pos + hashes < input.size() && input[pos + hashes] == '#') {
            ++hashes;
        }
        if (hashes >= 1 && hashes <= 3 && pos + hashes < input.size()) {
            const char next = input[pos + hashes];
            if (next == ' ' || next == '\t' || next == '\n' || next == '\r'
                || next == '\f' || next == '\v') {
                ++count;
            }
        }
        const auto nl = input.find('\n', pos);
        if (nl == std::string_view::npos) break;
        pos = nl + 1;
    }
    return count;
}

} // anonymous namespace

const char* strictness_to_string(InjectionStrictness s) {
    switch (s) {
        case InjectionStrictness::LOW:    return "low";
        case InjectionStrictness::MEDIUM: return "medium";
        case InjectionStrictness::HIGH:   return "high";
    }
    return "medium";
}

std::optional<InjectionStrictness> parse_strictness(std::string_view s) {
    if (s == "low") return InjectionStrictness::LOW;
    if (s == "medium") return InjectionStrictness::MEDIUM;
    if (s == "high") return InjectionStrictness::HIGH;
    return std::nullopt;
}

double strictness_threshold(InjectionStrictness s) {
    switch (s) {
        case InjectionStrictness::LOW:    return 0.5;
        case InjectionStrictness::MEDIUM: return 0.3;
        case InjectionStrictness::HIGH:   return 0.15;
    }
    return 0.3;
}

HeuristicScanner::HeuristicScanner(const Config& config)
    : threshold_(config.threshold.value_or(
          strictness_threshold(config.strictness.value_or(InjectionStrictness::MEDIUM)))),
      action_(config.action) {

    if (threshold_ < 0.0 || threshold_ > 1.0) {
        throw ShieldError(ErrorCategory::CONFIG_ERROR,
            std::format("Injection threshold must be within [0, 1], got {}", threshold_));
    }
    if (action_ == Decision::ALLOW) {
        throw ShieldError(ErrorCategory::CONFIG_ERROR,
            "Injection action must be 'block' or 'warn'");
    }

    rules_.reserve(std::size(kRules) + config.custom_patterns.size());
    for (const auto& def : kRules) {
        rules_.push_back(Rule{
            .id = def.id,
            .category = def.category,
            .pattern = std::regex(def.pattern, kRegexFlags),
            .weight = def.weight,
            .description = def.description,
        });
    }

    for (size_t i = 0; i < config.custom_patterns.size(); ++i) {
        const auto& source = config.custom_patterns[i];
        std::regex compiled;
        try {
            compiled = std::regex(source, kRegexFlags);
        } catch (const std::regex_error& e) {
            throw ShieldError(ErrorCategory::CONFIG_ERROR,
                std::format("Invalid custom injection pattern #{} '{}': {}", i + 1, source, e.what()));
        }
        rules_.push_back(Rule{
            .id = std::format("CUSTOM-{}", i + 1),
            .category = "instruction_override",
            .pattern = std::move(compiled),
            .weight = kCustomPatternWeight,
            .description = std::format("Custom pattern #{}", i + 1),
        });
    }
}

std::vector<std::string> HeuristicScanner::pattern_ids() const {
    std::vector<std::string> ids;
    ids.reserve(rules_.size());
    for (const auto& r : rules_) {
        ids.push_back(r.id);
    }
    return ids;
}

double HeuristicScanner::structural_score(std::string_view input) {
    double score = 0.0;

    const auto newlines = std::count(input.begin(), input.end(), '\n');
    if (newlines > 15) score += 0.05;

    if (count_markdown_headers(input) > 3) score += 0.05;

    size_t markers = 0;
    for (const auto& w : make_windows(input.size())) {
        const char* begin = input.data() + w.offset;
        for (std::cregex_iterator it(begin, begin + w.length, role_marker_regex(), window_flags(w)), end;
             it != end; ++it) {
            if (static_cast<size_t>(it->position(0)) < w.owned) ++markers;
        }
    }
    if (markers > 2) score += 0.10;

    if (input.size() > 5000) score += 0.05;

    return score;
}

bool HeuristicScanner::matches(const Rule& rule, std::string_view input,
                               const std::vector<TextWindow>& windows) {
    for (const auto& w : windows) {
        const auto begin = input.begin() + static_cast<std::ptrdiff_t>(w.offset);
        const auto end = begin + static_cast<std::ptrdiff_t>(w.length);
        if (std::regex_search(begin, end, rule.pattern, window_flags(w))) {
            return true;
        }
    }
    return false;
}

HeuristicScanner::Evaluation HeuristicScanner::evaluate(std::string_view input) const {
    Evaluation eval;
    double total = 0.0;
    const auto windows = make_windows(input.size());

    for (const auto& rule : rules_) {
        if (!matches(rule, input, windows)) {
            continue;
        }
        total += rule.weight;
        eval.violations.push_back(Violation{
            .type = ViolationType::PROMPT_INJECTION,
            .scanner = std::string(name()),
            .score = rule.weight,
            .threshold = threshold_,
            .message = rule.description,
            .detail = std::format("Rule {} ({})", rule.id, rule.category),
        });
    }

    eval.structural_score = structural_score(input);
    total += eval.structural_score;
    eval.score = std::min(total, 1.0);
    return eval;
}

ScannerResult HeuristicScanner::scan(std::string_view input,
                                     const ScanContext& /*context*/) const {
    const utils::Timer timer;
    auto eval = evaluate(input);

    ScannerResult result;
    if (eval.score >= threshold_) {
        result.decision = action_;
    } else if (eval.score >= threshold_ * kWarnFraction) {
        result.decision = Decision::WARN;
    } else {
        result.decision = Decision::ALLOW;
    }
    result.violations = std::move(eval.violations);
    result.duration = timer.elapsed_us();
    return result;
}

} // namespace llmshield
