#include "policy/tool_policy_scanner.hpp"
#include "core/error.hpp"
#include "core/hash.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>

namespace llmshield {

// ============================================================================
// Wildcard Matching
// ============================================================================

bool match_wildcard(std::string_view pattern, std::string_view value) {
    if (pattern == "*") return true;
    if (pattern.find('*') == std::string_view::npos) return pattern == value;

    // Iterative glob match with single-star backtracking
    size_t p = 0, v = 0;
    size_t star = std::string_view::npos, mark = 0;
    while (v < value.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == value[v])) {
            ++p;
            ++v;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            mark = v;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            v = ++mark;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

// ============================================================================
// Manifest Pins
// ============================================================================

std::string manifest_hash(std::vector<std::string> tool_names) {
    std::sort(tool_names.begin(), tool_names.end());
    return hash::sha256_hex(utils::join(tool_names, ","));
}

ToolManifestPin pin_manifest(std::string server_id, std::vector<std::string> tool_names) {
    std::sort(tool_names.begin(), tool_names.end());
    const auto now = utils::now();

    ToolManifestPin pin;
    pin.server_id = std::move(server_id);
    pin.tools_hash = hash::sha256_hex(utils::join(tool_names, ","));
    pin.tool_count = tool_names.size();
    pin.known_tools = std::move(tool_names);
    pin.pinned_at = now;
    pin.updated_at = now;
    return pin;
}

ManifestVerification verify_manifest(const ToolManifestPin& pin,
                                     std::vector<std::string> current_tools) {
    std::sort(current_tools.begin(), current_tools.end());

    ManifestVerification result;
    if (hash::sha256_hex(utils::join(current_tools, ",")) == pin.tools_hash) {
        return result;
    }

    result.valid = false;
    const std::unordered_set<std::string> current(current_tools.begin(), current_tools.end());
    const std::unordered_set<std::string> pinned(pin.known_tools.begin(), pin.known_tools.end());

    for (const auto& t : current_tools) {
        if (!pinned.contains(t)) result.added.push_back(t);
    }
    for (const auto& t : pin.known_tools) {
        if (!current.contains(t)) result.removed.push_back(t);
    }
    return result;
}

// ============================================================================
// ToolPolicyScanner
// ============================================================================

ToolPolicyScanner::ToolPolicyScanner(ToolPolicy policy, std::vector<ToolManifestPin> pins)
    : policy_(std::move(policy)) {
    for (auto& pin : pins) {
        if (pin.server_id.empty()) {
            throw ShieldError(ErrorCategory::MANIFEST_ERROR, "Manifest pin without server id");
        }
        std::sort(pin.known_tools.begin(), pin.known_tools.end());
        const auto expected = hash::sha256_hex(utils::join(pin.known_tools, ","));
        if (pin.tools_hash.empty()) {
            pin.tools_hash = expected;
        } else if (pin.tools_hash != expected) {
            throw ShieldError(ErrorCategory::MANIFEST_ERROR,
                std::format("Manifest pin for server '{}' does not match its tool list",
                            pin.server_id));
        }
        pin.tool_count = pin.known_tools.size();
        auto server_id = pin.server_id;
        pins_.insert_or_assign(std::move(server_id), std::move(pin));
    }
}

const ToolManifestPin* ToolPolicyScanner::find_pin(const std::string& server_id) const {
    const auto it = pins_.find(server_id);
    return it != pins_.end() ? &it->second : nullptr;
}

bool ToolPolicyScanner::is_globally_dangerous(std::string_view tool_name) const {
    return std::any_of(policy_.dangerous_patterns.begin(), policy_.dangerous_patterns.end(),
        [&](const std::string& p) { return match_wildcard(p, tool_name); });
}

std::optional<std::string> ToolPolicyScanner::matching_deny(std::string_view tool_name,
                                                            const ToolPermissions& perms) const {
    for (const auto& p : perms.denied) {
        if (match_wildcard(p, tool_name)) return p;
    }
    return std::nullopt;
}

Violation ToolPolicyScanner::make_violation(ViolationType type, double threshold,
                                            std::string message, std::string detail) const {
    return Violation{
        .type = type,
        .scanner = std::string(name()),
        .score = 1.0,
        .threshold = threshold,
        .message = std::move(message),
        .detail = std::move(detail),
    };
}

std::optional<Violation> ToolPolicyScanner::check_manifest_drift(const ToolCall& tool) const {
    if (tool.server_id.empty()) return std::nullopt;
    const auto* pin = find_pin(tool.server_id);
    if (!pin) return std::nullopt;

    if (std::binary_search(pin->known_tools.begin(), pin->known_tools.end(), tool.name)) {
        return std::nullopt;
    }
    return make_violation(ViolationType::MANIFEST_DRIFT, 0.0,
        std::format("Tool '{}' not in pinned manifest for server '{}'", tool.name, tool.server_id),
        std::format("Known tools: {}", utils::join(pin->known_tools, ", ")));
}

ScannerResult ToolPolicyScanner::scan(std::string_view /*input*/,
                                      const ScanContext& context) const {
    const utils::Timer timer;
    ScannerResult result;

    if (context.tools.empty()) {
        result.duration = timer.elapsed_us();
        return result;
    }

    const std::string agent_id = context.agent_id.empty()
        ? std::string(kDefaultAgent) : context.agent_id;
    const auto perm_it = policy_.permissions.find(agent_id);
    const ToolPermissions* perms = perm_it != policy_.permissions.end() ? &perm_it->second : nullptr;

    for (const auto& tool : context.tools) {
        if (is_globally_dangerous(tool.name)) {
            result.violations.push_back(make_violation(ViolationType::TOOL_DENIED, 0.0,
                std::format("Tool '{}' matches global dangerous pattern", tool.name),
                "Matched global.dangerousPatterns"));
            continue;
        }

        if (policy_.read_only_mode) {
            result.violations.push_back(make_violation(ViolationType::TOOL_DENIED, 0.0,
                std::format("Tool '{}' blocked: read-only mode active", tool.name)));
            continue;
        }

        if (perms) {
            if (auto denied = matching_deny(tool.name, *perms)) {
                result.violations.push_back(make_violation(ViolationType::TOOL_DENIED, 0.0,
                    std::format("Tool '{}' denied for agent '{}'", tool.name, agent_id),
                    std::format("Matched deny pattern: {}", *denied)));
                continue;
            }

            const bool allowed = std::any_of(perms->allowed.begin(), perms->allowed.end(),
                [&](const std::string& p) { return match_wildcard(p, tool.name); });
            if (!allowed) {
                result.violations.push_back(make_violation(ViolationType::TOOL_DENIED, 0.0,
                    std::format("Tool '{}' not in allow list for agent '{}'", tool.name, agent_id)));
            }
        }

        if (auto drift = check_manifest_drift(tool)) {
            result.violations.push_back(std::move(*drift));
        }
    }

    if (policy_.max_chain_depth > 0 && context.tools.size() > policy_.max_chain_depth) {
        result.violations.push_back(make_violation(ViolationType::TOOL_RATE_LIMIT,
            static_cast<double>(policy_.max_chain_depth),
            std::format("Tool chain depth {} exceeds maximum {}",
                        context.tools.size(), policy_.max_chain_depth),
            std::format("Declared tools: {}", context.tools.size())));
    }

    result.decision = result.violations.empty() ? Decision::ALLOW : Decision::BLOCK;
    result.duration = timer.elapsed_us();
    return result;
}

} // namespace llmshield
