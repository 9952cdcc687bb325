#pragma once

#include "scanner/iscanner.hpp"
#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace llmshield {

/**
 * @brief Glob match used by tool permission lists
 *
 * "*" alone matches everything. A pattern without '*' must equal the value.
 * Otherwise '*' matches any run of characters and '?' exactly one, anchored
 * at both ends.
 */
[[nodiscard]] bool match_wildcard(std::string_view pattern, std::string_view value);

struct ToolPermissions {
    std::vector<std::string> allowed;   // Wildcard patterns
    std::vector<std::string> denied;    // Wildcard patterns, checked first
};

struct ToolPolicy {
    std::unordered_map<std::string, ToolPermissions> permissions;  // Keyed by agent id
    std::vector<std::string> dangerous_patterns;
    bool read_only_mode = false;
    size_t max_chain_depth = 0;         // 0 = unlimited
};

/**
 * @brief Hashed snapshot of the tool names a server exposes
 */
struct ToolManifestPin {
    std::string server_id;
    std::string tools_hash;             // SHA-256 hex of sorted names joined by ","
    size_t tool_count = 0;
    std::vector<std::string> known_tools;   // Sorted
    std::chrono::system_clock::time_point pinned_at;
    std::chrono::system_clock::time_point updated_at;
};

struct ManifestVerification {
    bool valid = true;
    std::vector<std::string> added;     // In candidate, absent from pin
    std::vector<std::string> removed;   // In pin, absent from candidate
};

[[nodiscard]] std::string manifest_hash(std::vector<std::string> tool_names);

[[nodiscard]] ToolManifestPin pin_manifest(std::string server_id,
                                           std::vector<std::string> tool_names);

[[nodiscard]] ManifestVerification verify_manifest(const ToolManifestPin& pin,
                                                   std::vector<std::string> current_tools);

/**
 * @brief Permission and manifest-integrity checks over declared tool calls
 *
 * Per tool, first match wins:
 *   1. global dangerous pattern            -> tool_denied
 *   2. read-only mode                      -> tool_denied
 *   3. agent deny list                     -> tool_denied
 *   4. agent allow list miss               -> tool_denied
 * Then, independently of 3/4:
 *   5. server pinned and name not known    -> manifest_drift
 *
 * Declaring more tools than max_chain_depth yields tool_rate_limit.
 * Any violation blocks; otherwise the scan allows.
 */
class ToolPolicyScanner final : public IScanner {
public:
    static constexpr std::string_view kDefaultAgent = "default";

    /// @throws ShieldError(MANIFEST_ERROR) for a pin whose hash does not match its tool list
    explicit ToolPolicyScanner(ToolPolicy policy, std::vector<ToolManifestPin> pins = {});

    [[nodiscard]] ScannerResult scan(std::string_view input,
                                     const ScanContext& context) const override;
    [[nodiscard]] std::string_view name() const override { return "tool_policy"; }

    [[nodiscard]] const ToolPolicy& policy() const { return policy_; }
    [[nodiscard]] const ToolManifestPin* find_pin(const std::string& server_id) const;

private:
    [[nodiscard]] bool is_globally_dangerous(std::string_view tool_name) const;
    [[nodiscard]] std::optional<std::string> matching_deny(std::string_view tool_name,
                                                           const ToolPermissions& perms) const;
    [[nodiscard]] std::optional<Violation> check_manifest_drift(const ToolCall& tool) const;

    [[nodiscard]] Violation make_violation(ViolationType type, double threshold,
                                           std::string message, std::string detail = {}) const;

    ToolPolicy policy_;
    std::unordered_map<std::string, ToolManifestPin> pins_;
};

} // namespace llmshield
