#include <catch2/catch_test_macros.hpp>
#include "policy/tool_policy_scanner.hpp"
#include "core/error.hpp"

using namespace llmshield;

namespace {

ScanContext with_tools(std::string agent, std::vector<std::string> names,
                       const std::string& server_id = {}) {
    ScanContext ctx;
    ctx.agent_id = std::move(agent);
    for (auto& n : names) {
        ctx.tools.push_back(ToolCall{.name = std::move(n), .arguments = "{}", .server_id = server_id});
    }
    return ctx;
}

ToolPolicy support_policy() {
    ToolPolicy policy;
    policy.permissions["support-bot"] = ToolPermissions{
        .allowed = {"search_*", "get_ticket", "delete_draft"},
        .denied = {"search_internal_*"},
    };
    policy.dangerous_patterns = {"delete_*", "drop_*"};
    return policy;
}

} // namespace

// ============================================================================
// Wildcards
// ============================================================================

TEST_CASE("ToolPolicy: wildcard matching", "[tools]") {
    CHECK(match_wildcard("*", "anything"));
    CHECK(match_wildcard("delete_*", "delete_user"));
    CHECK(match_wildcard("delete_*", "delete_"));
    CHECK_FALSE(match_wildcard("delete_*", "undelete_user"));
    CHECK(match_wildcard("*_admin", "super_admin"));
    CHECK(match_wildcard("get_*_by_id", "get_user_by_id"));
    CHECK_FALSE(match_wildcard("get_*_by_id", "get_user_by_name"));
    CHECK(match_wildcard("send_email", "send_email"));
    CHECK_FALSE(match_wildcard("send_email", "send_emails"));
    // '?' only has meaning alongside '*'
    CHECK_FALSE(match_wildcard("get_?", "get_x"));
    CHECK(match_wildcard("get_?*", "get_x"));
}

// ============================================================================
// Permission checks
// ============================================================================

TEST_CASE("ToolPolicy: no declared tools allows", "[tools]") {
    ToolPolicyScanner scanner(support_policy());
    auto result = scanner.scan("hello", ScanContext{});
    CHECK(result.decision == Decision::ALLOW);
    CHECK(result.violations.empty());
}

TEST_CASE("ToolPolicy: allowed tool passes", "[tools]") {
    ToolPolicyScanner scanner(support_policy());
    auto result = scanner.scan("", with_tools("support-bot", {"search_docs", "get_ticket"}));
    CHECK(result.decision == Decision::ALLOW);
    CHECK(result.violations.empty());
}

TEST_CASE("ToolPolicy: global dangerous pattern beats the allow list", "[tools]") {
    ToolPolicyScanner scanner(support_policy());
    auto result = scanner.scan("", with_tools("support-bot", {"delete_draft"}));
    CHECK(result.decision == Decision::BLOCK);
    REQUIRE(result.violations.size() == 1);
    CHECK(result.violations[0].type == ViolationType::TOOL_DENIED);
    CHECK(result.violations[0].message == "Tool 'delete_draft' matches global dangerous pattern");
    CHECK(result.violations[0].scanner == "tool_policy");
}

TEST_CASE("ToolPolicy: deny list is checked before allow list", "[tools]") {
    ToolPolicyScanner scanner(support_policy());
    auto result = scanner.scan("", with_tools("support-bot", {"search_internal_wiki"}));
    CHECK(result.decision == Decision::BLOCK);
    REQUIRE(result.violations.size() == 1);
    CHECK(result.violations[0].message == "Tool 'search_internal_wiki' denied for agent 'support-bot'");
    CHECK(result.violations[0].detail == "Matched deny pattern: search_internal_*");
}

TEST_CASE("ToolPolicy: tool outside allow list is denied", "[tools]") {
    ToolPolicyScanner scanner(support_policy());
    auto result = scanner.scan("", with_tools("support-bot", {"refund_order"}));
    CHECK(result.decision == Decision::BLOCK);
    REQUIRE(result.violations.size() == 1);
    CHECK(result.violations[0].message == "Tool 'refund_order' not in allow list for agent 'support-bot'");
}

TEST_CASE("ToolPolicy: agents without permissions only face global checks", "[tools]") {
    ToolPolicyScanner scanner(support_policy());
    CHECK(scanner.scan("", with_tools("other-bot", {"refund_order"})).decision == Decision::ALLOW);
    CHECK(scanner.scan("", with_tools("other-bot", {"drop_table"})).decision == Decision::BLOCK);
}

TEST_CASE("ToolPolicy: missing agent id uses the default permissions", "[tools]") {
    ToolPolicy policy;
    policy.permissions["default"] = ToolPermissions{.allowed = {"search_*"}, .denied = {}};
    ToolPolicyScanner scanner(policy);

    auto result = scanner.scan("", with_tools("", {"send_sms"}));
    REQUIRE(result.violations.size() == 1);
    CHECK(result.violations[0].message == "Tool 'send_sms' not in allow list for agent 'default'");
}

TEST_CASE("ToolPolicy: read-only mode denies every tool", "[tools]") {
    ToolPolicy policy;
    policy.read_only_mode = true;
    ToolPolicyScanner scanner(policy);

    auto result = scanner.scan("", with_tools("x", {"get_ticket"}));
    CHECK(result.decision == Decision::BLOCK);
    REQUIRE(result.violations.size() == 1);
    CHECK(result.violations[0].message == "Tool 'get_ticket' blocked: read-only mode active");
}

TEST_CASE("ToolPolicy: chain depth beyond maximum is rate limited", "[tools]") {
    ToolPolicy policy;
    policy.max_chain_depth = 2;
    ToolPolicyScanner scanner(policy);

    CHECK(scanner.scan("", with_tools("x", {"a", "b"})).decision == Decision::ALLOW);

    auto result = scanner.scan("", with_tools("x", {"a", "b", "c"}));
    CHECK(result.decision == Decision::BLOCK);
    REQUIRE(result.violations.size() == 1);
    CHECK(result.violations[0].type == ViolationType::TOOL_RATE_LIMIT);
    CHECK(result.violations[0].message == "Tool chain depth 3 exceeds maximum 2");
}

// ============================================================================
// Manifest pins
// ============================================================================

TEST_CASE("ToolPolicy: manifest hash ignores order", "[tools]") {
    CHECK(manifest_hash({"b", "a", "c"}) == manifest_hash({"c", "b", "a"}));
    CHECK(manifest_hash({"a", "b"}) != manifest_hash({"a", "b", "c"}));
    CHECK(manifest_hash({"a"}).size() == 64);
}

TEST_CASE("ToolPolicy: pin_manifest sorts and counts tools", "[tools]") {
    auto pin = pin_manifest("crm", {"update_contact", "get_contact"});
    CHECK(pin.server_id == "crm");
    CHECK(pin.tool_count == 2);
    CHECK(pin.known_tools == std::vector<std::string>{"get_contact", "update_contact"});
    CHECK(pin.tools_hash == manifest_hash({"get_contact", "update_contact"}));
}

TEST_CASE("ToolPolicy: verify_manifest reports drift", "[tools]") {
    auto pin = pin_manifest("crm", {"get_contact", "update_contact"});

    auto same = verify_manifest(pin, {"update_contact", "get_contact"});
    CHECK(same.valid);
    CHECK(same.added.empty());
    CHECK(same.removed.empty());

    auto drifted = verify_manifest(pin, {"get_contact", "export_all"});
    CHECK_FALSE(drifted.valid);
    CHECK(drifted.added == std::vector<std::string>{"export_all"});
    CHECK(drifted.removed == std::vector<std::string>{"update_contact"});
}

TEST_CASE("ToolPolicy: unknown tool on a pinned server is manifest drift", "[tools]") {
    // Drift is reported regardless of allow lists
    ToolPolicy policy;
    policy.permissions["agent"] = ToolPermissions{.allowed = {"*"}, .denied = {}};
    ToolPolicyScanner scanner(policy, {pin_manifest("crm", {"get_contact"})});

    CHECK(scanner.scan("", with_tools("agent", {"get_contact"}, "crm")).decision == Decision::ALLOW);

    auto result = scanner.scan("", with_tools("agent", {"export_all"}, "crm"));
    CHECK(result.decision == Decision::BLOCK);
    REQUIRE(result.violations.size() == 1);
    CHECK(result.violations[0].type == ViolationType::MANIFEST_DRIFT);
    CHECK(result.violations[0].message == "Tool 'export_all' not in pinned manifest for server 'crm'");

    // Unpinned server: no drift check
    CHECK(scanner.scan("", with_tools("agent", {"export_all"}, "erp")).decision == Decision::ALLOW);
}

TEST_CASE("ToolPolicy: pin with mismatching hash is a manifest error", "[tools]") {
    auto pin = pin_manifest("crm", {"get_contact"});
    pin.tools_hash = manifest_hash({"something_else"});
    try {
        ToolPolicyScanner scanner(ToolPolicy{}, {pin});
        FAIL("expected ShieldError");
    } catch (const ShieldError& e) {
        CHECK(e.category() == ErrorCategory::MANIFEST_ERROR);
    }
}

TEST_CASE("ToolPolicy: pin without server id is a manifest error", "[tools]") {
    ToolManifestPin pin;
    pin.known_tools = {"a"};
    CHECK_THROWS_AS(ToolPolicyScanner(ToolPolicy{}, {pin}), ShieldError);
}
