#include "audit/audit_json.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

namespace llmshield {

namespace {

double to_ms(std::chrono::microseconds us) {
    return static_cast<double>(us.count()) / 1000.0;
}

glz::json_t object() {
    glz::json_t j;
    j = glz::json_t::object_t{};
    return j;
}

glz::json_t string_array(const std::vector<std::string>& items) {
    glz::json_t::array_t arr;
    arr.reserve(items.size());
    for (const auto& s : items) {
        glz::json_t e;
        e = s;
        arr.push_back(std::move(e));
    }
    glz::json_t j;
    j = std::move(arr);
    return j;
}

glz::json_t violation_array(const std::vector<Violation>& violations) {
    glz::json_t::array_t arr;
    arr.reserve(violations.size());
    for (const auto& v : violations) {
        arr.push_back(to_json(v));
    }
    glz::json_t j;
    j = std::move(arr);
    return j;
}

} // anonymous namespace

glz::json_t to_json(const Violation& v) {
    auto j = object();
    j["type"] = std::string(violation_type_to_string(v.type));
    j["scanner"] = v.scanner;
    j["score"] = v.score;
    j["threshold"] = v.threshold;
    j["message"] = v.message;
    if (!v.detail.empty()) {
        j["detail"] = v.detail;
    }
    return j;
}

glz::json_t to_json(const ScanMeta& m) {
    auto j = object();
    j["scan_duration_ms"] = to_ms(m.scan_duration);
    j["scanners_run"] = string_array(m.scanners_run);
    j["cached"] = m.cached;
    return j;
}

glz::json_t to_json(const ScanResult& r) {
    auto j = object();
    j["safe"] = r.safe;
    j["decision"] = std::string(decision_to_string(r.decision));
    j["sanitized"] = r.sanitized;
    j["violations"] = violation_array(r.violations);
    j["meta"] = to_json(r.meta);
    return j;
}

glz::json_t to_json(const AuditRecord& r) {
    auto j = object();
    j["id"] = r.id;
    j["timestamp"] = utils::format_timestamp(r.timestamp);
    j["request_type"] = std::string(request_type_to_string(r.request_type));
    j["input_hash"] = r.input_hash;
    j["input_token_count"] = static_cast<double>(r.input_token_count);
    j["security_decision"] = std::string(decision_to_string(r.security_decision));
    j["violations"] = violation_array(r.violations);
    j["scan_duration_ms"] = to_ms(r.scan_duration);

    if (!r.session_id.empty()) j["session_id"] = r.session_id;
    if (!r.agent_id.empty()) j["agent_id"] = r.agent_id;
    if (!r.user_id_hash.empty()) j["user_id_hash"] = r.user_id_hash;
    if (!r.model.empty()) j["model"] = r.model;
    if (!r.security_reason.empty()) j["security_reason"] = r.security_reason;
    if (r.output_token_count) j["output_token_count"] = static_cast<double>(*r.output_token_count);
    if (!r.tools_called.empty()) j["tools_called"] = string_array(r.tools_called);
    if (r.cost_usd) j["cost_usd"] = *r.cost_usd;
    return j;
}

std::string dump_json(const glz::json_t& j) {
    std::string buffer;
    const auto ec = glz::write_json(j, buffer);
    if (ec) {
        throw ShieldError(ErrorCategory::INTERNAL_ERROR,
            "JSON serialization failed: " + glz::format_error(ec, buffer));
    }
    return buffer;
}

} // namespace llmshield
