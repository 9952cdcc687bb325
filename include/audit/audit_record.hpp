#pragma once

#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace llmshield {

enum class RequestType {
    CHAT,
    TOOL_CALL
};

[[nodiscard]] inline const char* request_type_to_string(RequestType t) {
    switch (t) {
        case RequestType::CHAT:      return "chat";
        case RequestType::TOOL_CALL: return "tool_call";
    }
    return "chat";
}

/**
 * @brief One privacy-safe row per scanned request
 *
 * Holds a SHA-256 of the input and a truncated hash of the user id, never the
 * raw text. Created once by the AuditLogger and never updated.
 */
struct AuditRecord {
    // Identity
    std::string id;                             // UUID v4
    std::chrono::system_clock::time_point timestamp;
    std::string session_id;                     // Empty = absent
    std::string agent_id;
    std::string user_id_hash;                   // First 16 hex of SHA-256(user id)

    // Request
    RequestType request_type = RequestType::CHAT;
    std::string input_hash;                     // SHA-256 hex of the input
    uint64_t input_token_count = 0;             // ceil(bytes / 4)
    std::string model;

    // Security outcome
    Decision security_decision = Decision::ALLOW;
    std::string security_reason;                // Violation messages joined by "; "
    std::vector<Violation> violations;
    std::chrono::microseconds scan_duration{0};

    // Downstream (optional)
    std::optional<uint64_t> output_token_count;
    std::vector<std::string> tools_called;
    std::optional<double> cost_usd;
};

/// Caller-supplied fields that the scan itself does not know
struct AuditExtras {
    std::string model;
    std::optional<uint64_t> output_token_count;
    std::vector<std::string> tools_called;
    std::optional<double> cost_usd;
};

} // namespace llmshield
