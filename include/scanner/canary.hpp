#pragma once

#include <string>
#include <string_view>

namespace llmshield {

/**
 * @brief Canary marker for system-prompt leak detection
 *
 * A random token is appended to the system prompt inside an HTML comment.
 * If the token later shows up in a model response, the prompt was extracted.
 */
struct CanaryResult {
    std::string injected_prompt;
    std::string token;          // 16 lowercase hex chars
};

[[nodiscard]] CanaryResult inject_canary(std::string_view system_prompt);

[[nodiscard]] bool check_canary_leak(std::string_view response, std::string_view token);

} // namespace llmshield
