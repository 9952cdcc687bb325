#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"

#include <string>

namespace llmshield {

/**
 * @brief TOML loader for ShieldConfig
 *
 * Supports ${ENV_VAR} expansion in string values and an optional top-level
 * `include = ["base.toml"]` (file loads only; the including file wins on
 * conflicts). Unknown enum spellings are load errors. Never throws.
 *
 * Example:
 *   preset = "internal_support"
 *
 *   [injection]
 *   strictness = "high"
 *
 *   [pii.types]
 *   email = "tokenize"
 *
 *   [cost.budgets.support-bot]
 *   soft_limit = 5.0
 *   hard_limit = 10.0
 *   period = "daily"
 */
class ConfigLoader {
public:
    using LoadResult = Result<ShieldConfig>;

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);
};

} // namespace llmshield
